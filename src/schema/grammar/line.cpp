#include "protolink/schema/grammar/line.hpp"

#include <charconv>
#include <cstddef>


namespace protolink::schema::grammar {

namespace {

[[nodiscard]]
inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

[[nodiscard]]
inline constexpr bool is_word(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

[[nodiscard]]
inline constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Forward-only scanner over one line
class Cursor {
public:
    explicit Cursor(std::string_view s) noexcept : s_(s) {}

    std::size_t skip_ws() noexcept {
        const std::size_t start = pos_;
        while (pos_ < s_.size() && is_space(s_[pos_])) ++pos_;
        return pos_ - start;
    }

    [[nodiscard]]
    bool literal(std::string_view lit) noexcept {
        if (s_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    [[nodiscard]]
    bool ch(char c) noexcept {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    template<class Pred>
    [[nodiscard]]
    std::string_view take_while(Pred pred) noexcept {
        const std::size_t start = pos_;
        while (pos_ < s_.size() && pred(s_[pos_])) ++pos_;
        return s_.substr(start, pos_ - start);
    }

    [[nodiscard]] std::string_view word() noexcept { return take_while(is_word); }
    [[nodiscard]] std::string_view dotted() noexcept { return take_while([](char c) { return is_word(c) || c == '.'; }); }
    [[nodiscard]] std::string_view digits() noexcept { return take_while(is_digit); }

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= s_.size(); }

    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }
    void rewind(std::size_t pos) noexcept { pos_ = pos; }

private:
    std::string_view s_;
    std::size_t pos_ = 0;
};

[[nodiscard]]
std::string_view trim(std::string_view s) noexcept {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

// "= digits ;" tail shared by both field shapes
[[nodiscard]]
bool match_assignment(Cursor& cur, LineMatch& out) noexcept {
    cur.skip_ws();
    if (!cur.ch('=')) return false;
    cur.skip_ws();
    auto tag = cur.digits();
    if (tag.empty()) return false;
    cur.skip_ws();
    if (!cur.ch(';')) return false;
    out.tag = tag;
    return true;
}

[[nodiscard]]
bool match_message_header(std::string_view line, LineMatch& out) noexcept {
    Cursor cur(line);
    cur.skip_ws();
    if (!cur.literal("message")) return false;
    if (cur.skip_ws() == 0) return false;
    auto name = cur.word();
    if (name.empty()) return false;
    cur.skip_ws();
    (void)cur.ch('{');
    cur.skip_ws();
    if (!cur.at_end()) return false;
    out.name = name;
    return true;
}

[[nodiscard]]
bool match_map_field(std::string_view line, LineMatch& out) noexcept {
    Cursor cur(line);
    cur.skip_ws();
    if (!cur.literal("map")) return false;
    cur.skip_ws();
    if (!cur.ch('<')) return false;
    cur.skip_ws();
    auto key_type = cur.dotted();
    if (key_type.empty()) return false;
    cur.skip_ws();
    if (!cur.ch(',')) return false;
    cur.skip_ws();
    auto value_type = cur.dotted();
    if (value_type.empty()) return false;
    cur.skip_ws();
    if (!cur.ch('>')) return false;
    if (cur.skip_ws() == 0) return false;
    auto name = cur.word();
    if (name.empty()) return false;
    if (!match_assignment(cur, out)) return false;
    out.key_type = key_type;
    out.value_type = value_type;
    out.name = name;
    return true;
}

// `type name = tag;` starting at the cursor
[[nodiscard]]
bool match_field_body(Cursor& cur, LineMatch& out) noexcept {
    auto type = cur.dotted();
    if (type.empty()) return false;
    if (cur.skip_ws() == 0) return false;
    auto name = cur.word();
    if (name.empty()) return false;
    if (!match_assignment(cur, out)) return false;
    out.type = type;
    out.name = name;
    return true;
}

[[nodiscard]]
bool match_field(std::string_view line, LineMatch& out) noexcept {
    Cursor cur(line);
    cur.skip_ws();
    const std::size_t start = cur.pos();
    // Optional "repeated" modifier. When the remainder does not form a field,
    // "repeated" itself is retried as the type token.
    if (cur.literal("repeated") && cur.skip_ws() > 0) {
        if (match_field_body(cur, out)) {
            out.repeated = true;
            return true;
        }
    }
    cur.rewind(start);
    out.repeated = false;
    return match_field_body(cur, out);
}

} // namespace


LineMatch classify(std::string_view line) noexcept {
    LineMatch m;
    const auto trimmed = trim(line);
    if (trimmed.empty()) {
        m.kind = LineKind::Blank;
        return m;
    }
    if (trimmed.substr(0, 2) == "//") {
        m.kind = LineKind::Comment;
        return m;
    }
    if (match_message_header(line, m)) {
        m.kind = LineKind::MessageHeader;
        return m;
    }
    if (match_map_field(line, m)) {
        m.kind = LineKind::MapField;
        return m;
    }
    m = LineMatch{};
    if (match_field(line, m)) {
        m.kind = LineKind::Field;
        return m;
    }
    return LineMatch{};
}

int brace_delta(std::string_view line) noexcept {
    int delta = 0;
    for (char c : line) {
        if (c == '{') ++delta;
        else if (c == '}') --delta;
    }
    return delta;
}

std::int64_t parse_tag(std::string_view digits) noexcept {
    std::int64_t value = 0;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return 0;
    }
    return value;
}

} // namespace protolink::schema::grammar
