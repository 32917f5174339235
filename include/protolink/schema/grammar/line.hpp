#pragma once

#include <cstdint>
#include <string_view>


namespace protolink::schema::grammar {

/*
================================================================================
IDL Line Classifier
================================================================================

The grammar is line oriented. Each source line is classified into exactly one
of the kinds below and, where applicable, its named parts are returned as
views into the original line (no allocation).

Recognized shapes (`ws` = space, tab, CR, LF, FF; `ident` = [A-Za-z0-9_]+;
`dotted` = [A-Za-z0-9_.]+):

  MessageHeader   ws* "message" ws+ ident ws* "{"? ws*            (whole line)
  MapField        ws* "map" ws* "<" ws* dotted ws* "," ws* dotted ws* ">"
                  ws+ ident ws* "=" ws* digits ws* ";" ...
  Field           ws* ("repeated" ws+)? dotted ws+ ident ws* "=" ws* digits
                  ws* ";" ...

Precedence (first match wins):
  Blank -> Comment -> MessageHeader -> MapField -> Field -> Other

MapField is tried before Field.
Text after the terminating ';' (trailing comments, options) is ignored.
Braces are never interpreted here, see brace_delta().
================================================================================
*/

enum class LineKind : std::uint8_t {
    Blank,
    Comment,        // trimmed line starts with "//"
    MessageHeader,
    MapField,
    Field,
    Other
};

[[nodiscard]]
inline constexpr std::string_view to_string(LineKind k) noexcept {
    switch (k) {
        case LineKind::Blank:         return "Blank";
        case LineKind::Comment:       return "Comment";
        case LineKind::MessageHeader: return "MessageHeader";
        case LineKind::MapField:      return "MapField";
        case LineKind::Field:         return "Field";
        case LineKind::Other:         return "Other";
    }
    return "Unknown";
}

// Structured match. Only the parts relevant to `kind` are populated.
struct LineMatch {
    LineKind kind = LineKind::Other;

    // MessageHeader: message name. MapField / Field: field name.
    std::string_view name{};

    // Field only
    bool repeated = false;
    std::string_view type{};

    // MapField only
    std::string_view key_type{};
    std::string_view value_type{};

    // MapField / Field: raw tag digits
    std::string_view tag{};
};

// Classifies one source line (without its line terminator).
[[nodiscard]]
LineMatch classify(std::string_view line) noexcept;

// Number of '{' minus number of '}' on the line. Braces inside strings or
// comments are counted too.
[[nodiscard]]
int brace_delta(std::string_view line) noexcept;

// Parses tag digits. Out-of-range values yield 0 (accepted quirk, no error).
[[nodiscard]]
std::int64_t parse_tag(std::string_view digits) noexcept;

} // namespace protolink::schema::grammar
