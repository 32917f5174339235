#include "protolink/schema/grammar/parser.hpp"

#include <fstream>
#include <sstream>

#include "lcr/log/logger.hpp"


namespace protolink::schema::grammar {

parser::Result Parser::parse_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        PL_WARN("[PROTO] Cannot open source file: " << path << " -> skipped");
        return parser::Result::IoError;
    }
    if (!parse_stream_(in, path)) {
        PL_WARN("[PROTO] Read error in source file: " << path << " -> remaining content skipped");
        return parser::Result::IoError;
    }
    PL_DEBUG("[PROTO] Parsed source file: " << path << " (registry size=" << registry_.size() << ")");
    return parser::Result::Parsed;
}

void Parser::parse_text(std::string_view text, std::string_view origin) {
    std::istringstream in{std::string(text)};
    (void)parse_stream_(in, origin);
}

bool Parser::parse_stream_(std::istream& in, std::string_view origin) {
    begin_source_();
    std::string line;
    while (std::getline(in, line)) {
        // Line terminators may be CRLF
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        parse_line_(line);
    }
    const bool ok = !in.bad();
    end_source_(origin);
    return ok;
}

void Parser::begin_source_() noexcept {
    current_.reset();
    depth_ = 0;
    awaiting_open_ = false;
}

void Parser::end_source_(std::string_view origin) {
    if (current_) {
        PL_WARN("[PROTO] Message '" << current_->name << "' not closed at end of " << origin << " -> discarded");
        current_.reset();
    }
    depth_ = 0;
    awaiting_open_ = false;
}

void Parser::parse_line_(std::string_view line) {
    const LineMatch m = classify(line);

    switch (m.kind) {
        case LineKind::Blank:
        case LineKind::Comment:
            return;
        case LineKind::MessageHeader: {
            if (current_) {
                PL_DEBUG("[PROTO] Message '" << current_->name << "' interrupted by header of '" << m.name << "' -> discarded");
            }
            current_ = Message{.name = std::string(m.name)};
            depth_ = brace_delta(line);
            awaiting_open_ = (depth_ == 0);
            if (awaiting_open_) {
                depth_ = 1; // opening brace on a following line
            }
            return;
        }
        default:
            break;
    }

    if (!current_) {
        return; // outside any message body
    }

    int delta = brace_delta(line);
    if (awaiting_open_ && line.find('{') != std::string_view::npos) {
        --delta; // first '{' already accounted for by the header
        awaiting_open_ = false;
    }
    depth_ += delta;

    if (m.kind == LineKind::MapField) {
        add_map_field_(m);
    }
    else if (m.kind == LineKind::Field) {
        add_field_(m);
    }

    if (depth_ <= 0) {
        PL_TRACE("[PROTO] Message '" << current_->name << "' finalized with " << current_->fields.size() << " field(s)");
        std::string name = current_->name;
        registry_[std::move(name)] = std::move(*current_);
        current_.reset();
    }
}

void Parser::add_map_field_(const LineMatch& m) {
    const std::string field_name(m.name);
    const std::string entry_name = map_entry_name(current_->name, field_name);

    const auto key_type = normalize_type_name(m.key_type);
    const auto value_type = normalize_type_name(m.value_type);

    // Synthetic entry message: key (tag 1), value (tag 2)
    Message entry{.name = entry_name};
    entry.fields.reserve(2);

    Field key{.name = "key", .tag = 1};
    if (!canonicalize(key_type, key.type)) {
        PL_WARN("[PROTO] Unsupported map key type '" << m.key_type << "' degraded to string (field="
                << current_->name << "." << field_name << ")");
        key.type = FieldType::String;
    }
    entry.fields.push_back(std::move(key));

    Field value{.name = "value", .tag = 2};
    if (!canonicalize(value_type, value.type)) {
        value.type = FieldType::Message;
        value.type_name = std::string(value_type);
    }
    entry.fields.push_back(std::move(value));

    // An already registered entry of the same name is kept
    registry_.try_emplace(entry_name, std::move(entry));

    // On the wire the map is a repeated entry message
    current_->fields.push_back(Field{
        .name      = field_name,
        .type      = FieldType::Message,
        .tag       = parse_tag(m.tag),
        .repeated  = true,
        .type_name = entry_name
    });
}

void Parser::add_field_(const LineMatch& m) {
    Field field{
        .name     = std::string(m.name),
        .tag      = parse_tag(m.tag),
        .repeated = m.repeated
    };
    if (!canonicalize(m.type, field.type)) {
        field.type = FieldType::Message;
        field.type_name = std::string(normalize_type_name(m.type));
    }
    if (field.tag == 0 && m.tag.find_first_not_of('0') != std::string_view::npos) {
        PL_DEBUG("[PROTO] Field '" << current_->name << "." << field.name << "' has tag '" << m.tag << "' out of range -> tag 0");
    }
    current_->fields.push_back(std::move(field));
}

} // namespace protolink::schema::grammar
