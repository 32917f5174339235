#include "protolink/schema/message.hpp"


namespace protolink::schema {

std::string Field::key() const {
    const std::string_view modifier_sv = to_string(modifier());
    std::string out;
    out.reserve(modifier_sv.size() + name.size() + type_name.size() + 16);
    out.append(modifier_sv);
    out += ' ';
    if (type == FieldType::Message) {
        out.append(to_string(FieldType::Message));
        out += ' ';
        out.append(type_name);
    }
    else {
        out.append(to_string(type));
    }
    out += ' ';
    out.append(name);
    return out;
}

} // namespace protolink::schema
