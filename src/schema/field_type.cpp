#include "protolink/schema/field_type.hpp"

#include <array>
#include <utility>


namespace protolink::schema {

namespace {

constexpr std::array<std::pair<std::string_view, FieldType>, 15> TYPE_TABLE{{
    {"string",   FieldType::String},
    {"bool",     FieldType::Bool},
    {"int32",    FieldType::Int32},
    {"uint32",   FieldType::UInt32},
    {"sint32",   FieldType::SInt32},
    {"int64",    FieldType::Int64},
    {"uint64",   FieldType::UInt64},
    {"sint64",   FieldType::SInt64},
    {"float",    FieldType::Float},
    {"double",   FieldType::Double},
    {"bytes",    FieldType::Bytes},
    {"fixed32",  FieldType::UInt32},
    {"fixed64",  FieldType::UInt64},
    {"sfixed32", FieldType::Int32},
    {"sfixed64", FieldType::Int64},
}};

} // namespace


bool canonicalize(std::string_view token, FieldType& out) noexcept {
    for (const auto& [name, type] : TYPE_TABLE) {
        if (name == token) {
            out = type;
            return true;
        }
    }
    return false;
}

std::string_view normalize_type_name(std::string_view token) noexcept {
    const auto pos = token.rfind('.');
    if (pos == std::string_view::npos) {
        return token;
    }
    return token.substr(pos + 1);
}

} // namespace protolink::schema
