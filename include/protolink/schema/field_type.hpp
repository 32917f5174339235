#pragma once

#include <cstdint>
#include <string_view>


namespace protolink::schema {

// ===============================================================
// FIELD TYPE ENUM (closed set)
// ===============================================================
enum class FieldType : std::uint8_t {
    String,
    Bool,
    Int32,
    UInt32,
    SInt32,
    Int64,
    UInt64,
    SInt64,
    Float,
    Double,
    Bytes,
    Message     // reference to another compiled message (by name)
};

// ------------------------------------------------------------
// FieldType → wire spelling (as emitted in field keys)
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(FieldType t) noexcept {
    switch (t) {
        case FieldType::String:  return "string";
        case FieldType::Bool:    return "bool";
        case FieldType::Int32:   return "int32";
        case FieldType::UInt32:  return "uInt32";
        case FieldType::SInt32:  return "sInt32";
        case FieldType::Int64:   return "int64";
        case FieldType::UInt64:  return "uInt64";
        case FieldType::SInt64:  return "sInt64";
        case FieldType::Float:   return "float";
        case FieldType::Double:  return "double";
        case FieldType::Bytes:   return "bytes";
        case FieldType::Message: return "message";
    }
    return "unknown";
}


// ===============================================================
// FIELD MODIFIER ENUM
// ===============================================================
// Required is part of the model but the compiler only ever emits
// Optional or Repeated.
enum class Modifier : std::uint8_t {
    Required,
    Optional,
    Repeated
};

[[nodiscard]]
inline constexpr std::string_view to_string(Modifier m) noexcept {
    switch (m) {
        case Modifier::Required: return "required";
        case Modifier::Optional: return "optional";
        case Modifier::Repeated: return "repeated";
    }
    return "unknown";
}


// ===============================================================
// TYPE MAPPER
// ===============================================================

// Maps a raw scalar type token onto the canonical field type.
// Synonyms fold onto the nearest canonical type (fixed32 -> uInt32, ...).
// Returns false for unknown tokens: the caller treats them as references
// to other messages. Never fails otherwise.
[[nodiscard]]
bool canonicalize(std::string_view token, FieldType& out) noexcept;

// Strips a dotted package qualifier: "pkg.sub.Name" -> "Name".
[[nodiscard]]
std::string_view normalize_type_name(std::string_view token) noexcept;

} // namespace protolink::schema
