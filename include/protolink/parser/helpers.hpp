#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "protolink/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the document parsers of this project to extract
primitive values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, string, string collections)
  • Provide explicit optional-field presence signaling

Optional-field semantics:
  • A missing key and an explicit `null` are both reported as "not present"
  • A present key with the wrong type is InvalidSchema

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
================================================================================
*/


namespace protolink::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// Looks up `key` in `parent`. Returns false when the key is missing or null.
[[nodiscard]]
inline bool lookup_(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (parent[key].get(out)) {
        return false;
    }
    return !out.is_null();
}

// ------------------------------------------------------------
// OPTIONAL OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!lookup_(parent, key, out)) {
        return Result::Parsed; // optional, not present
    }
    if (require_object(out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    out = std::string_view{};
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::int64_t& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, bool& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// OPTIONAL STRING LIST (strict: every element must be a string)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out, bool& present) {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return Result::InvalidSchema;
    }
    std::vector<std::string> values;
    values.reserve(arr.size());
    for (auto item : arr) {
        std::string_view sv;
        if (item.get(sv)) {
            return Result::InvalidSchema;
        }
        values.emplace_back(sv);
    }
    out = std::move(values);
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// OPTIONAL STRING MAP (strict: every value must be a string)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_map_optional(const simdjson::dom::element& obj, const char* key, std::map<std::string, std::string>& out, bool& present) {
    present = false;
    simdjson::dom::element field;
    auto r = parse_object_optional(obj, key, field, present);
    if (r != Result::Parsed || !present) {
        return r;
    }
    present = false;
    simdjson::dom::object map;
    if (field.get(map)) {
        return Result::InvalidSchema;
    }
    std::map<std::string, std::string> values;
    for (auto [k, v] : map) {
        std::string_view sv;
        if (v.get(sv)) {
            return Result::InvalidSchema;
        }
        values[std::string(k)] = std::string(sv);
    }
    out = std::move(values);
    present = true;
    return Result::Parsed;
}

} // namespace protolink::parser::helper
