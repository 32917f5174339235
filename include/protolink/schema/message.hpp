#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "protolink/schema/field_type.hpp"


namespace protolink::schema {

// -----------------------------------------------------------------------------
// Field
// -----------------------------------------------------------------------------
// `type_name` is only meaningful when `type == FieldType::Message`.
// Tags are not validated for uniqueness.
struct Field {
    std::string name;
    FieldType type = FieldType::String;
    std::int64_t tag = 0;
    bool repeated = false;
    std::string type_name{};

    [[nodiscard]]
    inline Modifier modifier() const noexcept {
        return repeated ? Modifier::Repeated : Modifier::Optional;
    }

    // "<modifier> <type> <name>", e.g. "optional uInt32 code",
    // "repeated message Item items"
    [[nodiscard]]
    std::string key() const;
};

// -----------------------------------------------------------------------------
// Message
// -----------------------------------------------------------------------------
// Fields keep source insertion order (independent of tag order); duplicates
// are preserved verbatim.
struct Message {
    std::string name;
    std::vector<Field> fields{};
};

// Message registry (name -> message), owned by one compile run.
using Registry = std::map<std::string, Message>;

// Synthetic map entry message name: "<Owner>_<field>Entry"
[[nodiscard]]
inline std::string map_entry_name(const std::string& owner, const std::string& field) {
    return owner + "_" + field + "Entry";
}

} // namespace protolink::schema
