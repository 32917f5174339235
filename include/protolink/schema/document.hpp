#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>


namespace protolink::schema {

/*
===============================================================================
Compiled schema document
===============================================================================

  {
    "version": 1234,
    "server": {
      "<route>": {
        "optional uInt32 code": 1,
        "repeated message Hero heroes": 2,
        "__messages__": {
          "Hero": { "optional int32 configId": 1, "optional string name": 2 }
        }
      }
    },
    "client": { ... },
    "__messages__": { ... }          (global-message mode only)
  }

A message schema is an ordered list of (field key -> tag) entries. A route
schema holds its own entries plus the nested definitions reachable from it;
the two shapes are kept as distinct members and only merged at serialization
time under the reserved "__messages__" key.
===============================================================================
*/

// -----------------------------------------------------------------------------
// MessageSchema: field key -> tag, in emission (ascending tag) order
// -----------------------------------------------------------------------------
class MessageSchema {
public:
    struct Entry {
        std::string key;
        std::int64_t tag = 0;

        bool operator==(const Entry&) const = default;
    };

    // Last write wins. A rewritten key moves to the end so that emission
    // order keeps following the order of writes.
    void set(std::string key, std::int64_t tag);

    [[nodiscard]]
    bool find(std::string_view key, std::int64_t& tag) const noexcept;

    [[nodiscard]]
    inline bool contains(std::string_view key) const noexcept {
        std::int64_t ignored = 0;
        return find(key, ignored);
    }

    [[nodiscard]] inline const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return entries_.empty(); }

    bool operator==(const MessageSchema&) const = default;

private:
    std::vector<Entry> entries_;
};

using MessageTable = std::map<std::string, MessageSchema>;

// -----------------------------------------------------------------------------
// RouteSchema: own fields + nested definitions (empty in global mode)
// -----------------------------------------------------------------------------
struct RouteSchema {
    MessageSchema fields{};
    MessageTable nested{};

    bool operator==(const RouteSchema&) const = default;
};

using RouteTable = std::map<std::string, RouteSchema>;

// -----------------------------------------------------------------------------
// Schema
// -----------------------------------------------------------------------------
struct Schema {
    std::int64_t version = 0;
    RouteTable server{};
    RouteTable client{};
    MessageTable messages{};   // global dictionary (global-message mode only)

    bool operator==(const Schema&) const = default;
};

// ============================================================================
// JSON serialization (compact, deterministic)
// ============================================================================
//
// Route and message dictionaries are emitted in ascending key order, field
// entries in emission order. The "__messages__" keys are only written when
// the corresponding dictionary is non-empty.

void write_json(std::string& out, const MessageSchema& msg);
void write_json(std::string& out, const RouteSchema& route);
void write_json(std::string& out, const Schema& schema);

// Full document, version included
[[nodiscard]]
std::string to_json(const Schema& schema);

// Hash input: {"server":…,"client":…[,"__messages__":…]} (version excluded)
[[nodiscard]]
std::string to_content_json(const Schema& schema);

} // namespace protolink::schema
