#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "protolink/parser/result.hpp"


namespace protolink::schema {

/*
===============================================================================
Schema compiler options
===============================================================================

  files            explicit .proto paths, processed first and in order
  dir              directory scanned recursively for *.proto files
  version          explicit schema version; 0 = derive from content
  global_messages  merge nested definitions into one top-level dictionary
  server_routes    route -> message name (server -> client messages)
  client_routes    route -> message name (client -> server messages)

No sources configured means the feature is disabled, not an error.
===============================================================================
*/
struct Options {
    std::vector<std::string> files{};
    std::string dir{};
    std::int64_t version = 0;
    bool global_messages = false;
    std::map<std::string, std::string> server_routes{};
    std::map<std::string, std::string> client_routes{};

    [[nodiscard]]
    inline bool has_proto_config() const noexcept {
        return !dir.empty() || !files.empty();
    }

    void dump(std::ostream& os) const;
};

// -----------------------------------------------------------------------------
// JSON configuration
// -----------------------------------------------------------------------------
//
//   {
//     "files":          ["a.proto", "b.proto"],
//     "dir":            "protos",
//     "version":        0,
//     "globalMessages": false,
//     "server":         { "connector.entryHandler.entry": "EntryResponse" },
//     "client":         { "connector.entryHandler.entry": "EntryRequest" }
//   }
//
// Every key is optional. Keys present in the document overwrite the
// corresponding member of `out`; absent keys leave it untouched.

[[nodiscard]]
parser::Result load_options(std::string_view json, Options& out);

[[nodiscard]]
parser::Result load_options_file(const std::string& path, Options& out);

} // namespace protolink::schema
