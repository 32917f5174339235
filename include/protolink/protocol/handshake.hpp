#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "protolink/parser/result.hpp"
#include "protolink/protocol/config.hpp"
#include "protolink/schema/document.hpp"


namespace protolink::protocol::handshake {

/*
================================================================================
Handshake documents
================================================================================

Client request (Handshake packet body):

  {
    "sys":  { "type": "js-websocket", "version": "0.0.1",
              "protoVersion": 1234, "rsa": { ... } },
    "user": { ... }
  }

Every member is optional. protoVersion is the schema version the client has
cached (0 or absent: nothing cached).

Server response (Handshake packet body), keys in ascending order:

  {
    "code": 200,
    "sys": {
      "dict":       { "<route>": <code>, ... },
      "heartbeat":  <seconds>,
      "protos":     { "version": N, "server": {...}, "client": {...} },
      "serializer": "<name>"
    }
  }

"protos" is written only when a schema is supplied (the full response). The
lean response is the same document without it.
================================================================================
*/

struct ClientHandshake {
    std::string type{};
    std::string version{};
    std::int64_t proto_version = 0;
    bool has_rsa = false;
    bool has_user = false;
};

// Parses a client handshake body. `out` is untouched unless Parsed.
//   • empty body      -> Ignored
//   • malformed JSON  -> InvalidJson
//   • wrong types     -> InvalidSchema
[[nodiscard]]
parser::Result parse_client(std::string_view json, ClientHandshake& out);

// Appends the response document. `protos` may be null (lean response).
void write_response(std::string& out, const Config& cfg, const schema::Schema* protos);

[[nodiscard]]
inline std::string response_json(const Config& cfg, const schema::Schema* protos) {
    std::string out;
    write_response(out, cfg, protos);
    return out;
}

} // namespace protolink::protocol::handshake
