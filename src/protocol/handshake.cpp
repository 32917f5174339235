#include "protolink/protocol/handshake.hpp"

#include "protolink/config/protocol.hpp"
#include "protolink/parser/helpers.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace protolink::protocol::handshake {

parser::Result parse_client(std::string_view json, ClientHandshake& out) {
    using parser::Result;
    namespace helper = parser::helper;

    if (json.empty()) {
        return Result::Ignored;
    }

    simdjson::dom::parser json_parser;
    simdjson::dom::element root;
    auto error = json_parser.parse(json.data(), json.size()).get(root);
    if (error) {
        PL_DEBUG("[HANDSHAKE] JSON parse error: " << error);
        return Result::InvalidJson;
    }
    if (helper::require_object(root) != Result::Parsed) {
        PL_DEBUG("[HANDSHAKE] Root is not an object");
        return Result::InvalidSchema;
    }

    ClientHandshake hs;
    bool present = false;

    // user (optional)
    simdjson::dom::element user;
    auto r = helper::parse_object_optional(root, "user", user, present);
    if (r != Result::Parsed) {
        PL_DEBUG("[HANDSHAKE] Field 'user' must be an object");
        return r;
    }
    hs.has_user = present;

    // sys (optional)
    simdjson::dom::element sys;
    r = helper::parse_object_optional(root, "sys", sys, present);
    if (r != Result::Parsed) {
        PL_DEBUG("[HANDSHAKE] Field 'sys' must be an object");
        return r;
    }
    if (present) {
        std::string_view sv;
        r = helper::parse_string_optional(sys, "type", sv, present);
        if (r != Result::Parsed) {
            PL_DEBUG("[HANDSHAKE] Field 'sys.type' must be a string");
            return r;
        }
        hs.type = std::string(sv);

        r = helper::parse_string_optional(sys, "version", sv, present);
        if (r != Result::Parsed) {
            PL_DEBUG("[HANDSHAKE] Field 'sys.version' must be a string");
            return r;
        }
        hs.version = std::string(sv);

        r = helper::parse_int64_optional(sys, "protoVersion", hs.proto_version, present);
        if (r != Result::Parsed) {
            PL_DEBUG("[HANDSHAKE] Field 'sys.protoVersion' must be an integer");
            return r;
        }
        if (!present) {
            hs.proto_version = 0;
        }

        simdjson::dom::element rsa;
        r = helper::parse_object_optional(sys, "rsa", rsa, present);
        if (r != Result::Parsed) {
            PL_DEBUG("[HANDSHAKE] Field 'sys.rsa' must be an object");
            return r;
        }
        hs.has_rsa = present;
    }

    out = std::move(hs);
    return Result::Parsed;
}

void write_response(std::string& out, const Config& cfg, const schema::Schema* protos) {
    using namespace lcr::json;

    out += '{';
    append_key(out, "code");
    append(out, static_cast<std::int64_t>(config::HANDSHAKE_OK_CODE));
    out += ',';
    append_key(out, "sys");
    out += '{';

    append_key(out, "dict");
    out += '{';
    bool first = true;
    for (const auto& [route, code] : cfg.dict) {
        if (!first) {
            out += ',';
        }
        first = false;
        append_key(out, route);
        append(out, static_cast<std::uint64_t>(code));
    }
    out += '}';

    out += ',';
    append_key(out, "heartbeat");
    append(out, static_cast<std::int64_t>(cfg.heartbeat.count()));

    if (protos != nullptr) {
        out += ',';
        append_key(out, "protos");
        schema::write_json(out, *protos);
    }

    out += ',';
    append_key(out, "serializer");
    append_string(out, cfg.serializer);

    out += "}}";
}

} // namespace protolink::protocol::handshake
