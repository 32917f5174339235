#include "protolink/schema/options.hpp"

#include <fstream>
#include <sstream>

#include "protolink/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace protolink::schema {

void Options::dump(std::ostream& os) const {
    os << "Schema options:\n  Files           : ";
    for (const auto& f : files) {
        os << f << " ";
    }
    os << "\n  Dir             : " << dir
       << "\n  Version         : " << version << (version > 0 ? "" : " (auto)")
       << "\n  Global messages : " << (global_messages ? "yes" : "no")
       << "\n  Server routes   : " << server_routes.size()
       << "\n  Client routes   : " << client_routes.size() << "\n";
}

parser::Result load_options(std::string_view json, Options& out) {
    using parser::Result;
    namespace helper = parser::helper;

    if (json.empty()) {
        return Result::Ignored;
    }

    simdjson::dom::parser json_parser;
    simdjson::dom::element root;
    auto error = json_parser.parse(json.data(), json.size()).get(root);
    if (error) {
        PL_WARN("[CONFIG] JSON parse error: " << error);
        return Result::InvalidJson;
    }
    if (helper::require_object(root) != Result::Parsed) {
        PL_WARN("[CONFIG] Root is not an object");
        return Result::InvalidSchema;
    }

    // Parse everything into a scratch copy so `out` is untouched on failure
    Options opts = out;
    bool present = false;

    // files (optional)
    auto r = helper::parse_string_list_optional(root, "files", opts.files, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'files' must be an array of strings");
        return r;
    }

    // dir (optional)
    std::string_view dir;
    r = helper::parse_string_optional(root, "dir", dir, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'dir' must be a string");
        return r;
    }
    if (present) {
        opts.dir = std::string(dir);
    }

    // version (optional)
    std::int64_t version = 0;
    r = helper::parse_int64_optional(root, "version", version, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'version' must be an integer");
        return r;
    }
    if (present) {
        if (version < 0) {
            PL_WARN("[CONFIG] Field 'version' must not be negative (" << version << ")");
            return Result::InvalidValue;
        }
        opts.version = version;
    }

    // globalMessages (optional)
    bool global_messages = false;
    r = helper::parse_bool_optional(root, "globalMessages", global_messages, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'globalMessages' must be a boolean");
        return r;
    }
    if (present) {
        opts.global_messages = global_messages;
    }

    // server / client route tables (optional)
    r = helper::parse_string_map_optional(root, "server", opts.server_routes, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'server' must map route names to message names");
        return r;
    }
    r = helper::parse_string_map_optional(root, "client", opts.client_routes, present);
    if (r != Result::Parsed) {
        PL_WARN("[CONFIG] Field 'client' must map route names to message names");
        return r;
    }

    out = std::move(opts);
    return Result::Parsed;
}

parser::Result load_options_file(const std::string& path, Options& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        PL_ERROR("[CONFIG] Cannot open configuration file: " << path);
        return parser::Result::IoError;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        PL_ERROR("[CONFIG] Failed to read configuration file: " << path);
        return parser::Result::IoError;
    }
    const std::string json = ss.str();
    auto r = load_options(json, out);
    if (r == parser::Result::Parsed) {
        PL_INFO("[CONFIG] Loaded schema options from " << path);
    }
    return r;
}

} // namespace protolink::schema
