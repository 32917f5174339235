#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>

#include "protolink/schema/document.hpp"
#include "protolink/schema/message.hpp"
#include "protolink/schema/options.hpp"


namespace protolink::schema {

/*
================================================================================
Schema Builder
================================================================================

Turns a message registry plus the server/client route mappings into a
versioned Schema.

  • Routes are processed in ascending route order; a route whose message is
    not registered is logged and skipped (never fails the build)
  • Fields are emitted in ascending tag order (stable: equal tags keep
    registry order) as "<modifier> <type> <name>" -> tag
  • Every message reachable through `message` fields is collected into the
    route's nested dictionary, once per name. A visited set cuts cycles and a
    depth cap of max(config::MAX_NESTED_DEPTH, registry size) bounds the walk,
    so acyclic chains always resolve completely
  • Global-message mode merges all nested dictionaries (server routes first,
    then client routes; first seen wins, differing duplicates are reported)
    and strips them from the routes
  • version > 0 is used verbatim, otherwise it is derived from content

The builder never mutates the registry and keeps no state between builds.
================================================================================
*/

using RouteMap = std::map<std::string, std::string>;

class Builder {
public:
    explicit Builder(const Registry& registry) noexcept
        : registry_(registry)
    {}

    [[nodiscard]]
    Schema build(const RouteMap& server_routes,
                 const RouteMap& client_routes,
                 bool global_messages,
                 std::int64_t configured_version) const;

    [[nodiscard]]
    inline Schema build(const Options& opts) const {
        return build(opts.server_routes, opts.client_routes, opts.global_messages, opts.version);
    }

    // Route schema of one registered message. Returns false if the message
    // is unknown.
    [[nodiscard]]
    bool build_route(std::string_view message_name, RouteSchema& out) const;

    // Field entries of one message, ascending tag order
    [[nodiscard]]
    static MessageSchema build_message(const Message& msg);

private:
    using Visited = std::unordered_set<std::string>;

    void build_routes_(const RouteMap& routes, RouteTable& out, std::string_view side) const;

    void collect_nested_(const std::string& name, MessageTable& out, Visited& visited, std::size_t depth) const;

    [[nodiscard]]
    std::size_t depth_cap_() const noexcept;

    static void merge_global_(RouteTable& routes, MessageTable& global);

private:
    const Registry& registry_;
};

} // namespace protolink::schema
