#include "protolink/schema/builder.hpp"

#include <algorithm>
#include <vector>

#include "protolink/config/protocol.hpp"
#include "protolink/schema/version.hpp"
#include "lcr/log/logger.hpp"


namespace protolink::schema {

namespace {

[[nodiscard]]
std::vector<const Field*> sorted_by_tag_(const Message& msg) {
    std::vector<const Field*> sorted;
    sorted.reserve(msg.fields.size());
    for (const auto& f : msg.fields) {
        sorted.push_back(&f);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Field* a, const Field* b) {
        return a->tag < b->tag;
    });
    return sorted;
}

} // namespace


Schema Builder::build(const RouteMap& server_routes,
                      const RouteMap& client_routes,
                      bool global_messages,
                      std::int64_t configured_version) const
{
    Schema schema;

    build_routes_(server_routes, schema.server, "server");
    build_routes_(client_routes, schema.client, "client");

    if (global_messages) {
        MessageTable global;
        merge_global_(schema.server, global);
        merge_global_(schema.client, global);
        schema.messages = std::move(global);
    }

    if (configured_version > 0) {
        schema.version = configured_version;
    }
    else {
        schema.version = version::compute(schema);
    }

    PL_DEBUG("[PROTO] Schema built: version=" << schema.version
             << ", server routes=" << schema.server.size()
             << ", client routes=" << schema.client.size()
             << ", global messages=" << schema.messages.size());
    return schema;
}

bool Builder::build_route(std::string_view message_name, RouteSchema& out) const {
    auto it = registry_.find(std::string(message_name));
    if (it == registry_.end()) {
        return false;
    }
    const Message& msg = it->second;

    RouteSchema route;
    route.fields = build_message(msg);
    Visited visited;
    for (const Field* field : sorted_by_tag_(msg)) {
        if (field->type == FieldType::Message) {
            collect_nested_(field->type_name, route.nested, visited, 1);
        }
    }
    out = std::move(route);
    return true;
}

MessageSchema Builder::build_message(const Message& msg) {
    MessageSchema schema;
    for (const Field* field : sorted_by_tag_(msg)) {
        schema.set(field->key(), field->tag);
    }
    return schema;
}

void Builder::build_routes_(const RouteMap& routes, RouteTable& out, std::string_view side) const {
    for (const auto& [route, message_name] : routes) {
        RouteSchema schema;
        if (!build_route(message_name, schema)) {
            PL_WARN("[PROTO] Message for " << side << " route not found: route=" << route << ", message=" << message_name << " -> skipped");
            continue;
        }
        out[route] = std::move(schema);
    }
}

// A chain of distinct messages is never longer than the registry
std::size_t Builder::depth_cap_() const noexcept {
    return std::max(config::MAX_NESTED_DEPTH, registry_.size());
}

void Builder::collect_nested_(const std::string& name, MessageTable& out, Visited& visited, std::size_t depth) const {
    if (depth > depth_cap_()) {
        PL_WARN("[PROTO] Nested message depth limit (" << depth_cap_() << ") reached at '" << name << "' -> not descending");
        return;
    }
    if (!visited.insert(name).second) {
        return; // already collected (or being collected: cycle)
    }
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return;
    }
    const Message& msg = it->second;

    for (const Field* field : sorted_by_tag_(msg)) {
        if (field->type == FieldType::Message) {
            collect_nested_(field->type_name, out, visited, depth + 1);
        }
    }
    out.try_emplace(name, build_message(msg));
}

void Builder::merge_global_(RouteTable& routes, MessageTable& global) {
    for (auto& [route, schema] : routes) {
        for (auto& [name, msg] : schema.nested) {
            auto [it, inserted] = global.try_emplace(name, msg);
            if (!inserted && !(it->second == msg)) {
                PL_WARN("[PROTO] Global message conflict: " << name << " (route=" << route << ") -> first definition kept");
            }
        }
        schema.nested.clear();
    }
}

} // namespace protolink::schema
