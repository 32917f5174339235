#include "protolink/schema/document.hpp"

#include <algorithm>

#include "protolink/config/protocol.hpp"
#include "lcr/json.hpp"


namespace protolink::schema {

// -----------------------------------------------------------------------------
// MessageSchema
// -----------------------------------------------------------------------------

void MessageSchema::set(std::string key, std::int64_t tag) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
        return e.key == key;
    });
    if (it != entries_.end()) {
        entries_.erase(it);
    }
    entries_.push_back(Entry{.key = std::move(key), .tag = tag});
}

bool MessageSchema::find(std::string_view key, std::int64_t& tag) const noexcept {
    for (const auto& e : entries_) {
        if (e.key == key) {
            tag = e.tag;
            return true;
        }
    }
    return false;
}

// -----------------------------------------------------------------------------
// JSON
// -----------------------------------------------------------------------------

namespace {

void write_entries_(std::string& out, const MessageSchema& msg, bool& first) {
    for (const auto& e : msg.entries()) {
        if (!first) out += ',';
        first = false;
        lcr::json::append_key(out, e.key);
        lcr::json::append(out, e.tag);
    }
}

void write_message_table_(std::string& out, const MessageTable& table) {
    out += '{';
    bool first = true;
    for (const auto& [name, msg] : table) {
        if (!first) out += ',';
        first = false;
        lcr::json::append_key(out, name);
        write_json(out, msg);
    }
    out += '}';
}

void write_route_table_(std::string& out, const RouteTable& table) {
    out += '{';
    bool first = true;
    for (const auto& [route, schema] : table) {
        if (!first) out += ',';
        first = false;
        lcr::json::append_key(out, route);
        write_json(out, schema);
    }
    out += '}';
}

void write_content_(std::string& out, const Schema& schema) {
    lcr::json::append_key(out, "server");
    write_route_table_(out, schema.server);
    out += ',';
    lcr::json::append_key(out, "client");
    write_route_table_(out, schema.client);
    if (!schema.messages.empty()) {
        out += ',';
        lcr::json::append_key(out, config::MESSAGES_KEY);
        write_message_table_(out, schema.messages);
    }
}

} // namespace

void write_json(std::string& out, const MessageSchema& msg) {
    out += '{';
    bool first = true;
    write_entries_(out, msg, first);
    out += '}';
}

void write_json(std::string& out, const RouteSchema& route) {
    out += '{';
    bool first = true;
    write_entries_(out, route.fields, first);
    if (!route.nested.empty()) {
        if (!first) out += ',';
        lcr::json::append_key(out, config::MESSAGES_KEY);
        write_message_table_(out, route.nested);
    }
    out += '}';
}

void write_json(std::string& out, const Schema& schema) {
    out += '{';
    lcr::json::append_key(out, "version");
    lcr::json::append(out, schema.version);
    out += ',';
    write_content_(out, schema);
    out += '}';
}

std::string to_json(const Schema& schema) {
    std::string out;
    out.reserve(256);
    write_json(out, schema);
    return out;
}

std::string to_content_json(const Schema& schema) {
    std::string out;
    out.reserve(256);
    out += '{';
    write_content_(out, schema);
    out += '}';
    return out;
}

} // namespace protolink::schema
