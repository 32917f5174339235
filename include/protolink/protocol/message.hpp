#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "protolink/protocol/packet.hpp"


namespace protolink::protocol::message {

// ===============================================
// MESSAGE TYPE
// ===============================================
enum class Type : std::uint8_t {
    Request  = 0,
    Notify   = 1,
    Response = 2,
    Push     = 3
};

[[nodiscard]]
inline constexpr std::string_view to_string(Type t) noexcept {
    switch (t) {
        case Type::Request:  return "Request";
        case Type::Notify:   return "Notify";
        case Type::Response: return "Response";
        case Type::Push:     return "Push";
        default:             return "Unknown";
    }
}

// ===============================================
// MESSAGE ENVELOPE (body of a Data packet)
// ===============================================
struct Message {
    Type type = Type::Request;
    std::uint64_t id = 0;
    std::string route{};
    Bytes data{};
};

// ===============================================
// ROUTE
// ===============================================
//
// "nodeType.handleName.method" or "handleName.method" (local node).
// Every segment must be non-empty.
struct Route {
    std::string node_type{};
    std::string handle_name{};
    std::string method{};

    [[nodiscard]]
    static bool parse(std::string_view route, Route& out);

    [[nodiscard]]
    std::string to_string() const;

    bool operator==(const Route&) const = default;
};

// ===============================================
// CODEC CONCEPT
// ===============================================
template<class C>
concept CodecConcept =
    requires(const C& codec, std::span<const std::uint8_t> in, Message& msg, std::string_view route, Route& r) {
        { codec.decode(in, msg) } -> std::same_as<bool>;
        { codec.decode_route(route, r) } -> std::same_as<bool>;
    };

} // namespace protolink::protocol::message
