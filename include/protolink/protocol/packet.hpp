#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>


namespace protolink::protocol {

using Bytes = std::vector<std::uint8_t>;

namespace packet {

/*
================================================================================
Packet framing
================================================================================

  +--------+-------------------------+----------------------+
  | type   | body length (3 bytes,   | body                 |
  | 1 byte | big-endian)             | (length bytes)       |
  +--------+-------------------------+----------------------+

A packet body is at most config::PACKET_MAX_BODY_SIZE bytes.
================================================================================
*/

// ===============================================
// PACKET TYPE
// ===============================================
enum class Type : std::uint8_t {
    None         = 0,
    Handshake    = 1,   // client -> server: handshake request / server -> client: response
    HandshakeAck = 2,   // client -> server: handshake accepted
    Heartbeat    = 3,
    Data         = 4,   // application message envelope
    Kick         = 5    // server -> client: disconnect notice
};

[[nodiscard]]
inline constexpr std::string_view to_string(Type t) noexcept {
    switch (t) {
        case Type::None:         return "None";
        case Type::Handshake:    return "Handshake";
        case Type::HandshakeAck: return "HandshakeAck";
        case Type::Heartbeat:    return "Heartbeat";
        case Type::Data:         return "Data";
        case Type::Kick:         return "Kick";
        default:                 return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_valid(Type t) noexcept {
    return t >= Type::Handshake && t <= Type::Kick;
}

// ===============================================
// CODEC ERROR
// ===============================================
enum class Error : std::uint8_t {
    None,
    InvalidType,       // Type byte outside [Handshake, Kick]
    PayloadTooLarge,   // Body does not fit the 24-bit length field
    Truncated          // Fewer bytes than header + declared body length
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:            return "None";
        case Error::InvalidType:     return "InvalidType";
        case Error::PayloadTooLarge: return "PayloadTooLarge";
        case Error::Truncated:       return "Truncated";
        default:                     return "Unknown";
    }
}

// ===============================================
// PACKET
// ===============================================
struct Packet {
    Type type = Type::None;
    Bytes data{};
};

// ===============================================
// CODEC CONCEPT
// ===============================================
template<class C>
concept CodecConcept =
    requires(const C& codec, Type type, std::span<const std::uint8_t> in, Bytes& out, Packet& pkt) {
        { codec.encode(type, in, out) } -> std::same_as<Error>;
        { codec.decode(in, pkt) } -> std::same_as<Error>;
    };

// ===============================================
// DEFAULT CODEC
// ===============================================
class Codec {
public:
    // Frames `body` into `out` (replaces its content). `out` is untouched on error.
    [[nodiscard]]
    Error encode(Type type, std::span<const std::uint8_t> body, Bytes& out) const;

    // Decodes the first packet of `in`. Bytes past the declared body length
    // are not consumed. `pkt` is untouched on error.
    [[nodiscard]]
    Error decode(std::span<const std::uint8_t> in, Packet& pkt) const;
};

static_assert(CodecConcept<Codec>);

} // namespace packet
} // namespace protolink::protocol
