#include "protolink/protocol/packet.hpp"

#include "protolink/config/protocol.hpp"


namespace protolink::protocol::packet {

Error Codec::encode(Type type, std::span<const std::uint8_t> body, Bytes& out) const {
    if (!is_valid(type)) {
        return Error::InvalidType;
    }
    if (body.size() > config::PACKET_MAX_BODY_SIZE) {
        return Error::PayloadTooLarge;
    }

    const auto len = static_cast<std::uint32_t>(body.size());
    Bytes frame;
    frame.reserve(config::PACKET_HEADER_SIZE + body.size());
    frame.push_back(static_cast<std::uint8_t>(type));
    frame.push_back(static_cast<std::uint8_t>((len >> 16) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(len & 0xFF));
    frame.insert(frame.end(), body.begin(), body.end());

    out = std::move(frame);
    return Error::None;
}

Error Codec::decode(std::span<const std::uint8_t> in, Packet& pkt) const {
    if (in.size() < config::PACKET_HEADER_SIZE) {
        return Error::Truncated;
    }

    const auto type = static_cast<Type>(in[0]);
    if (!is_valid(type)) {
        return Error::InvalidType;
    }

    const std::size_t len = (static_cast<std::size_t>(in[1]) << 16)
                          | (static_cast<std::size_t>(in[2]) << 8)
                          |  static_cast<std::size_t>(in[3]);
    if (in.size() - config::PACKET_HEADER_SIZE < len) {
        return Error::Truncated;
    }

    const auto body = in.subspan(config::PACKET_HEADER_SIZE, len);
    pkt.type = type;
    pkt.data.assign(body.begin(), body.end());
    return Error::None;
}

} // namespace protolink::protocol::packet
