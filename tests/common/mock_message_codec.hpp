#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "protolink/protocol/message.hpp"


namespace protolink::protocol {

// Plain-text envelope used by the command tests:
//
//   "<route>"            -> Request without payload
//   "<route>\n<payload>" -> Request with payload
//
// An empty body fails to decode.
class MockMessageCodec {
public:
    [[nodiscard]]
    inline bool decode(std::span<const std::uint8_t> in, message::Message& out) const {
        ++decode_calls_;
        if (in.empty()) {
            return false;
        }
        const std::string_view text(reinterpret_cast<const char*>(in.data()), in.size());
        const auto nl = text.find('\n');
        message::Message msg;
        msg.type = message::Type::Request;
        msg.route = std::string(text.substr(0, nl));
        if (nl != std::string_view::npos) {
            const auto payload = in.subspan(nl + 1);
            msg.data.assign(payload.begin(), payload.end());
        }
        out = std::move(msg);
        return true;
    }

    [[nodiscard]]
    inline bool decode_route(std::string_view route, message::Route& out) const {
        return message::Route::parse(route, out);
    }

    [[nodiscard]] inline std::size_t decode_calls() const noexcept { return decode_calls_; }

    // Helper: builds an envelope body
    [[nodiscard]]
    static Bytes envelope(std::string_view route, std::string_view payload = {}) {
        Bytes out(route.begin(), route.end());
        if (!payload.empty()) {
            out.push_back('\n');
            out.insert(out.end(), payload.begin(), payload.end());
        }
        return out;
    }

private:
    mutable std::size_t decode_calls_ = 0;
};

static_assert(message::CodecConcept<MockMessageCodec>);

} // namespace protolink::protocol
