#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>

#include "protolink/protocol/packet.hpp"


namespace protolink::protocol::agent {

// ===============================================
// CONNECTION STATE
// ===============================================
//
// Init -> WaitAck -> Working -> Closed
//
// Init and Closed are owned by the connection object. The command layer
// only moves an agent to WaitAck (handshake received) and Working
// (handshake acknowledged).
enum class State : std::uint8_t {
    Init,
    WaitAck,
    Working,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Init:    return "Init";
        case State::WaitAck: return "WaitAck";
        case State::Working: return "Working";
        case State::Closed:  return "Closed";
        default:             return "Unknown";
    }
}

// ===============================================
// AGENT CONCEPT (one client connection)
// ===============================================
template<class A>
concept AgentConcept =
    requires(A& agent, const A& cagent, State state, const Bytes& bytes) {
        { cagent.sid() } -> std::convertible_to<std::string_view>;
        { cagent.uid() } -> std::convertible_to<std::int64_t>;
        { cagent.remote_addr() } -> std::convertible_to<std::string_view>;
        { cagent.state() } -> std::same_as<State>;
        { agent.set_state(state) };
        { agent.send_raw(bytes) } -> std::same_as<bool>;
    };

} // namespace protolink::protocol::agent
