/*
===============================================================================
Session Command Layer
===============================================================================

Owns the protocol-level behavior of every client connection: handshake
negotiation, handshake acknowledgement, heartbeat echo and the gating of
application data behind connection state.

Lifecycle:
  1. Construct with a protocol::Config (heartbeat, route dictionary,
     serializer name, schema compiler options)
  2. Optionally customize: on_packet(), on_data_route(), set_protos()
  3. init(): compiles the schema (when configured), precomputes the handshake
     and heartbeat payloads and fills the default packet handlers
  4. handle(agent, packet) from any number of connection threads

Precomputed payloads (never built per connection):
  • full handshake : {"code":200,"sys":{"dict","heartbeat","protos","serializer"}}
  • lean handshake : same document without "protos"
  • heartbeat      : Heartbeat packet with an empty body

Handshake negotiation:
  A client that declares sys.protoVersion > 0 equal to the current schema
  version receives the lean handshake; every other client (no declaration,
  malformed body, 0, stale version) receives the full one.

Threading model:
  • The handler table is frozen by init() and read-only afterwards
  • The payload snapshot {schema, full, lean, heartbeat} is immutable and
    published through an atomic shared_ptr; set_protos() swaps it as a whole
  • Each handler loads the snapshot exactly once, so the version it compares
    against and the bytes it sends always belong together

The Command is owned by the host; handlers receive it by reference.
===============================================================================
*/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "protolink/parser/result.hpp"
#include "protolink/protocol/agent.hpp"
#include "protolink/protocol/config.hpp"
#include "protolink/protocol/handshake.hpp"
#include "protolink/protocol/message.hpp"
#include "protolink/protocol/packet.hpp"
#include "protolink/schema/compiler.hpp"
#include "protolink/schema/document.hpp"
#include "lcr/log/logger.hpp"


namespace protolink::protocol {

template<
    agent::AgentConcept Agent,
    message::CodecConcept MessageCodec,
    packet::CodecConcept PacketCodec = packet::Codec
>
class Command {

public:
    using PacketFn    = std::function<void(const Command&, Agent&, const packet::Packet&)>;
    using DataRouteFn = std::function<void(const Command&, Agent&, const message::Route&, const message::Message&)>;

    // Immutable payload snapshot
    struct Payloads {
        std::shared_ptr<const schema::Schema> schema{};
        Bytes handshake{};
        Bytes handshake_lean{};
        Bytes heartbeat{};
    };

public:
    explicit Command(Config cfg, MessageCodec message_codec = {}, PacketCodec packet_codec = {})
        : config_(std::move(cfg))
        , message_codec_(std::move(message_codec))
        , packet_codec_(std::move(packet_codec))
    {}

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    // -------------------------------------------------------------------------
    // Customization (before init() only)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline bool on_packet(packet::Type type, PacketFn fn) {
        if (initialized_.load(std::memory_order_acquire)) {
            PL_WARN("[COMMAND] on_packet(" << packet::to_string(type) << ") ignored: command already initialized");
            return false;
        }
        handlers_[type] = std::move(fn);
        return true;
    }

    [[nodiscard]]
    inline bool on_data_route(DataRouteFn fn) {
        if (initialized_.load(std::memory_order_acquire)) {
            PL_WARN("[COMMAND] on_data_route() ignored: command already initialized");
            return false;
        }
        data_route_ = std::move(fn);
        return true;
    }

    // -------------------------------------------------------------------------
    // Initialization
    // -------------------------------------------------------------------------
    //
    // A schema supplied through set_protos() takes precedence over compiling
    // config().proto. A compile failure leaves the command usable without a
    // schema (both handshakes are then identical).
    [[nodiscard]]
    bool init() {
        if (initialized_.load(std::memory_order_acquire)) {
            PL_WARN("[COMMAND] init() called twice -> ignored");
            return false;
        }

        std::shared_ptr<const schema::Schema> protos = pending_schema_;
        if (!protos) {
            protos = compile_protos_();
        }

        auto payloads = make_payloads_(std::move(protos));
        if (!payloads) {
            return false;
        }
        payloads_.store(std::move(payloads), std::memory_order_release);

        install_default_handlers_();
        pending_schema_.reset();
        initialized_.store(true, std::memory_order_release);
        return true;
    }

    [[nodiscard]]
    inline bool initialized() const noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Schema replacement
    // -------------------------------------------------------------------------
    //
    // Before init(): the schema is used instead of compiling config().proto.
    // After init(): payloads are rebuilt and published atomically; handlers
    // already running keep the snapshot they loaded.
    [[nodiscard]]
    bool set_protos(std::shared_ptr<const schema::Schema> protos) {
        if (!protos) {
            PL_WARN("[COMMAND] set_protos() called with a null schema -> ignored");
            return false;
        }
        if (!initialized_.load(std::memory_order_acquire)) {
            pending_schema_ = std::move(protos);
            return true;
        }
        auto payloads = make_payloads_(std::move(protos));
        if (!payloads) {
            return false;
        }
        payloads_.store(std::move(payloads), std::memory_order_release);
        return true;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline std::shared_ptr<const Payloads> payloads() const noexcept {
        return payloads_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::shared_ptr<const schema::Schema> schema() const noexcept {
        auto snapshot = payloads();
        return snapshot ? snapshot->schema : nullptr;
    }

    // 0 when no schema is loaded
    [[nodiscard]]
    inline std::int64_t version() const noexcept {
        auto snapshot = payloads();
        return (snapshot && snapshot->schema) ? snapshot->schema->version : 0;
    }

    [[nodiscard]] inline const Config& config() const noexcept { return config_; }
    [[nodiscard]] inline const MessageCodec& message_codec() const noexcept { return message_codec_; }
    [[nodiscard]] inline const PacketCodec& packet_codec() const noexcept { return packet_codec_; }

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------
    void handle(Agent& agent, const packet::Packet& pkt) const {
        if (!initialized_.load(std::memory_order_acquire)) {
            PL_WARN("[COMMAND] Packet " << packet::to_string(pkt.type) << " received before init() -> dropped");
            return;
        }
        auto it = handlers_.find(pkt.type);
        if (it == handlers_.end() || !it->second) {
            PL_WARN("[COMMAND] " << tag_(agent) << " No handler for packet type "
                    << static_cast<int>(pkt.type) << " (" << packet::to_string(pkt.type) << ") -> ignored");
            return;
        }
        it->second(*this, agent, pkt);
    }

    // -------------------------------------------------------------------------
    // Default handlers
    // -------------------------------------------------------------------------
    void handshake(Agent& agent, const packet::Packet& pkt) const {
        agent.set_state(agent::State::WaitAck);

        auto snapshot = payloads();
        if (!snapshot) {
            return;
        }
        const Bytes* response = &snapshot->handshake;

        if (!pkt.data.empty()) {
            const std::string_view body(reinterpret_cast<const char*>(pkt.data.data()), pkt.data.size());
            handshake::ClientHandshake client;
            if (handshake::parse_client(body, client) == parser::Result::Parsed) {
                const std::int64_t server_version = snapshot->schema ? snapshot->schema->version : 0;
                if (client.proto_version > 0 && client.proto_version == server_version) {
                    response = &snapshot->handshake_lean;
                    PL_DEBUG("[COMMAND] " << tag_(agent) << " Proto version matched (v" << server_version
                             << "), skipping protos download. [address=" << agent.remote_addr() << "]");
                }
                else {
                    PL_DEBUG("[COMMAND] " << tag_(agent) << " Proto version mismatch (client=" << client.proto_version
                             << ", server=" << server_version << "), sending full protos. [address=" << agent.remote_addr() << "]");
                }
            }
        }

        if (!agent.send_raw(*response)) {
            PL_DEBUG("[COMMAND] " << tag_(agent) << " Failed to send handshake response");
            return;
        }
        PL_DEBUG("[COMMAND] " << tag_(agent) << " Request handshake. [address=" << agent.remote_addr() << "]");
    }

    void handshake_ack(Agent& agent, const packet::Packet&) const {
        agent.set_state(agent::State::Working);
        PL_DEBUG("[COMMAND] " << tag_(agent) << " Request handshakeACK. [address=" << agent.remote_addr() << "]");
    }

    void heartbeat(Agent& agent, const packet::Packet&) const {
        auto snapshot = payloads();
        if (!snapshot) {
            return;
        }
        if (!agent.send_raw(snapshot->heartbeat)) {
            PL_DEBUG("[COMMAND] " << tag_(agent) << " Failed to send heartbeat");
        }
    }

    void data(Agent& agent, const packet::Packet& pkt) const {
        const auto state = agent.state();
        if (state != agent::State::Working) {
            PL_DEBUG("[COMMAND] " << tag_(agent) << " Data dropped: state is not Working. [state=" << agent::to_string(state) << "]");
            return;
        }

        message::Message msg;
        if (!message_codec_.decode(std::span<const std::uint8_t>(pkt.data), msg)) {
            PL_DEBUG("[COMMAND] " << tag_(agent) << " Data message decode error -> dropped. [size=" << pkt.data.size() << "]");
            return;
        }

        message::Route route;
        if (!message_codec_.decode_route(msg.route, route)) {
            PL_DEBUG("[COMMAND] " << tag_(agent) << " Data message route decode error -> dropped. [route=" << msg.route << "]");
            return;
        }

        data_route_(*this, agent, route, msg);
    }

private:
    Config config_;
    MessageCodec message_codec_;
    PacketCodec packet_codec_;

    std::map<packet::Type, PacketFn> handlers_{};
    DataRouteFn data_route_{};

    std::shared_ptr<const schema::Schema> pending_schema_{};
    std::atomic<std::shared_ptr<const Payloads>> payloads_{};
    std::atomic<bool> initialized_{false};

private:
    [[nodiscard]]
    static std::string tag_(const Agent& agent) {
        std::string s = "[sid=";
        s += std::string_view(agent.sid());
        s += ", uid=";
        s += std::to_string(static_cast<std::int64_t>(agent.uid()));
        s += ']';
        return s;
    }

    [[nodiscard]]
    std::shared_ptr<const schema::Schema> compile_protos_() const {
        if (!config_.proto.has_proto_config()) {
            return nullptr;
        }
        schema::Compiler compiler(config_.proto);
        auto protos = std::make_shared<schema::Schema>();
        const auto r = compiler.compile(*protos);
        if (r != schema::compiler::Result::Compiled) {
            PL_ERROR("[COMMAND] Proto schema compilation failed: " << schema::compiler::to_string(r));
            return nullptr;
        }
        PL_INFO("[COMMAND] Proto schema loaded: version=" << protos->version
                << ", server routes=" << protos->server.size()
                << ", client routes=" << protos->client.size());
        return protos;
    }

    [[nodiscard]]
    std::shared_ptr<const Payloads> make_payloads_(std::shared_ptr<const schema::Schema> protos) const {
        auto payloads = std::make_shared<Payloads>();

        const std::string full = handshake::response_json(config_, protos.get());
        const std::string lean = handshake::response_json(config_, nullptr);

        if (!encode_(packet::Type::Handshake, full, payloads->handshake) ||
            !encode_(packet::Type::Handshake, lean, payloads->handshake_lean) ||
            !encode_(packet::Type::Heartbeat, {}, payloads->heartbeat)) {
            return nullptr;
        }

        payloads->schema = std::move(protos);
        PL_INFO("[COMMAND] Handshake bytes size: with protos=" << payloads->handshake.size()
                << ", without protos=" << payloads->handshake_lean.size());
        PL_DEBUG("[COMMAND] Handshake data (with protos) = " << full);
        return payloads;
    }

    [[nodiscard]]
    bool encode_(packet::Type type, std::string_view body, Bytes& out) const {
        const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(body.data()), body.size());
        const auto err = packet_codec_.encode(type, bytes, out);
        if (err != packet::Error::None) {
            PL_ERROR("[COMMAND] Failed to encode " << packet::to_string(type) << " packet: " << packet::to_string(err)
                     << " (" << body.size() << " bytes)");
            return false;
        }
        return true;
    }

    void install_default_handlers_() {
        handlers_.try_emplace(packet::Type::Handshake, [](const Command& cmd, Agent& agent, const packet::Packet& pkt) {
            cmd.handshake(agent, pkt);
        });
        handlers_.try_emplace(packet::Type::HandshakeAck, [](const Command& cmd, Agent& agent, const packet::Packet& pkt) {
            cmd.handshake_ack(agent, pkt);
        });
        handlers_.try_emplace(packet::Type::Heartbeat, [](const Command& cmd, Agent& agent, const packet::Packet& pkt) {
            cmd.heartbeat(agent, pkt);
        });
        handlers_.try_emplace(packet::Type::Data, [](const Command& cmd, Agent& agent, const packet::Packet& pkt) {
            cmd.data(agent, pkt);
        });

        if (!data_route_) {
            data_route_ = [](const Command&, Agent& agent, const message::Route& route, const message::Message&) {
                PL_DEBUG("[COMMAND] " << tag_(agent) << " No data route handler -> dropped. [route=" << route.to_string() << "]");
            };
        }
    }
};

} // namespace protolink::protocol
