#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "common/mock_agent.hpp"
#include "common/mock_message_codec.hpp"
#include "common/proto_fixture.hpp"
#include "common/test_check.hpp"

#include "protolink/protocol/command.hpp"
#include "lcr/log/logger.hpp"

using namespace protolink;
using namespace protolink::protocol;

/*
================================================================================
Session Command — Handshake Negotiation Tests
================================================================================

  • Clients declaring the current schema version receive the lean handshake
  • Every other client (0, absent, stale, malformed) receives the full one
  • The handshake moves the agent to WaitAck and always responds
  • Payloads are precomputed and swapped atomically by set_protos()
  • The schema is compiled from the configured proto options at init()
================================================================================
*/

using TestCommand = Command<MockAgent, MockMessageCodec>;

static Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

static packet::Packet handshake_packet(std::string_view body) {
    return packet::Packet{.type = packet::Type::Handshake, .data = to_bytes(body)};
}

static std::string declare(std::int64_t proto_version) {
    return R"({"sys":{"type":"js-websocket","version":"0.0.1","protoVersion":)" + std::to_string(proto_version) + R"(},"user":{}})";
}

static std::shared_ptr<const schema::Schema> make_schema(std::int64_t version) {
    auto s = std::make_shared<schema::Schema>();
    s->version = version;
    s->server["game.room.join"].fields.set("optional int32 code", 1);
    s->server["game.room.join"].fields.set("optional string room", 2);
    s->client["game.room.join"].fields.set("optional string token", 1);
    return s;
}

// Body of a framed handshake response
static std::string body_of(const Bytes& frame) {
    packet::Codec codec;
    packet::Packet pkt;
    TEST_CHECK(codec.decode(frame, pkt) == packet::Error::None);
    TEST_CHECK(pkt.type == packet::Type::Handshake);
    return std::string(pkt.data.begin(), pkt.data.end());
}

static const Bytes& respond(const TestCommand& cmd, std::string_view body) {
    static MockAgent agent;
    agent.clear_sent();
    cmd.handle(agent, handshake_packet(body));
    TEST_CHECK_EQ(agent.sent().size(), std::size_t{1});
    TEST_CHECK(agent.state() == agent::State::WaitAck);
    return agent.sent().front();
}

void test_lean_on_matching_version() {
    std::cout << "[TEST] Matching proto version gets the lean handshake..." << std::endl;

    TestCommand cmd(Config{});
    TEST_CHECK(cmd.set_protos(make_schema(42)));
    TEST_CHECK(cmd.init());
    TEST_CHECK(cmd.version() == 42);

    const auto payloads = cmd.payloads();
    TEST_CHECK(payloads != nullptr);
    TEST_CHECK(payloads->handshake_lean.size() < payloads->handshake.size());

    const Bytes lean = respond(cmd, declare(42));
    TEST_CHECK(lean == payloads->handshake_lean);

    const std::string body = body_of(lean);
    TEST_CHECK(body.find("\"protos\"") == std::string::npos);
    TEST_CHECK(body.find("\"heartbeat\":60") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_full_on_any_other_declaration() {
    std::cout << "[TEST] Other declarations get the full handshake..." << std::endl;

    TestCommand cmd(Config{});
    TEST_CHECK(cmd.set_protos(make_schema(42)));
    TEST_CHECK(cmd.init());
    const auto payloads = cmd.payloads();

    TEST_CHECK(respond(cmd, declare(0)) == payloads->handshake);
    TEST_CHECK(respond(cmd, declare(41)) == payloads->handshake);
    TEST_CHECK(respond(cmd, declare(-42)) == payloads->handshake);
    TEST_CHECK(respond(cmd, R"({"sys":{"type":"js-websocket"}})") == payloads->handshake);   // absent
    TEST_CHECK(respond(cmd, "{}") == payloads->handshake);
    TEST_CHECK(respond(cmd, "") == payloads->handshake);
    TEST_CHECK(respond(cmd, "not json") == payloads->handshake);
    TEST_CHECK(respond(cmd, R"({"sys":{"protoVersion":"42"}})") == payloads->handshake);

    const std::string body = body_of(payloads->handshake);
    TEST_CHECK(body.find(R"("protos":{"version":42,"server":{"game.room.join":)") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_without_schema() {
    std::cout << "[TEST] No schema configured..." << std::endl;

    Config cfg;
    cfg.serializer = "json";
    TestCommand cmd(cfg);
    TEST_CHECK(cmd.init());
    TEST_CHECK(cmd.schema() == nullptr);
    TEST_CHECK(cmd.version() == 0);

    const auto payloads = cmd.payloads();
    TEST_CHECK(payloads->handshake == payloads->handshake_lean);
    TEST_CHECK(payloads->heartbeat == (Bytes{3, 0, 0, 0}));

    // A client cannot match version 0
    TEST_CHECK(respond(cmd, declare(0)) == payloads->handshake);
    TEST_CHECK_EQ(body_of(payloads->handshake),
                  std::string(R"({"code":200,"sys":{"dict":{},"heartbeat":60,"serializer":"json"}})"));

    std::cout << "[TEST] OK\n";
}

void test_set_protos_after_init() {
    std::cout << "[TEST] Schema swap after init..." << std::endl;

    TestCommand cmd(Config{});
    TEST_CHECK(cmd.set_protos(make_schema(42)));
    TEST_CHECK(cmd.init());
    const auto before = cmd.payloads();

    auto next = std::make_shared<schema::Schema>(*make_schema(43));
    next->server["game.room.leave"].fields.set("optional int32 code", 1);
    TEST_CHECK(cmd.set_protos(next));
    TEST_CHECK(!cmd.set_protos(nullptr));

    const auto after = cmd.payloads();
    TEST_CHECK(after != before);
    TEST_CHECK(cmd.version() == 43);
    TEST_CHECK(cmd.schema() == next);

    // Old snapshot still intact for whoever holds it
    TEST_CHECK(before->schema->version == 42);

    TEST_CHECK(respond(cmd, declare(42)) == after->handshake);
    TEST_CHECK(respond(cmd, declare(43)) == after->handshake_lean);
    TEST_CHECK(body_of(after->handshake).find("game.room.leave") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_compiled_from_config() {
    std::cout << "[TEST] Schema compiled from proto options..." << std::endl;

    test::TempDir dir;
    dir.write("game/player.proto", test::PLAYER_PROTO);

    Config cfg;
    cfg.dict = {{"game.login", 1}};
    cfg.proto.dir = dir.str();
    cfg.proto.server_routes = {{"game.login", "LoginResponse"}};
    cfg.proto.client_routes = {{"game.login", "LoginRequest"}};

    TestCommand cmd(cfg);
    TEST_CHECK(cmd.init());
    TEST_CHECK(cmd.schema() != nullptr);
    TEST_CHECK(cmd.schema()->server.count("game.login") == 1);

    const std::int64_t version = cmd.version();
    TEST_CHECK(version > 0);

    const auto payloads = cmd.payloads();
    TEST_CHECK(respond(cmd, declare(version)) == payloads->handshake_lean);
    TEST_CHECK(respond(cmd, declare(version + 1)) == payloads->handshake);
    TEST_CHECK(body_of(payloads->handshake).find("Player_scoresEntry") != std::string::npos);

    // Compile failure leaves the command usable without a schema
    Config broken;
    broken.proto.dir = dir.str() + "/does-not-exist";
    TestCommand fallback(broken);
    TEST_CHECK(fallback.init());
    TEST_CHECK(fallback.schema() == nullptr);

    std::cout << "[TEST] OK\n";
}

void test_send_failure_still_transitions() {
    std::cout << "[TEST] Handshake with failing transport..." << std::endl;

    TestCommand cmd(Config{});
    TEST_CHECK(cmd.init());

    MockAgent agent;
    agent.fail_sends(true);
    cmd.handle(agent, handshake_packet(declare(1)));
    TEST_CHECK(agent.state() == agent::State::WaitAck);
    TEST_CHECK_EQ(agent.sent().size(), std::size_t{1});

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_lean_on_matching_version();
    test_full_on_any_other_declaration();
    test_without_schema();
    test_set_protos_after_init();
    test_compiled_from_config();
    test_send_failure_still_transitions();

    std::cout << "[TEST] ALL COMMAND HANDSHAKE TESTS PASSED!\n";
    return 0;
}
