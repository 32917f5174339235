#include <iostream>
#include <string>

#include "common/test_check.hpp"

#include "protolink/schema/document.hpp"

using namespace protolink::schema;

/*
================================================================================
Schema Document — Unit Tests
================================================================================

  • MessageSchema write semantics (last write wins, moved to the end)
  • Compact deterministic JSON: sorted dictionaries, emission-ordered fields
  • "__messages__" only written when non-empty
  • String escaping of keys
================================================================================
*/

static Schema hero_schema() {
    Schema s;
    s.version = 7;

    RouteSchema route;
    route.fields.set("optional uInt32 code", 1);
    route.fields.set("repeated message Hero heroes", 2);
    route.nested["Hero"].set("optional int32 configId", 1);
    s.server["game.hero.list"] = route;
    return s;
}

void test_message_schema_set() {
    std::cout << "[TEST] MessageSchema last write wins..." << std::endl;

    MessageSchema m;
    m.set("optional int32 a", 1);
    m.set("optional int32 b", 2);
    m.set("optional int32 a", 3);

    TEST_CHECK_EQ(m.size(), std::size_t{2});
    TEST_CHECK(m.entries()[0].key == "optional int32 b");
    TEST_CHECK(m.entries()[1].key == "optional int32 a");

    std::int64_t tag = 0;
    TEST_CHECK(m.find("optional int32 a", tag));
    TEST_CHECK(tag == 3);
    TEST_CHECK(!m.contains("optional int32 c"));

    std::cout << "[TEST] OK\n";
}

void test_route_json() {
    std::cout << "[TEST] Route schema JSON..." << std::endl;

    const Schema s = hero_schema();
    TEST_CHECK_EQ(to_json(s), std::string(
        R"({"version":7,"server":{"game.hero.list":{"optional uInt32 code":1,"repeated message Hero heroes":2,)"
        R"("__messages__":{"Hero":{"optional int32 configId":1}}}},"client":{}})"));

    TEST_CHECK_EQ(to_content_json(s), std::string(
        R"({"server":{"game.hero.list":{"optional uInt32 code":1,"repeated message Hero heroes":2,)"
        R"("__messages__":{"Hero":{"optional int32 configId":1}}}},"client":{}})"));

    std::cout << "[TEST] OK\n";
}

void test_global_messages_json() {
    std::cout << "[TEST] Global dictionary JSON..." << std::endl;

    Schema s;
    s.version = 1;
    RouteSchema route;
    route.fields.set("optional message Hero hero", 1);
    s.client["b.route"] = route;
    s.client["a.route"] = route;
    s.messages["Hero"].set("optional string name", 1);

    TEST_CHECK_EQ(to_json(s), std::string(
        R"({"version":1,"server":{},"client":{"a.route":{"optional message Hero hero":1},)"
        R"("b.route":{"optional message Hero hero":1}},"__messages__":{"Hero":{"optional string name":1}}})"));

    std::cout << "[TEST] OK\n";
}

void test_nested_only_route() {
    std::cout << "[TEST] Route without own fields..." << std::endl;

    Schema s;
    RouteSchema route;
    route.nested["Empty"] = MessageSchema{};
    s.server["r"] = route;

    TEST_CHECK_EQ(to_content_json(s), std::string(R"({"server":{"r":{"__messages__":{"Empty":{}}}},"client":{}})"));

    std::cout << "[TEST] OK\n";
}

void test_escaping_and_numbers() {
    std::cout << "[TEST] Escaping and numbers..." << std::endl;

    Schema s;
    s.version = 0;
    RouteSchema route;
    route.fields.set("optional int32 neg", -1);
    route.fields.set("optional int32 big", 9223372036854775807LL);
    s.server["a<b>&\"c\\"] = route;

    TEST_CHECK_EQ(to_json(s), std::string(
        R"({"version":0,"server":{"a\u003cb\u003e\u0026\"c\\":{"optional int32 neg":-1,"optional int32 big":9223372036854775807}},"client":{}})"));

    std::cout << "[TEST] OK\n";
}

void test_equality() {
    std::cout << "[TEST] Structural equality..." << std::endl;

    Schema a = hero_schema();
    Schema b = hero_schema();
    TEST_CHECK(a == b);

    b.server["game.hero.list"].nested["Hero"].set("optional int32 level", 2);
    TEST_CHECK(!(a == b));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    test_message_schema_set();
    test_route_json();
    test_global_messages_json();
    test_nested_only_route();
    test_escaping_and_numbers();
    test_equality();

    std::cout << "[TEST] ALL SCHEMA DOCUMENT TESTS PASSED!\n";
    return 0;
}
