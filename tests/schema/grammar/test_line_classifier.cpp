#include <iostream>
#include <string_view>

#include "common/test_check.hpp"

#include "protolink/schema/grammar/line.hpp"

using namespace protolink::schema::grammar;

/*
================================================================================
IDL Line Classifier — Unit Tests
================================================================================

  • Precedence: Blank -> Comment -> MessageHeader -> MapField -> Field -> Other
  • Structured parts are views into the source line
  • Trailing text after ';' is ignored
  • Brace balance and tag parsing helpers
================================================================================
*/

void test_blank_and_comment() {
    std::cout << "[TEST] Blank and comment lines..." << std::endl;

    TEST_CHECK(classify("").kind == LineKind::Blank);
    TEST_CHECK(classify("   \t ").kind == LineKind::Blank);
    TEST_CHECK(classify("// int32 x = 1;").kind == LineKind::Comment);
    TEST_CHECK(classify("    //message Foo {").kind == LineKind::Comment);
    TEST_CHECK(classify("/* int32 x = 1; */").kind == LineKind::Other);

    std::cout << "[TEST] OK\n";
}

void test_message_header() {
    std::cout << "[TEST] Message headers..." << std::endl;

    auto m = classify("message Player {");
    TEST_CHECK(m.kind == LineKind::MessageHeader);
    TEST_CHECK(m.name == "Player");

    m = classify("  message   Position");
    TEST_CHECK(m.kind == LineKind::MessageHeader);
    TEST_CHECK(m.name == "Position");

    m = classify("message Item{ ");
    TEST_CHECK(m.kind == LineKind::MessageHeader);
    TEST_CHECK(m.name == "Item");

    // Anything after the brace disqualifies the header
    TEST_CHECK(classify("message Empty {}").kind != LineKind::MessageHeader);
    TEST_CHECK(classify("message Foo { int32 x = 1; }").kind != LineKind::MessageHeader);
    TEST_CHECK(classify("message").kind != LineKind::MessageHeader);
    TEST_CHECK(classify("messageFoo {").kind != LineKind::MessageHeader);

    std::cout << "[TEST] OK\n";
}

void test_map_field() {
    std::cout << "[TEST] Map fields..." << std::endl;

    auto m = classify("    map<string, int32> scores = 5;");
    TEST_CHECK(m.kind == LineKind::MapField);
    TEST_CHECK(m.key_type == "string");
    TEST_CHECK(m.value_type == "int32");
    TEST_CHECK(m.name == "scores");
    TEST_CHECK(m.tag == "5");

    m = classify("map < int64 , game.Item >  bag=12 ; // by id");
    TEST_CHECK(m.kind == LineKind::MapField);
    TEST_CHECK(m.key_type == "int64");
    TEST_CHECK(m.value_type == "game.Item");
    TEST_CHECK(m.name == "bag");
    TEST_CHECK(m.tag == "12");

    // Map takes precedence over the generic field shape
    TEST_CHECK(classify("map<string,string> attrs = 1;").kind == LineKind::MapField);

    // A field whose type is literally named "map" stays a plain field
    m = classify("map lookup = 3;");
    TEST_CHECK(m.kind == LineKind::Field);
    TEST_CHECK(m.type == "map");

    TEST_CHECK(classify("map<string, int32>scores = 5;").kind == LineKind::Other);

    std::cout << "[TEST] OK\n";
}

void test_field() {
    std::cout << "[TEST] Plain and repeated fields..." << std::endl;

    auto m = classify("  uint32 id = 1;");
    TEST_CHECK(m.kind == LineKind::Field);
    TEST_CHECK(!m.repeated);
    TEST_CHECK(m.type == "uint32");
    TEST_CHECK(m.name == "id");
    TEST_CHECK(m.tag == "1");

    m = classify("\trepeated   game.Item items=3;  // inventory");
    TEST_CHECK(m.kind == LineKind::Field);
    TEST_CHECK(m.repeated);
    TEST_CHECK(m.type == "game.Item");
    TEST_CHECK(m.name == "items");
    TEST_CHECK(m.tag == "3");

    // "repeated" used as a type name
    m = classify("repeated count = 4;");
    TEST_CHECK(m.kind == LineKind::Field);
    TEST_CHECK(!m.repeated);
    TEST_CHECK(m.type == "repeated");
    TEST_CHECK(m.name == "count");

    std::cout << "[TEST] OK\n";
}

void test_other() {
    std::cout << "[TEST] Unrecognized lines..." << std::endl;

    TEST_CHECK(classify("}").kind == LineKind::Other);
    TEST_CHECK(classify("syntax = \"proto3\";").kind == LineKind::Other);
    TEST_CHECK(classify("package game;").kind == LineKind::Other);
    TEST_CHECK(classify("int32 x = -1;").kind == LineKind::Other);
    TEST_CHECK(classify("int32 x = 1").kind == LineKind::Other);
    TEST_CHECK(classify("optional int32 x = 1;").kind == LineKind::Other);
    TEST_CHECK(classify("enum Color {").kind == LineKind::Other);

    std::cout << "[TEST] OK\n";
}

void test_brace_delta() {
    std::cout << "[TEST] Brace balance..." << std::endl;

    TEST_CHECK(brace_delta("message A {") == 1);
    TEST_CHECK(brace_delta("}") == -1);
    TEST_CHECK(brace_delta("{ { }") == 1);
    TEST_CHECK(brace_delta("int32 x = 1;") == 0);
    TEST_CHECK(brace_delta("} }") == -2);

    std::cout << "[TEST] OK\n";
}

void test_parse_tag() {
    std::cout << "[TEST] Tag parsing..." << std::endl;

    TEST_CHECK(parse_tag("1") == 1);
    TEST_CHECK(parse_tag("007") == 7);
    TEST_CHECK(parse_tag("536870911") == 536870911);
    TEST_CHECK(parse_tag("9223372036854775807") == 9223372036854775807LL);
    TEST_CHECK(parse_tag("9223372036854775808") == 0);      // overflow
    TEST_CHECK(parse_tag("99999999999999999999999") == 0);  // overflow

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    test_blank_and_comment();
    test_message_header();
    test_map_field();
    test_field();
    test_other();
    test_brace_delta();
    test_parse_tag();

    std::cout << "[TEST] ALL LINE CLASSIFIER TESTS PASSED!\n";
    return 0;
}
