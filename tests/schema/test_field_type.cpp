#include <iostream>
#include <string_view>

#include "common/test_check.hpp"

#include "protolink/schema/field_type.hpp"
#include "protolink/schema/message.hpp"

using namespace protolink::schema;

/*
================================================================================
Type Mapper — Unit Tests
================================================================================

  • Every canonical scalar token maps onto its FieldType
  • Fixed-width synonyms fold onto the nearest canonical type
  • Unknown tokens (message references) are reported as not found
  • Wire spellings and field keys match what clients decode
================================================================================
*/

static FieldType mapped(std::string_view token) {
    FieldType t = FieldType::Message;
    TEST_CHECK(canonicalize(token, t));
    return t;
}

void test_canonical_scalars() {
    std::cout << "[TEST] Canonical scalar tokens..." << std::endl;

    TEST_CHECK(mapped("string") == FieldType::String);
    TEST_CHECK(mapped("bool")   == FieldType::Bool);
    TEST_CHECK(mapped("int32")  == FieldType::Int32);
    TEST_CHECK(mapped("uint32") == FieldType::UInt32);
    TEST_CHECK(mapped("sint32") == FieldType::SInt32);
    TEST_CHECK(mapped("int64")  == FieldType::Int64);
    TEST_CHECK(mapped("uint64") == FieldType::UInt64);
    TEST_CHECK(mapped("sint64") == FieldType::SInt64);
    TEST_CHECK(mapped("float")  == FieldType::Float);
    TEST_CHECK(mapped("double") == FieldType::Double);
    TEST_CHECK(mapped("bytes")  == FieldType::Bytes);

    std::cout << "[TEST] OK\n";
}

void test_synonyms_fold() {
    std::cout << "[TEST] Fixed-width synonyms..." << std::endl;

    TEST_CHECK(mapped("fixed32")  == FieldType::UInt32);
    TEST_CHECK(mapped("fixed64")  == FieldType::UInt64);
    TEST_CHECK(mapped("sfixed32") == FieldType::Int32);
    TEST_CHECK(mapped("sfixed64") == FieldType::Int64);

    std::cout << "[TEST] OK\n";
}

void test_unknown_tokens() {
    std::cout << "[TEST] Unknown tokens..." << std::endl;

    FieldType t = FieldType::Bool;
    TEST_CHECK(!canonicalize("Player", t));
    TEST_CHECK(!canonicalize("game.Player", t));
    TEST_CHECK(!canonicalize("String", t));   // case sensitive
    TEST_CHECK(!canonicalize("uInt32", t));   // wire spelling is not a source token
    TEST_CHECK(!canonicalize("", t));
    TEST_CHECK(t == FieldType::Bool);         // untouched

    std::cout << "[TEST] OK\n";
}

void test_normalize_type_name() {
    std::cout << "[TEST] Package qualifier stripping..." << std::endl;

    TEST_CHECK(normalize_type_name("Player") == "Player");
    TEST_CHECK(normalize_type_name("game.Player") == "Player");
    TEST_CHECK(normalize_type_name("a.b.c.Item") == "Item");
    TEST_CHECK(normalize_type_name(".Item") == "Item");

    std::cout << "[TEST] OK\n";
}

void test_wire_spelling_and_keys() {
    std::cout << "[TEST] Wire spellings and field keys..." << std::endl;

    TEST_CHECK(to_string(FieldType::UInt32) == "uInt32");
    TEST_CHECK(to_string(FieldType::SInt32) == "sInt32");
    TEST_CHECK(to_string(FieldType::UInt64) == "uInt64");
    TEST_CHECK(to_string(FieldType::SInt64) == "sInt64");
    TEST_CHECK(to_string(FieldType::Int64)  == "int64");
    TEST_CHECK(to_string(Modifier::Required) == "required");

    Field code{.name = "code", .type = FieldType::UInt32, .tag = 1};
    TEST_CHECK_EQ(code.key(), std::string("optional uInt32 code"));

    Field heroes{.name = "heroes", .type = FieldType::Message, .tag = 2, .repeated = true, .type_name = "Hero"};
    TEST_CHECK(heroes.modifier() == Modifier::Repeated);
    TEST_CHECK_EQ(heroes.key(), std::string("repeated message Hero heroes"));

    TEST_CHECK_EQ(map_entry_name("Player", "scores"), std::string("Player_scoresEntry"));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    test_canonical_scalars();
    test_synonyms_fold();
    test_unknown_tokens();
    test_normalize_type_name();
    test_wire_spelling_and_keys();

    std::cout << "[TEST] ALL TYPE MAPPER TESTS PASSED!\n";
    return 0;
}
