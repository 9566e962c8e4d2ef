#include <catch2/catch_test_macros.hpp>
#include "graph/LabelSanitizer.hpp"
#include "graph/GraphErrors.hpp"

using namespace graph;

TEST_CASE("sanitize accepts ordinary labels", "[LabelSanitizer]") {
    CHECK(LabelSanitizer::sanitize("Person").str() == "Person");
    CHECK(LabelSanitizer::sanitize("Place").quoted() == "`Place`");
    CHECK(LabelSanitizer::sanitize("Two Words").quoted() == "`Two Words`");
    CHECK(LabelSanitizer::sanitize("with-dash_and.dot").str() == "with-dash_and.dot");
    CHECK(LabelSanitizer::sanitize("x'\"(){};/").str() == "x'\"(){};/");
}

TEST_CASE("sanitize accepts non ASCII UTF-8", "[LabelSanitizer]") {
    CHECK(LabelSanitizer::sanitize("Société").str() == "Société");
    CHECK(LabelSanitizer::sanitize("東京").str() == "東京");
    CHECK(LabelSanitizer::sanitize("Emoji\xF0\x9F\x98\x80").str() == "Emoji\xF0\x9F\x98\x80");
}

TEST_CASE("sanitize rejects empty labels", "[LabelSanitizer]") {
    CHECK_THROWS_AS(LabelSanitizer::sanitize(""), InvalidLabelError);
}

TEST_CASE("sanitize rejects quoting and escape characters", "[LabelSanitizer]") {
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Person`; DETACH DELETE n //"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("`"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\\u0060son"), InvalidLabelError);
}

TEST_CASE("sanitize rejects control characters", "[LabelSanitizer]") {
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\nson"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\rson"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\tson"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize(std::string("Per\0son", 7)), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\x7Fson"), InvalidLabelError);
    // C1 control U+0085 (NEL)
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xC2\x85son"), InvalidLabelError);
    // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xE2\x80\xA8son"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xE2\x80\xA9son"), InvalidLabelError);
}

TEST_CASE("sanitize rejects invalid UTF-8", "[LabelSanitizer]") {
    // Lone continuation byte
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\x80son"), InvalidLabelError);
    // Truncated sequence
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xE2\x80"), InvalidLabelError);
    // Overlong encoding of '`'
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xC1\xA0son"), InvalidLabelError);
    // UTF-16 surrogate
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xED\xA0\x80son"), InvalidLabelError);
    // Above U+10FFFF
    CHECK_THROWS_AS(LabelSanitizer::sanitize("Per\xF4\x90\x80\x80son"), InvalidLabelError);
}

TEST_CASE("normalizeRelationshipType", "[LabelSanitizer]") {
    CHECK(LabelSanitizer::normalizeRelationshipType("knows") == "KNOWS");
    CHECK(LabelSanitizer::normalizeRelationshipType("works at") == "WORKS_AT");
    CHECK(LabelSanitizer::normalizeRelationshipType("  lives   in \t") == "LIVES_IN");
    CHECK(LabelSanitizer::normalizeRelationshipType("already_NORMAL") == "ALREADY_NORMAL");
    CHECK(LabelSanitizer::normalizeRelationshipType("a\t\nb") == "A_B");
    CHECK(LabelSanitizer::normalizeRelationshipType("   ").empty());
    // Non ASCII bytes are left untouched
    CHECK(LabelSanitizer::normalizeRelationshipType("aimé par") == "AIMé_PAR");
}

TEST_CASE("sanitizeRelationshipType normalizes then validates", "[LabelSanitizer]") {
    CHECK(LabelSanitizer::sanitizeRelationshipType(" works at ").str() == "WORKS_AT");
    CHECK_THROWS_AS(LabelSanitizer::sanitizeRelationshipType("   "), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitizeRelationshipType("KNOWS`]->()"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitizeRelationshipType("KNOWS\x01"), InvalidLabelError);
}

TEST_CASE("sanitizeNodeType rejects the marker label", "[LabelSanitizer]") {
    CHECK(LabelSanitizer::sanitizeNodeType("Person").str() == "Person");
    CHECK_THROWS_AS(LabelSanitizer::sanitizeNodeType("Entity"), InvalidLabelError);
    CHECK_THROWS_AS(LabelSanitizer::sanitizeNodeType(""), InvalidLabelError);
    // Episodes may be created as ordinary entity types
    CHECK(LabelSanitizer::sanitizeNodeType("Episode").str() == "Episode");
}
