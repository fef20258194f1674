/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>

using namespace GlyphFlow;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  JsonValue numberVal(2.5);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.asNumber(), 2.5, 0.001);
  BOOST_CHECK_EQUAL(numberVal.asInt(), 2);

  JsonValue stringVal(std::string("organic"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "organic");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"organic\"");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal(std::string("test"));
  JsonValue numberVal(42.0);

  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(numberVal.tryAsNumber().has_value());
  BOOST_CHECK_EQUAL(numberVal.tryAsNumber().value(), 42.0);

  BOOST_CHECK(!stringVal.tryAsNumber().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(!numberVal.tryAsBool().has_value());
  BOOST_CHECK(numberVal.tryAsArray() == nullptr);
  BOOST_CHECK(numberVal.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsReturnNull) {
  JsonValue numberVal(1.0);
  BOOST_CHECK(numberVal["anything"].isNull());
  BOOST_CHECK(numberVal[size_t{3}].isNull());
  BOOST_CHECK(!numberVal.hasKey("anything"));
  BOOST_CHECK_EQUAL(numberVal.size(), 0);

  JsonArray arr;
  arr.push_back(JsonValue(1.0));
  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal[size_t{0}].isNumber());
  BOOST_CHECK(arrayVal[size_t{1}].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"hello\\nworld\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello\nworld");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  // U+00E9 is two bytes in UTF-8
  BOOST_CHECK(reader.parse("\"caf\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "caf\xC3\xA9");

  // U+1F600 via a surrogate pair
  BOOST_CHECK(reader.parse("\"\\ud83d\\ude00\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;

  std::string configJson = R"({
        "simulation": {
            "particleCount": 250000,
            "textHoldDuration": 2.5
        },
        "macroCurve": [
            {"end": 10, "noiseStrength": 0.001},
            {"end": 20, "noiseStrength": 0.004}
        ],
        "threading": {"enabled": true}
    })";

  BOOST_CHECK(reader.parse(configJson));
  const auto &root = reader.getRoot();

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root["simulation"]["particleCount"].asInt(), 250000);
  BOOST_CHECK_CLOSE(root["simulation"]["textHoldDuration"].asNumber(), 2.5, 0.001);

  const auto &curve = root["macroCurve"];
  BOOST_CHECK(curve.isArray());
  BOOST_CHECK_EQUAL(curve.size(), 2);
  BOOST_CHECK_EQUAL(curve[size_t{1}]["end"].asInt(), 20);
  BOOST_CHECK_EQUAL(root["threading"]["enabled"].asBool(), true);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("[\n  1,\n  2,\n  3\n]"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 3);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.parse("[1, 2, 3"));
  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.parse("\"hello\\x\""));
  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.parse(""));
}

BOOST_AUTO_TEST_CASE(TestErrorLocation) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"key\" 1\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 2") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_CHECK(reader.parse("{\"a\": 1}"));
  BOOST_CHECK(reader.getRoot().isObject());

  BOOST_CHECK(!reader.parse("{\"a\": }"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestDeepNestingRejected) {
  JsonReader reader;
  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  std::string filename = "test_json_reader_temp.json";
  {
    std::ofstream file(filename);
    file << R"({"text": {"fontPath": "res/fonts/Arial.ttf", "fontSize": 180}})";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getRoot()["text"]["fontPath"].asString(), "res/fonts/Arial.ttf");
  BOOST_CHECK_EQUAL(reader.getRoot()["text"]["fontSize"].asInt(), 180);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
