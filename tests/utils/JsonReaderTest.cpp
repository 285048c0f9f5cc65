/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace LatticeEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  JsonValue falseVal(false);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(falseVal.asBool(), false);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");
  BOOST_CHECK_EQUAL(falseVal.toString(), "false");

  JsonValue intVal(42);
  JsonValue doubleVal(3.14);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.getType(), JsonType::Number);
  BOOST_CHECK_EQUAL(intVal.asInt(), 42);
  BOOST_CHECK_EQUAL(intVal.toString(), "42");
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);

  JsonValue stringVal("hello");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"hello\"");
}

BOOST_AUTO_TEST_CASE(TestArrayOperations) {
  JsonArray arr;
  arr.push_back(JsonValue(1));
  arr.push_back(JsonValue("test"));
  arr.push_back(JsonValue(true));

  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 3u);
  BOOST_CHECK_EQUAL(arrayVal[0].asInt(), 1);
  BOOST_CHECK_EQUAL(arrayVal[1].asString(), "test");
  BOOST_CHECK_EQUAL(arrayVal[2].asBool(), true);

  // Out of range reads as null
  BOOST_CHECK(arrayVal[7].isNull());
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonObject obj;
  obj["name"] = JsonValue("Orbiter");
  obj["priority"] = JsonValue(30);
  obj["active"] = JsonValue(true);

  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 3u);
  BOOST_CHECK(objectVal.hasKey("name"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK_EQUAL(objectVal["name"].asString(), "Orbiter");
  BOOST_CHECK_EQUAL(objectVal["priority"].asInt(), 30);
  BOOST_CHECK(objectVal["missing"].isNull());
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue number(2.5);
  JsonValue text("chunk");

  BOOST_REQUIRE(number.tryAsNumber().has_value());
  BOOST_CHECK_CLOSE(*number.tryAsNumber(), 2.5, 0.001);
  BOOST_CHECK(!number.tryAsString().has_value());

  BOOST_REQUIRE(text.tryAsString().has_value());
  BOOST_CHECK_EQUAL(*text.tryAsString(), "chunk");
  BOOST_CHECK(!text.tryAsNumber().has_value());

  // Scalars have no size and no keys
  BOOST_CHECK_EQUAL(number.size(), 0u);
  BOOST_CHECK(!number.hasKey("x"));
  BOOST_CHECK(number["x"].isNull());
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchThrows) {
  JsonValue text("not a number");
  BOOST_CHECK_THROW(text.asNumber(), std::bad_variant_access);
  BOOST_CHECK_THROW(text.asArray(), std::bad_variant_access);
}

BOOST_AUTO_TEST_CASE(TestSerialization) {
  JsonObject obj;
  obj["b"] = JsonValue(JsonArray{JsonValue(1), JsonValue(2)});
  obj["a"] = JsonValue("x\"y");
  obj["empty"] = JsonValue(JsonArray{});

  const std::string expected =
      "{\n"
      "  \"a\": \"x\\\"y\",\n"
      "  \"b\": [\n"
      "    1,\n"
      "    2\n"
      "  ],\n"
      "  \"empty\": []\n"
      "}";
  BOOST_CHECK_EQUAL(JsonValue(obj).toString(), expected);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestParseScalars) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse(" true "));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_REQUIRE(reader.parse("-12.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -125.0, 0.001);

  BOOST_REQUIRE(reader.parse("0"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 0);

  BOOST_REQUIRE(reader.parse("\"text\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "text");
}

BOOST_AUTO_TEST_CASE(TestParseEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"("line\nbreak \"quoted\" \\ \/ \t")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak \"quoted\" \\ / \t");

  // U+00E9 encodes as two UTF-8 bytes
  BOOST_REQUIRE(reader.parse(R"("caf\u00e9")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "caf\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestParseSettingsDocument) {
  const std::string json = R"({
    "simulation": {
      "chunk_width": 256,
      "chunk_height": 128,
      "time_factor": 0.5
    },
    "host": {
      "target_fps": 60,
      "vsync": false,
      "layers": [-1, 0, 2]
    }
  })";

  JsonReader reader;
  BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());
  const JsonValue& root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root["simulation"]["chunk_width"].asInt(), 256);
  BOOST_CHECK_EQUAL(root["simulation"]["chunk_height"].asInt(), 128);
  BOOST_CHECK_CLOSE(root["simulation"]["time_factor"].asNumber(), 0.5, 0.001);
  BOOST_CHECK_EQUAL(root["host"]["vsync"].asBool(), false);
  BOOST_CHECK_EQUAL(root["host"]["layers"].size(), 3u);
  BOOST_CHECK_EQUAL(root["host"]["layers"][0].asInt(), -1);
  BOOST_CHECK(root["host"]["missing"]["deeper"].isNull());
}

BOOST_AUTO_TEST_CASE(TestParseEmptyContainers) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{ }"));
  BOOST_CHECK(reader.getRoot().isObject());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_REQUIRE(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestSerializedOutputParsesBack) {
  JsonObject obj;
  obj["name"] = JsonValue("tab\there");
  obj["value"] = JsonValue(0.25);

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(JsonValue(obj).toString()));
  BOOST_CHECK_EQUAL(reader.getRoot()["name"].asString(), "tab\there");
  BOOST_CHECK_CLOSE(reader.getRoot()["value"].asNumber(), 0.25, 0.001);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "lattice_json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"host": {"window_width": 800}})";
  }

  JsonReader reader;
  BOOST_REQUIRE_MESSAGE(reader.loadFromFile(path.string()), reader.getLastError());
  BOOST_CHECK_EQUAL(reader.getRoot()["host"]["window_width"].asInt(), 800);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestMissingFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("definitely/not/here.json"));
  BOOST_CHECK(reader.getLastError().find("Failed to open file") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestMalformedDocuments) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("{\"a\": 1,}"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("\"bad \\q escape\""));
  BOOST_CHECK(!reader.parse("\"\\u12G4\""));
  BOOST_CHECK(!reader.parse("{} extra"));
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("[1, 2, 3]"));
  BOOST_CHECK(!reader.parse("[1, 2,"));
  BOOST_CHECK(reader.getRoot().isNull());
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_REQUIRE(reader.parse("true"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorReportsLineAndColumn) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": 1,\n  \"b\" 2\n}"));
  const std::string& error = reader.getLastError();
  BOOST_CHECK_MESSAGE(error.find("Expected ':'") != std::string::npos, error);
  BOOST_CHECK_MESSAGE(error.find("line 3") != std::string::npos, error);
  BOOST_CHECK_MESSAGE(error.find("column 7") != std::string::npos, error);
}

BOOST_AUTO_TEST_CASE(TestDepthLimit) {
  JsonReader reader;

  const std::string shallow = std::string(50, '[') + std::string(50, ']');
  BOOST_CHECK(reader.parse(shallow));

  const std::string deep = std::string(200, '[') + std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
