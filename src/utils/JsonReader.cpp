/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>

namespace LatticeEngine {

namespace {
constexpr int MAX_DEPTH = 128;

const JsonValue& nullValue() {
  static const JsonValue null;
  return null;
}

void writeEscaped(std::ostream& stream, const std::string& text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':  stream << "\\\""; break;
    case '\\': stream << "\\\\"; break;
    case '\b': stream << "\\b"; break;
    case '\f': stream << "\\f"; break;
    case '\n': stream << "\\n"; break;
    case '\r': stream << "\\r"; break;
    case '\t': stream << "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << "\\u" << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<int>(c) << std::dec << std::setfill(' ');
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

void appendUtf8(std::string& out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}
} // namespace

std::ostream& operator<<(std::ostream& os, JsonType type) {
  switch (type) {
  case JsonType::Null:    return os << "Null";
  case JsonType::Boolean: return os << "Boolean";
  case JsonType::Number:  return os << "Number";
  case JsonType::String:  return os << "String";
  case JsonType::Array:   return os << "Array";
  case JsonType::Object:  return os << "Object";
  }
  return os << "Unknown";
}

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

std::optional<double> JsonValue::tryAsNumber() const {
  if (const auto* number = std::get_if<double>(&m_value)) {
    return *number;
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const auto* text = std::get_if<std::string>(&m_value)) {
    return *text;
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string& key) const {
  const auto* object = std::get_if<JsonObject>(&m_value);
  return object && object->find(key) != object->end();
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
  if (const auto* object = std::get_if<JsonObject>(&m_value)) {
    auto it = object->find(key);
    if (it != object->end()) {
      return it->second;
    }
  }
  return nullValue();
}

const JsonValue& JsonValue::operator[](size_t index) const {
  if (const auto* array = std::get_if<JsonArray>(&m_value)) {
    if (index < array->size()) {
      return (*array)[index];
    }
  }
  return nullValue();
}

size_t JsonValue::size() const {
  if (const auto* array = std::get_if<JsonArray>(&m_value)) {
    return array->size();
  }
  if (const auto* object = std::get_if<JsonObject>(&m_value)) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream stream;
  write(stream, 0);
  return stream.str();
}

void JsonValue::write(std::ostream& stream, int indent) const {
  const std::string pad(static_cast<size_t>(indent + 2), ' ');
  const std::string closePad(static_cast<size_t>(indent), ' ');

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    const double number = asNumber();
    if (std::floor(number) == number && std::fabs(number) < 1e15) {
      stream << static_cast<long long>(number);
    } else {
      stream << std::setprecision(std::numeric_limits<double>::max_digits10)
             << number;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const JsonArray& array = asArray();
    if (array.empty()) {
      stream << "[]";
      break;
    }
    stream << "[\n";
    for (size_t i = 0; i < array.size(); ++i) {
      stream << pad;
      array[i].write(stream, indent + 2);
      stream << (i + 1 < array.size() ? ",\n" : "\n");
    }
    stream << closePad << ']';
    break;
  }
  case JsonType::Object: {
    const JsonObject& object = asObject();
    if (object.empty()) {
      stream << "{}";
      break;
    }
    stream << "{\n";
    size_t i = 0;
    for (const auto& [key, value] : object) {
      stream << pad;
      writeEscaped(stream, key);
      stream << ": ";
      value.write(stream, indent + 2);
      stream << (++i < object.size() ? ",\n" : "\n");
    }
    stream << closePad << '}';
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return parse(contents.str());
}

bool JsonReader::parse(const std::string& jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(root);
  return true;
}

char JsonReader::advance() {
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::fail(const std::string& message) {
  m_lastError = message + " at line " + std::to_string(m_line) + ", column " +
                std::to_string(m_column);
  return false;
}

bool JsonReader::parseValue(JsonValue& out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    if (atEnd()) {
      return fail("Unexpected end of input");
    }
    return fail("Unexpected character");
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseLiteral(const char* literal, JsonValue value, JsonValue& out) {
  for (const char* c = literal; *c; ++c) {
    if (peek() != *c) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
    advance();
  }
  out = std::move(value);
  return true;
}

bool JsonReader::parseObject(JsonValue& out, int depth) {
  advance(); // {
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (peek() != ':') {
      return fail("Expected ':' after object key");
    }
    advance();
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth + 1)) {
      return false;
    }
    object[key] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == '}') {
      advance();
      break;
    }
    return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue& out, int depth) {
  advance(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth + 1)) {
      return false;
    }
    array.push_back(std::move(value));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == ']') {
      advance();
      break;
    }
    return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string& out) {
  advance(); // opening quote
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    const char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      return fail("Unterminated escape sequence");
    }
    const char escape = advance();
    switch (escape) {
    case '"':  out += '"'; break;
    case '\\': out += '\\'; break;
    case '/':  out += '/'; break;
    case 'b':  out += '\b'; break;
    case 'f':  out += '\f'; break;
    case 'n':  out += '\n'; break;
    case 'r':  out += '\r'; break;
    case 't':  out += '\t'; break;
    case 'u': {
      uint32_t codepoint = 0;
      for (int i = 0; i < 4; ++i) {
        if (atEnd()) {
          return fail("Incomplete unicode escape");
        }
        const char h = advance();
        codepoint <<= 4;
        if (h >= '0' && h <= '9') {
          codepoint |= static_cast<uint32_t>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
          codepoint |= static_cast<uint32_t>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
          codepoint |= static_cast<uint32_t>(h - 'A' + 10);
        } else {
          return fail("Invalid hex digit in unicode escape");
        }
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(std::string("Invalid escape sequence '\\") + escape + "'");
    }
  }
}

bool JsonReader::parseNumber(JsonValue& out) {
  const size_t start = m_position;
  auto digits = [&]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      return fail("Expected digits after decimal point");
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (digits() == 0) {
      return fail("Expected digits in exponent");
    }
  }

  std::istringstream text(m_input.substr(start, m_position - start));
  text.imbue(std::locale::classic());
  double number = 0.0;
  text >> number;
  if (text.fail()) {
    return fail("Number out of range");
  }
  out = JsonValue(number);
  return true;
}

} // namespace LatticeEngine
