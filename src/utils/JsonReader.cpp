/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <ostream>
#include <sstream>
#include <string_view>

namespace GlyphFlow {

namespace {
constexpr size_t MAX_NESTING_DEPTH = 128;

const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

void writeEscaped(std::string &out, const std::string &s) {
  out += '"';
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out += c;
    }
  }
  out += '"';
}
} // anonymous namespace

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

// JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *value = std::get_if<std::string>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (object == nullptr) {
    return nullValue();
  }
  auto it = object->find(key);
  return it != object->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = tryAsArray();
  if (array == nullptr || index >= array->size()) {
    return nullValue();
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) {
    return array->size();
  }
  if (const JsonObject *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    out += std::format("{}", asNumber());
    break;
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first) {
        out += ',';
      }
      first = false;
      element.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, member] : asObject()) {
      if (!first) {
        out += ',';
      }
      first = false;
      writeEscaped(out, key);
      out += ':';
      member.write(out);
    }
    out += '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  JsonValue root = parseValue();
  if (failed()) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing content");
    return false;
  }

  m_root = std::move(root);
  return true;
}

JsonValue JsonReader::parseValue() {
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case '\0':
    setError("Unexpected end of input");
    return JsonValue();
  default:
    break;
  }

  if (peek() == '-' || isDigit(peek())) {
    return JsonValue(parseNumber());
  }
  return parseLiteral();
}

JsonValue JsonReader::parseObject() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Nesting too deep");
    return JsonValue();
  }
  advance(); // '{'

  JsonObject object;
  skipWhitespace();
  if (consume('}')) {
    --m_depth;
    return JsonValue(std::move(object));
  }

  while (!failed()) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      break;
    }
    std::string key = parseString();
    skipWhitespace();
    if (!consume(':')) {
      setError("Expected ':' after object key");
      break;
    }
    skipWhitespace();
    JsonValue value = parseValue();
    if (failed()) {
      break;
    }
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    if (consume('}')) {
      --m_depth;
      return JsonValue(std::move(object));
    }
    if (!consume(',')) {
      setError("Expected ',' or '}' in object");
    }
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Nesting too deep");
    return JsonValue();
  }
  advance(); // '['

  JsonArray array;
  skipWhitespace();
  if (consume(']')) {
    --m_depth;
    return JsonValue(std::move(array));
  }

  while (!failed()) {
    skipWhitespace();
    array.push_back(parseValue());
    if (failed()) {
      break;
    }
    skipWhitespace();
    if (consume(']')) {
      --m_depth;
      return JsonValue(std::move(array));
    }
    if (!consume(',')) {
      setError("Expected ',' or ']' in array");
    }
  }
  return JsonValue();
}

JsonValue JsonReader::parseLiteral() {
  auto matchWord = [this](std::string_view word) {
    if (m_input.compare(m_position, word.size(), word) != 0) {
      return false;
    }
    for (size_t i = 0; i < word.size(); ++i) {
      advance();
    }
    return true;
  };

  if (matchWord("true")) {
    return JsonValue(true);
  }
  if (matchWord("false")) {
    return JsonValue(false);
  }
  if (matchWord("null")) {
    return JsonValue();
  }

  setError("Unexpected character: " + std::string(1, peek()));
  return JsonValue();
}

std::string JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (m_position < m_input.size()) {
    const char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return "";
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    if (m_position >= m_input.size()) {
      break;
    }
    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u': {
      uint32_t codepoint = parseHex4();
      if (failed()) {
        return "";
      }
      // Surrogate pair
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\') {
        advance();
        if (!consume('u')) {
          setError("Invalid Unicode surrogate pair");
          return "";
        }
        const uint32_t low = parseHex4();
        if (failed() || low < 0xDC00 || low > 0xDFFF) {
          setError("Invalid Unicode surrogate pair");
          return "";
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return "";
    }
  }

  setError("Unterminated string");
  return "";
}

double JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }
  if (!isDigit(peek())) {
    setError("Invalid number format");
    return 0.0;
  }
  while (isDigit(peek())) {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return 0.0;
    }
    while (isDigit(peek())) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return 0.0;
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    setError("Number out of range");
    return 0.0;
  }
  return value;
}

uint32_t JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return 0;
    }
    advance();
    value = (value << 4) | digit;
  }
  return value;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    return '\0';
  }
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    const char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  // Keep the first error; later ones are cascades
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

} // namespace GlyphFlow
