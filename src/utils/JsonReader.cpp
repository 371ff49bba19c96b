/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace CityScale {

namespace {
constexpr int MAX_NESTING_DEPTH = 64;

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static const char HEX[] = "0123456789abcdef";
        const auto byte = static_cast<unsigned char>(c);
        stream << "\\u00" << HEX[byte >> 4] << HEX[byte & 0x0F];
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}
} // namespace

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  if (isObject())
    return &asObject();
  return nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss, 2, 0);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream, int indent,
                              int depth) const {
  const std::string pad(static_cast<size_t>(indent * (depth + 1)), ' ');
  const std::string closePad(static_cast<size_t>(indent * depth), ' ');

  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      std::ostringstream precise;
      precise.precision(17);
      precise << num;
      stream << precise.str();
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    stream << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      stream << (i > 0 ? ", " : "");
      arr[i].writeToStream(stream, indent, depth + 1);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    if (obj.empty()) {
      stream << "{}";
      break;
    }
    stream << "{\n";
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        stream << ",\n";
      first = false;
      stream << pad;
      writeEscaped(stream, key);
      stream << ": ";
      value.writeToStream(stream, indent, depth + 1);
    }
    stream << "\n" << closePad << "}";
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    setError("Could not open file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing characters");
    return false;
  }
  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    return '\0';
  }
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (std::isspace(static_cast<unsigned char>(peek()))) {
    advance();
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      setError(std::string("Invalid literal, expected '") + literal + "'");
      return false;
    }
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    setError("Nesting too deep");
    return false;
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
    out = JsonValue(true);
    return expectLiteral("true");
  case 'f':
    out = JsonValue(false);
    return expectLiteral("false");
  case 'n':
    out = JsonValue();
    return expectLiteral("null");
  case '\0':
    setError("Unexpected end of input");
    return false;
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
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
    std::string key;
    if (peek() != '"' || !parseString(key)) {
      if (m_lastError.empty()) {
        setError("Expected string key");
      }
      return false;
    }
    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after key '" + key + "'");
      return false;
    }
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth + 1)) {
      return false;
    }
    object[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return false;
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
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
    char c = advance();
    if (c == ']') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return false;
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();
  while (true) {
    if (m_position >= m_input.size()) {
      setError("Unterminated string");
      return false;
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (!parseUnicodeEscape(out)) {
        return false;
      }
      break;
    default:
      setError(std::string("Unsupported escape sequence \\") + escaped);
      return false;
    }
  }
}

// Basic Multilingual Plane only; surrogate halves are rejected
bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t code = 0;
  for (int i = 0; i < 4; ++i) {
    const char h = advance();
    code <<= 4;
    if (h >= '0' && h <= '9') {
      code |= static_cast<uint32_t>(h - '0');
    } else if (h >= 'a' && h <= 'f') {
      code |= static_cast<uint32_t>(h - 'a' + 10);
    } else if (h >= 'A' && h <= 'F') {
      code |= static_cast<uint32_t>(h - 'A' + 10);
    } else {
      setError("Invalid hex digit in \\u escape");
      return false;
    }
  }
  if (code >= 0xD800 && code <= 0xDFFF) {
    setError("Surrogate \\u escapes are not supported");
    return false;
  }

  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  if (peek() == '-') {
    advance();
  }
  auto isNumberChar = [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
           c == 'e' || c == 'E' || c == '+' || c == '-';
  };
  while (isNumberChar(peek())) {
    advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  if (text.empty() || text == "-") {
    setError("Unexpected character");
    return false;
  }

  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(value)) {
    setError("Invalid number '" + text + "'");
    return false;
  }
  out = JsonValue(value);
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (!m_lastError.empty()) {
    return;
  }
  m_lastError = "JSON error at line " + std::to_string(m_line) + ", column " +
                std::to_string(m_column) + ": " + message;
}

} // namespace CityScale
