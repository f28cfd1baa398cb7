#ifndef AGENTCORE_CORE_JSON_DOM_HPP_
#define AGENTCORE_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace agentcore::core::json {

// Small STL-only DOM shared by the table config loader and tests.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Returns the member named `key`, or nullptr when `object` is not an object
// or has no such member.
inline const Value* FindMember(const Value& object, std::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Recursive-descent parser. Diagnostics carry line/column of the failing
// token. Nesting is capped so hostile input cannot exhaust the stack.
class Parser {
public:
  static constexpr std::size_t kMaxDepth = 64;

  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    error.clear();
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting depth exceeds " + std::to_string(kMaxDepth), error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    const char c = Peek();
    switch (c) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    default:
      break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeKeyword("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeKeyword("false")) {
      value.type = Value::Type::kBool;
      return true;
    }
    if (ConsumeKeyword("null")) {
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      if (value.object_value.count(key) != 0U) {
        return Fail("duplicate object key '" + key + "'", error);
      }

      SkipWhitespace();
      if (!Expect(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();

      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.object_value.emplace(std::move(key), std::move(item));

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Expect(',', "expected ',' or '}' after object member", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Expect(',', "expected ',' or ']' after array item", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!Expect('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }

      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Decodes \uXXXX for the Basic Multilingual Plane into UTF-8. Surrogate
  // halves are rejected.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }

    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate code points are not supported", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    const std::size_t start = pos_;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
    return pos_ > start;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool Expect(char expected, std::string_view message, std::string& error) {
    if (!Match(expected)) {
      return Fail(message, error);
    }
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace agentcore::core::json

#endif // AGENTCORE_CORE_JSON_DOM_HPP_
