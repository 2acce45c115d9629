#include "clawlink/common/json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace clawlink::common {

namespace {

constexpr std::size_t kMaxDepth = 128;

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6u)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Result<JsonValue> parse_document() {
    skip_ws();
    JsonValue value;
    if (!parse_value(value, 0)) {
      return Result<JsonValue>::failure(error_);
    }
    skip_ws();
    if (pos_ != text_.size()) {
      return Result<JsonValue>::failure("trailing characters at offset " + std::to_string(pos_));
    }
    return Result<JsonValue>::success(std::move(value));
  }

private:
  bool fail(const std::string &message) {
    error_ = message + " at offset " + std::to_string(pos_);
    return false;
  }

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume_literal(const char *literal) {
    const std::string word(literal);
    if (text_.compare(pos_, word.size(), word) != 0) {
      return fail("invalid literal");
    }
    pos_ += word.size();
    return true;
  }

  bool parse_value(JsonValue &out, const std::size_t depth) {
    if (depth > kMaxDepth) {
      return fail("nesting too deep");
    }
    skip_ws();
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }
    const char ch = text_[pos_];
    switch (ch) {
    case '{':
      return parse_object(out, depth);
    case '[':
      return parse_array(out, depth);
    case '"': {
      std::string value;
      if (!parse_string(value)) {
        return false;
      }
      out = JsonValue(std::move(value));
      return true;
    }
    case 't':
      out = JsonValue(true);
      return consume_literal("true");
    case 'f':
      out = JsonValue(false);
      return consume_literal("false");
    case 'n':
      out = JsonValue();
      return consume_literal("null");
    default:
      return parse_number(out);
    }
  }

  bool parse_object(JsonValue &out, const std::size_t depth) {
    ++pos_; // {
    JsonValue::Object members;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      out = JsonValue(std::move(members));
      return true;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      std::string key;
      if (!parse_string(key)) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      members[std::move(key)] = std::move(value);
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        break;
      }
      return fail("expected ',' or '}'");
    }
    out = JsonValue(std::move(members));
    return true;
  }

  bool parse_array(JsonValue &out, const std::size_t depth) {
    ++pos_; // [
    JsonValue::Array items;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      out = JsonValue(std::move(items));
      return true;
    }
    while (true) {
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      items.push_back(std::move(value));
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        break;
      }
      return fail("expected ',' or ']'");
    }
    out = JsonValue(std::move(items));
    return true;
  }

  bool parse_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      return fail("truncated unicode escape");
    }
    out = 0;
    for (std::size_t i = 0; i < 4; ++i) {
      const char ch = text_[pos_ + i];
      out <<= 4u;
      if (ch >= '0' && ch <= '9') {
        out |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        out |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        out |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
      }
    }
    pos_ += 4;
    return true;
  }

  bool parse_string(std::string &out) {
    ++pos_; // opening quote
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20u) {
        return fail("control character in string");
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) {
          return false;
        }
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          std::uint32_t low = 0;
          if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
            return fail("unpaired surrogate");
          }
          pos_ += 2;
          if (!parse_hex4(low) || low < 0xDC00u || low > 0xDFFFu) {
            return fail("invalid low surrogate");
          }
          cp = 0x10000u + ((cp - 0xD800u) << 10u) + (low - 0xDC00u);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parse_number(JsonValue &out) {
    const std::size_t start = pos_;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    bool digits = false;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        digits = true;
      } else if (ch != '.' && ch != 'e' && ch != 'E' && ch != '+' && ch != '-') {
        break;
      }
      ++pos_;
    }
    if (!digits) {
      pos_ = start;
      return fail("unexpected character");
    }
    const std::string token = text_.substr(start, pos_ - start);
    try {
      std::size_t used = 0;
      const double value = std::stod(token, &used);
      if (used != token.size()) {
        pos_ = start;
        return fail("invalid number");
      }
      out = JsonValue(value);
    } catch (const std::exception &) {
      pos_ = start;
      return fail("invalid number");
    }
    return true;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string error_;
};

} // namespace

JsonValue JsonValue::object(
    std::initializer_list<std::pair<const std::string, JsonValue>> members) {
  return JsonValue(Object(members));
}

JsonValue JsonValue::array(std::initializer_list<JsonValue> items) {
  return JsonValue(Array(items));
}

std::optional<bool> JsonValue::as_bool() const {
  if (type_ != Type::Bool) {
    return std::nullopt;
  }
  return bool_;
}

std::optional<double> JsonValue::as_number() const {
  if (type_ != Type::Number) {
    return std::nullopt;
  }
  return number_;
}

std::optional<std::int64_t> JsonValue::as_int() const {
  if (type_ != Type::Number || !std::isfinite(number_) ||
      number_ < -9223372036854775808.0 || number_ >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(number_);
}

std::optional<std::string> JsonValue::as_string() const {
  if (type_ != Type::String) {
    return std::nullopt;
  }
  return string_;
}

const JsonValue::Array *JsonValue::as_array() const {
  return type_ == Type::Array ? &array_ : nullptr;
}

const JsonValue::Object *JsonValue::as_object() const {
  return type_ == Type::Object ? &object_ : nullptr;
}

const JsonValue *JsonValue::find(const std::string &key) const {
  if (type_ != Type::Object) {
    return nullptr;
  }
  const auto it = object_.find(key);
  return it == object_.end() ? nullptr : &it->second;
}

std::optional<std::string> JsonValue::string_field(const std::string &key) const {
  const auto *value = find(key);
  return value == nullptr ? std::nullopt : value->as_string();
}

std::optional<bool> JsonValue::bool_field(const std::string &key) const {
  const auto *value = find(key);
  return value == nullptr ? std::nullopt : value->as_bool();
}

std::optional<double> JsonValue::number_field(const std::string &key) const {
  const auto *value = find(key);
  return value == nullptr ? std::nullopt : value->as_number();
}

std::optional<std::int64_t> JsonValue::int_field(const std::string &key) const {
  const auto *value = find(key);
  return value == nullptr ? std::nullopt : value->as_int();
}

void JsonValue::set(const std::string &key, JsonValue value) {
  if (type_ == Type::Null) {
    type_ = Type::Object;
  }
  if (type_ != Type::Object) {
    return;
  }
  object_[key] = std::move(value);
}

void JsonValue::push_back(JsonValue value) {
  if (type_ == Type::Null) {
    type_ = Type::Array;
  }
  if (type_ != Type::Array) {
    return;
  }
  array_.push_back(std::move(value));
}

std::string JsonValue::dump() const {
  std::string out;
  dump_to(out);
  return out;
}

void JsonValue::dump_to(std::string &out) const {
  switch (type_) {
  case Type::Null:
    out += "null";
    break;
  case Type::Bool:
    out += bool_ ? "true" : "false";
    break;
  case Type::Number: {
    if (!std::isfinite(number_)) {
      out += "null";
      break;
    }
    double integral = 0.0;
    if (std::modf(number_, &integral) == 0.0 && std::fabs(number_) < 9.0e15) {
      out += std::to_string(static_cast<std::int64_t>(number_));
      break;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", number_);
    out += buffer;
    break;
  }
  case Type::String:
    out += "\"";
    out += json_escape(string_);
    out += "\"";
    break;
  case Type::Array: {
    out += "[";
    bool first = true;
    for (const auto &item : array_) {
      if (!first) {
        out += ",";
      }
      first = false;
      item.dump_to(out);
    }
    out += "]";
    break;
  }
  case Type::Object: {
    out += "{";
    bool first = true;
    for (const auto &[key, value] : object_) {
      if (!first) {
        out += ",";
      }
      first = false;
      out += "\"";
      out += json_escape(key);
      out += "\":";
      value.dump_to(out);
    }
    out += "}";
    break;
  }
  }
}

bool JsonValue::operator==(const JsonValue &other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
  case Type::Null:
    return true;
  case Type::Bool:
    return bool_ == other.bool_;
  case Type::Number:
    return number_ == other.number_;
  case Type::String:
    return string_ == other.string_;
  case Type::Array:
    return array_ == other.array_;
  case Type::Object:
    return object_ == other.object_;
  }
  return false;
}

Result<JsonValue> parse_json(const std::string &text) {
  Parser parser(text);
  return parser.parse_document();
}

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20u) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

} // namespace clawlink::common
