#pragma once

#include "clawlink/common/result.hpp"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clawlink::common {

/// Tagged JSON value used for RPC params, results and event payloads.
///
/// Accessors never throw: a lookup or conversion that does not match the stored
/// type yields `std::nullopt` (or `nullptr` for member lookups).
class JsonValue {
public:
  enum class Type { Null, Bool, Number, String, Array, Object };

  using Array = std::vector<JsonValue>;
  using Object = std::map<std::string, JsonValue>;

  JsonValue() = default;
  JsonValue(std::nullptr_t) {}
  JsonValue(bool value) : type_(Type::Bool), bool_(value) {}
  JsonValue(int value) : type_(Type::Number), number_(value) {}
  JsonValue(std::int64_t value) : type_(Type::Number), number_(static_cast<double>(value)) {}
  JsonValue(double value) : type_(Type::Number), number_(value) {}
  JsonValue(const char *value) : type_(Type::String), string_(value) {}
  JsonValue(std::string value) : type_(Type::String), string_(std::move(value)) {}
  JsonValue(Array value) : type_(Type::Array), array_(std::move(value)) {}
  JsonValue(Object value) : type_(Type::Object), object_(std::move(value)) {}

  static JsonValue object(std::initializer_list<std::pair<const std::string, JsonValue>> members);
  static JsonValue array(std::initializer_list<JsonValue> items);

  [[nodiscard]] Type type() const { return type_; }
  [[nodiscard]] bool is_null() const { return type_ == Type::Null; }
  [[nodiscard]] bool is_bool() const { return type_ == Type::Bool; }
  [[nodiscard]] bool is_number() const { return type_ == Type::Number; }
  [[nodiscard]] bool is_string() const { return type_ == Type::String; }
  [[nodiscard]] bool is_array() const { return type_ == Type::Array; }
  [[nodiscard]] bool is_object() const { return type_ == Type::Object; }

  [[nodiscard]] std::optional<bool> as_bool() const;
  [[nodiscard]] std::optional<double> as_number() const;
  [[nodiscard]] std::optional<std::int64_t> as_int() const;
  [[nodiscard]] std::optional<std::string> as_string() const;
  [[nodiscard]] const Array *as_array() const;
  [[nodiscard]] const Object *as_object() const;

  /// Member lookup; nullptr when this is not an object or the key is absent.
  [[nodiscard]] const JsonValue *find(const std::string &key) const;
  [[nodiscard]] bool contains(const std::string &key) const { return find(key) != nullptr; }

  [[nodiscard]] std::optional<std::string> string_field(const std::string &key) const;
  [[nodiscard]] std::optional<bool> bool_field(const std::string &key) const;
  [[nodiscard]] std::optional<double> number_field(const std::string &key) const;
  [[nodiscard]] std::optional<std::int64_t> int_field(const std::string &key) const;

  /// Sets a member, converting a null value into an empty object first.
  void set(const std::string &key, JsonValue value);
  void push_back(JsonValue value);

  [[nodiscard]] std::string dump() const;

  bool operator==(const JsonValue &other) const;
  bool operator!=(const JsonValue &other) const { return !(*this == other); }

private:
  void dump_to(std::string &out) const;

  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  Array array_;
  Object object_;
};

[[nodiscard]] Result<JsonValue> parse_json(const std::string &text);

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

} // namespace clawlink::common
