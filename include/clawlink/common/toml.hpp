#pragma once

#include "clawlink/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace clawlink::common {

struct TomlValue {
  enum class Kind { String, Bool, Integer };

  Kind kind = Kind::String;
  std::string text;
  bool flag = false;
  std::uint64_t number = 0;
  std::size_t line = 0;
};

/// Flat view of a TOML document: every key is addressed as `section.key`.
///
/// Covers the subset the config file uses: `[table]` headers, basic and literal
/// strings, booleans and non-negative integers. Values are typed at parse time,
/// so a getter fails when the stored value has a different type.
class TomlDocument {
public:
  /// Returns false when the key is already present.
  [[nodiscard]] bool insert(const std::string &key, TomlValue value) {
    return values_.emplace(key, std::move(value)).second;
  }

  [[nodiscard]] bool has(const std::string &key) const { return values_.contains(key); }
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] Result<std::string> get_string(const std::string &key,
                                               const std::string &fallback = "") const;
  [[nodiscard]] Result<bool> get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] Result<std::uint64_t> get_u64(const std::string &key,
                                              std::uint64_t fallback) const;

private:
  std::map<std::string, TomlValue> values_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// Basic-string literal for `value`, escaped so parse_toml reads it back.
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace clawlink::common
