#include "clawlink/common/toml.hpp"

#include "clawlink/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace clawlink::common {

namespace {

std::string at_line(const std::size_t line, const std::string &message) {
  return "line " + std::to_string(line) + ": " + message;
}

bool is_bare_key(const std::string &key) {
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_' && ch != '-' &&
        ch != '.') {
      return false;
    }
  }
  return key.front() != '.' && key.back() != '.' && key.find("..") == std::string::npos;
}

/// Everything after a value must be blank or a comment.
bool only_trailing_comment(const std::string &rest) {
  const std::string tail = trim(rest);
  return tail.empty() || tail.front() == '#';
}

/// Reads a "..." string starting at `text[0]`. `consumed` receives the length
/// including both quotes.
bool read_basic_string(const std::string &text, std::string &out, std::size_t &consumed,
                       std::string &error) {
  for (std::size_t i = 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '"') {
      consumed = i + 1;
      return true;
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (++i >= text.size()) {
      break;
    }
    switch (text[i]) {
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
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
    default:
      error = std::string("unsupported escape \\") + text[i];
      return false;
    }
  }
  error = "unterminated string";
  return false;
}

Status parse_value(const std::string &raw, TomlValue &value) {
  const std::size_t line = value.line;
  if (raw.empty()) {
    return Status::error(at_line(line, "missing value"));
  }

  if (raw.front() == '"') {
    std::size_t consumed = 0;
    std::string error;
    if (!read_basic_string(raw, value.text, consumed, error)) {
      return Status::error(at_line(line, error));
    }
    if (!only_trailing_comment(raw.substr(consumed))) {
      return Status::error(at_line(line, "unexpected text after string"));
    }
    value.kind = TomlValue::Kind::String;
    return Status::success();
  }

  if (raw.front() == '\'') {
    const auto close = raw.find('\'', 1);
    if (close == std::string::npos) {
      return Status::error(at_line(line, "unterminated string"));
    }
    if (!only_trailing_comment(raw.substr(close + 1))) {
      return Status::error(at_line(line, "unexpected text after string"));
    }
    value.text = raw.substr(1, close - 1);
    value.kind = TomlValue::Kind::String;
    return Status::success();
  }

  const auto hash = raw.find('#');
  const std::string token = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
  if (token == "true" || token == "false") {
    value.flag = token == "true";
    value.kind = TomlValue::Kind::Bool;
    return Status::success();
  }

  std::string digits;
  for (const char ch : token) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  const char *first = digits.data();
  const char *last = first + digits.size();
  if (!digits.empty() && digits.front() == '+') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, value.number);
  if (first == last || ec != std::errc() || ptr != last) {
    return Status::error(at_line(line, "unsupported value '" + token + "'"));
  }
  value.kind = TomlValue::Kind::Integer;
  return Status::success();
}

} // namespace

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &[key, value] : values_) {
    out.push_back(key);
  }
  return out;
}

Result<std::string> TomlDocument::get_string(const std::string &key,
                                             const std::string &fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::string>::success(fallback);
  }
  if (it->second.kind != TomlValue::Kind::String) {
    return Result<std::string>::failure(at_line(it->second.line, key + " must be a string"));
  }
  return Result<std::string>::success(it->second.text);
}

Result<bool> TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<bool>::success(fallback);
  }
  if (it->second.kind != TomlValue::Kind::Bool) {
    return Result<bool>::failure(at_line(it->second.line, key + " must be true or false"));
  }
  return Result<bool>::success(it->second.flag);
}

Result<std::uint64_t> TomlDocument::get_u64(const std::string &key,
                                            const std::uint64_t fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::uint64_t>::success(fallback);
  }
  if (it->second.kind != TomlValue::Kind::Integer) {
    return Result<std::uint64_t>::failure(
        at_line(it->second.line, key + " must be a non-negative integer"));
  }
  return Result<std::uint64_t>::success(it->second.number);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string table;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(line);
    if (clean.empty() || clean.front() == '#') {
      continue;
    }

    if (clean.front() == '[') {
      const auto close = clean.find(']');
      if (close == std::string::npos || !only_trailing_comment(clean.substr(close + 1))) {
        return Result<TomlDocument>::failure(at_line(line_number, "malformed table header"));
      }
      table = trim(clean.substr(1, close - 1));
      if (!is_bare_key(table)) {
        return Result<TomlDocument>::failure(
            at_line(line_number, "invalid table name '" + table + "'"));
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(at_line(line_number, "expected key = value"));
    }
    const std::string key = trim(clean.substr(0, equals));
    if (!is_bare_key(key)) {
      return Result<TomlDocument>::failure(at_line(line_number, "invalid key '" + key + "'"));
    }
    const std::string full_key = table.empty() ? key : table + "." + key;

    TomlValue value;
    value.line = line_number;
    if (const auto parsed = parse_value(trim(clean.substr(equals + 1)), value); !parsed.ok()) {
      return Result<TomlDocument>::failure(parsed.error());
    }
    if (!document.insert(full_key, std::move(value))) {
      return Result<TomlDocument>::failure(
          at_line(line_number, "duplicate key '" + full_key + "'"));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
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
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace clawlink::common
