#include "clawlink/config/config.hpp"

#include "clawlink/common/fs.hpp"
#include "clawlink/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>

namespace clawlink::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".clawlink";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CLAWLINK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

constexpr const char *KNOWN_KEYS[] = {
    "gateway.url",
    "gateway.client_type",
    "gateway.request_timeout_secs",
    "gateway.tls_verify",
    "pairing.poll_interval_secs",
    "pairing.max_poll_attempts",
    "reconnect.max_attempts",
    "reconnect.max_delay_secs",
    "device.display_name",
    "device.identity_db",
    "secrets.dir",
    "observability.backend",
};

bool is_known_key(const std::string &key) {
  for (const char *known : KNOWN_KEYS) {
    if (key == known) {
      return true;
    }
  }
  return false;
}

/// Reads typed values and remembers the first failure.
class FieldReader {
public:
  explicit FieldReader(const common::TomlDocument &doc) : doc_(doc) {}

  void read(const std::string &key, std::string &target) {
    keep(doc_.get_string(key, target), target);
  }
  void read(const std::string &key, bool &target) { keep(doc_.get_bool(key, target), target); }
  void read(const std::string &key, std::uint32_t &target) {
    const auto value = doc_.get_u64(key, target);
    if (!value.ok()) {
      fail(value.error());
      return;
    }
    if (value.value() > std::numeric_limits<std::uint32_t>::max()) {
      fail(key + " is out of range");
      return;
    }
    target = static_cast<std::uint32_t>(value.value());
  }

  [[nodiscard]] const std::optional<std::string> &error() const { return error_; }

private:
  template <typename T> void keep(const common::Result<T> &value, T &target) {
    if (value.ok()) {
      target = value.value();
    } else {
      fail(value.error());
    }
  }

  void fail(const std::string &message) {
    if (!error_.has_value()) {
      error_ = message;
    }
  }

  const common::TomlDocument &doc_;
  std::optional<std::string> error_;
};

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *url = std::getenv("CLAWLINK_GATEWAY_URL"); url != nullptr && *url) {
    config.gateway.url = url;
  }

  if (const char *name = std::getenv("CLAWLINK_DISPLAY_NAME"); name != nullptr && *name) {
    config.device.display_name = name;
  }

  if (const char *backend = std::getenv("CLAWLINK_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (common::trim(config.device.display_name).empty()) {
    config.device.display_name = common::host_name();
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    config.device.identity_db = expand_config_value(config.device.identity_db);
    config.secrets.dir = expand_config_value(config.secrets.dir);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto contents = common::read_file(path);
  if (!contents.ok()) {
    return common::Result<Config>::failure(contents.error());
  }
  const auto parsed = common::parse_toml(contents.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  const auto &doc = parsed.value();
  for (const auto &key : doc.keys()) {
    if (!is_known_key(key)) {
      return common::Result<Config>::failure(path.string() + ": unknown key '" + key + "'");
    }
  }

  FieldReader reader(doc);
  reader.read("gateway.url", config.gateway.url);
  reader.read("gateway.client_type", config.gateway.client_type);
  reader.read("gateway.request_timeout_secs", config.gateway.request_timeout_secs);
  reader.read("gateway.tls_verify", config.gateway.tls_verify);
  reader.read("pairing.poll_interval_secs", config.pairing.poll_interval_secs);
  reader.read("pairing.max_poll_attempts", config.pairing.max_poll_attempts);
  reader.read("reconnect.max_attempts", config.reconnect.max_attempts);
  reader.read("reconnect.max_delay_secs", config.reconnect.max_delay_secs);
  reader.read("device.display_name", config.device.display_name);
  reader.read("device.identity_db", config.device.identity_db);
  reader.read("secrets.dir", config.secrets.dir);
  reader.read("observability.backend", config.observability.backend);
  if (reader.error().has_value()) {
    return common::Result<Config>::failure(path.string() + ": " + *reader.error());
  }

  config.gateway.url = expand_config_value(config.gateway.url);
  config.device.identity_db = expand_config_value(config.device.identity_db);
  config.secrets.dir = expand_config_value(config.secrets.dir);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  std::ostringstream out;
  out << "[gateway]\n";
  out << "url = " << common::quote_toml_string(config.gateway.url) << "\n";
  out << "client_type = " << common::quote_toml_string(config.gateway.client_type) << "\n";
  out << "request_timeout_secs = " << config.gateway.request_timeout_secs << "\n";
  out << "tls_verify = " << bool_to_toml(config.gateway.tls_verify) << "\n";

  out << "\n[pairing]\n";
  out << "poll_interval_secs = " << config.pairing.poll_interval_secs << "\n";
  out << "max_poll_attempts = " << config.pairing.max_poll_attempts << "\n";

  out << "\n[reconnect]\n";
  out << "max_attempts = " << config.reconnect.max_attempts << "\n";
  out << "max_delay_secs = " << config.reconnect.max_delay_secs << "\n";

  out << "\n[device]\n";
  out << "display_name = " << common::quote_toml_string(config.device.display_name) << "\n";
  out << "identity_db = " << common::quote_toml_string(config.device.identity_db) << "\n";

  out << "\n[secrets]\n";
  out << "dir = " << common::quote_toml_string(config.secrets.dir) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(path, out.str(), 0644);
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;

  const std::string url = common::to_lower(common::trim(config.gateway.url));
  if (!url.starts_with("ws://") && !url.starts_with("wss://")) {
    problems.push_back("gateway.url must use ws:// or wss://: " + config.gateway.url);
  }
  if (config.gateway.request_timeout_secs == 0) {
    problems.push_back("gateway.request_timeout_secs must be greater than 0");
  }
  if (common::trim(config.gateway.client_type).empty()) {
    problems.push_back("gateway.client_type must not be empty");
  }
  if (config.pairing.poll_interval_secs == 0) {
    problems.push_back("pairing.poll_interval_secs must be greater than 0");
  }
  if (config.pairing.max_poll_attempts == 0) {
    problems.push_back("pairing.max_poll_attempts must be greater than 0");
  }
  if (config.reconnect.max_attempts == 0) {
    problems.push_back("reconnect.max_attempts must be greater than 0");
  }
  if (config.reconnect.max_delay_secs == 0) {
    problems.push_back("reconnect.max_delay_secs must be greater than 0");
  }
  return problems;
}

} // namespace clawlink::config
