#pragma once

#include <cstdint>
#include <string>

namespace clawlink::config {

struct GatewayConfig {
  std::string url = "wss://127.0.0.1:443";
  std::string client_type = "node";
  std::uint32_t request_timeout_secs = 30;
  bool tls_verify = true;
};

struct PairingConfig {
  std::uint32_t poll_interval_secs = 2;
  std::uint32_t max_poll_attempts = 150;
};

struct ReconnectConfig {
  std::uint32_t max_attempts = 5;
  std::uint32_t max_delay_secs = 30;
};

struct DeviceConfig {
  std::string display_name;
  std::string identity_db = "~/.clawlink/identity.db";
};

struct SecretsConfig {
  std::string dir = "~/.clawlink/secrets";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GatewayConfig gateway;
  PairingConfig pairing;
  ReconnectConfig reconnect;
  DeviceConfig device;
  SecretsConfig secrets;
  ObservabilityConfig observability;
};

} // namespace clawlink::config
