#include "clawlink/cli/commands.hpp"

#include "clawlink/common/fs.hpp"
#include "clawlink/config/config.hpp"
#include "clawlink/gateway/controller.hpp"
#include "clawlink/observability/factory.hpp"
#include "clawlink/observability/global.hpp"
#include "clawlink/observability/multi_observer.hpp"
#include "clawlink/runtime/event_loop.hpp"
#include "clawlink/storage/identity_store.hpp"
#include "clawlink/storage/secret_store.hpp"
#include "clawlink/transport/websocket.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace clawlink::cli {

// Slack on top of the request timeout so the correlator reports the timeout first.
constexpr auto RPC_WAIT_SLACK = std::chrono::seconds(5);

std::chrono::seconds rpc_wait(const config::Config &config) {
  return std::chrono::seconds(config.gateway.request_timeout_secs) + RPC_WAIT_SLACK;
}

namespace {

std::string version_string() {
#ifdef CLAWLINK_VERSION
  std::string version = CLAWLINK_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "clawlink " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (args[i].starts_with("--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_double(const std::string &raw, double &out) {
  try {
    std::size_t used = 0;
    out = std::stod(raw, &used);
    return used == raw.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_u32(const std::string &raw, std::uint32_t &out) {
  try {
    std::size_t used = 0;
    const unsigned long value = std::stoul(raw, &used);
    if (used != raw.size() || value > 0xFFFFFFFFUL) {
      return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string format_time(const gateway::Timestamp value) {
  const std::time_t raw = gateway::Clock::to_time_t(value);
  std::tm local{};
  localtime_r(&raw, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

/// Mirrors controller state onto the CLI thread and prints streaming output.
class SessionMonitor {
public:
  void on_connection(const gateway::ConnectionState &state) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connection_ = state;
    }
    cv_.notify_all();
  }

  void on_pairing(const gateway::PairingState &state) {
    if (state.is_pending()) {
      std::cout << "Pairing code: " << (state.code.empty() ? "(none)" : state.code)
                << "\nApprove this device on the gateway to continue.\n"
                << std::flush;
    } else if (state.kind == gateway::PairingState::Kind::Failed) {
      std::cerr << "Pairing failed: " << state.reason << "\n";
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pairing_ = state;
    }
    cv_.notify_all();
  }

  void on_conversation(const gateway::Conversation &conversation) {
    if (!stream_output_ || conversation.messages.empty()) {
      return;
    }
    const auto &last = conversation.messages.back();
    if (last.role != gateway::MessageRole::Assistant) {
      return;
    }
    std::size_t &printed = printed_[last.id];
    if (printed < last.content.size()) {
      std::cout << last.content.substr(printed) << std::flush;
      printed = last.content.size();
    }
    if (!last.is_streaming && finished_.insert(last.id).second) {
      std::cout << "\n" << std::flush;
    }
  }

  void on_gateway_error(const gateway::GatewayError &error) {
    std::cerr << "Gateway error [" << error.code << "]: " << error.message << "\n";
  }

  void set_stream_output(bool enabled) { stream_output_ = enabled; }

  /// Blocks until the device is paired and connected. Pairing approval can take
  /// minutes, hence the caller-provided budget.
  bool wait_ready(std::chrono::seconds budget, std::string &error) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool settled = cv_.wait_for(lock, budget, [this]() {
      return (connection_.is_connected() && pairing_.is_paired()) ||
             pairing_.kind == gateway::PairingState::Kind::Failed ||
             connection_.reason == gateway::MAX_RECONNECT_MESSAGE;
    });
    if (!settled) {
      error = "Timed out waiting for the gateway";
      return false;
    }
    if (pairing_.kind == gateway::PairingState::Kind::Failed) {
      error = pairing_.reason;
      return false;
    }
    if (!connection_.is_connected()) {
      error = connection_.reason;
      return false;
    }
    return true;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  gateway::ConnectionState connection_;
  gateway::PairingState pairing_;
  // Touched only from the loop thread.
  bool stream_output_ = false;
  std::map<std::string, std::size_t> printed_;
  std::set<std::string> finished_;
};

struct ClientStack {
  config::Config config;
  SessionMonitor monitor;
  runtime::EventLoop loop;
  std::unique_ptr<storage::ISecretStore> secrets;
  std::unique_ptr<storage::IIdentityStore> identities;
  std::unique_ptr<gateway::Controller> controller;

  ~ClientStack() {
    loop.stop();
    controller.reset();
  }

  /// Runs `fn` on the loop and waits for its value.
  template <typename Fn> auto query(Fn fn) -> decltype(fn()) {
    std::promise<decltype(fn())> promise;
    auto future = promise.get_future();
    loop.post([&promise, &fn]() { promise.set_value(fn()); });
    return future.get();
  }
};

common::Result<std::unique_ptr<ClientStack>> build_stack(const config::Config &config) {
  using StackResult = common::Result<std::unique_ptr<ClientStack>>;

  if (const auto problems = config::validate_config(config); !problems.empty()) {
    std::string joined = "Invalid configuration:";
    for (const auto &problem : problems) {
      joined += "\n  " + problem;
    }
    return StackResult::failure(joined);
  }

  auto stack = std::make_unique<ClientStack>();
  stack->config = config;
  stack->identities = std::make_unique<storage::SqliteIdentityStore>(config.device.identity_db);
  stack->secrets = std::make_unique<storage::EncryptedFileSecretStore>(config.secrets.dir);

  auto identity = storage::load_or_create_identity(*stack->identities, config.device.display_name);
  if (!identity.ok()) {
    return StackResult::failure("Unable to load device identity: " + identity.error());
  }

  gateway::ControllerOptions options;
  options.url = config.gateway.url;
  options.client_type = config.gateway.client_type;
  options.tls_verify = config.gateway.tls_verify;
  options.request_timeout = std::chrono::seconds(config.gateway.request_timeout_secs);
  options.pairing.poll_interval = std::chrono::seconds(config.pairing.poll_interval_secs);
  options.pairing.max_poll_attempts = config.pairing.max_poll_attempts;
  options.reconnect_max_attempts = config.reconnect.max_attempts;
  options.reconnect_max_delay = std::chrono::seconds(config.reconnect.max_delay_secs);

  SessionMonitor &monitor = stack->monitor;
  gateway::ControllerHooks hooks{
      .on_connection_state = [&monitor](const auto &state) { monitor.on_connection(state); },
      .on_pairing_state = [&monitor](const auto &state) { monitor.on_pairing(state); },
      .on_conversation_updated =
          [&monitor](const auto &conversation) { monitor.on_conversation(conversation); },
      .on_sub_agent_updated =
          [](const gateway::SubAgentInfo &info) {
            std::cout << "[sub-agent " << info.label << "] " << gateway::to_string(info.status)
                      << "\n";
          },
      .on_gateway_error = [&monitor](const auto &error) { monitor.on_gateway_error(error); },
  };

  stack->controller = std::make_unique<gateway::Controller>(
      stack->loop, std::make_unique<transport::WebSocketTransport>(), *stack->secrets,
      *stack->identities, identity.value(), std::move(options), std::move(hooks));
  stack->loop.start();
  return StackResult::success(std::move(stack));
}

std::chrono::seconds readiness_budget(const config::Config &config) {
  return std::chrono::seconds(static_cast<std::int64_t>(config.pairing.poll_interval_secs) *
                                  config.pairing.max_poll_attempts +
                              config.gateway.request_timeout_secs);
}

common::Result<std::unique_ptr<ClientStack>> connect_stack(const config::Config &config) {
  auto stack = build_stack(config);
  if (!stack.ok()) {
    return stack;
  }
  auto &client = *stack.value();
  client.controller->connect();
  std::string error;
  if (!client.monitor.wait_ready(readiness_budget(config), error)) {
    return common::Result<std::unique_ptr<ClientStack>>::failure(error);
  }
  return stack;
}

int report_rpc(std::future<gateway::RpcResult<common::JsonValue>> &future,
               const std::chrono::seconds wait) {
  if (future.wait_for(wait) != std::future_status::ready) {
    std::cerr << gateway::TIMEOUT_MESSAGE << "\n";
    return 1;
  }
  const auto result = future.get();
  if (!result.ok()) {
    std::cerr << "Send failed: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Sent.\n";
  return 0;
}

int run_send(const config::Config &config, std::vector<std::string> args) {
  std::string message;
  std::string session;
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--session", "-s", session);
  if (common::trim(message).empty()) {
    std::cerr << "Usage: clawlink send -m <text> [--session <key>]\n";
    return 1;
  }

  auto stack = connect_stack(config);
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  // Shared with the callback, which may still fire on the loop after a local timeout.
  auto done = std::make_shared<std::promise<gateway::RpcResult<common::JsonValue>>>();
  auto future = done->get_future();
  stack.value()->controller->send_message(
      message, session.empty() ? std::nullopt : std::optional<std::string>(session),
      [done](gateway::RpcResult<common::JsonValue> result) { done->set_value(std::move(result)); });
  return report_rpc(future, rpc_wait(config));
}

int run_location(const config::Config &config, std::vector<std::string> args) {
  std::string lat_raw;
  std::string lon_raw;
  std::string accuracy_raw;
  std::string ttl_raw;
  std::string session;
  (void)take_option(args, "--lat", "", lat_raw);
  (void)take_option(args, "--lon", "", lon_raw);
  (void)take_option(args, "--accuracy", "", accuracy_raw);
  (void)take_option(args, "--ttl", "", ttl_raw);
  (void)take_option(args, "--session", "-s", session);

  gateway::LocationShare location;
  location.timestamp = gateway::Clock::now();
  if (!parse_double(lat_raw, location.latitude) || !parse_double(lon_raw, location.longitude)) {
    std::cerr << "Usage: clawlink location --lat <deg> --lon <deg> [--accuracy <m>] [--ttl <s>]\n";
    return 1;
  }
  if (!accuracy_raw.empty()) {
    double accuracy = 0.0;
    if (!parse_double(accuracy_raw, accuracy)) {
      std::cerr << "invalid --accuracy: " << accuracy_raw << "\n";
      return 1;
    }
    location.accuracy = accuracy;
  }
  if (!ttl_raw.empty()) {
    std::uint32_t ttl = 0;
    if (!parse_u32(ttl_raw, ttl)) {
      std::cerr << "invalid --ttl: " << ttl_raw << "\n";
      return 1;
    }
    location.ttl = std::chrono::seconds(ttl);
  }

  auto stack = connect_stack(config);
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  // Shared with the callback, which may still fire on the loop after a local timeout.
  auto done = std::make_shared<std::promise<gateway::RpcResult<common::JsonValue>>>();
  auto future = done->get_future();
  stack.value()->controller->send_location(
      location, session.empty() ? std::nullopt : std::optional<std::string>(session),
      [done](gateway::RpcResult<common::JsonValue> result) { done->set_value(std::move(result)); });
  return report_rpc(future, rpc_wait(config));
}

int run_history(const config::Config &config, std::vector<std::string> args) {
  std::string limit_raw;
  (void)take_option(args, "--limit", "-n", limit_raw);
  if (args.empty()) {
    std::cerr << "Usage: clawlink history <sessionKey> [--limit N]\n";
    return 1;
  }
  std::uint32_t limit = 50;
  if (!limit_raw.empty() && !parse_u32(limit_raw, limit)) {
    std::cerr << "invalid --limit: " << limit_raw << "\n";
    return 1;
  }

  auto stack = connect_stack(config);
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  auto done = std::make_shared<std::promise<gateway::RpcResult<std::vector<gateway::Message>>>>();
  auto future = done->get_future();
  stack.value()->controller->fetch_history(
      args.front(), limit, [done](gateway::RpcResult<std::vector<gateway::Message>> result) {
        done->set_value(std::move(result));
      });
  if (future.wait_for(rpc_wait(config)) != std::future_status::ready) {
    std::cerr << gateway::TIMEOUT_MESSAGE << "\n";
    return 1;
  }
  const auto result = future.get();
  if (!result.ok()) {
    std::cerr << "History failed: " << result.error().message << "\n";
    return 1;
  }
  for (const auto &message : result.value()) {
    std::cout << "[" << format_time(message.timestamp) << "] " << gateway::to_string(message.role)
              << ": " << message.content << "\n";
  }
  return 0;
}

int run_chat(const config::Config &config, std::vector<std::string> args) {
  std::string session;
  (void)take_option(args, "--session", "-s", session);

  auto stack = build_stack(config);
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  auto &client = *stack.value();
  client.monitor.set_stream_output(true);
  client.controller->connect();
  std::string error;
  if (!client.monitor.wait_ready(readiness_budget(config), error)) {
    std::cerr << error << "\n";
    return 1;
  }

  const std::optional<std::string> key =
      session.empty() ? std::nullopt : std::optional<std::string>(session);
  std::cout << "Connected to " << config.gateway.url << " as "
            << client.query([&client, &key]() { return client.controller->resolve_session_key(key); })
            << "\nType a message, /quit to exit.\n";

  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    line = common::trim(line);
    if (line.empty()) {
      continue;
    }
    if (line == "/quit" || line == "/exit") {
      break;
    }
    client.controller->send_message(line, key, [](gateway::RpcResult<common::JsonValue> result) {
      if (!result.ok()) {
        std::cerr << "Send failed: " << result.error().message << "\n";
      }
    });
  }

  client.controller->disconnect();
  return 0;
}

int run_status(const config::Config &config) {
  auto cp = config::config_path();
  std::cout << "Gateway: " << config.gateway.url << "\n";
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  if (const auto *observer = observability::get_global_observer(); observer != nullptr) {
    std::cout << "Observability: " << observability::describe_observer(*observer) << "\n";
  }

  storage::SqliteIdentityStore identities(config.device.identity_db);
  const auto loaded = identities.load();
  if (!loaded.ok()) {
    std::cerr << "Identity: " << loaded.error() << "\n";
    return 1;
  }
  if (!loaded.value().has_value()) {
    std::cout << "Device: not created yet\n";
    return 0;
  }
  const auto &identity = *loaded.value();
  std::cout << "Node: " << identity.node_id << "\n";
  std::cout << "Display name: " << identity.display_name << "\n";

  storage::EncryptedFileSecretStore secrets(config.secrets.dir);
  const auto token =
      secrets.get_string(storage::NODE_TOKEN_SERVICE, storage::node_token_account(identity.node_id));
  const bool paired = (token.ok() && token.value().has_value()) || identity.pairing_token.has_value();
  std::cout << "Pairing: " << (paired ? "paired" : "unpaired");
  if (paired && identity.paired_at.has_value()) {
    std::cout << " since " << format_time(*identity.paired_at);
  }
  std::cout << "\n";
  return 0;
}

int run_reset_pairing(const config::Config &config) {
  auto stack = build_stack(config);
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  auto &client = *stack.value();
  client.controller->reset_pairing();
  const bool paired = client.query([&client]() { return client.controller->pairing_state().is_paired(); });
  if (paired) {
    std::cerr << "Pairing could not be reset\n";
    return 1;
  }
  std::cout << "Pairing reset. The next connection will request a new pairing code.\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: clawlink [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  chat [--session KEY]                 Interactive chat with streaming replies\n";
  std::cout << "  send -m TEXT [--session KEY]         Send one message\n";
  std::cout << "  location --lat X --lon Y [--accuracy M] [--ttl S]\n";
  std::cout << "                                       Share a location\n";
  std::cout << "  history KEY [--limit N]              Print a conversation's history\n";
  std::cout << "  status                               Show device and pairing status\n";
  std::cout << "  reset-pairing                        Forget the pairing token\n";
  std::cout << "  config-path                          Print the config file location\n";
  std::cout << "  version                              Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  if (subcommand == "status") {
    return run_status(cfg.value());
  }
  if (subcommand == "send") {
    return run_send(cfg.value(), std::move(args));
  }
  if (subcommand == "location") {
    return run_location(cfg.value(), std::move(args));
  }
  if (subcommand == "history") {
    return run_history(cfg.value(), std::move(args));
  }
  if (subcommand == "chat") {
    return run_chat(cfg.value(), std::move(args));
  }
  if (subcommand == "reset-pairing") {
    return run_reset_pairing(cfg.value());
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace clawlink::cli
