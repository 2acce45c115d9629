#pragma once

#include <chrono>

namespace clawlink::config {
struct Config;
}

namespace clawlink::cli {

int run_cli(int argc, char **argv);

/// How long a one-shot command waits for an RPC callback. Always longer than
/// the configured request timeout.
[[nodiscard]] std::chrono::seconds rpc_wait(const config::Config &config);

} // namespace clawlink::cli
