#include "clawlink/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // TLS writes go through SSL_write, which cannot pass MSG_NOSIGNAL.
  std::signal(SIGPIPE, SIG_IGN);
  return clawlink::cli::run_cli(argc, argv);
}
