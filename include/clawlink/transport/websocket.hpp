#pragma once

#include "clawlink/common/result.hpp"
#include "clawlink/transport/transport.hpp"

#include <openssl/ssl.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace clawlink::transport {

enum class Opcode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

struct WsUrl {
  bool secure = false;
  std::string host;
  std::uint16_t port = 0;
  std::string path;
};

[[nodiscard]] common::Result<WsUrl> parse_ws_url(const std::string &url);

/// Sec-WebSocket-Accept value the server must answer for `client_key`.
[[nodiscard]] std::string websocket_accept_key(const std::string &client_key);

/// Builds a single FIN frame with the client mask applied.
[[nodiscard]] std::vector<std::uint8_t> encode_client_frame(Opcode opcode,
                                                            const std::string &payload,
                                                            const std::array<std::uint8_t, 4> &mask);

[[nodiscard]] std::string build_handshake_request(const WsUrl &url, const std::string &client_key,
                                                  const HeaderList &headers);

/// Validates the HTTP upgrade response (status line and accept key).
[[nodiscard]] common::Status check_handshake_response(const std::string &response,
                                                      const std::string &client_key);

/// RFC 6455 client over POSIX sockets, with OpenSSL for wss://.
class WebSocketTransport final : public ITransport {
public:
  WebSocketTransport() = default;
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  void open(const TransportRequest &request, OpenHandler on_open) override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;
  void receive(ReceiveHandler handler) override;
  void close(CloseCode code, const std::string &reason) override;
  [[nodiscard]] bool is_open() const override { return open_.load(); }

private:
  void io_loop(TransportRequest request, OpenHandler on_open);
  [[nodiscard]] common::Status establish(const TransportRequest &request);
  [[nodiscard]] common::Result<std::string> read_message();
  [[nodiscard]] bool read_exact(std::uint8_t *data, std::size_t size);
  ssize_t read_some(std::uint8_t *data, std::size_t size);
  [[nodiscard]] bool write_all(const std::vector<std::uint8_t> &bytes);
  void deliver(common::Result<std::string> message);
  void release_socket();

  std::thread io_thread_;
  std::atomic<bool> open_{false};
  std::atomic<bool> stopping_{false};

  // Serializes socket and SSL use between the I/O thread and senders.
  std::mutex io_mutex_;
  std::atomic<int> fd_{-1};
  SSL_CTX *tls_ctx_ = nullptr;
  SSL *ssl_ = nullptr;
  std::string leftover_;

  std::mutex inbox_mutex_;
  std::deque<std::string> inbox_;
  std::optional<std::string> terminal_error_;
  ReceiveHandler pending_receive_;
};

} // namespace clawlink::transport
