#include "clawlink/transport/websocket.hpp"

#include "clawlink/common/fs.hpp"
#include "clawlink/observability/global.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <unordered_map>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace clawlink::transport {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;
constexpr std::size_t kMaxMessageBytes = 16 * 1024 * 1024;
constexpr int kPollIntervalMs = 200;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Polls in short slices so a close() from another thread is noticed.
bool wait_ready(const int fd, const short events, const std::atomic<bool> &stopping) {
  while (!stopping.load()) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready < 0) {
      return false;
    }
    if (ready > 0) {
      return true;
    }
  }
  return false;
}

bool set_blocking(const int fd, const bool blocking) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int wanted = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(fd, F_SETFL, wanted) == 0;
}

// Leaves the socket non-blocking on success.
common::Status connect_socket(const int fd, const addrinfo &address,
                              const std::atomic<bool> &stopping) {
  if (!set_blocking(fd, false)) {
    return common::Status::error(std::strerror(errno));
  }
  if (::connect(fd, address.ai_addr, address.ai_addrlen) == 0) {
    return common::Status::success();
  }
  if (errno != EINPROGRESS) {
    return common::Status::error(std::strerror(errno));
  }
  if (!wait_ready(fd, POLLOUT, stopping)) {
    return common::Status::error(stopping.load() ? "Connection closed" : std::strerror(errno));
  }
  int error = 0;
  socklen_t length = sizeof(error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) != 0) {
    return common::Status::error(std::strerror(errno));
  }
  if (error != 0) {
    return common::Status::error(std::strerror(error));
  }
  return common::Status::success();
}

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  const int out_len = 4 * static_cast<int>((size + 2) / 3);
  std::string out(static_cast<std::size_t>(out_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data, static_cast<int>(size));
  return out;
}

void fill_random(std::uint8_t *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  std::random_device rd;
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<std::uint8_t>(rd() & 0xFF);
  }
}

std::string random_websocket_key() {
  std::array<std::uint8_t, 16> bytes{};
  fill_random(bytes.data(), bytes.size());
  return base64_encode(bytes.data(), bytes.size());
}

std::array<std::uint8_t, 4> random_mask() {
  std::array<std::uint8_t, 4> mask{};
  fill_random(mask.data(), mask.size());
  return mask;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &response) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(response);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":status-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string close_payload(const CloseCode code, const std::string &reason) {
  const auto value = static_cast<std::uint16_t>(code);
  std::string payload;
  payload.push_back(static_cast<char>((value >> 8u) & 0xFFu));
  payload.push_back(static_cast<char>(value & 0xFFu));
  // Control frame payloads are capped at 125 bytes.
  payload += reason.substr(0, 123);
  return payload;
}

} // namespace

common::Result<WsUrl> parse_ws_url(const std::string &url) {
  const std::string trimmed = common::trim(url);
  const std::string lowered = common::to_lower(trimmed);

  WsUrl parsed;
  std::size_t host_start = 0;
  if (lowered.starts_with("wss://")) {
    parsed.secure = true;
    parsed.port = 443;
    host_start = 6;
  } else if (lowered.starts_with("ws://")) {
    parsed.port = 80;
    host_start = 5;
  } else {
    return common::Result<WsUrl>::failure("unsupported websocket url scheme: " + trimmed);
  }

  std::size_t path_start = trimmed.find('/', host_start);
  const std::string host_port =
      (path_start == std::string::npos) ? trimmed.substr(host_start)
                                        : trimmed.substr(host_start, path_start - host_start);
  if (host_port.empty()) {
    return common::Result<WsUrl>::failure("missing websocket host");
  }

  std::string port_text;
  if (host_port.front() == '[') {
    const auto close_bracket = host_port.find(']');
    if (close_bracket == std::string::npos) {
      return common::Result<WsUrl>::failure("invalid websocket host");
    }
    parsed.host = host_port.substr(1, close_bracket - 1);
    if (close_bracket + 1 < host_port.size()) {
      if (host_port[close_bracket + 1] != ':') {
        return common::Result<WsUrl>::failure("invalid websocket host");
      }
      port_text = host_port.substr(close_bracket + 2);
    }
  } else if (const auto colon = host_port.rfind(':'); colon != std::string::npos) {
    parsed.host = host_port.substr(0, colon);
    port_text = host_port.substr(colon + 1);
  } else {
    parsed.host = host_port;
  }

  if (parsed.host.empty()) {
    return common::Result<WsUrl>::failure("missing websocket host");
  }

  if (!port_text.empty()) {
    if (!std::all_of(port_text.begin(), port_text.end(),
                     [](const char ch) { return ch >= '0' && ch <= '9'; }) ||
        port_text.size() > 5) {
      return common::Result<WsUrl>::failure("invalid websocket port");
    }
    const unsigned long value = std::stoul(port_text);
    if (value == 0 || value > 65535) {
      return common::Result<WsUrl>::failure("invalid websocket port");
    }
    parsed.port = static_cast<std::uint16_t>(value);
  }

  parsed.path = (path_start == std::string::npos) ? "/" : trimmed.substr(path_start);
  return common::Result<WsUrl>::success(std::move(parsed));
}

std::string websocket_accept_key(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());
  return base64_encode(digest.data(), digest.size());
}

std::vector<std::uint8_t> encode_client_frame(const Opcode opcode, const std::string &payload,
                                              const std::array<std::uint8_t, 4> &mask) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (static_cast<std::uint8_t>(opcode) & 0x0Fu)));

  const std::size_t size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(0x80u | size));
  } else if (size <= 65535u) {
    frame.push_back(0x80u | 126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(0x80u | 127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
  }
  return frame;
}

std::string build_handshake_request(const WsUrl &url, const std::string &client_key,
                                    const HeaderList &headers) {
  const bool default_port = (url.secure && url.port == 443) || (!url.secure && url.port == 80);
  const bool ipv6 = url.host.find(':') != std::string::npos;
  std::string host = ipv6 ? "[" + url.host + "]" : url.host;
  if (!default_port) {
    host += ":" + std::to_string(url.port);
  }

  std::ostringstream req;
  req << "GET " << url.path << " HTTP/1.1\r\n";
  req << "Host: " << host << "\r\n";
  req << "Upgrade: websocket\r\n";
  req << "Connection: Upgrade\r\n";
  req << "Sec-WebSocket-Key: " << client_key << "\r\n";
  req << "Sec-WebSocket-Version: 13\r\n";
  for (const auto &[name, value] : headers) {
    req << name << ": " << value << "\r\n";
  }
  req << "\r\n";
  return req.str();
}

common::Status check_handshake_response(const std::string &response,
                                        const std::string &client_key) {
  const auto headers = parse_headers(response);
  const auto status_it = headers.find(":status-line");
  if (status_it == headers.end()) {
    return common::Status::error("websocket handshake response is empty");
  }
  std::istringstream status_line(status_it->second);
  std::string version;
  int status = 0;
  status_line >> version >> status;
  if (status != 101) {
    return common::Status::error("websocket handshake rejected: " + status_it->second);
  }

  const auto upgrade_it = headers.find("upgrade");
  if (upgrade_it == headers.end() || common::to_lower(upgrade_it->second) != "websocket") {
    return common::Status::error("websocket handshake missing upgrade header");
  }

  const auto accept_it = headers.find("sec-websocket-accept");
  if (accept_it == headers.end() || accept_it->second != websocket_accept_key(client_key)) {
    return common::Status::error("websocket handshake accept key mismatch");
  }
  return common::Status::success();
}

WebSocketTransport::~WebSocketTransport() { close(CloseCode::GoingAway, "shutdown"); }

void WebSocketTransport::open(const TransportRequest &request, OpenHandler on_open) {
  if (io_thread_.joinable()) {
    close(CloseCode::GoingAway, "reconnect");
  }
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_.clear();
    terminal_error_.reset();
    pending_receive_ = nullptr;
  }
  stopping_ = false;
  io_thread_ = std::thread([this, request, on_open = std::move(on_open)]() mutable {
    io_loop(std::move(request), std::move(on_open));
  });
}

common::Status WebSocketTransport::send_text(const std::string &payload) {
  if (!open_.load()) {
    return common::Status::error("websocket is not open");
  }
  if (!write_all(encode_client_frame(Opcode::Text, payload, random_mask()))) {
    return common::Status::error("websocket send failed");
  }
  return common::Status::success();
}

void WebSocketTransport::receive(ReceiveHandler handler) {
  std::unique_lock<std::mutex> lock(inbox_mutex_);
  if (!inbox_.empty()) {
    std::string message = std::move(inbox_.front());
    inbox_.pop_front();
    lock.unlock();
    handler(common::Result<std::string>::success(std::move(message)));
    return;
  }
  if (terminal_error_.has_value()) {
    const std::string error = *terminal_error_;
    lock.unlock();
    handler(common::Result<std::string>::failure(error));
    return;
  }
  if (!open_.load() && !io_thread_.joinable()) {
    lock.unlock();
    handler(common::Result<std::string>::failure("websocket is not open"));
    return;
  }
  pending_receive_ = std::move(handler);
}

void WebSocketTransport::close(const CloseCode code, const std::string &reason) {
  stopping_ = true;
  if (open_.exchange(false)) {
    if (!write_all(encode_client_frame(Opcode::Close, close_payload(code, reason), random_mask()))) {
      observability::record_error("websocket", "close frame not delivered");
    }
  }
  if (const int fd = fd_.load(); fd >= 0) {
    shutdown(fd, SHUT_RDWR);
  }
  if (io_thread_.joinable()) {
    if (io_thread_.get_id() == std::this_thread::get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }

  std::lock_guard<std::mutex> lock(inbox_mutex_);
  pending_receive_ = nullptr;
  terminal_error_ = "Connection closed";
}

void WebSocketTransport::io_loop(TransportRequest request, OpenHandler on_open) {
  const auto status = establish(request);
  if (!status.ok()) {
    release_socket();
    on_open(status);
    return;
  }

  open_ = true;
  on_open(common::Status::success());

  while (!stopping_.load()) {
    auto message = read_message();
    if (!message.ok()) {
      open_ = false;
      deliver(stopping_.load() ? common::Result<std::string>::failure("Connection closed")
                               : std::move(message));
      break;
    }
    deliver(std::move(message));
  }
  release_socket();
}

common::Status WebSocketTransport::establish(const TransportRequest &request) {
  const auto parsed_result = parse_ws_url(request.url);
  if (!parsed_result.ok()) {
    return common::Status::error(parsed_result.error());
  }
  const WsUrl &url = parsed_result.value();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *addresses = nullptr;
  const std::string port = std::to_string(url.port);
  if (const int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &addresses); rc != 0) {
    return common::Status::error("failed to resolve " + url.host + ": " + gai_strerror(rc));
  }

  std::string connect_error = "no usable address";
  for (addrinfo *ai = addresses; ai != nullptr && !stopping_.load(); ai = ai->ai_next) {
    const int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      connect_error = std::strerror(errno);
      continue;
    }
    fd_ = fd;
    const auto connected = connect_socket(fd, *ai, stopping_);
    if (connected.ok()) {
      break;
    }
    connect_error = connected.error();
    fd_ = -1;
    ::close(fd);
  }
  freeaddrinfo(addresses);

  if (fd_.load() < 0) {
    return common::Status::error("websocket connect failed: " + connect_error);
  }
  if (stopping_.load()) {
    return common::Status::error("Connection closed");
  }

  if (url.secure) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    tls_ctx_ = SSL_CTX_new(TLS_client_method());
    if (tls_ctx_ == nullptr) {
      return common::Status::error("failed to create TLS context: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);
    if (request.tls_verify) {
      SSL_CTX_set_verify(tls_ctx_, SSL_VERIFY_PEER, nullptr);
      if (SSL_CTX_set_default_verify_paths(tls_ctx_) != 1) {
        return common::Status::error("failed to load trust store: " + openssl_error_string());
      }
    }

    ssl_ = SSL_new(tls_ctx_);
    if (ssl_ == nullptr) {
      return common::Status::error("failed to create TLS session: " + openssl_error_string());
    }
    SSL_set_fd(ssl_, fd_.load());
    SSL_set_tlsext_host_name(ssl_, url.host.c_str());
    if (request.tls_verify && SSL_set1_host(ssl_, url.host.c_str()) != 1) {
      return common::Status::error("failed to set TLS host name: " + openssl_error_string());
    }
    while (true) {
      const int rc = SSL_connect(ssl_);
      if (rc == 1) {
        break;
      }
      const int err = SSL_get_error(ssl_, rc);
      if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
        return common::Status::error("TLS handshake failed: " + openssl_error_string());
      }
      if (!wait_ready(fd_.load(), err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, stopping_)) {
        return common::Status::error(stopping_.load() ? "Connection closed"
                                                      : "TLS handshake failed: poll error");
      }
    }
  }
  if (!set_blocking(fd_.load(), true)) {
    return common::Status::error("websocket socket mode: " + std::string(std::strerror(errno)));
  }

  const std::string client_key = random_websocket_key();
  const std::string handshake = build_handshake_request(url, client_key, request.headers);
  if (!write_all(std::vector<std::uint8_t>(handshake.begin(), handshake.end()))) {
    return common::Status::error("websocket handshake send failed");
  }

  std::string response;
  std::array<std::uint8_t, 1024> buffer{};
  std::size_t header_end = std::string::npos;
  while ((header_end = response.find("\r\n\r\n")) == std::string::npos) {
    const ssize_t n = read_some(buffer.data(), buffer.size());
    if (n <= 0) {
      return common::Status::error("websocket handshake receive failed");
    }
    response.append(reinterpret_cast<const char *>(buffer.data()), static_cast<std::size_t>(n));
    if (response.size() > kMaxHandshakeBytes) {
      return common::Status::error("websocket handshake too large");
    }
  }

  leftover_ = response.substr(header_end + 4);
  return check_handshake_response(response.substr(0, header_end + 4), client_key);
}

common::Result<std::string> WebSocketTransport::read_message() {
  std::string message;
  bool fragmented = false;

  while (true) {
    std::array<std::uint8_t, 2> header{};
    if (!read_exact(header.data(), header.size())) {
      return common::Result<std::string>::failure("websocket receive failed");
    }

    const bool fin = (header[0] & 0x80u) != 0;
    const auto opcode = static_cast<Opcode>(header[0] & 0x0Fu);
    const bool masked = (header[1] & 0x80u) != 0;
    std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);
    if (payload_len == 126u) {
      std::array<std::uint8_t, 2> ext{};
      if (!read_exact(ext.data(), ext.size())) {
        return common::Result<std::string>::failure("websocket frame header failed");
      }
      payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
    } else if (payload_len == 127u) {
      std::array<std::uint8_t, 8> ext{};
      if (!read_exact(ext.data(), ext.size())) {
        return common::Result<std::string>::failure("websocket frame header failed");
      }
      payload_len = 0;
      for (const auto byte : ext) {
        payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
      }
    }
    if (payload_len > kMaxMessageBytes || message.size() + payload_len > kMaxMessageBytes) {
      return common::Result<std::string>::failure("websocket message too large");
    }

    std::array<std::uint8_t, 4> mask{};
    if (masked && !read_exact(mask.data(), mask.size())) {
      return common::Result<std::string>::failure("websocket mask read failed");
    }
    std::string payload(static_cast<std::size_t>(payload_len), '\0');
    if (!payload.empty() &&
        !read_exact(reinterpret_cast<std::uint8_t *>(payload.data()), payload.size())) {
      return common::Result<std::string>::failure("websocket payload read failed");
    }
    if (masked) {
      for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
      }
    }

    switch (opcode) {
    case Opcode::Text:
    case Opcode::Binary:
      if (fragmented) {
        return common::Result<std::string>::failure("websocket data frame inside fragmented message");
      }
      message = std::move(payload);
      if (fin) {
        return common::Result<std::string>::success(std::move(message));
      }
      fragmented = true;
      break;
    case Opcode::Continuation:
      if (!fragmented) {
        return common::Result<std::string>::failure("unexpected websocket continuation frame");
      }
      message += payload;
      if (fin) {
        return common::Result<std::string>::success(std::move(message));
      }
      break;
    case Opcode::Ping:
      if (!write_all(encode_client_frame(Opcode::Pong, payload, random_mask()))) {
        return common::Result<std::string>::failure("websocket pong failed");
      }
      break;
    case Opcode::Pong:
      break;
    case Opcode::Close: {
      std::string detail = "Connection closed by peer";
      if (payload.size() >= 2) {
        const unsigned code = (static_cast<unsigned>(static_cast<std::uint8_t>(payload[0])) << 8u) |
                              static_cast<std::uint8_t>(payload[1]);
        detail += " (code " + std::to_string(code) + ")";
      }
      if (!write_all(encode_client_frame(Opcode::Close, payload.substr(0, 2), random_mask()))) {
        observability::record_error("websocket", "close acknowledgement not delivered");
      }
      return common::Result<std::string>::failure(detail);
    }
    default:
      return common::Result<std::string>::failure("unsupported websocket opcode");
    }
  }
}

bool WebSocketTransport::read_exact(std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = read_some(data + received, size - received);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

ssize_t WebSocketTransport::read_some(std::uint8_t *data, const std::size_t size) {
  if (!leftover_.empty()) {
    const std::size_t n = std::min(size, leftover_.size());
    std::memcpy(data, leftover_.data(), n);
    leftover_.erase(0, n);
    return static_cast<ssize_t>(n);
  }

  while (!stopping_.load()) {
    const int fd = fd_.load();
    if (fd < 0) {
      return -1;
    }

    bool buffered = false;
    {
      std::lock_guard<std::mutex> lock(io_mutex_);
      buffered = ssl_ != nullptr && SSL_pending(ssl_) > 0;
    }
    if (!buffered && !wait_ready(fd, POLLIN, stopping_)) {
      return -1;
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (ssl_ != nullptr) {
      const int n = SSL_read(ssl_, data, static_cast<int>(size));
      if (n <= 0) {
        const int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return -1;
      }
      return n;
    }
    return recv(fd, data, size, 0);
  }
  return -1;
}

bool WebSocketTransport::write_all(const std::vector<std::uint8_t> &bytes) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  const int fd = fd_.load();
  if (fd < 0) {
    return false;
  }
  std::size_t sent = 0;
  while (sent < bytes.size()) {
    const std::size_t remaining = bytes.size() - sent;
    ssize_t n = 0;
    if (ssl_ != nullptr) {
      n = SSL_write(ssl_, bytes.data() + sent, static_cast<int>(remaining));
    } else {
      n = ::send(fd, bytes.data() + sent, remaining, MSG_NOSIGNAL);
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

void WebSocketTransport::deliver(common::Result<std::string> message) {
  std::unique_lock<std::mutex> lock(inbox_mutex_);
  if (!message.ok()) {
    terminal_error_ = message.error();
  } else if (!pending_receive_) {
    inbox_.push_back(std::move(message.value()));
    return;
  }
  if (!pending_receive_) {
    return;
  }
  ReceiveHandler handler = std::move(pending_receive_);
  pending_receive_ = nullptr;
  lock.unlock();
  handler(std::move(message));
}

void WebSocketTransport::release_socket() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (ssl_ != nullptr) {
    SSL_shutdown(ssl_);
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  if (const int fd = fd_.exchange(-1); fd >= 0) {
    ::close(fd);
  }
  leftover_.clear();
}

} // namespace clawlink::transport
