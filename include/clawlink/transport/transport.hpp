#pragma once

#include "clawlink/common/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace clawlink::transport {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

enum class CloseCode : std::uint16_t {
  Normal = 1000,
  GoingAway = 1001,
};

struct TransportRequest {
  std::string url;
  HeaderList headers;
  bool tls_verify = true;
};

using OpenHandler = std::function<void(common::Status)>;
using ReceiveHandler = std::function<void(common::Result<std::string>)>;

/// Message-framed duplex stream. Handlers may be invoked from an internal I/O
/// thread and must not call back into the transport synchronously.
class ITransport {
public:
  virtual ~ITransport() = default;

  /// Starts connecting; `on_open` fires exactly once with the outcome. Opening
  /// an already open transport tears the previous stream down first.
  virtual void open(const TransportRequest &request, OpenHandler on_open) = 0;

  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;

  /// One-shot receive: `handler` gets the next inbound text message, or the
  /// error that ended the stream.
  virtual void receive(ReceiveHandler handler) = 0;

  virtual void close(CloseCode code, const std::string &reason) = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace clawlink::transport
