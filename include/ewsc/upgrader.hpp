#ifndef EWSC_UPGRADER_HPP_
#define EWSC_UPGRADER_HPP_

#include "channel.hpp"
#include "handshake.hpp"
#include "request.hpp"
#include "tls.hpp"
#include "vocabulary.hpp"
#include "websocket_stream.hpp"

#include <memory>

namespace ewsc {

// Successful connection: the upgraded stream plus the raw handshake response
struct ConnectResult {
  WebSocketStream stream;
  HandshakeResponse response;
};

// ============================================================================
// Upgrade (optional TLS + WebSocket handshake as one delegated operation)
// ============================================================================

/**
 * @brief One in-flight upgrade. Owns the channel until take_result().
 *
 * Destroying an unfinished session closes the channel and any TLS wrapper.
 */
class UpgradeSession {
 public:
  virtual ~UpgradeSession() = default;

  // true once the stream is ready, false while waiting on handle()
  virtual expected<bool, Error> advance() = 0;

  virtual int handle() const = 0;

  // poll() events to wait for before the next advance()
  virtual short interest() const = 0;

  virtual expected<ConnectResult, Error> take_result() = 0;
};

class Upgrader {
 public:
  virtual ~Upgrader() = default;

  /**
   * @brief Begin upgrading channel for request.
   *
   * The scheme decides whether TLS is layered first (wss) or not (ws).
   * connector overrides the TLS policy; nullptr builds the default one.
   * config is stored in the resulting stream; defaults apply when empty.
   */
  virtual expected<std::unique_ptr<UpgradeSession>, Error> start(
      std::unique_ptr<Channel> channel, const Request& request,
      const optional<WebSocketConfig>& config, const Connector* connector) = 0;
};

// Default Upgrader: mbedTLS (when built in) followed by ClientHandshake
class StreamUpgrader final : public Upgrader {
 public:
  expected<std::unique_ptr<UpgradeSession>, Error> start(
      std::unique_ptr<Channel> channel, const Request& request,
      const optional<WebSocketConfig>& config, const Connector* connector) override;
};

}  // namespace ewsc

#endif  // EWSC_UPGRADER_HPP_
