/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef EWSC_CONNECT_HPP_
#define EWSC_CONNECT_HPP_

#include "channel.hpp"
#include "dialer.hpp"
#include "endpoint.hpp"
#include "request.hpp"
#include "tls.hpp"
#include "upgrader.hpp"
#include "vocabulary.hpp"
#include "websocket_stream.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <string_view>

namespace ewsc {

// ============================================================================
// Connect State Machine
// ============================================================================

enum class ConnectState : uint8_t {
  kStart,        // Input not yet normalized
  kNormalized,   // Request descriptor valid
  kResolving,    // Name lookup in flight (networked transport only)
  kResolved,     // Addresses known
  kDialing,      // Connect in progress
  kDialed,       // Transport connected
  kTuned,        // TCP_NODELAY applied
  kHandshaking,  // TLS and/or WebSocket handshake in progress
  kSuccess,
  kFailed
};

const char* to_string(ConnectState state) noexcept;

struct ConnectOptions {
  optional<WebSocketConfig> config;  // Empty = WebSocketConfig defaults
  ChannelOptions channel;
  optional<Connector> connector;     // Empty = default TLS policy for wss
  std::string unix_path;             // Non-empty selects the local transport
};

/**
 * @brief One connection attempt: normalize, resolve, dial, tune, upgrade.
 *
 * Non-blocking. Call advance() until it returns true, waiting on handle()
 * for interest() between calls. The first failure is terminal; advance()
 * then keeps returning the same error. Destroying the operation at any
 * point releases the transport and any TLS wrapper.
 *
 * Usage with a reactor:
 *   ewsc::SocketDialer dialer;
 *   ewsc::StreamUpgrader upgrader;
 *   ewsc::ConnectOperation op("ws://127.0.0.1:9001/", {}, dialer, upgrader);
 *   while (true) {
 *     auto r = op.advance();
 *     if (!r || r.value()) break;
 *     // register op.handle() for op.interest() and wait
 *   }
 */
class ConnectOperation {
 public:
  ConnectOperation(std::string_view url, ConnectOptions options, Dialer& dialer,
                   Upgrader& upgrader);
  ConnectOperation(const Request& request, ConnectOptions options, Dialer& dialer,
                   Upgrader& upgrader);

  ConnectOperation(const ConnectOperation&) = delete;
  ConnectOperation& operator=(const ConnectOperation&) = delete;

  expected<bool, Error> advance();

  // Handle to wait on while suspended, -1 otherwise
  int handle() const;

  // POLLIN/POLLOUT while suspended, 0 otherwise
  short interest() const;

  ConnectState state() const { return state_; }

  // Only valid once advance() returned true
  expected<ConnectResult, Error> take_result();

 private:
  std::string url_;
  bool from_url_;
  Request request_;
  ConnectOptions options_;
  Dialer& dialer_;
  Upgrader& upgrader_;

  ConnectState state_ = ConnectState::kStart;
  Endpoint endpoint_;
  std::unique_ptr<Lookup> lookup_;
  std::unique_ptr<Channel> channel_;
  std::unique_ptr<UpgradeSession> session_;
  Error error_;

  bool is_local() const { return !options_.unix_path.empty(); }
  void transition(ConnectState next);
  expected<bool, Error> fail(const Error& err);
};

// Drive op with poll() until it succeeds or fails. No timeout.
expected<ConnectResult, Error> run_to_completion(ConnectOperation& op);

// ============================================================================
// Blocking entry points (SocketDialer + StreamUpgrader)
// ============================================================================

expected<ConnectResult, Error> connect_blocking(std::string_view url, ConnectOptions options);
expected<ConnectResult, Error> connect_blocking(const Request& request, ConnectOptions options);

// R: URL text (const char*, std::string, std::string_view) or Request
template <typename R>
expected<ConnectResult, Error> connect_with_config(const R& request,
                                                   const optional<WebSocketConfig>& config,
                                                   bool disable_nagle) {
  ConnectOptions options;
  options.config = config;
  options.channel.tcp_nodelay = disable_nagle;
  return connect_blocking(request, std::move(options));
}

template <typename R>
expected<ConnectResult, Error> connect(const R& request) {
  return connect_with_config(request, optional<WebSocketConfig>(), false);
}

// connector: plain, or TLS with a caller trust policy; empty = default
template <typename R>
expected<ConnectResult, Error> connect_tls_with_config(const R& request,
                                                       const optional<WebSocketConfig>& config,
                                                       bool disable_nagle,
                                                       const optional<Connector>& connector) {
  ConnectOptions options;
  options.config = config;
  options.channel.tcp_nodelay = disable_nagle;
  options.connector = connector;
  return connect_blocking(request, std::move(options));
}

template <typename R>
expected<ConnectResult, Error> connect_unix_with_config(const std::string& path, const R& request,
                                                        const optional<WebSocketConfig>& config) {
  ConnectOptions options;
  options.config = config;
  options.unix_path = path;
  return connect_blocking(request, std::move(options));
}

template <typename R>
expected<ConnectResult, Error> connect_unix(const std::string& path, const R& request) {
  return connect_unix_with_config(path, request, optional<WebSocketConfig>());
}

}  // namespace ewsc

#endif  // EWSC_CONNECT_HPP_
