/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef EWSC_ENDPOINT_HPP_
#define EWSC_ENDPOINT_HPP_

#include "request.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>

namespace ewsc {

// ============================================================================
// Endpoint Resolver
// ============================================================================

static constexpr uint16_t kDefaultWsPort = 80;
static constexpr uint16_t kDefaultWssPort = 443;

struct Endpoint {
  std::string host;  // No IPv6 brackets
  uint16_t port = 0;

  // "host:port", or "[host]:port" for IPv6 literals
  std::string to_string() const;
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
  return a.port == b.port && a.host == b.host;
}

// Scheme default port: ws -> 80, wss -> 443, otherwise none
optional<uint16_t> default_port(Scheme scheme) noexcept;

// Explicit port wins regardless of scheme; otherwise the scheme default.
// Fails with kUnsupportedScheme when neither is available. No I/O.
expected<Endpoint, Error> resolve_endpoint(const Request& request);

}  // namespace ewsc

#endif  // EWSC_ENDPOINT_HPP_
