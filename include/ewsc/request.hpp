/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef EWSC_REQUEST_HPP_
#define EWSC_REQUEST_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Request Descriptor
// ============================================================================

enum class Scheme : uint8_t {
  kWs,       // ws://
  kWss,      // wss://
  kUnknown   // Any other syntactically valid scheme
};

const char* to_string(Scheme scheme) noexcept;

// Case-insensitive: "ws" -> kWs, "WSS" -> kWss, anything else -> kUnknown
Scheme parse_scheme(std::string_view text) noexcept;

struct Header {
  std::string name;
  std::string value;
};

/**
 * @brief Canonical client request: where to connect and what to send in
 *        the opening handshake.
 *
 * host never carries IPv6 brackets; authority() adds them back.
 * target is the request-target (path plus optional query), starting with '/'.
 */
struct Request {
  Scheme scheme = Scheme::kUnknown;
  std::string scheme_text;
  std::string host;
  optional<uint16_t> port;
  std::string target = "/";
  std::vector<Header> headers;

  Request& add_header(std::string name, std::string value) {
    headers.push_back(Header{std::move(name), std::move(value)});
    return *this;
  }

  // First header with a case-insensitive name match, nullptr if absent
  const Header* find_header(std::string_view name) const;

  bool is_ipv6_host() const { return host.find(':') != std::string::npos; }

  // host or [host], plus ":port" when an explicit port is present
  std::string authority() const;
};

// ============================================================================
// Request Normalizer
// ============================================================================

// Parse scheme://host[:port][/path][?query]. Fails with kRequestConstruction.
expected<Request, Error> into_request(std::string_view url);

// Validate an already-structured request (host, target, header syntax).
expected<Request, Error> into_request(const Request& request);

// Header name must be a non-empty token; value must not contain CR, LF or NUL.
bool is_valid_header(const Header& header);

}  // namespace ewsc

#endif  // EWSC_REQUEST_HPP_
