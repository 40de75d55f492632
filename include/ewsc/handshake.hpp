#ifndef EWSC_HANDSHAKE_HPP_
#define EWSC_HANDSHAKE_HPP_

#include "channel.hpp"
#include "request.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Handshake Response
// ============================================================================

struct HandshakeResponse {
  int status = 0;
  std::string reason;
  std::vector<Header> headers;

  // Value of the first header named name (case-insensitive), nullptr if absent
  const std::string* header(std::string_view name) const;
};

// Opening handshake request text (RFC 6455 section 4.1) for request and key.
// Caller headers follow the generated ones; a caller header replaces the
// generated header with the same name.
std::string build_request(const Request& request, std::string_view key);

// ============================================================================
// ClientHandshake (non-blocking opening handshake over a Channel)
// ============================================================================

class ClientHandshake {
 public:
  // max_response_size bounds the response head (status line + headers).
  ClientHandshake(const Request& request, size_t max_response_size);
  ClientHandshake(const Request& request, size_t max_response_size, std::string key);

  // Fresh random 16-byte key, base64 encoded
  static std::string generate_key();

  /**
   * @brief Write the request, then read and validate the response.
   *
   * Returns kOk once the response was accepted, kWantRead/kWantWrite while
   * waiting on the channel. Transport failures pass through unchanged;
   * protocol failures are kHandshake.
   */
  expected<IoStatus, Error> advance(Channel& channel);

  /**
   * @brief Parse a response head from data.
   *
   * Returns the head size including the terminating blank line, 0 if the
   * head is still incomplete, or kHandshake for a malformed head.
   */
  static expected<size_t, Error> parse_response(std::string_view data, HandshakeResponse& out);

  // Status 101, Upgrade/Connection headers and Sec-WebSocket-Accept for key
  static expected<void, Error> validate_response(const HandshakeResponse& response,
                                                 std::string_view key);

  bool is_complete() const { return complete_; }
  const std::string& key() const { return key_; }
  const HandshakeResponse& response() const { return response_; }

  HandshakeResponse take_response() { return std::move(response_); }

  // Bytes received past the response head
  std::vector<uint8_t> take_leftover() { return std::move(leftover_); }

 private:
  std::string key_;
  std::string request_text_;
  size_t sent_ = 0;
  size_t max_response_size_;
  std::string received_;
  HandshakeResponse response_;
  std::vector<uint8_t> leftover_;
  bool complete_ = false;

  expected<IoStatus, Error> fail(int status);
};

}  // namespace ewsc

#endif  // EWSC_HANDSHAKE_HPP_
