#ifndef EWSC_WEBSOCKET_STREAM_HPP_
#define EWSC_WEBSOCKET_STREAM_HPP_

#include "channel.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <limits>
#include <memory>
#include <random>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Protocol Configuration
// ============================================================================

struct WebSocketConfig {
  size_t read_buffer_size = 128 * 1024;
  size_t write_buffer_size = 128 * 1024;
  size_t max_write_buffer_size = std::numeric_limits<size_t>::max();
  optional<size_t> max_message_size{static_cast<size_t>(64) << 20};
  optional<size_t> max_frame_size{static_cast<size_t>(16) << 20};
  bool accept_unmasked_frames = false;

  size_t max_handshake_size = 16 * 1024;  // Response head limit
};

// ============================================================================
// WebSocketStream (upgraded connection handed to the caller)
// ============================================================================

/**
 * @brief Owns the upgraded channel after a successful opening handshake.
 *
 * Sends single-frame masked client messages. Reading and the framing state
 * machine are left to the caller; bytes that arrived together with the
 * handshake response are available through read_buffer().
 */
class WebSocketStream {
 public:
  WebSocketStream(std::unique_ptr<Channel> channel, const WebSocketConfig& config,
                  std::vector<uint8_t> read_buffer);
  ~WebSocketStream();

  WebSocketStream(WebSocketStream&&) noexcept = default;
  WebSocketStream& operator=(WebSocketStream&&) noexcept = default;

  WebSocketStream(const WebSocketStream&) = delete;
  WebSocketStream& operator=(const WebSocketStream&) = delete;

  bool is_secure() const { return channel_ && channel_->is_secure(); }
  int handle() const { return channel_ ? channel_->handle() : -1; }
  const WebSocketConfig& config() const { return config_; }

  const std::vector<uint8_t>& read_buffer() const { return read_buffer_; }
  std::vector<uint8_t> take_read_buffer() { return std::move(read_buffer_); }

  Channel& channel() { return *channel_; }

  expected<void, Error> send_text(std::string_view text);
  expected<void, Error> send_binary(const uint8_t* data, size_t len);
  expected<void, Error> ping(std::string_view payload = {});

  // Send a close frame; further sends fail with kInvalidState
  expected<void, Error> close(uint16_t code = 1000, std::string_view reason = {});

 private:
  std::unique_ptr<Channel> channel_;
  WebSocketConfig config_;
  std::vector<uint8_t> read_buffer_;
  std::mt19937 mask_rng_;
  bool close_sent_ = false;

  expected<void, Error> send_frame(ws::OpCode opcode, const uint8_t* payload, size_t len);

  // Write everything, waiting on the handle while the channel is busy
  expected<void, Error> write_all(const uint8_t* data, size_t len);
};

}  // namespace ewsc

#endif  // EWSC_WEBSOCKET_STREAM_HPP_
