/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef EWSC_CHANNEL_HPP_
#define EWSC_CHANNEL_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

namespace ewsc {

// ============================================================================
// Transport Channel
// ============================================================================

enum class ChannelKind : uint8_t {
  kTcp,   // Networked stream socket
  kUnix,  // Local inter-process stream socket
  kTls    // Encrypted wrapper around another channel
};

enum class IoStatus : uint8_t {
  kOk,         // bytes transferred (or operation complete)
  kWantRead,   // Retry once the handle is readable
  kWantWrite,  // Retry once the handle is writable
  kClosed      // Peer closed the stream
};

struct IoResult {
  IoStatus status = IoStatus::kOk;
  size_t bytes = 0;

  static IoResult done(size_t n) { return IoResult{IoStatus::kOk, n}; }
  static IoResult pending(IoStatus s) { return IoResult{s, 0}; }
};

/**
 * @brief Bidirectional non-blocking byte stream.
 *
 * A channel is exclusively owned (std::unique_ptr). Wrapping stages take
 * ownership; destroying the channel closes the underlying handle.
 */
class Channel {
 public:
  virtual ~Channel() = default;

  // Complete a connect started by a Dialer.
  // Returns true once connected, false while still in progress.
  virtual expected<bool, Error> finish_connect() = 0;

  // Disable (or re-enable) send coalescing. Networked channels only.
  virtual expected<void, Error> set_nodelay(bool enable) = 0;

  virtual expected<IoResult, Error> read(uint8_t* buf, size_t len) = 0;

  virtual expected<IoResult, Error> write(const uint8_t* buf, size_t len) = 0;

  // OS handle to wait on (poll)
  virtual int handle() const = 0;

  virtual ChannelKind kind() const = 0;

  virtual void close() = 0;

  bool is_secure() const { return kind() == ChannelKind::kTls; }
};

// poll() event mask for a pending I/O status
short poll_events(IoStatus status) noexcept;

// ============================================================================
// Channel Configuration
// ============================================================================

struct ChannelOptions {
  bool tcp_nodelay = false;  // Disable Nagle algorithm (networked transport only)
};

}  // namespace ewsc

#endif  // EWSC_CHANNEL_HPP_
