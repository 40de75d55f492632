/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef EWSC_DIALER_HPP_
#define EWSC_DIALER_HPP_

#include "channel.hpp"
#include "endpoint.hpp"
#include "vocabulary.hpp"

#include <sys/socket.h>

#include <memory>
#include <sockpp/stream_socket.h>
#include <string>
#include <vector>

namespace ewsc {

// One resolved socket address
struct SocketAddress {
  sockaddr_storage storage{};
  socklen_t len = 0;
};

// ============================================================================
// Name Lookup
// ============================================================================

/**
 * @brief One in-flight name lookup for an endpoint.
 *
 * poll() never blocks. While it returns false the caller waits for
 * handle() to become readable.
 */
class Lookup {
 public:
  virtual ~Lookup() = default;

  virtual const Endpoint& endpoint() const = 0;

  // True once addresses() is complete
  virtual expected<bool, Error> poll() = 0;

  // Readable when poll() can make progress, -1 if it never waits
  virtual int handle() const = 0;

  virtual const std::vector<SocketAddress>& addresses() const = 0;
};

// ============================================================================
// Transport Dialer
// ============================================================================

/**
 * @brief Opens transport channels. One attempt per call, no retries.
 *
 * Networked dials are split in two: resolve() starts the name lookup and
 * dial() connects once the lookup has completed. The returned channel may
 * still be connecting; the caller completes it with
 * Channel::finish_connect() once the handle is writable.
 */
class Dialer {
 public:
  virtual ~Dialer() = default;

  // Start resolving host:port
  virtual expected<std::unique_ptr<Lookup>, Error> resolve(const Endpoint& endpoint) = 0;

  // Networked stream to a completed lookup
  virtual expected<std::unique_ptr<Channel>, Error> dial(const Lookup& lookup) = 0;

  // Local stream socket at a filesystem path
  virtual expected<std::unique_ptr<Channel>, Error> dial_local(const std::string& path) = 0;
};

// ============================================================================
// SocketChannel (sockpp stream socket, non-blocking)
// ============================================================================

class SocketChannel final : public Channel {
 public:
  // Takes the resolved address list; each entry is tried once, in order.
  SocketChannel(ChannelKind kind, std::vector<SocketAddress> addresses);
  ~SocketChannel() override;

  SocketChannel(const SocketChannel&) = delete;
  SocketChannel& operator=(const SocketChannel&) = delete;

  // Start connecting to the first address
  expected<void, Error> start();

  expected<bool, Error> finish_connect() override;
  expected<void, Error> set_nodelay(bool enable) override;
  expected<IoResult, Error> read(uint8_t* buf, size_t len) override;
  expected<IoResult, Error> write(const uint8_t* buf, size_t len) override;
  int handle() const override { return socket_.handle(); }
  ChannelKind kind() const override { return kind_; }
  void close() override;

 private:
  ChannelKind kind_;
  sockpp::stream_socket socket_;
  std::vector<SocketAddress> addresses_;
  size_t next_address_ = 0;
  bool connected_ = false;
  int last_errno_ = 0;

  // Begin a non-blocking connect to addresses_[next_address_++].
  // Returns true if connected immediately.
  expected<bool, Error> connect_next();
};

// ============================================================================
// SocketDialer (default Dialer)
// ============================================================================

class SocketDialer final : public Dialer {
 public:
  SocketDialer();

  // Numeric hosts complete at once; names are looked up on a worker thread
  // that signals a pipe when done.
  expected<std::unique_ptr<Lookup>, Error> resolve(const Endpoint& endpoint) override;
  expected<std::unique_ptr<Channel>, Error> dial(const Lookup& lookup) override;
  expected<std::unique_ptr<Channel>, Error> dial_local(const std::string& path) override;
};

}  // namespace ewsc

#endif  // EWSC_DIALER_HPP_
