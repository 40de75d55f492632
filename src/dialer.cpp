#include "ewsc/dialer.hpp"

#include "ewsc/log.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sockpp/unix_address.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace ewsc {

namespace {

Error io_error(int err) {
  return Error::make(ErrorCode::kTransport, err);
}

Error lookup_error(const Endpoint& endpoint, int rc, int os_err) {
  EWSC_LOG_WARN("resolve " + endpoint.to_string() + " failed: " + gai_strerror(rc));
  return Error::make(ErrorCode::kTransport, os_err, rc);
}

// getaddrinfo into out. Returns the getaddrinfo code; os_err is set for EAI_SYSTEM.
int lookup_addresses(const Endpoint& endpoint, int flags, std::vector<SocketAddress>& out,
                     int& os_err) {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = flags | AI_NUMERICSERV;

  std::string port = std::to_string(endpoint.port);
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    os_err = (rc == EAI_SYSTEM) ? errno : 0;
    return rc;
  }
  ScopeGuard free_res([res]() { ::freeaddrinfo(res); });

  for (const addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
    SocketAddress addr;
    std::memcpy(&addr.storage, ai->ai_addr, ai->ai_addrlen);
    addr.len = static_cast<socklen_t>(ai->ai_addrlen);
    out.push_back(addr);
  }
  return 0;
}

// Address literal, known when resolve() returns
class ReadyLookup final : public Lookup {
 public:
  ReadyLookup(const Endpoint& endpoint, std::vector<SocketAddress> addresses)
      : endpoint_(endpoint), addresses_(std::move(addresses)) {}

  const Endpoint& endpoint() const override { return endpoint_; }
  expected<bool, Error> poll() override { return expected<bool, Error>::success(true); }
  int handle() const override { return -1; }
  const std::vector<SocketAddress>& addresses() const override { return addresses_; }

 private:
  Endpoint endpoint_;
  std::vector<SocketAddress> addresses_;
};

// Written once by the worker, read by ThreadedLookup. Shared so an
// abandoned worker can still finish into it.
struct LookupSlot {
  std::mutex mutex;
  bool done = false;
  int rc = 0;
  int os_error = 0;
  std::vector<SocketAddress> addresses;
  int wake_fds[2] = {-1, -1};  // [0] readable once done

  ~LookupSlot() {
    for (int fd : wake_fds) {
      if (fd >= 0) ::close(fd);
    }
  }
};

class ThreadedLookup final : public Lookup {
 public:
  ThreadedLookup(const Endpoint& endpoint, std::shared_ptr<LookupSlot> slot)
      : endpoint_(endpoint), slot_(std::move(slot)) {}

  const Endpoint& endpoint() const override { return endpoint_; }

  expected<bool, Error> poll() override {
    if (finished_) {
      return expected<bool, Error>::success(true);
    }
    std::lock_guard<std::mutex> lock(slot_->mutex);
    if (!slot_->done) {
      return expected<bool, Error>::success(false);
    }
    if (slot_->rc != 0) {
      return expected<bool, Error>::error(lookup_error(endpoint_, slot_->rc, slot_->os_error));
    }
    addresses_ = std::move(slot_->addresses);
    finished_ = true;
    return expected<bool, Error>::success(true);
  }

  int handle() const override { return slot_->wake_fds[0]; }
  const std::vector<SocketAddress>& addresses() const override { return addresses_; }

 private:
  Endpoint endpoint_;
  std::shared_ptr<LookupSlot> slot_;
  std::vector<SocketAddress> addresses_;
  bool finished_ = false;
};

}  // namespace

short poll_events(IoStatus status) noexcept {
  switch (status) {
    case IoStatus::kWantRead:
      return POLLIN;
    case IoStatus::kWantWrite:
      return POLLOUT;
    default:
      break;
  }
  return POLLIN | POLLOUT;
}

// ============================================================================
// SocketChannel
// ============================================================================

SocketChannel::SocketChannel(ChannelKind kind, std::vector<SocketAddress> addresses)
    : kind_(kind), addresses_(std::move(addresses)) {}

SocketChannel::~SocketChannel() {
  close();
}

void SocketChannel::close() {
  if (socket_.is_open()) {
    socket_.close();
  }
  connected_ = false;
}

expected<void, Error> SocketChannel::start() {
  auto result = connect_next();
  if (!result) {
    return expected<void, Error>::error(result.get_error());
  }
  connected_ = result.value();
  return expected<void, Error>::success();
}

expected<bool, Error> SocketChannel::connect_next() {
  while (next_address_ < addresses_.size()) {
    const SocketAddress& addr = addresses_[next_address_++];

    int fd = ::socket(addr.storage.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      last_errno_ = errno;
      continue;
    }
    sockpp::stream_socket sock(fd);
    if (!sock.set_non_blocking(true)) {
      // A blocking connect() here would stall the caller
      last_errno_ = errno;
      EWSC_LOG_DEBUG(std::string("O_NONBLOCK failed: ") + strerror(last_errno_));
      continue;
    }

    if (::connect(sock.handle(), reinterpret_cast<const sockaddr*>(&addr.storage), addr.len) == 0) {
      socket_ = std::move(sock);
      return expected<bool, Error>::success(true);
    }

    int err = errno;
    if (err == EINPROGRESS) {
      socket_ = std::move(sock);
      return expected<bool, Error>::success(false);
    }
    last_errno_ = err;
    EWSC_LOG_DEBUG(std::string("connect failed: ") + strerror(err));
  }

  return expected<bool, Error>::error(io_error(last_errno_ != 0 ? last_errno_ : ECONNREFUSED));
}

expected<bool, Error> SocketChannel::finish_connect() {
  if (connected_) {
    return expected<bool, Error>::success(true);
  }
  if (!socket_.is_open()) {
    return expected<bool, Error>::error(Error::make(ErrorCode::kInvalidState));
  }

  pollfd pfd{socket_.handle(), POLLOUT, 0};
  int n = ::poll(&pfd, 1, 0);
  if (n < 0) {
    int err = errno;
    if (err == EINTR) {
      return expected<bool, Error>::success(false);
    }
    return expected<bool, Error>::error(io_error(err));
  }
  if (n == 0) {
    return expected<bool, Error>::success(false);
  }

  int so_error = 0;
  socklen_t so_len = sizeof(so_error);
  if (::getsockopt(socket_.handle(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
    so_error = errno;
  }
  if (so_error == 0) {
    connected_ = true;
    return expected<bool, Error>::success(true);
  }

  // This address failed; move on to the next one of the same attempt
  last_errno_ = so_error;
  socket_.close();
  auto next = connect_next();
  if (!next) {
    return next;
  }
  connected_ = next.value();
  return next;
}

expected<void, Error> SocketChannel::set_nodelay(bool enable) {
  if (kind_ != ChannelKind::kTcp) {
    return expected<void, Error>::success();
  }
  int opt = enable ? 1 : 0;
  if (::setsockopt(socket_.handle(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
    int err = errno;
    EWSC_LOG_WARN(std::string("TCP_NODELAY failed: ") + strerror(err));
    return expected<void, Error>::error(io_error(err));
  }
  return expected<void, Error>::success();
}

expected<IoResult, Error> SocketChannel::read(uint8_t* buf, size_t len) {
  ssize_t n = socket_.read(buf, len);
  if (n > 0) {
    return expected<IoResult, Error>::success(IoResult::done(static_cast<size_t>(n)));
  }
  if (n == 0) {
    return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kClosed));
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kWantRead));
  }
  return expected<IoResult, Error>::error(io_error(err));
}

expected<IoResult, Error> SocketChannel::write(const uint8_t* buf, size_t len) {
  ssize_t n = socket_.write(buf, len);
  if (n >= 0) {
    return expected<IoResult, Error>::success(IoResult::done(static_cast<size_t>(n)));
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kWantWrite));
  }
  return expected<IoResult, Error>::error(io_error(err));
}

// ============================================================================
// SocketDialer
// ============================================================================

SocketDialer::SocketDialer() {
  sockpp::initialize();
}

expected<std::unique_ptr<Lookup>, Error> SocketDialer::resolve(const Endpoint& endpoint) {
  // Address literals never touch the network
  std::vector<SocketAddress> addresses;
  int os_err = 0;
  int rc = lookup_addresses(endpoint, AI_NUMERICHOST, addresses, os_err);
  if (rc == 0) {
    return expected<std::unique_ptr<Lookup>, Error>::success(
        std::unique_ptr<Lookup>(std::make_unique<ReadyLookup>(endpoint, std::move(addresses))));
  }
  if (rc != EAI_NONAME) {
    return expected<std::unique_ptr<Lookup>, Error>::error(lookup_error(endpoint, rc, os_err));
  }

  auto slot = std::make_shared<LookupSlot>();
  if (::pipe2(slot->wake_fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    return expected<std::unique_ptr<Lookup>, Error>::error(io_error(errno));
  }

  // getaddrinfo cannot be interrupted. A worker whose lookup was dropped
  // finishes into the slot and exits; it never touches a socket.
  std::thread([slot, endpoint]() {
    std::vector<SocketAddress> found;
    int err = 0;
    int code = lookup_addresses(endpoint, 0, found, err);
    {
      std::lock_guard<std::mutex> lock(slot->mutex);
      slot->rc = code;
      slot->os_error = err;
      slot->addresses = std::move(found);
      slot->done = true;
    }
    const char wake = 1;
    if (::write(slot->wake_fds[1], &wake, 1) < 0) {
      EWSC_LOG_DEBUG(std::string("resolver wakeup failed: ") + strerror(errno));
    }
  }).detach();

  EWSC_LOG_DEBUG("resolving " + endpoint.to_string());
  return expected<std::unique_ptr<Lookup>, Error>::success(
      std::unique_ptr<Lookup>(std::make_unique<ThreadedLookup>(endpoint, std::move(slot))));
}

expected<std::unique_ptr<Channel>, Error> SocketDialer::dial(const Lookup& lookup) {
  const Endpoint& endpoint = lookup.endpoint();
  std::vector<SocketAddress> addresses = lookup.addresses();
  if (addresses.empty()) {
    return expected<std::unique_ptr<Channel>, Error>::error(io_error(EADDRNOTAVAIL));
  }

  auto channel = std::make_unique<SocketChannel>(ChannelKind::kTcp, std::move(addresses));
  auto started = channel->start();
  if (!started) {
    EWSC_LOG_WARN("dial " + endpoint.to_string() + ": " + to_string(started.get_error()));
    return expected<std::unique_ptr<Channel>, Error>::error(started.get_error());
  }
  EWSC_LOG_DEBUG("dialing " + endpoint.to_string());
  return expected<std::unique_ptr<Channel>, Error>::success(std::unique_ptr<Channel>(std::move(channel)));
}

expected<std::unique_ptr<Channel>, Error> SocketDialer::dial_local(const std::string& path) {
  if (path.empty()) {
    return expected<std::unique_ptr<Channel>, Error>::error(io_error(EINVAL));
  }
  if (path.size() >= sizeof(sockaddr_un::sun_path)) {
    return expected<std::unique_ptr<Channel>, Error>::error(io_error(ENAMETOOLONG));
  }

  sockpp::unix_address unix_addr(path);
  SocketAddress addr;
  std::memcpy(&addr.storage, unix_addr.sockaddr_ptr(), unix_addr.size());
  addr.len = static_cast<socklen_t>(unix_addr.size());

  std::vector<SocketAddress> addresses;
  addresses.push_back(addr);

  auto channel = std::make_unique<SocketChannel>(ChannelKind::kUnix, std::move(addresses));
  auto started = channel->start();
  if (!started) {
    EWSC_LOG_WARN("dial unix:" + path + ": " + to_string(started.get_error()));
    return expected<std::unique_ptr<Channel>, Error>::error(started.get_error());
  }
  EWSC_LOG_DEBUG("dialing unix:" + path);
  return expected<std::unique_ptr<Channel>, Error>::success(std::unique_ptr<Channel>(std::move(channel)));
}

}  // namespace ewsc
