#include "ewsc/connect.hpp"

#include "ewsc/log.hpp"

#include <cerrno>

#include <poll.h>

namespace ewsc {

const char* to_string(ConnectState state) noexcept {
  switch (state) {
    case ConnectState::kStart:
      return "start";
    case ConnectState::kNormalized:
      return "normalized";
    case ConnectState::kResolving:
      return "resolving";
    case ConnectState::kResolved:
      return "resolved";
    case ConnectState::kDialing:
      return "dialing";
    case ConnectState::kDialed:
      return "dialed";
    case ConnectState::kTuned:
      return "tuned";
    case ConnectState::kHandshaking:
      return "handshaking";
    case ConnectState::kSuccess:
      return "success";
    case ConnectState::kFailed:
      return "failed";
  }
  return "unknown";
}

// ============================================================================
// ConnectOperation
// ============================================================================

ConnectOperation::ConnectOperation(std::string_view url, ConnectOptions options, Dialer& dialer,
                                   Upgrader& upgrader)
    : url_(url),
      from_url_(true),
      options_(std::move(options)),
      dialer_(dialer),
      upgrader_(upgrader) {}

ConnectOperation::ConnectOperation(const Request& request, ConnectOptions options,
                                   Dialer& dialer, Upgrader& upgrader)
    : from_url_(false),
      request_(request),
      options_(std::move(options)),
      dialer_(dialer),
      upgrader_(upgrader) {}

void ConnectOperation::transition(ConnectState next) {
  EWSC_LOG_DEBUG(std::string("connect: ") + to_string(state_) + " -> " + to_string(next));
  state_ = next;
}

expected<bool, Error> ConnectOperation::fail(const Error& err) {
  EWSC_LOG_WARN(std::string("connect failed while ") + to_string(state_) + ": " +
                to_string(err));
  session_.reset();
  channel_.reset();
  lookup_.reset();
  error_ = err;
  state_ = ConnectState::kFailed;
  return expected<bool, Error>::error(err);
}

expected<bool, Error> ConnectOperation::advance() {
  while (true) {
    switch (state_) {
      case ConnectState::kStart: {
        auto normalized = from_url_ ? into_request(url_) : into_request(request_);
        if (!normalized) {
          return fail(normalized.get_error());
        }
        request_ = std::move(normalized).value();
        transition(ConnectState::kNormalized);
        break;
      }

      case ConnectState::kNormalized: {
        if (is_local()) {
          // Local transport dials the path; no endpoint to resolve
          auto dialed = dialer_.dial_local(options_.unix_path);
          if (!dialed) {
            return fail(dialed.get_error());
          }
          channel_ = std::move(dialed).value();
          transition(ConnectState::kDialing);
          break;
        }
        auto resolved = resolve_endpoint(request_);
        if (!resolved) {
          return fail(resolved.get_error());
        }
        endpoint_ = std::move(resolved).value();
        auto lookup = dialer_.resolve(endpoint_);
        if (!lookup) {
          return fail(lookup.get_error());
        }
        lookup_ = std::move(lookup).value();
        transition(ConnectState::kResolving);
        break;
      }

      case ConnectState::kResolving: {
        auto done = lookup_->poll();
        if (!done) {
          return fail(done.get_error());
        }
        if (!done.value()) {
          return expected<bool, Error>::success(false);
        }
        transition(ConnectState::kResolved);
        break;
      }

      case ConnectState::kResolved: {
        auto dialed = dialer_.dial(*lookup_);
        lookup_.reset();
        if (!dialed) {
          return fail(dialed.get_error());
        }
        channel_ = std::move(dialed).value();
        transition(ConnectState::kDialing);
        break;
      }

      case ConnectState::kDialing: {
        auto connected = channel_->finish_connect();
        if (!connected) {
          return fail(connected.get_error());
        }
        if (!connected.value()) {
          return expected<bool, Error>::success(false);
        }
        transition(ConnectState::kDialed);
        break;
      }

      case ConnectState::kDialed:
      case ConnectState::kTuned: {
        // Tuning applies to networked transport only, before any other use
        if (state_ == ConnectState::kDialed && options_.channel.tcp_nodelay &&
            channel_->kind() == ChannelKind::kTcp) {
          auto tuned = channel_->set_nodelay(true);
          if (!tuned) {
            return fail(tuned.get_error());
          }
          transition(ConnectState::kTuned);
        }

        const Connector* connector =
            options_.connector.has_value() ? &options_.connector.value() : nullptr;
        auto started = upgrader_.start(std::move(channel_), request_, options_.config, connector);
        if (!started) {
          return fail(started.get_error());
        }
        session_ = std::move(started).value();
        transition(ConnectState::kHandshaking);
        break;
      }

      case ConnectState::kHandshaking: {
        auto upgraded = session_->advance();
        if (!upgraded) {
          return fail(upgraded.get_error());
        }
        if (!upgraded.value()) {
          return expected<bool, Error>::success(false);
        }
        transition(ConnectState::kSuccess);
        break;
      }

      case ConnectState::kSuccess:
        return expected<bool, Error>::success(true);

      case ConnectState::kFailed:
        return expected<bool, Error>::error(error_);
    }
  }
}

int ConnectOperation::handle() const {
  switch (state_) {
    case ConnectState::kResolving:
      return lookup_->handle();
    case ConnectState::kDialing:
      return channel_->handle();
    case ConnectState::kHandshaking:
      return session_->handle();
    default:
      break;
  }
  return -1;
}

short ConnectOperation::interest() const {
  switch (state_) {
    case ConnectState::kResolving:
      return POLLIN;
    case ConnectState::kDialing:
      return POLLOUT;
    case ConnectState::kHandshaking:
      return session_->interest();
    default:
      break;
  }
  return 0;
}

expected<ConnectResult, Error> ConnectOperation::take_result() {
  if (state_ != ConnectState::kSuccess || !session_) {
    return expected<ConnectResult, Error>::error(Error::make(ErrorCode::kInvalidState));
  }
  auto result = session_->take_result();
  session_.reset();
  return result;
}

// ============================================================================
// Blocking drivers
// ============================================================================

expected<ConnectResult, Error> run_to_completion(ConnectOperation& op) {
  while (true) {
    auto progress = op.advance();
    if (!progress) {
      return expected<ConnectResult, Error>::error(progress.get_error());
    }
    if (progress.value()) {
      return op.take_result();
    }

    int fd = op.handle();
    if (fd < 0) {
      return expected<ConnectResult, Error>::error(Error::make(ErrorCode::kInvalidState));
    }
    pollfd pfd{fd, op.interest(), 0};
    if (::poll(&pfd, 1, -1) < 0) {
      int err = errno;
      if (err != EINTR) {
        return expected<ConnectResult, Error>::error(Error::make(ErrorCode::kTransport, err));
      }
    }
  }
}

expected<ConnectResult, Error> connect_blocking(std::string_view url, ConnectOptions options) {
  SocketDialer dialer;
  StreamUpgrader upgrader;
  ConnectOperation op(url, std::move(options), dialer, upgrader);
  return run_to_completion(op);
}

expected<ConnectResult, Error> connect_blocking(const Request& request, ConnectOptions options) {
  SocketDialer dialer;
  StreamUpgrader upgrader;
  ConnectOperation op(request, std::move(options), dialer, upgrader);
  return run_to_completion(op);
}

}  // namespace ewsc
