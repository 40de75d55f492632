#include "ewsc/upgrader.hpp"

#include "ewsc/log.hpp"

namespace ewsc {

namespace {

using StartResult = expected<std::unique_ptr<UpgradeSession>, Error>;

// TLS handshake (if any), then the WebSocket opening handshake
class StreamSession final : public UpgradeSession {
 public:
  StreamSession(std::unique_ptr<Channel> channel, SecureChannel* secure, const Request& request,
                const WebSocketConfig& config)
      : channel_(std::move(channel)),
        secure_(secure),
        config_(config),
        handshake_(request, config.max_handshake_size) {}

  expected<bool, Error> advance() override {
    if (result_.has_value()) {
      return expected<bool, Error>::success(true);
    }
    if (!channel_) {
      return expected<bool, Error>::error(Error::make(ErrorCode::kInvalidState));
    }

    if (secure_ != nullptr && !tls_done_) {
      auto tls = secure_->handshake();
      if (!tls) {
        return expected<bool, Error>::error(tls.get_error());
      }
      if (tls.value() != IoStatus::kOk) {
        want_ = tls.value();
        return expected<bool, Error>::success(false);
      }
      tls_done_ = true;
    }

    auto hs = handshake_.advance(*channel_);
    if (!hs) {
      return expected<bool, Error>::error(hs.get_error());
    }
    if (hs.value() != IoStatus::kOk) {
      want_ = hs.value();
      return expected<bool, Error>::success(false);
    }

    secure_ = nullptr;
    result_ = ConnectResult{
        WebSocketStream(std::move(channel_), config_, handshake_.take_leftover()),
        handshake_.take_response()};
    return expected<bool, Error>::success(true);
  }

  int handle() const override { return channel_ ? channel_->handle() : -1; }

  short interest() const override { return poll_events(want_); }

  expected<ConnectResult, Error> take_result() override {
    if (!result_.has_value()) {
      return expected<ConnectResult, Error>::error(Error::make(ErrorCode::kInvalidState));
    }
    auto out = expected<ConnectResult, Error>::success(std::move(result_.value()));
    result_.reset();
    return out;
  }

 private:
  std::unique_ptr<Channel> channel_;
  SecureChannel* secure_;  // Aliases channel_ when TLS is layered
  WebSocketConfig config_;
  ClientHandshake handshake_;
  IoStatus want_ = IoStatus::kWantWrite;
  bool tls_done_ = false;
  optional<ConnectResult> result_;
};

}  // namespace

StartResult StreamUpgrader::start(std::unique_ptr<Channel> channel, const Request& request,
                                  const optional<WebSocketConfig>& config,
                                  const Connector* connector) {
  WebSocketConfig ws_config = config.has_value() ? config.value() : WebSocketConfig{};

  switch (request.scheme) {
    case Scheme::kWs: {
      EWSC_LOG_DEBUG("upgrading plain channel");
      return StartResult::success(std::unique_ptr<UpgradeSession>(
          std::make_unique<StreamSession>(std::move(channel), nullptr, request, ws_config)));
    }
    case Scheme::kWss:
      break;
    case Scheme::kUnknown:
      EWSC_LOG_WARN("cannot upgrade scheme '" + request.scheme_text + "'");
      return StartResult::error(Error::make(ErrorCode::kUnsupportedScheme));
  }

  if (connector != nullptr && connector->kind() == Connector::Kind::kPlain) {
    EWSC_LOG_WARN("wss requested but the connector does not support TLS");
    return StartResult::error(Error::make(ErrorCode::kSecureChannel));
  }

  // No override: build the default trust policy here, for this attempt only
  TlsConfig tls_config =
      connector != nullptr ? connector->config() : Connector::default_connector().config();

  auto wrapped = wrap_tls(std::move(channel), tls_config, request.host);
  if (!wrapped) {
    return StartResult::error(wrapped.get_error());
  }
  std::unique_ptr<SecureChannel> secure = std::move(wrapped).value();
  SecureChannel* secure_ptr = secure.get();
  EWSC_LOG_DEBUG("upgrading TLS channel for " + request.host);
  return StartResult::success(std::unique_ptr<UpgradeSession>(
      std::make_unique<StreamSession>(std::move(secure), secure_ptr, request, ws_config)));
}

}  // namespace ewsc
