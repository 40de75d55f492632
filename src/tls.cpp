#include "ewsc/tls.hpp"

#include "ewsc/log.hpp"

#include <cerrno>
#include <cstring>

#ifdef EWSC_WITH_TLS
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#if defined(MBEDTLS_USE_PSA_CRYPTO) || defined(MBEDTLS_SSL_PROTO_TLS1_3)
#include <psa/crypto.h>
#endif
#endif  // EWSC_WITH_TLS

namespace ewsc {

bool tls_supported() noexcept {
#ifdef EWSC_WITH_TLS
  return true;
#else
  return false;
#endif
}

#ifdef EWSC_WITH_TLS

namespace {

std::string mbedtls_message(int ret) {
  char buf[128];
  mbedtls_strerror(ret, buf, sizeof(buf));
  return std::string(buf);
}

}  // namespace

// ============================================================================
// TlsContext
// ============================================================================

int TlsContext::init(const TlsConfig& config) {
#if defined(MBEDTLS_USE_PSA_CRYPTO) || defined(MBEDTLS_SSL_PROTO_TLS1_3)
  if (psa_crypto_init() != PSA_SUCCESS) {
    return MBEDTLS_ERR_SSL_INTERNAL_ERROR;
  }
#endif

  const char* pers = "ewsc_tls";

  // Seed RNG
  int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func,
                                  &entropy_,
                                  reinterpret_cast<const unsigned char*>(pers),
                                  strlen(pers));
  if (ret != 0) return ret;

  // Load trust anchors. Positive returns count certificates skipped in a bundle.
  if (!config.ca_pem.empty()) {
    ret = mbedtls_x509_crt_parse(&cacert_,
                                 reinterpret_cast<const unsigned char*>(config.ca_pem.c_str()),
                                 config.ca_pem.size() + 1);
    if (ret < 0) return ret;
  } else if (!config.ca_path.empty()) {
    ret = mbedtls_x509_crt_parse_file(&cacert_, config.ca_path.c_str());
    if (ret < 0) return ret;
  } else if (config.verify_peer) {
    ret = mbedtls_x509_crt_parse_file(&cacert_, kDefaultCaBundle);
    if (ret < 0) return ret;
  }

  // Client certificate for mutual TLS
  if (!config.cert_path.empty()) {
    ret = mbedtls_x509_crt_parse_file(&clicert_, config.cert_path.c_str());
    if (ret != 0) return ret;

    ret = mbedtls_pk_parse_keyfile(&pkey_, config.key_path.c_str(),
                                   nullptr, mbedtls_ctr_drbg_random,
                                   &ctr_drbg_);
    if (ret != 0) return ret;
  }

  // Setup SSL config
  ret = mbedtls_ssl_config_defaults(&conf_,
                                    MBEDTLS_SSL_IS_CLIENT,
                                    MBEDTLS_SSL_TRANSPORT_STREAM,
                                    MBEDTLS_SSL_PRESET_DEFAULT);
  if (ret != 0) return ret;

  mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
  mbedtls_ssl_conf_ca_chain(&conf_, &cacert_, nullptr);
  mbedtls_ssl_conf_authmode(&conf_, config.verify_peer ? MBEDTLS_SSL_VERIFY_REQUIRED
                                                        : MBEDTLS_SSL_VERIFY_NONE);

  if (!config.cert_path.empty()) {
    ret = mbedtls_ssl_conf_own_cert(&conf_, &clicert_, &pkey_);
    if (ret != 0) return ret;
  }

  mbedtls_ssl_conf_min_tls_version(&conf_, config.min_tls_version >= 3
                                               ? MBEDTLS_SSL_VERSION_TLS1_3
                                               : MBEDTLS_SSL_VERSION_TLS1_2);
  return 0;
}

// ============================================================================
// TlsChannel
// ============================================================================

TlsChannel::TlsChannel(std::unique_ptr<TlsContext> ctx, std::unique_ptr<Channel> inner)
    : ctx_(std::move(ctx)), inner_(std::move(inner)) {
  mbedtls_ssl_init(&ssl_);
}

TlsChannel::~TlsChannel() {
  mbedtls_ssl_free(&ssl_);
}

int TlsChannel::setup(const std::string& server_name) {
  int ret = mbedtls_ssl_setup(&ssl_, ctx_->config());
  if (ret != 0) return ret;

  ret = mbedtls_ssl_set_hostname(&ssl_, server_name.c_str());
  if (ret != 0) return ret;

  mbedtls_ssl_set_bio(&ssl_, this, bio_send, bio_recv, nullptr);
  return 0;
}

int TlsChannel::bio_send(void* ctx, const unsigned char* buf, size_t len) {
  auto* self = static_cast<TlsChannel*>(ctx);
  auto result = self->inner_->write(buf, len);
  if (!result) {
    self->inner_error_ = result.get_error();
    return MBEDTLS_ERR_NET_SEND_FAILED;
  }
  switch (result.value().status) {
    case IoStatus::kOk:
      return static_cast<int>(result.value().bytes);
    case IoStatus::kWantRead:
      return MBEDTLS_ERR_SSL_WANT_READ;
    case IoStatus::kWantWrite:
      return MBEDTLS_ERR_SSL_WANT_WRITE;
    case IoStatus::kClosed:
      break;
  }
  self->inner_error_ = Error::make(ErrorCode::kTransport, EPIPE);
  return MBEDTLS_ERR_NET_CONN_RESET;
}

int TlsChannel::bio_recv(void* ctx, unsigned char* buf, size_t len) {
  auto* self = static_cast<TlsChannel*>(ctx);
  auto result = self->inner_->read(buf, len);
  if (!result) {
    self->inner_error_ = result.get_error();
    return MBEDTLS_ERR_NET_RECV_FAILED;
  }
  switch (result.value().status) {
    case IoStatus::kOk:
      return static_cast<int>(result.value().bytes);
    case IoStatus::kWantRead:
      return MBEDTLS_ERR_SSL_WANT_READ;
    case IoStatus::kWantWrite:
      return MBEDTLS_ERR_SSL_WANT_WRITE;
    case IoStatus::kClosed:
      break;
  }
  return 0;  // EOF
}

expected<IoStatus, Error> TlsChannel::handshake() {
  if (handshake_done_) {
    return expected<IoStatus, Error>::success(IoStatus::kOk);
  }

  int ret = mbedtls_ssl_handshake(&ssl_);
  if (ret == 0) {
    handshake_done_ = true;
    EWSC_LOG_DEBUG(std::string("TLS established: ") + mbedtls_ssl_get_version(&ssl_));
    return expected<IoStatus, Error>::success(IoStatus::kOk);
  }
  if (ret == MBEDTLS_ERR_SSL_WANT_READ) {
    return expected<IoStatus, Error>::success(IoStatus::kWantRead);
  }
  if (ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
    return expected<IoStatus, Error>::success(IoStatus::kWantWrite);
  }

  // Underlying transport failed while negotiating
  if (inner_error_.code != ErrorCode::kOk) {
    return expected<IoStatus, Error>::error(inner_error_);
  }

  if (ret == MBEDTLS_ERR_X509_CERT_VERIFY_FAILED) {
    char info[256];
    mbedtls_x509_crt_verify_info(info, sizeof(info), "", mbedtls_ssl_get_verify_result(&ssl_));
    EWSC_LOG_WARN(std::string("certificate verification failed: ") + info);
  } else {
    EWSC_LOG_WARN("TLS handshake failed: " + mbedtls_message(ret));
  }
  return expected<IoStatus, Error>::error(Error::make(ErrorCode::kSecureChannel, 0, ret));
}

expected<IoResult, Error> TlsChannel::map_result(int ret) {
  if (ret >= 0) {
    return expected<IoResult, Error>::success(IoResult::done(static_cast<size_t>(ret)));
  }
  switch (ret) {
    case MBEDTLS_ERR_SSL_WANT_READ:
      return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kWantRead));
    case MBEDTLS_ERR_SSL_WANT_WRITE:
      return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kWantWrite));
    case MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY:
    case MBEDTLS_ERR_SSL_CONN_EOF:
      return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kClosed));
    default:
      break;
  }
  if (inner_error_.code != ErrorCode::kOk) {
    return expected<IoResult, Error>::error(inner_error_);
  }
  EWSC_LOG_WARN("TLS I/O failed: " + mbedtls_message(ret));
  return expected<IoResult, Error>::error(Error::make(ErrorCode::kSecureChannel, 0, ret));
}

expected<IoResult, Error> TlsChannel::read(uint8_t* buf, size_t len) {
  int ret;
  do {
    ret = mbedtls_ssl_read(&ssl_, buf, len);
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
  } while (ret == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET);
#else
  } while (false);
#endif
  if (ret == 0) {
    return expected<IoResult, Error>::success(IoResult::pending(IoStatus::kClosed));
  }
  return map_result(ret);
}

expected<IoResult, Error> TlsChannel::write(const uint8_t* buf, size_t len) {
  return map_result(mbedtls_ssl_write(&ssl_, buf, len));
}

void TlsChannel::close() {
  if (handshake_done_) {
    int ret = mbedtls_ssl_close_notify(&ssl_);
    if (ret < 0 && ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
      EWSC_LOG_DEBUG("close_notify: " + mbedtls_message(ret));
    }
    handshake_done_ = false;
  }
  inner_->close();
}

#endif  // EWSC_WITH_TLS

expected<std::unique_ptr<SecureChannel>, Error> wrap_tls(std::unique_ptr<Channel> inner,
                                                         const TlsConfig& config,
                                                         const std::string& server_name) {
#ifdef EWSC_WITH_TLS
  auto ctx = std::make_unique<TlsContext>();
  int ret = ctx->init(config);
  if (ret != 0) {
    EWSC_LOG_WARN("TLS context init failed: " + mbedtls_message(ret));
    return expected<std::unique_ptr<SecureChannel>, Error>::error(
        Error::make(ErrorCode::kSecureChannel, 0, ret));
  }

  auto channel = std::make_unique<TlsChannel>(std::move(ctx), std::move(inner));
  const std::string& name = config.server_name.empty() ? server_name : config.server_name;
  ret = channel->setup(name);
  if (ret != 0) {
    EWSC_LOG_WARN("TLS session setup failed: " + mbedtls_message(ret));
    return expected<std::unique_ptr<SecureChannel>, Error>::error(
        Error::make(ErrorCode::kSecureChannel, 0, ret));
  }
  return expected<std::unique_ptr<SecureChannel>, Error>::success(
      std::unique_ptr<SecureChannel>(std::move(channel)));
#else
  (void)inner;
  (void)config;
  (void)server_name;
  EWSC_LOG_WARN("TLS support not enabled (build with EWSC_WITH_TLS=ON)");
  return expected<std::unique_ptr<SecureChannel>, Error>::error(
      Error::make(ErrorCode::kSecureChannel));
#endif
}

}  // namespace ewsc
