#ifndef EWSC_TLS_HPP_
#define EWSC_TLS_HPP_

// ============================================================================
// TLS Configuration and Abstraction Layer
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option EWSC_WITH_TLS=ON.
// When disabled, wrap_tls() fails with ErrorCode::kSecureChannel and only
// plain ws:// connections are possible. Never falls back to plain for wss://.
//
// Usage:
//   ewsc::TlsConfig tls;
//   tls.ca_path = "/path/to/ca.pem";
//   auto result = ewsc::connect_tls_with_config(
//       "wss://example.com/chat", {}, false, ewsc::Connector::tls(tls));
//

#include "channel.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>

#ifdef EWSC_WITH_TLS

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/pk.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#endif  // EWSC_WITH_TLS

namespace ewsc {

// ============================================================================
// TLS Configuration (trust policy)
// ============================================================================

// Used when neither ca_path nor ca_pem is set
static constexpr const char* kDefaultCaBundle = "/etc/ssl/certs/ca-certificates.crt";

struct TlsConfig {
  std::string ca_path;            // CA bundle (PEM file); empty = kDefaultCaBundle
  std::string ca_pem;             // In-memory CA certificates (PEM), replaces ca_path
  std::string cert_path;          // Client certificate for mutual TLS (optional)
  std::string key_path;           // Client private key (optional)
  bool verify_peer = true;        // Require a valid server certificate chain
  std::string server_name;        // SNI/verification name; empty = request host

  int min_tls_version = 0;        // 0 = TLS 1.2 minimum, 3 = TLS 1.3
};

// ============================================================================
// Connector (override of how the transport is wrapped)
// ============================================================================

class Connector {
 public:
  enum class Kind : uint8_t { kPlain, kTls };

  // Never encrypts; wss:// requests fail instead of downgrading
  static Connector plain() { return Connector(Kind::kPlain, TlsConfig{}); }

  static Connector tls(const TlsConfig& config) { return Connector(Kind::kTls, config); }

  // What the upgrader builds when the caller supplies no connector
  static Connector default_connector() { return tls(TlsConfig{}); }

  Kind kind() const { return kind_; }
  const TlsConfig& config() const { return config_; }

 private:
  Connector(Kind kind, const TlsConfig& config) : kind_(kind), config_(config) {}

  Kind kind_;
  TlsConfig config_;
};

// True when built with EWSC_WITH_TLS
bool tls_supported() noexcept;

// ============================================================================
// SecureChannel (encrypted channel that needs a handshake)
// ============================================================================

class SecureChannel : public Channel {
 public:
  // Drive the TLS handshake. kOk once complete; kWantRead/kWantWrite while
  // waiting on the underlying handle.
  virtual expected<IoStatus, Error> handshake() = 0;

  ChannelKind kind() const override { return ChannelKind::kTls; }
};

// Wrap inner in a TLS client channel verifying server_name.
// The returned channel owns inner.
expected<std::unique_ptr<SecureChannel>, Error> wrap_tls(std::unique_ptr<Channel> inner,
                                                         const TlsConfig& config,
                                                         const std::string& server_name);

#ifdef EWSC_WITH_TLS

// ============================================================================
// TLS Context (one per connection attempt, certificates and config)
// ============================================================================

class TlsContext {
 public:
  TlsContext() {
    mbedtls_ssl_config_init(&conf_);
    mbedtls_x509_crt_init(&cacert_);
    mbedtls_x509_crt_init(&clicert_);
    mbedtls_pk_init(&pkey_);
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&ctr_drbg_);
  }

  ~TlsContext() {
    mbedtls_ssl_config_free(&conf_);
    mbedtls_x509_crt_free(&cacert_);
    mbedtls_x509_crt_free(&clicert_);
    mbedtls_pk_free(&pkey_);
    mbedtls_entropy_free(&entropy_);
    mbedtls_ctr_drbg_free(&ctr_drbg_);
  }

  // Non-copyable
  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  // Initialize client context with config
  // Returns 0 on success, mbedtls error code on failure
  int init(const TlsConfig& config);

  const mbedtls_ssl_config* config() const { return &conf_; }

 private:
  mbedtls_ssl_config conf_;
  mbedtls_x509_crt cacert_;
  mbedtls_x509_crt clicert_;
  mbedtls_pk_context pkey_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
};

// ============================================================================
// TlsChannel (one per connection, BIO bound to the inner channel)
// ============================================================================

class TlsChannel final : public SecureChannel {
 public:
  TlsChannel(std::unique_ptr<TlsContext> ctx, std::unique_ptr<Channel> inner);
  ~TlsChannel() override;

  // Non-copyable
  TlsChannel(const TlsChannel&) = delete;
  TlsChannel& operator=(const TlsChannel&) = delete;

  // Setup session for server_name
  // Returns 0 on success, mbedtls error code on failure
  int setup(const std::string& server_name);

  expected<IoStatus, Error> handshake() override;

  expected<bool, Error> finish_connect() override { return inner_->finish_connect(); }
  expected<void, Error> set_nodelay(bool enable) override { return inner_->set_nodelay(enable); }
  expected<IoResult, Error> read(uint8_t* buf, size_t len) override;
  expected<IoResult, Error> write(const uint8_t* buf, size_t len) override;
  int handle() const override { return inner_->handle(); }
  void close() override;

 private:
  std::unique_ptr<TlsContext> ctx_;
  std::unique_ptr<Channel> inner_;
  mbedtls_ssl_context ssl_;
  Error inner_error_;  // Transport error seen by the BIO callbacks
  bool handshake_done_ = false;

  static int bio_send(void* ctx, const unsigned char* buf, size_t len);
  static int bio_recv(void* ctx, unsigned char* buf, size_t len);

  // Map an mbedtls return code to IoStatus or Error
  expected<IoResult, Error> map_result(int ret);
};

#endif  // EWSC_WITH_TLS

}  // namespace ewsc

#endif  // EWSC_TLS_HPP_
