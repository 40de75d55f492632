#include "fakes.hpp"

#include <cerrno>

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace ewsc;

namespace {

using Events = std::vector<std::string>;

// Advance until done or suspended; the fakes never need a real poll
expected<bool, Error> drive(ConnectOperation& op, int max_steps = 16) {
  auto result = op.advance();
  for (int i = 0; i < max_steps && result.has_value() && !result.value(); ++i) {
    result = op.advance();
  }
  return result;
}

}  // namespace

// ============================================================================
// Stage ordering (fake dialer + fake upgrader)
// ============================================================================

TEST_CASE("Connect - ws URL resolves to port 80 without TLS", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("ws://example.test/chat", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE(result.has_value());
  REQUIRE(result.value());
  REQUIRE(op.state() == ConnectState::kSuccess);

  REQUIRE(dialer.dialed.size() == 1);
  REQUIRE(dialer.dialed[0] == Endpoint{"example.test", 80});
  REQUIRE(events == Events{"resolve example.test:80", "dial example.test:80",
                          "upgrade ws example.test"});
  REQUIRE(dialer.channel->nodelay_calls == 0);
  REQUIRE_FALSE(upgrader.had_connector);
  REQUIRE_FALSE(upgrader.had_config);

  auto conn = op.take_result();
  REQUIRE(conn.has_value());
  REQUIRE(conn.value().response.status == 101);
  REQUIRE_FALSE(conn.value().stream.is_secure());
}

TEST_CASE("Connect - wss URL resolves to port 443 and upgrades for the host", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("wss://example.test/chat", {}, dialer, upgrader);
  REQUIRE(drive(op).value());

  REQUIRE(dialer.dialed[0] == Endpoint{"example.test", 443});
  REQUIRE(upgrader.calls == 1);
  REQUIRE(upgrader.last_host == "example.test");
  REQUIRE(events == Events{"resolve example.test:443", "dial example.test:443",
                          "upgrade wss example.test"});
}

TEST_CASE("Connect - explicit port wins over scheme default", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("ws://example.test:9001/", {}, dialer, upgrader);
  REQUIRE(drive(op).value());
  REQUIRE(dialer.dialed[0] == Endpoint{"example.test", 9001});
}

TEST_CASE("Connect - unknown scheme without port never dials", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("ftp://example.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kUnsupportedScheme);
  REQUIRE(dialer.dial_count() == 0);
  REQUIRE(dialer.resolved.empty());
  REQUIRE(upgrader.calls == 0);
  REQUIRE(op.state() == ConnectState::kFailed);

  // Terminal: the same error again, still no dial
  auto again = op.advance();
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == result.get_error());
  REQUIRE(dialer.dial_count() == 0);
}

TEST_CASE("Connect - malformed URL fails before any I/O", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("ws://exa mple/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kRequestConstruction);
  REQUIRE(events.empty());
}

TEST_CASE("Connect - local transport dials the exact path and skips tuning", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOptions options;
  options.unix_path = "/tmp/sock";
  options.channel.tcp_nodelay = true;

  ConnectOperation op("ws://localhost/", std::move(options), dialer, upgrader);
  REQUIRE(drive(op).value());

  REQUIRE(dialer.local_paths == std::vector<std::string>{"/tmp/sock"});
  REQUIRE(dialer.resolved.empty());
  REQUIRE(dialer.dialed.empty());
  REQUIRE(dialer.channel->nodelay_calls == 0);
  REQUIRE(upgrader.calls == 1);
  REQUIRE(upgrader.last_channel_kind == ChannelKind::kUnix);
  REQUIRE(events == Events{"dial_local /tmp/sock", "upgrade ws localhost"});
}

TEST_CASE("Connect - nodelay is applied after dial and before upgrade", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.channel->connect_polls = 2;

  ConnectOptions options;
  options.channel.tcp_nodelay = true;
  ConnectOperation op("ws://example.test/", std::move(options), dialer, upgrader);

  REQUIRE_FALSE(op.advance().value());
  REQUIRE(op.state() == ConnectState::kDialing);
  REQUIRE(events == Events{"resolve example.test:80", "dial example.test:80"});

  REQUIRE(drive(op).value());
  REQUIRE(events == Events{"resolve example.test:80", "dial example.test:80", "nodelay",
                          "upgrade ws example.test"});
  REQUIRE(dialer.channel->nodelay_calls == 1);
}

// ============================================================================
// Name lookup
// ============================================================================

TEST_CASE("Connect - pending name lookup suspends before dialing", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.resolve_polls = 2;

  ConnectOperation op("ws://example.test/", {}, dialer, upgrader);

  auto first = op.advance();
  REQUIRE(first.has_value());
  REQUIRE_FALSE(first.value());
  REQUIRE(op.state() == ConnectState::kResolving);
  REQUIRE(op.handle() == dialer.lookup_fd);
  REQUIRE(op.interest() == POLLIN);
  REQUIRE(dialer.dial_count() == 0);

  // Still pending: no dial yet
  REQUIRE_FALSE(op.advance().value());
  REQUIRE(op.state() == ConnectState::kResolving);
  REQUIRE(dialer.dial_count() == 0);

  REQUIRE(op.advance().value());
  REQUIRE(dialer.dialed.size() == 1);
  REQUIRE(dialer.lookup_drops == 1);
  REQUIRE(events == Events{"resolve example.test:80", "dial example.test:80",
                          "upgrade ws example.test"});
}

TEST_CASE("Connect - lookup failure is a transport error and never dials", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.fail_resolve_with = Error::make(ErrorCode::kTransport, 0, EAI_NONAME);

  ConnectOperation op("ws://nowhere.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == Error::make(ErrorCode::kTransport, 0, EAI_NONAME));
  REQUIRE(dialer.dial_count() == 0);
  REQUIRE(upgrader.calls == 0);
}

TEST_CASE("Connect - dropping during name lookup releases the lookup", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.resolve_polls = 100;

  {
    ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
    REQUIRE_FALSE(op.advance().value());
    REQUIRE(op.state() == ConnectState::kResolving);
    REQUIRE(dialer.lookup_drops == 0);
  }

  REQUIRE(dialer.lookup_drops == 1);
  REQUIRE(dialer.dial_count() == 0);
}

// ============================================================================
// Failure paths
// ============================================================================

TEST_CASE("Connect - dial failure prevents any upgrade", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.fail_with = Error::make(ErrorCode::kTransport, ECONNREFUSED);

  ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kTransport);
  REQUIRE(result.get_error().os_error == ECONNREFUSED);
  REQUIRE(upgrader.calls == 0);
}

TEST_CASE("Connect - nodelay failure is a transport error and skips the handshake", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.channel->fail_nodelay = true;

  ConnectOptions options;
  options.channel.tcp_nodelay = true;
  ConnectOperation op("ws://example.test/", std::move(options), dialer, upgrader);

  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kTransport);
  REQUIRE(upgrader.calls == 0);
  REQUIRE(dialer.channel->written.empty());
  REQUIRE(dialer.channel->drops == 1);
}

TEST_CASE("Connect - upgrade failure is reported unchanged", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  upgrader.fail_with = Error::make(ErrorCode::kSecureChannel, 0, -0x2700);

  ConnectOperation op("wss://example.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == Error::make(ErrorCode::kSecureChannel, 0, -0x2700));
  REQUIRE(dialer.channel->drops == 1);
}

TEST_CASE("Connect - take_result before success", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
  auto early = op.take_result();
  REQUIRE_FALSE(early.has_value());
  REQUIRE(early.get_error().code == ErrorCode::kInvalidState);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("Connect - dropping during dial releases the channel", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  dialer.channel->connect_polls = 100;

  {
    ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
    auto result = op.advance();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result.value());
    REQUIRE(op.state() == ConnectState::kDialing);
    REQUIRE(op.handle() == dialer.channel->fd);
    REQUIRE(op.interest() == POLLOUT);
    REQUIRE(dialer.channel->drops == 0);
  }

  REQUIRE(dialer.channel->drops == 1);
  REQUIRE(upgrader.calls == 0);
}

TEST_CASE("Connect - dropping during the upgrade releases the channel", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);
  upgrader.polls = 5;

  {
    ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
    REQUIRE_FALSE(op.advance().value());
    REQUIRE(op.state() == ConnectState::kHandshaking);
    REQUIRE(op.interest() == POLLIN);
  }

  REQUIRE(dialer.channel->drops == 1);
}

// ============================================================================
// Inputs and overrides
// ============================================================================

TEST_CASE("Connect - structured request and forwarded options", "[connect]") {
  Events events;
  fakes::FakeDialer dialer(events);
  fakes::FakeUpgrader upgrader(events);

  Request req;
  req.scheme = Scheme::kWss;
  req.host = "example.test";
  req.port = static_cast<uint16_t>(8443);

  ConnectOptions options;
  options.config = WebSocketConfig{};
  options.connector = Connector::plain();

  ConnectOperation op(req, std::move(options), dialer, upgrader);
  REQUIRE(drive(op).value());
  REQUIRE(dialer.dialed[0] == Endpoint{"example.test", 8443});
  REQUIRE(upgrader.had_config);
  REQUIRE(upgrader.had_connector);
}

TEST_CASE("ConnectState names", "[connect]") {
  REQUIRE(std::string(to_string(ConnectState::kStart)) == "start");
  REQUIRE(std::string(to_string(ConnectState::kResolving)) == "resolving");
  REQUIRE(std::string(to_string(ConnectState::kTuned)) == "tuned");
  REQUIRE(std::string(to_string(ConnectState::kFailed)) == "failed");
}

// ============================================================================
// StreamUpgrader over a fake transport
// ============================================================================

TEST_CASE("StreamUpgrader - plain handshake over the dialed channel", "[connect][upgrader]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;
  dialer.channel->auto_accept = true;

  ConnectOptions options;
  options.unix_path = "/tmp/sock";
  ConnectOperation op("ws://localhost/chat", std::move(options), dialer, upgrader);

  auto result = run_to_completion(op);
  REQUIRE(result.has_value());
  REQUIRE(dialer.channel->written.find("GET /chat HTTP/1.1\r\n") == 0);
  REQUIRE(dialer.channel->written.find("\r\nHost: localhost\r\n") != std::string::npos);

  ConnectResult& conn = result.value();
  REQUIRE(conn.response.status == 101);
  REQUIRE_FALSE(conn.stream.is_secure());
  REQUIRE(conn.stream.handle() == dialer.channel->fd);
  REQUIRE(conn.stream.config().max_handshake_size == 16 * 1024);
}

TEST_CASE("StreamUpgrader - unknown scheme with explicit port fails before writing",
          "[connect][upgrader]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;

  ConnectOperation op("ftp://example.test:2121/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kUnsupportedScheme);
  REQUIRE(dialer.dial_count() == 1);
  REQUIRE(dialer.channel->written.empty());
  REQUIRE(dialer.channel->drops == 1);
}

TEST_CASE("StreamUpgrader - plain connector never downgrades wss", "[connect][upgrader]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;

  ConnectOptions options;
  options.connector = Connector::plain();
  ConnectOperation op("wss://example.test/", std::move(options), dialer, upgrader);

  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kSecureChannel);
  REQUIRE(dialer.channel->written.empty());
}

TEST_CASE("StreamUpgrader - rejected handshake", "[connect][upgrader]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;
  dialer.channel->inbound = "HTTP/1.1 403 Forbidden\r\n\r\n";

  ConnectOperation op("ws://example.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kHandshake);
  REQUIRE(result.get_error().detail == 403);
}

// ============================================================================
// StreamUpgrader over TLS
// ============================================================================

#ifdef EWSC_WITH_TLS

TEST_CASE("StreamUpgrader - unreadable CA file fails after dial with a secure channel error",
          "[connect][upgrader][tls]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;

  TlsConfig tls;
  tls.ca_path = "/nonexistent/ewsc-ca.pem";
  ConnectOptions options;
  options.connector = Connector::tls(tls);
  ConnectOperation op("wss://example.test/", std::move(options), dialer, upgrader);

  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kSecureChannel);
  REQUIRE(result.get_error().detail != 0);
  REQUIRE(dialer.dial_count() == 1);
  REQUIRE(dialer.channel->written.empty());
  REQUIRE(dialer.channel->drops == 1);
}

TEST_CASE("StreamUpgrader - plain HTTP peer fails TLS negotiation", "[connect][upgrader][tls]") {
  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;
  dialer.channel->inbound = "HTTP/1.1 400 Bad Request\r\n\r\n";

  TlsConfig tls;
  tls.verify_peer = false;
  ConnectOptions options;
  options.connector = Connector::tls(tls);
  ConnectOperation op("wss://example.test/", std::move(options), dialer, upgrader);

  auto result = drive(op);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kSecureChannel);
  REQUIRE(result.get_error().detail != 0);
  REQUIRE(result.get_error().os_error == 0);

  // A ClientHello record went out; no HTTP request did
  REQUIRE_FALSE(dialer.channel->written.empty());
  REQUIRE(static_cast<uint8_t>(dialer.channel->written[0]) == 0x16);
  REQUIRE(dialer.channel->written.find("GET ") == std::string::npos);
  REQUIRE(dialer.channel->drops == 1);
}

TEST_CASE("StreamUpgrader - wss without a connector uses the default trust policy",
          "[connect][upgrader][tls]") {
  REQUIRE(tls_supported());
  Connector fallback = Connector::default_connector();
  REQUIRE(fallback.kind() == Connector::Kind::kTls);
  REQUIRE(fallback.config().verify_peer);
  REQUIRE(fallback.config().ca_path.empty());

  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;

  ConnectOperation op("wss://example.test/", {}, dialer, upgrader);
  auto result = op.advance();

  if (::access(kDefaultCaBundle, R_OK) == 0) {
    // Trust store loaded: the TLS handshake started and waits for the server
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result.value());
    REQUIRE(op.state() == ConnectState::kHandshaking);
    REQUIRE(op.interest() == POLLIN);
    REQUIRE(static_cast<uint8_t>(dialer.channel->written[0]) == 0x16);
  } else {
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.get_error().code == ErrorCode::kSecureChannel);
    REQUIRE(dialer.channel->written.empty());
  }
}

#else  // !EWSC_WITH_TLS

TEST_CASE("StreamUpgrader - wss without TLS support is a secure channel error",
          "[connect][upgrader][tls]") {
  REQUIRE_FALSE(tls_supported());

  Events events;
  fakes::FakeDialer dialer(events);
  StreamUpgrader upgrader;

  ConnectOperation op("wss://example.test/", {}, dialer, upgrader);
  auto result = op.advance();
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kSecureChannel);
  REQUIRE(dialer.dial_count() == 1);
  REQUIRE(dialer.channel->written.empty());
  REQUIRE(dialer.channel->drops == 1);
}

#endif  // EWSC_WITH_TLS

// ============================================================================
// WebSocketStream writes
// ============================================================================

TEST_CASE("WebSocketStream - masked client frames", "[stream]") {
  auto state = std::make_shared<fakes::ChannelState>();
  WebSocketStream stream(std::make_unique<fakes::FakeChannel>(ChannelKind::kTcp, state),
                         WebSocketConfig{}, {});

  REQUIRE(stream.send_text("Hello").has_value());
  const std::string& out = state->written;
  REQUIRE(out.size() == 2 + 4 + 5);
  REQUIRE(static_cast<uint8_t>(out[0]) == 0x81);
  REQUIRE(static_cast<uint8_t>(out[1]) == 0x85);

  std::string unmasked;
  for (size_t i = 0; i < 5; ++i) {
    unmasked += static_cast<char>(out[6 + i] ^ out[2 + (i % 4)]);
  }
  REQUIRE(unmasked == "Hello");
}

TEST_CASE("WebSocketStream - control frame limits and close", "[stream]") {
  auto state = std::make_shared<fakes::ChannelState>();
  WebSocketStream stream(std::make_unique<fakes::FakeChannel>(ChannelKind::kTcp, state),
                         WebSocketConfig{}, {});

  auto too_big = stream.ping(std::string(126, 'p'));
  REQUIRE_FALSE(too_big.has_value());
  REQUIRE(too_big.get_error().code == ErrorCode::kInvalidState);
  REQUIRE(state->written.empty());

  REQUIRE(stream.close(1000).has_value());
  REQUIRE(static_cast<uint8_t>(state->written[0]) == 0x88);
  REQUIRE_FALSE(stream.send_text("late").has_value());
}

TEST_CASE("WebSocketStream - max_frame_size", "[stream]") {
  auto state = std::make_shared<fakes::ChannelState>();
  WebSocketConfig config;
  config.max_frame_size = static_cast<size_t>(4);
  WebSocketStream stream(std::make_unique<fakes::FakeChannel>(ChannelKind::kTcp, state), config,
                         {});

  REQUIRE(stream.send_text("four").has_value());
  REQUIRE_FALSE(stream.send_text("fives").has_value());
}

TEST_CASE("WebSocketStream - destruction closes the channel", "[stream]") {
  auto state = std::make_shared<fakes::ChannelState>();
  {
    std::vector<uint8_t> initial{0x81, 0x00};
    WebSocketStream stream(std::make_unique<fakes::FakeChannel>(ChannelKind::kUnix, state),
                           WebSocketConfig{}, initial);
    REQUIRE(stream.read_buffer() == initial);

    WebSocketStream moved = std::move(stream);
    REQUIRE(moved.handle() == state->fd);
  }
  REQUIRE(state->close_calls == 1);
  REQUIRE(state->drops == 1);
}
