#include <catch2/catch_test_macros.hpp>
#include "ewsc/utils.hpp"

#include <string>

using namespace ewsc;

namespace {

std::string hex(const std::array<uint8_t, 20>& hash) {
  std::string out;
  for (auto byte : hash) {
    out += "0123456789abcdef"[byte >> 4];
    out += "0123456789abcdef"[byte & 0x0f];
  }
  return out;
}

std::string sha1_hex(const std::string& input) {
  return hex(SHA1::compute(reinterpret_cast<const uint8_t*>(input.data()), input.size()));
}

}  // namespace

// ============================================================================
// Base64 (RFC 4648 test vectors)
// ============================================================================

TEST_CASE("Base64 encode empty", "[utils]") {
  REQUIRE(Base64::encode(nullptr, 0).empty());
}

TEST_CASE("Base64 encode RFC 4648 vectors", "[utils]") {
  const uint8_t data[] = {'f', 'o', 'o', 'b', 'a', 'r'};
  REQUIRE(Base64::encode(data, 1) == "Zg==");
  REQUIRE(Base64::encode(data, 2) == "Zm8=");
  REQUIRE(Base64::encode(data, 3) == "Zm9v");
  REQUIRE(Base64::encode(data, 4) == "Zm9vYg==");
  REQUIRE(Base64::encode(data, 5) == "Zm9vYmE=");
  REQUIRE(Base64::encode(data, 6) == "Zm9vYmFy");
}

TEST_CASE("Base64 encode 16-byte nonce", "[utils]") {
  // RFC 6455 section 4.1 sample nonce
  const std::string nonce = "the sample nonce";
  REQUIRE(Base64::encode(reinterpret_cast<const uint8_t*>(nonce.data()), nonce.size()) ==
          "dGhlIHNhbXBsZSBub25jZQ==");
}

// ============================================================================
// SHA-1
// ============================================================================

TEST_CASE("SHA1 empty string", "[utils]") {
  REQUIRE(sha1_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("SHA1 quick brown fox", "[utils]") {
  REQUIRE(sha1_hex("The quick brown fox jumps over the lazy dog") ==
          "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 incremental update", "[utils]") {
  SHA1 sha1;
  std::string part1 = "The quick brown fox ";
  std::string part2 = "jumps over the lazy dog";
  sha1.update(reinterpret_cast<const uint8_t*>(part1.data()), part1.size());
  sha1.update(reinterpret_cast<const uint8_t*>(part2.data()), part2.size());
  REQUIRE(hex(sha1.finalize()) == "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 exactly 64 bytes (one block)", "[utils]") {
  REQUIRE(sha1_hex(std::string(64, 'a')) == "0098ba824b5c16427bd7a1122a5a442a25ec644d");
}

// ============================================================================
// HTTP helpers
// ============================================================================

TEST_CASE("http::iequals ignores ASCII case", "[utils]") {
  REQUIRE(http::iequals("WebSocket", "websocket"));
  REQUIRE(http::iequals("", ""));
  REQUIRE_FALSE(http::iequals("websocket", "websockets"));
}

TEST_CASE("http::trim strips spaces and tabs", "[utils]") {
  REQUIRE(http::trim("  Upgrade\t") == "Upgrade");
  REQUIRE(http::trim("   ").empty());
}

TEST_CASE("http::contains_token scans comma lists", "[utils]") {
  REQUIRE(http::contains_token("Upgrade", "upgrade"));
  REQUIRE(http::contains_token("keep-alive, Upgrade", "upgrade"));
  REQUIRE(http::contains_token("keep-alive,upgrade ", "upgrade"));
  REQUIRE_FALSE(http::contains_token("keep-alive", "upgrade"));
  REQUIRE_FALSE(http::contains_token("upgraded", "upgrade"));
}

TEST_CASE("http::is_token_char", "[utils]") {
  REQUIRE(http::is_token_char('a'));
  REQUIRE(http::is_token_char('-'));
  REQUIRE_FALSE(http::is_token_char(':'));
  REQUIRE_FALSE(http::is_token_char(' '));
}

// ============================================================================
// WebSocket helpers
// ============================================================================

TEST_CASE("ws::accept_key matches RFC 6455 sample", "[utils]") {
  REQUIRE(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("ws::encode_frame_header - masked short frame", "[utils]") {
  uint8_t buf[14];
  const uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
  size_t len = ws::encode_frame_header(buf, ws::OpCode::kText, 5, mask);
  REQUIRE(len == 6);
  REQUIRE(buf[0] == 0x81);
  REQUIRE(buf[1] == 0x85);
  REQUIRE(buf[2] == 0x37);
  REQUIRE(buf[5] == 0x3d);

  // RFC 6455 section 5.7 masked "Hello"
  uint8_t payload[] = {'H', 'e', 'l', 'l', 'o'};
  ws::mask_payload(payload, sizeof(payload), mask);
  const uint8_t expected[] = {0x7f, 0x9f, 0x4d, 0x51, 0x58};
  for (size_t i = 0; i < sizeof(payload); ++i) {
    REQUIRE(payload[i] == expected[i]);
  }
}

TEST_CASE("ws::encode_frame_header - extended lengths", "[utils]") {
  uint8_t buf[14];
  const uint8_t mask[4] = {1, 2, 3, 4};

  size_t len16 = ws::encode_frame_header(buf, ws::OpCode::kBinary, 300, mask);
  REQUIRE(len16 == 8);
  REQUIRE(buf[1] == (0x80 | 126));
  REQUIRE(buf[2] == 0x01);
  REQUIRE(buf[3] == 0x2C);

  size_t len64 = ws::encode_frame_header(buf, ws::OpCode::kBinary, 70000, mask);
  REQUIRE(len64 == 14);
  REQUIRE(buf[1] == (0x80 | 127));
  REQUIRE(buf[7] == 0x01);
  REQUIRE(buf[8] == 0x11);
  REQUIRE(buf[9] == 0x70);
}
