#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ewsc {

// ============================================================================
// Base64 encoding (RFC 4648, padded; only encoding is needed by a client)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= size; i += 3) {
      append_group(out, (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2], 4);
    }

    size_t rest = size - i;
    if (rest == 1) {
      append_group(out, uint32_t{data[i]} << 16, 2);
      out.append("==");
    } else if (rest == 2) {
      append_group(out, (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8), 3);
      out.push_back('=');
    }
    return out;
  }

 private:
  // Emit the top `chars` sextets of a 24-bit group
  static void append_group(std::string& out, uint32_t group, int chars) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (int n = 0; n < chars; ++n) {
      out.push_back(kAlphabet[(group >> (18 - 6 * n)) & 0x3F]);
    }
  }
};

// ============================================================================
// SHA-1 (FIPS 180-4), only used for Sec-WebSocket-Accept
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  void update(const uint8_t* data, size_t size) {
    total_len_ += size;
    while (size > 0) {
      size_t take = std::min(size, block_.size() - used_);
      std::copy(data, data + take, block_.begin() + static_cast<std::ptrdiff_t>(used_));
      used_ += take;
      data += take;
      size -= take;
      if (used_ == block_.size()) {
        compress();
        used_ = 0;
      }
    }
  }

  Digest finalize() {
    const uint64_t bit_len = total_len_ * 8;

    block_[used_++] = 0x80;
    if (used_ > 56) {
      std::fill(block_.begin() + static_cast<std::ptrdiff_t>(used_), block_.end(), 0);
      compress();
      used_ = 0;
    }
    std::fill(block_.begin() + static_cast<std::ptrdiff_t>(used_), block_.begin() + 56, 0);
    for (int i = 0; i < 8; ++i) {
      block_[63 - i] = static_cast<uint8_t>(bit_len >> (8 * i));
    }
    compress();
    used_ = 0;

    Digest digest{};
    for (size_t i = 0; i < digest.size(); ++i) {
      digest[i] = static_cast<uint8_t>(state_[i / 4] >> (24 - 8 * (i % 4)));
    }
    return digest;
  }

 private:
  std::array<uint32_t, 5> state_{{0x67452301u, 0xEFCDAB89u, 0x98BADCFEu, 0x10325476u,
                                  0xC3D2E1F0u}};
  std::array<uint8_t, 64> block_{};
  size_t used_ = 0;
  uint64_t total_len_ = 0;

  static uint32_t rotl(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void compress() {
    uint32_t w[80];
    for (int t = 0; t < 16; ++t) {
      const uint8_t* p = &block_[static_cast<size_t>(t) * 4];
      w[t] = (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) | (uint32_t{p[2]} << 8) | p[3];
    }
    for (int t = 16; t < 80; ++t) {
      w[t] = rotl(w[t - 3] ^ w[t - 8] ^ w[t - 14] ^ w[t - 16], 1);
    }

    uint32_t v[5] = {state_[0], state_[1], state_[2], state_[3], state_[4]};
    for (int t = 0; t < 80; ++t) {
      uint32_t f;
      uint32_t k;
      switch (t / 20) {
        case 0:
          f = (v[1] & v[2]) | (~v[1] & v[3]);
          k = 0x5A827999u;
          break;
        case 1:
          f = v[1] ^ v[2] ^ v[3];
          k = 0x6ED9EBA1u;
          break;
        case 2:
          f = (v[1] & v[2]) | (v[1] & v[3]) | (v[2] & v[3]);
          k = 0x8F1BBCDCu;
          break;
        default:
          f = v[1] ^ v[2] ^ v[3];
          k = 0xCA62C1D6u;
          break;
      }
      uint32_t next = rotl(v[0], 5) + f + v[4] + k + w[t];
      v[4] = v[3];
      v[3] = v[2];
      v[2] = rotl(v[1], 30);
      v[1] = v[0];
      v[0] = next;
    }

    for (int i = 0; i < 5; ++i) {
      state_[static_cast<size_t>(i)] += v[i];
    }
  }
};

// ============================================================================
// HTTP text helpers (ASCII only)
// ============================================================================

namespace http {

inline char to_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (to_lower(a[i]) != to_lower(b[i])) return false;
  }
  return true;
}

inline std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// True if the comma separated list contains token (case-insensitive),
// e.g. "keep-alive, Upgrade" contains "upgrade".
inline bool contains_token(std::string_view list, std::string_view token) {
  while (!list.empty()) {
    size_t comma = list.find(',');
    std::string_view item = trim(list.substr(0, comma));
    if (iequals(item, token)) return true;
    if (comma == std::string_view::npos) break;
    list.remove_prefix(comma + 1);
  }
  return false;
}

// RFC 7230 tchar
inline bool is_token_char(char c) {
  if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return true;
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
      return true;
    default:
      return false;
  }
}

}  // namespace http

// ============================================================================
// WebSocket utilities
// ============================================================================

namespace ws {

// GUID appended to Sec-WebSocket-Key (RFC 6455 section 1.3)
constexpr std::string_view kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Frame types
enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

// Expected Sec-WebSocket-Accept value for a client key
inline std::string accept_key(std::string_view client_key) {
  std::string key(client_key);
  key.append(kAcceptGuid);
  auto hash = SHA1::compute(reinterpret_cast<const uint8_t*>(key.data()), key.size());
  return Base64::encode(hash.data(), hash.size());
}

// Encode a frame header into buf (at least 14 bytes).
// Client frames always carry a mask key. Returns header length.
inline size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len,
                                  const uint8_t* mask_key) {
  size_t pos = 0;
  const uint8_t mask_bit = mask_key ? 0x80 : 0x00;
  buf[pos++] = 0x80 | static_cast<uint8_t>(opcode);
  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 126);
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 127);
    for (int i = 7; i >= 0; --i)
      buf[pos++] = static_cast<uint8_t>((payload_len >> (i * 8)) & 0xFF);
  }
  if (mask_key) {
    for (int i = 0; i < 4; ++i) buf[pos++] = mask_key[i];
  }
  return pos;
}

inline void mask_payload(uint8_t* payload, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) {
    payload[i] ^= mask_key[i % 4];
  }
}

}  // namespace ws

}  // namespace ewsc
