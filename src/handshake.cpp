#include "ewsc/handshake.hpp"

#include "ewsc/log.hpp"
#include "ewsc/utils.hpp"

#include <array>
#include <random>

namespace ewsc {

namespace {

constexpr size_t kReadChunk = 4096;

expected<size_t, Error> malformed(const char* why) {
  EWSC_LOG_WARN(std::string("malformed handshake response: ") + why);
  return expected<size_t, Error>::error(Error::make(ErrorCode::kHandshake));
}

expected<void, Error> rejected(const std::string& why, int status = 0) {
  EWSC_LOG_WARN("handshake rejected: " + why);
  return expected<void, Error>::error(Error::make(ErrorCode::kHandshake, 0, status));
}

// Append "name: value\r\n" unless the caller supplies the same header
void append_generated(std::string& out, const Request& request, std::string_view name,
                      std::string_view value) {
  if (request.find_header(name) != nullptr) return;
  out.append(name);
  out.append(": ");
  out.append(value);
  out.append("\r\n");
}

}  // namespace

const std::string* HandshakeResponse::header(std::string_view name) const {
  for (const auto& h : headers) {
    if (http::iequals(h.name, name)) return &h.value;
  }
  return nullptr;
}

std::string build_request(const Request& request, std::string_view key) {
  std::string out;
  out.reserve(256);
  out.append("GET ");
  out.append(request.target);
  out.append(" HTTP/1.1\r\n");

  append_generated(out, request, "Host", request.authority());
  append_generated(out, request, "Connection", "Upgrade");
  append_generated(out, request, "Upgrade", "websocket");
  append_generated(out, request, "Sec-WebSocket-Version", "13");
  append_generated(out, request, "Sec-WebSocket-Key", key);

  for (const auto& h : request.headers) {
    out.append(h.name);
    out.append(": ");
    out.append(h.value);
    out.append("\r\n");
  }
  out.append("\r\n");
  return out;
}

// ============================================================================
// ClientHandshake
// ============================================================================

ClientHandshake::ClientHandshake(const Request& request, size_t max_response_size)
    : ClientHandshake(request, max_response_size, generate_key()) {}

ClientHandshake::ClientHandshake(const Request& request, size_t max_response_size,
                                 std::string key)
    : key_(std::move(key)), max_response_size_(max_response_size) {
  // A caller-supplied key is what the server will hash
  if (const Header* h = request.find_header("Sec-WebSocket-Key")) {
    key_ = h->value;
  }
  request_text_ = build_request(request, key_);
}

std::string ClientHandshake::generate_key() {
  std::random_device rd;
  std::array<uint8_t, 16> nonce;
  for (size_t i = 0; i < nonce.size(); i += 4) {
    uint32_t r = rd();
    nonce[i] = static_cast<uint8_t>(r);
    nonce[i + 1] = static_cast<uint8_t>(r >> 8);
    nonce[i + 2] = static_cast<uint8_t>(r >> 16);
    nonce[i + 3] = static_cast<uint8_t>(r >> 24);
  }
  return Base64::encode(nonce.data(), nonce.size());
}

expected<IoStatus, Error> ClientHandshake::fail(int status) {
  return expected<IoStatus, Error>::error(Error::make(ErrorCode::kHandshake, 0, status));
}

expected<IoStatus, Error> ClientHandshake::advance(Channel& channel) {
  if (complete_) {
    return expected<IoStatus, Error>::success(IoStatus::kOk);
  }

  // Phase 1: send the request
  while (sent_ < request_text_.size()) {
    auto result = channel.write(reinterpret_cast<const uint8_t*>(request_text_.data()) + sent_,
                                request_text_.size() - sent_);
    if (!result) {
      return expected<IoStatus, Error>::error(result.get_error());
    }
    const IoResult& io = result.value();
    if (io.status == IoStatus::kClosed) {
      EWSC_LOG_WARN("peer closed while sending handshake request");
      return fail(0);
    }
    if (io.status != IoStatus::kOk) {
      return expected<IoStatus, Error>::success(io.status);
    }
    sent_ += io.bytes;
    if (sent_ == request_text_.size()) {
      EWSC_LOG_DEBUG("handshake request sent (" + std::to_string(sent_) + " bytes)");
    }
  }

  // Phase 2: read until the response head is complete
  uint8_t buf[kReadChunk];
  while (true) {
    auto result = channel.read(buf, sizeof(buf));
    if (!result) {
      return expected<IoStatus, Error>::error(result.get_error());
    }
    const IoResult& io = result.value();
    if (io.status == IoStatus::kClosed) {
      EWSC_LOG_WARN("peer closed before handshake response completed");
      return fail(0);
    }
    if (io.status != IoStatus::kOk) {
      return expected<IoStatus, Error>::success(io.status);
    }
    received_.append(reinterpret_cast<const char*>(buf), io.bytes);

    auto parsed = parse_response(received_, response_);
    if (!parsed) {
      return expected<IoStatus, Error>::error(parsed.get_error());
    }
    size_t head_size = parsed.value();
    if (head_size == 0) {
      if (received_.size() > max_response_size_) {
        EWSC_LOG_WARN("handshake response exceeds " + std::to_string(max_response_size_) +
                      " bytes");
        return fail(0);
      }
      continue;
    }
    if (head_size > max_response_size_) {
      EWSC_LOG_WARN("handshake response exceeds " + std::to_string(max_response_size_) +
                    " bytes");
      return fail(response_.status);
    }

    auto valid = validate_response(response_, key_);
    if (!valid) {
      return expected<IoStatus, Error>::error(valid.get_error());
    }

    leftover_.assign(received_.begin() + static_cast<std::ptrdiff_t>(head_size), received_.end());
    received_.clear();
    complete_ = true;
    EWSC_LOG_DEBUG("handshake complete, " + std::to_string(leftover_.size()) +
                   " bytes buffered");
    return expected<IoStatus, Error>::success(IoStatus::kOk);
  }
}

expected<size_t, Error> ClientHandshake::parse_response(std::string_view data,
                                                        HandshakeResponse& out) {
  size_t end_pos = data.find("\r\n\r\n");
  if (end_pos == std::string_view::npos) {
    return expected<size_t, Error>::success(0);
  }
  std::string_view head = data.substr(0, end_pos);

  // Status line: HTTP/1.1 SP 3DIGIT [SP reason]
  size_t line_end = head.find("\r\n");
  std::string_view status_line = head.substr(0, line_end);
  constexpr std::string_view kVersion = "HTTP/1.1 ";
  if (status_line.substr(0, kVersion.size()) != kVersion) {
    return malformed("expected HTTP/1.1 status line");
  }
  std::string_view code = status_line.substr(kVersion.size(), 3);
  if (code.size() != 3) {
    return malformed("short status code");
  }
  int status = 0;
  for (char c : code) {
    if (c < '0' || c > '9') return malformed("non-numeric status code");
    status = status * 10 + (c - '0');
  }
  std::string_view reason = status_line.substr(kVersion.size() + 3);
  if (!reason.empty()) {
    if (reason.front() != ' ') return malformed("bad status line");
    reason.remove_prefix(1);
  }

  HandshakeResponse response;
  response.status = status;
  response.reason = std::string(reason);

  std::string_view rest =
      line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 2);
  while (!rest.empty()) {
    size_t eol = rest.find("\r\n");
    std::string_view line = rest.substr(0, eol);
    rest = eol == std::string_view::npos ? std::string_view{} : rest.substr(eol + 2);

    if (line.empty() || line.front() == ' ' || line.front() == '\t') {
      return malformed("obsolete line folding");
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return malformed("header without name");
    }
    std::string_view name = line.substr(0, colon);
    for (char c : name) {
      if (!http::is_token_char(c)) return malformed("invalid header name");
    }
    response.headers.push_back(
        Header{std::string(name), std::string(http::trim(line.substr(colon + 1)))});
  }

  out = std::move(response);
  return expected<size_t, Error>::success(end_pos + 4);
}

expected<void, Error> ClientHandshake::validate_response(const HandshakeResponse& response,
                                                         std::string_view key) {
  if (response.status != 101) {
    return rejected("status " + std::to_string(response.status) + " " + response.reason,
                    response.status);
  }

  const std::string* upgrade = response.header("Upgrade");
  if (upgrade == nullptr || !http::iequals(*upgrade, "websocket")) {
    return rejected("missing 'Upgrade: websocket'", response.status);
  }

  const std::string* connection = response.header("Connection");
  if (connection == nullptr || !http::contains_token(*connection, "upgrade")) {
    return rejected("missing 'Connection: Upgrade'", response.status);
  }

  const std::string* accept = response.header("Sec-WebSocket-Accept");
  if (accept == nullptr) {
    return rejected("missing Sec-WebSocket-Accept", response.status);
  }
  if (*accept != ws::accept_key(key)) {
    return rejected("Sec-WebSocket-Accept mismatch", response.status);
  }
  return expected<void, Error>::success();
}

}  // namespace ewsc
