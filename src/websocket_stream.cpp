#include "ewsc/websocket_stream.hpp"

#include "ewsc/log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>

namespace ewsc {

WebSocketStream::WebSocketStream(std::unique_ptr<Channel> channel, const WebSocketConfig& config,
                                 std::vector<uint8_t> read_buffer)
    : channel_(std::move(channel)),
      config_(config),
      read_buffer_(std::move(read_buffer)),
      mask_rng_(std::random_device{}()) {}

WebSocketStream::~WebSocketStream() {
  if (channel_) {
    channel_->close();
  }
}

expected<void, Error> WebSocketStream::send_text(std::string_view text) {
  return send_frame(ws::OpCode::kText, reinterpret_cast<const uint8_t*>(text.data()),
                    text.size());
}

expected<void, Error> WebSocketStream::send_binary(const uint8_t* data, size_t len) {
  return send_frame(ws::OpCode::kBinary, data, len);
}

expected<void, Error> WebSocketStream::ping(std::string_view payload) {
  return send_frame(ws::OpCode::kPing, reinterpret_cast<const uint8_t*>(payload.data()),
                    payload.size());
}

expected<void, Error> WebSocketStream::close(uint16_t code, std::string_view reason) {
  std::vector<uint8_t> payload;
  payload.reserve(2 + reason.size());
  payload.push_back(static_cast<uint8_t>((code >> 8) & 0xFF));
  payload.push_back(static_cast<uint8_t>(code & 0xFF));
  payload.insert(payload.end(), reason.begin(), reason.end());

  auto result = send_frame(ws::OpCode::kClose, payload.data(), payload.size());
  if (result) {
    close_sent_ = true;
  }
  return result;
}

expected<void, Error> WebSocketStream::send_frame(ws::OpCode opcode, const uint8_t* payload,
                                                  size_t len) {
  if (!channel_ || close_sent_) {
    return expected<void, Error>::error(Error::make(ErrorCode::kInvalidState));
  }
  // Control frames carry at most 125 bytes (RFC 6455 section 5.5)
  bool control = (static_cast<uint8_t>(opcode) & 0x08) != 0;
  if (control && len > 125) {
    return expected<void, Error>::error(Error::make(ErrorCode::kInvalidState));
  }
  if (config_.max_frame_size.has_value() && len > config_.max_frame_size.value()) {
    EWSC_LOG_WARN("frame of " + std::to_string(len) + " bytes exceeds max_frame_size");
    return expected<void, Error>::error(Error::make(ErrorCode::kInvalidState));
  }

  uint8_t mask[4];
  uint32_t r = mask_rng_();
  for (int i = 0; i < 4; ++i) {
    mask[i] = static_cast<uint8_t>(r >> (8 * i));
  }

  std::vector<uint8_t> frame(14 + len);
  size_t header_len = ws::encode_frame_header(frame.data(), opcode, len, mask);
  if (len > 0) {
    std::memcpy(frame.data() + header_len, payload, len);
    ws::mask_payload(frame.data() + header_len, len, mask);
  }
  frame.resize(header_len + len);
  return write_all(frame.data(), frame.size());
}

expected<void, Error> WebSocketStream::write_all(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    auto result = channel_->write(data + sent, len - sent);
    if (!result) {
      return expected<void, Error>::error(result.get_error());
    }
    const IoResult& io = result.value();
    if (io.status == IoStatus::kOk) {
      sent += io.bytes;
      continue;
    }
    if (io.status == IoStatus::kClosed) {
      return expected<void, Error>::error(Error::make(ErrorCode::kTransport, EPIPE));
    }

    pollfd pfd{channel_->handle(), poll_events(io.status), 0};
    if (::poll(&pfd, 1, -1) < 0) {
      int err = errno;
      if (err != EINTR) {
        return expected<void, Error>::error(Error::make(ErrorCode::kTransport, err));
      }
    }
  }
  return expected<void, Error>::success();
}

}  // namespace ewsc
