#include "ewsc/vocabulary.hpp"

#include <cstdio>
#include <cstring>

namespace ewsc {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kRequestConstruction:
      return "request construction error";
    case ErrorCode::kUnsupportedScheme:
      return "unsupported URL scheme";
    case ErrorCode::kTransport:
      return "transport error";
    case ErrorCode::kSecureChannel:
      return "secure channel error";
    case ErrorCode::kHandshake:
      return "handshake error";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown error";
}

std::string to_string(const Error& err) {
  std::string msg = to_string(err.code);
  if (err.os_error != 0) {
    msg += ": ";
    msg += std::strerror(err.os_error);
  }
  if (err.detail != 0) {
    switch (err.code) {
      case ErrorCode::kHandshake:
        msg += " (HTTP status " + std::to_string(err.detail) + ")";
        break;
      case ErrorCode::kSecureChannel: {
        char buf[32];
        int v = err.detail < 0 ? -err.detail : err.detail;
        std::snprintf(buf, sizeof(buf), " (mbedtls -0x%04X)", v);
        msg += buf;
        break;
      }
      default:
        msg += " (code " + std::to_string(err.detail) + ")";
        break;
    }
  }
  return msg;
}

}  // namespace ewsc
