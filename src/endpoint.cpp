#include "ewsc/endpoint.hpp"

#include "ewsc/log.hpp"

namespace ewsc {

std::string Endpoint::to_string() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

optional<uint16_t> default_port(Scheme scheme) noexcept {
  switch (scheme) {
    case Scheme::kWss:
      return optional<uint16_t>(kDefaultWssPort);
    case Scheme::kWs:
      return optional<uint16_t>(kDefaultWsPort);
    case Scheme::kUnknown:
      break;
  }
  return optional<uint16_t>();
}

expected<Endpoint, Error> resolve_endpoint(const Request& request) {
  Endpoint ep;
  ep.host = request.host;

  if (request.port.has_value()) {
    ep.port = request.port.value();
    return expected<Endpoint, Error>::success(std::move(ep));
  }

  auto port = default_port(request.scheme);
  if (!port.has_value()) {
    EWSC_LOG_WARN("unsupported URL scheme '" + request.scheme_text + "' without explicit port");
    return expected<Endpoint, Error>::error(Error::make(ErrorCode::kUnsupportedScheme));
  }
  ep.port = port.value();
  return expected<Endpoint, Error>::success(std::move(ep));
}

}  // namespace ewsc
