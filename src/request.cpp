#include "ewsc/request.hpp"

#include "ewsc/log.hpp"
#include "ewsc/utils.hpp"

namespace ewsc {

namespace {

expected<Request, Error> reject(const std::string& why) {
  EWSC_LOG_WARN("invalid request: " + why);
  return expected<Request, Error>::error(Error::make(ErrorCode::kRequestConstruction));
}

bool is_scheme_text(std::string_view s) {
  if (s.empty()) return false;
  char first = http::to_lower(s[0]);
  if (first < 'a' || first > 'z') return false;
  for (char c : s) {
    char l = http::to_lower(c);
    bool ok = (l >= 'a' && l <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

// reg-name characters (RFC 3986 unreserved, sub-delims, pct-encoded)
bool is_host_char(char c) {
  if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return true;
  switch (c) {
    case '-': case '.': case '_': case '~': case '%':
    case '!': case '$': case '&': case '\'': case '(': case ')':
    case '*': case '+': case ',': case ';': case '=':
      return true;
    default:
      return false;
  }
}

bool is_ipv6_char(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F') ||
         c == ':' || c == '.';
}

bool is_target_char(char c) {
  // No controls, no space, no fragment
  return static_cast<unsigned char>(c) > 0x20 && c != 0x7F && c != '#';
}

bool parse_port(std::string_view text, uint16_t& out) {
  if (text.empty() || text.size() > 5) return false;
  uint32_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0 || value > 65535) return false;
  out = static_cast<uint16_t>(value);
  return true;
}

bool is_valid_host(std::string_view host) {
  if (host.empty()) return false;
  bool ipv6 = host.find(':') != std::string_view::npos;
  for (char c : host) {
    if (ipv6 ? !is_ipv6_char(c) : !is_host_char(c)) return false;
  }
  return true;
}

bool is_valid_target(std::string_view target) {
  if (target.empty() || target[0] != '/') return false;
  for (char c : target) {
    if (!is_target_char(c)) return false;
  }
  return true;
}

}  // namespace

const char* to_string(Scheme scheme) noexcept {
  switch (scheme) {
    case Scheme::kWs:
      return "ws";
    case Scheme::kWss:
      return "wss";
    case Scheme::kUnknown:
      break;
  }
  return "unknown";
}

Scheme parse_scheme(std::string_view text) noexcept {
  if (http::iequals(text, "ws")) return Scheme::kWs;
  if (http::iequals(text, "wss")) return Scheme::kWss;
  return Scheme::kUnknown;
}

const Header* Request::find_header(std::string_view name) const {
  for (const auto& h : headers) {
    if (http::iequals(h.name, name)) return &h;
  }
  return nullptr;
}

std::string Request::authority() const {
  std::string out;
  if (is_ipv6_host()) {
    out.reserve(host.size() + 8);
    out += '[';
    out += host;
    out += ']';
  } else {
    out = host;
  }
  if (port.has_value()) {
    out += ':';
    out += std::to_string(port.value());
  }
  return out;
}

bool is_valid_header(const Header& header) {
  if (header.name.empty()) return false;
  for (char c : header.name) {
    if (!http::is_token_char(c)) return false;
  }
  for (char c : header.value) {
    if (c == '\r' || c == '\n' || c == '\0') return false;
  }
  return true;
}

expected<Request, Error> into_request(std::string_view url) {
  size_t sep = url.find("://");
  if (sep == std::string_view::npos) {
    return reject("missing scheme separator");
  }

  std::string_view scheme = url.substr(0, sep);
  if (!is_scheme_text(scheme)) {
    return reject("bad scheme");
  }
  if (url.find('#') != std::string_view::npos) {
    return reject("fragment not allowed");
  }

  Request req;
  req.scheme = parse_scheme(scheme);
  req.scheme_text.reserve(scheme.size());
  for (char c : scheme) req.scheme_text.push_back(http::to_lower(c));

  std::string_view rest = url.substr(sep + 3);
  size_t auth_end = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, auth_end);
  std::string_view target =
      auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

  if (authority.find('@') != std::string_view::npos) {
    return reject("user info not allowed");
  }

  std::string_view host;
  std::string_view port_text;
  bool has_port = false;

  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      return reject("unterminated IPv6 literal");
    }
    host = authority.substr(1, close - 1);
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') return reject("garbage after IPv6 literal");
      port_text = after.substr(1);
      has_port = true;
    }
    if (host.find(':') == std::string_view::npos) {
      return reject("bracketed host is not IPv6");
    }
  } else {
    size_t colon = authority.find(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
      has_port = true;
    }
    if (host.find(':') != std::string_view::npos) {
      return reject("bad host");
    }
  }

  if (!is_valid_host(host)) {
    return reject("missing or invalid host");
  }
  req.host = std::string(host);

  if (has_port) {
    uint16_t port = 0;
    if (!parse_port(port_text, port)) {
      return reject("invalid port '" + std::string(port_text) + "'");
    }
    req.port = port;
  }

  if (target.empty()) {
    req.target = "/";
  } else if (target.front() == '?') {
    req.target = "/" + std::string(target);
  } else {
    req.target = std::string(target);
  }
  if (!is_valid_target(req.target)) {
    return reject("invalid path");
  }

  return expected<Request, Error>::success(std::move(req));
}

expected<Request, Error> into_request(const Request& request) {
  Request req = request;

  if (req.scheme_text.empty()) {
    req.scheme_text = to_string(req.scheme);
  } else if (!is_scheme_text(req.scheme_text)) {
    return reject("bad scheme");
  } else if (parse_scheme(req.scheme_text) != req.scheme && req.scheme != Scheme::kUnknown) {
    return reject("scheme text does not match scheme");
  } else {
    req.scheme = parse_scheme(req.scheme_text);
    for (char& c : req.scheme_text) c = http::to_lower(c);
  }

  // Tolerate a bracketed IPv6 host in a hand-built request
  if (req.host.size() > 2 && req.host.front() == '[' && req.host.back() == ']') {
    req.host = req.host.substr(1, req.host.size() - 2);
  }
  if (!is_valid_host(req.host)) {
    return reject("missing or invalid host");
  }
  if (req.port.has_value() && req.port.value() == 0) {
    return reject("port 0");
  }
  if (req.target.empty()) {
    req.target = "/";
  }
  if (!is_valid_target(req.target)) {
    return reject("invalid path");
  }
  for (const auto& h : req.headers) {
    if (!is_valid_header(h)) {
      return reject("invalid header '" + h.name + "'");
    }
  }
  return expected<Request, Error>::success(std::move(req));
}

}  // namespace ewsc
