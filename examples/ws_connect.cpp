// ============================================================================
// ws_connect: open one WebSocket connection and print the server's answer
//
// Usage: ./ws_connect <url> [--unix PATH] [--nodelay] [--insecure] [--ca FILE]
//                            [--header NAME:VALUE] [--send TEXT] [--debug]
// ============================================================================

#include "ewsc.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

struct Args {
  std::string url;
  std::string unix_path;
  std::string ca_path;
  std::string send_text;
  ewsc::Request extra;  // Headers only
  bool nodelay = false;
  bool insecure = false;
  bool debug = false;
};

void usage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " <url> [--unix PATH] [--nodelay] [--insecure] [--ca FILE]"
               " [--header NAME:VALUE] [--send TEXT] [--debug]"
            << std::endl;
}

Args parse_args(int argc, char* argv[]) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) {
        EWSC_THROW(std::invalid_argument(std::string(flag) + " needs a value"));
      }
      return argv[++i];
    };

    if (arg == "--unix") {
      args.unix_path = next("--unix");
    } else if (arg == "--ca") {
      args.ca_path = next("--ca");
    } else if (arg == "--send") {
      args.send_text = next("--send");
    } else if (arg == "--header") {
      std::string h = next("--header");
      size_t colon = h.find(':');
      if (colon == std::string::npos) {
        EWSC_THROW(std::invalid_argument("header must be NAME:VALUE"));
      }
      args.extra.add_header(h.substr(0, colon), std::string(ewsc::http::trim(h.substr(colon + 1))));
    } else if (arg == "--nodelay") {
      args.nodelay = true;
    } else if (arg == "--insecure") {
      args.insecure = true;
    } else if (arg == "--debug") {
      args.debug = true;
    } else if (!arg.empty() && arg[0] == '-') {
      EWSC_THROW(std::invalid_argument("unknown option " + arg));
    } else if (args.url.empty()) {
      args.url = arg;
    } else {
      EWSC_THROW(std::invalid_argument("unexpected argument " + arg));
    }
  }
  if (args.url.empty()) {
    EWSC_THROW(std::invalid_argument("missing url"));
  }
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    Args args = parse_args(argc, argv);
    ewsc::Logger::set_level(args.debug ? ewsc::Logger::Level::kDebug
                                       : ewsc::Logger::Level::kWarn);

    auto parsed = ewsc::into_request(args.url);
    if (!parsed) {
      std::cerr << "Error: " << ewsc::to_string(parsed.get_error()) << std::endl;
      return 1;
    }
    ewsc::Request request = std::move(parsed).value();
    for (const auto& h : args.extra.headers) {
      request.add_header(h.name, h.value);
    }

    ewsc::ConnectOptions options;
    options.channel.tcp_nodelay = args.nodelay;
    options.unix_path = args.unix_path;
    if (args.insecure || !args.ca_path.empty()) {
      ewsc::TlsConfig tls;
      tls.ca_path = args.ca_path;
      tls.verify_peer = !args.insecure;
      options.connector = ewsc::Connector::tls(tls);
    }

    auto result = ewsc::connect_blocking(request, std::move(options));
    if (!result) {
      std::cerr << "Error: " << ewsc::to_string(result.get_error()) << std::endl;
      return 1;
    }

    ewsc::ConnectResult& conn = result.value();
    std::cout << "HTTP/1.1 " << conn.response.status << " " << conn.response.reason
              << std::endl;
    for (const auto& h : conn.response.headers) {
      std::cout << h.name << ": " << h.value << std::endl;
    }
    std::cout << "secure: " << (conn.stream.is_secure() ? "yes" : "no")
              << ", buffered bytes: " << conn.stream.read_buffer().size() << std::endl;

    if (!args.send_text.empty()) {
      auto sent = conn.stream.send_text(args.send_text);
      if (!sent) {
        std::cerr << "Error: " << ewsc::to_string(sent.get_error()) << std::endl;
        return 1;
      }
    }

    auto closed = conn.stream.close(1000);
    if (!closed) {
      std::cerr << "Error: " << ewsc::to_string(closed.get_error()) << std::endl;
      return 1;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    usage(argv[0]);
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
