/*
 * h1load - HTTP/1.1 load generator
 *
 * Copyright (c) 2015 Tatsuhiro Tsujikawa
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */
#include <getopt.h>
#include <signal.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "h1load_server.h"
#include "h1load_log.h"
#include "util.h"

namespace h1load {

namespace {
struct ServerConfig {
  std::string host;
  size_t max_conns;
  uint16_t port;
  bool verbose;
  bool silent;

  ServerConfig()
      : host("127.0.0.1"), max_conns(0), port(8000), verbose(false),
        silent(false) {}
};
} // namespace

namespace {
void print_version(std::ostream &out) {
  out << "h1load-sv " H1LOAD_VERSION << std::endl;
}
} // namespace

namespace {
void print_usage(std::ostream &out) {
  out << R"(Usage: h1load-sv [OPTIONS]...
HTTP/1.1 server answering every request with 200 OK)" << std::endl;
}
} // namespace

namespace {
void print_help(std::ostream &out, const ServerConfig &config) {
  print_usage(out);

  out << R"(
Options:
  --host=<HOST>
              Address to listen on.
              Default: )" << config.host << R"(
  -p, --port=<PORT>
              Port to listen on.  If 0 is given, the port is chosen by
              the kernel.
              Default: )" << config.port << R"(
  --silent    Read requests, but never respond.  Useful for testing
              client timeouts.
  --max-conns=<N>
              Stop listening after accepting <N> connections.  Later
              connection attempts are refused.  0 means no limit.
              Default: )" << config.max_conns << R"(
  -v, --verbose
              Output debug information.
  --version   Display version information and exit.
  -h, --help  Display this help and exit.)" << std::endl;
}
} // namespace

int main(int argc, char **argv) {
  ServerConfig config;

  while (1) {
    static int flag = 0;
    static option long_options[] = {
        {"port", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, &flag, 1},
        {"host", required_argument, &flag, 2},
        {"silent", no_argument, &flag, 3},
        {"max-conns", required_argument, &flag, 4},
        {nullptr, 0, nullptr, 0}};
    int option_index = 0;
    auto c = getopt_long(argc, argv, "p:vh", long_options, &option_index);
    if (c == -1) {
      break;
    }
    switch (c) {
    case 'p': {
      auto n = util::parse_uint(optarg);
      if (n == -1 || n > 65535) {
        std::cerr << "-p: bad port: " << optarg << std::endl;
        exit(EXIT_FAILURE);
      }
      config.port = n;
      break;
    }
    case 'v':
      config.verbose = true;
      break;
    case 'h':
      print_help(std::cout, config);
      exit(EXIT_SUCCESS);
    case '?':
      util::show_candidates(argv[optind - 1], long_options);
      exit(EXIT_FAILURE);
    case 0:
      switch (flag) {
      case 1:
        // version option
        print_version(std::cout);
        exit(EXIT_SUCCESS);
      case 2:
        // host option
        config.host = optarg;
        break;
      case 3:
        // silent option
        config.silent = true;
        break;
      case 4: {
        // max-conns option
        auto n = util::parse_uint(optarg);
        if (n == -1) {
          std::cerr << "--max-conns: bad value: " << optarg << std::endl;
          exit(EXIT_FAILURE);
        }
        config.max_conns = n;
        break;
      }
      }
      break;
    default:
      break;
    }
  }

  if (optind < argc) {
    std::cerr << "too many arguments" << std::endl;
    exit(EXIT_FAILURE);
  }

  if (config.verbose) {
    Log::set_severity_level(INFO);
  }

  struct sigaction act {};
  act.sa_handler = SIG_IGN;
  sigaction(SIGPIPE, &act, nullptr);

  TargetServer server;
  server.set_verbose(config.verbose);
  server.set_respond(!config.silent);
  server.set_max_connections(config.max_conns);

  if (server.listen(config.host, config.port) != 0) {
    exit(EXIT_FAILURE);
  }

  std::cout << "listening on http://" << config.host << ":"
            << server.get_port() << std::endl;

  server.run();

  return 0;
}

} // namespace h1load

int main(int argc, char **argv) { return h1load::main(argc, argv); }
