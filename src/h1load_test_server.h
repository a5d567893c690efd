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
#ifndef H1LOAD_TEST_SERVER_H
#define H1LOAD_TEST_SERVER_H

#include <string>
#include <thread>

#include "h1load_server.h"
#include "util.h"

namespace h1load {

// Runs TargetServer on an ephemeral loopback port in a background
// thread.  The server is stopped and joined on destruction.
class TestServer {
public:
  explicit TestServer(bool respond = true, size_t max_conns = 0) {
    server_.set_respond(respond);
    server_.set_max_connections(max_conns);
  }
  ~TestServer() {
    if (thread_.joinable()) {
      server_.stop();
      thread_.join();
    }
  }
  TestServer(const TestServer &) = delete;
  TestServer &operator=(const TestServer &) = delete;

  // Returns 0 if it succeeds, or -1.
  int start() {
    if (server_.listen("127.0.0.1", 0) != 0) {
      return -1;
    }
    thread_ = std::thread([this]() { server_.run(); });
    return 0;
  }

  std::string get_uri(const std::string &path = "/") const {
    return "http://127.0.0.1:" + util::utos(server_.get_port()) + path;
  }

  size_t get_num_accepted() const { return server_.get_num_accepted(); }

private:
  TargetServer server_;
  std::thread thread_;
};

// Returns URI of a loopback port nobody listens on.
inline std::string get_refused_uri() {
  uint16_t port;
  {
    TargetServer server;
    if (server.listen("127.0.0.1", 0) != 0) {
      return "http://127.0.0.1:1/";
    }
    port = server.get_port();
  }
  return "http://127.0.0.1:" + util::utos(port) + "/";
}

} // namespace h1load

#endif // H1LOAD_TEST_SERVER_H
