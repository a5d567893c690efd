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
#ifndef H1LOAD_SERVER_H
#define H1LOAD_SERVER_H

#include <cstddef>
#include <cstdint>
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>

#include <ev.h>

namespace h1load {

class TargetServer;

// One accepted connection.  Reads request header, writes the fixed
// response and closes.
struct ServerConnection {
  ev_io rev;
  ev_io wev;
  ev_timer rt;
  TargetServer *server;
  // request header received so far
  std::string head;
  size_t woffset;
  int fd;
  bool responding;

  ServerConnection(TargetServer *server, int fd);
  ~ServerConnection();
  ServerConnection(const ServerConnection &) = delete;
  ServerConnection &operator=(const ServerConnection &) = delete;

  int on_read();
  int on_write();
  // Starts writing response.
  int respond();
};

// Minimal HTTP/1.1 server answering every request with 200 and body
// "OK", then closing the connection.  It is the reference target of
// h1load, and used by the tests.
class TargetServer {
public:
  TargetServer();
  ~TargetServer();
  TargetServer(const TargetServer &) = delete;
  TargetServer &operator=(const TargetServer &) = delete;

  // Binds |host|:|port| and listens.  If |port| is 0, the port is
  // chosen by the kernel.  Returns 0 if it succeeds, or -1.
  int listen(const std::string &host, uint16_t port);
  // Returns the bound port.  Only valid after listen() succeeded.
  uint16_t get_port() const;
  // If |f| is false, the server reads requests but never responds.
  // The connection is closed when the peer closes it.
  void set_respond(bool f);
  bool get_respond() const;
  // After |n| connections were accepted, the listening socket is
  // closed, and further connection attempts are refused.  0 means no
  // limit.
  void set_max_connections(size_t n);
  void set_verbose(bool f);
  // Runs the event loop until stop() is called.
  void run();
  // Makes run() return.  This function can be called from any
  // thread.
  void stop();
  // The number of connections accepted so far.  This function can be
  // called from any thread.
  size_t get_num_accepted() const;

  void accept_connection();
  // Closes the listening socket.  Accepted connections are served.
  void stop_accepting();
  void remove_connection(ServerConnection *conn);
  struct ev_loop *get_loop() const;

private:
  std::unordered_map<ServerConnection *, std::unique_ptr<ServerConnection>>
      conns_;
  ev_io acceptev_;
  ev_async stopev_;
  std::atomic<size_t> num_accepted_;
  size_t max_conns_;
  struct ev_loop *loop_;
  int fd_;
  uint16_t port_;
  bool respond_;
  bool verbose_;
};

} // namespace h1load

#endif // H1LOAD_SERVER_H
