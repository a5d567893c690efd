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
#ifndef H1LOAD_CLIENT_H
#define H1LOAD_CLIENT_H

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include <cstdint>
#include <chrono>
#include <functional>

#include <ev.h>

namespace h1load {

struct Worker;

enum ClientState { CLIENT_IDLE, CLIENT_CONNECTING, CLIENT_CONNECTED };

enum RequestFailure {
  // no failure
  FAILURE_NONE,
  // could not establish connection to any address
  FAILURE_CONNECT,
  // connect, write or read did not complete in time
  FAILURE_TIMEOUT,
  // write or read error, or connection closed before the request was
  // written
  FAILURE_IO,
};

struct RequestOutcome {
  // latency from the connection attempt to the end of response.
  // Only meaningful if failure == FAILURE_NONE.
  std::chrono::nanoseconds latency;
  RequestFailure failure;

  bool success() const { return failure == FAILURE_NONE; }
};

// Client issues exactly one request over a fresh connection, and
// reads until the peer closes the connection.  When it finishes,
// Worker::on_request_done() is called, which destroys the Client.
struct Client {
  ev_io wev;
  ev_io rev;
  ev_timer request_timeout_watcher;
  std::function<int(Client &)> readfn, writefn;
  Worker *worker;
  const addrinfo *next_addr;
  // time point when connection establishment starts
  std::chrono::steady_clock::time_point request_time;
  // The number of bytes of the request written so far
  size_t woffset;
  // The number of bytes received
  int64_t bytes_read;
  int fd;
  ClientState state;

  enum { ERR_CONNECT_FAIL = -100, ERR_EOF = -101 };

  Client(Worker *worker);
  ~Client();
  // Starts request.  Returns 0 if connection establishment started,
  // or -1.
  int start();
  int connect();
  void disconnect();
  // These three functions hand the outcome over to the Worker which
  // deletes this object.  Don't touch the object after calling them.
  void fail();
  void timeout();
  void on_eof();
  void restart_timeout();

  int do_read();
  int do_write();

  // low-level I/O callback functions called by do_read/do_write
  int connected();
  int read_clear();
  int write_clear();
};

} // namespace h1load

#endif // H1LOAD_CLIENT_H
