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
#include "h1load_client.h"

#include <unistd.h>

#include <cerrno>

#include "h1load_worker.h"
#include "h1load_target.h"
#include "h1load_log.h"
#include "util.h"
#include "template.h"

namespace h1load {

namespace {
void writecb(struct ev_loop *loop, ev_io *w, int revents) {
  auto client = static_cast<Client *>(w->data);
  auto rv = client->do_write();
  if (rv == Client::ERR_CONNECT_FAIL) {
    client->disconnect();
    // try next address
    rv = client->connect();
    if (rv != 0) {
      client->fail();
      return;
    }
    client->restart_timeout();
    return;
  }
  if (rv != 0) {
    client->fail();
  }
}
} // namespace

namespace {
void readcb(struct ev_loop *loop, ev_io *w, int revents) {
  auto client = static_cast<Client *>(w->data);
  auto rv = client->do_read();
  if (rv == Client::ERR_EOF) {
    client->on_eof();
    return;
  }
  if (rv != 0) {
    client->fail();
  }
}
} // namespace

namespace {
// Called when connect, write or read does not make progress within
// the configured timeout.
void request_timeout_cb(struct ev_loop *loop, ev_timer *w, int revents) {
  auto client = static_cast<Client *>(w->data);
  client->timeout();
}
} // namespace

Client::Client(Worker *worker)
    : worker(worker), next_addr(worker->addrs), woffset(0), bytes_read(0),
      fd(-1), state(CLIENT_IDLE) {
  ev_io_init(&wev, writecb, 0, EV_WRITE);
  ev_io_init(&rev, readcb, 0, EV_READ);

  wev.data = this;
  rev.data = this;

  ev_timer_init(&request_timeout_watcher, request_timeout_cb, 0.,
                worker->timeout);
  request_timeout_watcher.data = this;
}

Client::~Client() { disconnect(); }

int Client::do_read() { return readfn(*this); }
int Client::do_write() { return writefn(*this); }

int Client::start() {
  request_time = std::chrono::steady_clock::now();
  state = CLIENT_CONNECTING;

  restart_timeout();

  return connect();
}

int Client::connect() {
  while (next_addr) {
    auto addr = next_addr;
    next_addr = next_addr->ai_next;
    fd = util::create_nonblock_socket(addr->ai_family);
    if (fd == -1) {
      continue;
    }

    auto rv = ::connect(fd, addr->ai_addr, addr->ai_addrlen);
    if (rv != 0 && errno != EINPROGRESS) {
      close(fd);
      fd = -1;
      continue;
    }
    break;
  }

  if (fd == -1) {
    return -1;
  }

  writefn = &Client::connected;

  ev_io_set(&rev, fd, EV_READ);
  ev_io_set(&wev, fd, EV_WRITE);

  ev_io_start(worker->loop, &wev);

  return 0;
}

void Client::disconnect() {
  ev_timer_stop(worker->loop, &request_timeout_watcher);
  ev_io_stop(worker->loop, &wev);
  ev_io_stop(worker->loop, &rev);
  if (fd != -1) {
    close(fd);
    fd = -1;
  }
}

void Client::fail() {
  disconnect();

  RequestOutcome outcome{};
  outcome.failure = state == CLIENT_CONNECTED ? FAILURE_IO : FAILURE_CONNECT;

  worker->on_request_done(this, outcome);
}

void Client::timeout() {
  disconnect();

  RequestOutcome outcome{};
  outcome.failure = FAILURE_TIMEOUT;

  worker->on_request_done(this, outcome);
}

void Client::on_eof() {
  auto end = std::chrono::steady_clock::now();

  disconnect();

  RequestOutcome outcome{};

  if (woffset < worker->target->request.size()) {
    // the peer closed connection before it got the whole request.
    outcome.failure = FAILURE_IO;
  } else {
    outcome.failure = FAILURE_NONE;
    outcome.latency =
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - request_time);
  }

  worker->on_request_done(this, outcome);
}

void Client::restart_timeout() {
  ev_timer_again(worker->loop, &request_timeout_watcher);
}

int Client::connected() {
  if (!util::check_socket_connected(fd)) {
    return ERR_CONNECT_FAIL;
  }

  state = CLIENT_CONNECTED;

  restart_timeout();

  ev_io_start(worker->loop, &rev);
  ev_io_stop(worker->loop, &wev);

  readfn = &Client::read_clear;
  writefn = &Client::write_clear;

  return do_write();
}

int Client::read_clear() {
  uint8_t buf[8_k];

  for (;;) {
    ssize_t nread;
    while ((nread = read(fd, buf, sizeof(buf))) == -1 && errno == EINTR)
      ;
    if (nread == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return 0;
      }
      return -1;
    }

    if (nread == 0) {
      return ERR_EOF;
    }

    bytes_read += nread;

    restart_timeout();
  }
}

int Client::write_clear() {
  const auto &req = worker->target->request;

  while (woffset < req.size()) {
    ssize_t nwrite;
    while ((nwrite = write(fd, req.c_str() + woffset, req.size() - woffset)) ==
               -1 &&
           errno == EINTR)
      ;
    if (nwrite == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        ev_io_start(worker->loop, &wev);
        return 0;
      }
      return -1;
    }
    woffset += nwrite;

    restart_timeout();
  }

  ev_io_stop(worker->loop, &wev);

  return 0;
}

} // namespace h1load
