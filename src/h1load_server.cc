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
#include "h1load_server.h"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <array>

#include "h1load_log.h"
#include "util.h"
#include "template.h"

namespace h1load {

namespace {
constexpr char RESPONSE[] = "HTTP/1.1 200 OK\r\n"
                            "Content-Length: 2\r\n"
                            "Connection: close\r\n"
                            "\r\n"
                            "OK";

// Time allowed to receive the request header
constexpr ev_tstamp HEADER_TIMEOUT = 2.;

// Give up reading header if it exceeds this size
constexpr size_t MAX_HEADER_SIZE = 64_k;
} // namespace

namespace {
void conn_readcb(struct ev_loop *loop, ev_io *w, int revents) {
  auto conn = static_cast<ServerConnection *>(w->data);
  if (conn->on_read() != 0) {
    conn->server->remove_connection(conn);
  }
}
} // namespace

namespace {
void conn_writecb(struct ev_loop *loop, ev_io *w, int revents) {
  auto conn = static_cast<ServerConnection *>(w->data);
  if (conn->on_write() != 0) {
    conn->server->remove_connection(conn);
  }
}
} // namespace

namespace {
void conn_timeoutcb(struct ev_loop *loop, ev_timer *w, int revents) {
  auto conn = static_cast<ServerConnection *>(w->data);
  // respond even if header is incomplete
  if (conn->respond() != 0) {
    conn->server->remove_connection(conn);
  }
}
} // namespace

ServerConnection::ServerConnection(TargetServer *server, int fd)
    : server(server), woffset(0), fd(fd), responding(false) {
  ev_io_init(&rev, conn_readcb, fd, EV_READ);
  rev.data = this;
  ev_io_init(&wev, conn_writecb, fd, EV_WRITE);
  wev.data = this;
  ev_timer_init(&rt, conn_timeoutcb, HEADER_TIMEOUT, 0.);
  rt.data = this;

  ev_io_start(server->get_loop(), &rev);
  ev_timer_start(server->get_loop(), &rt);
}

ServerConnection::~ServerConnection() {
  auto loop = server->get_loop();
  ev_timer_stop(loop, &rt);
  ev_io_stop(loop, &wev);
  ev_io_stop(loop, &rev);
  close(fd);
}

int ServerConnection::on_read() {
  std::array<char, 4_k> buf;

  for (;;) {
    ssize_t nread;
    while ((nread = read(fd, buf.data(), buf.size())) == -1 && errno == EINTR)
      ;
    if (nread == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return 0;
      }
      return -1;
    }

    if (nread == 0) {
      if (!server->get_respond()) {
        return -1;
      }
      // peer half-closed before sending complete header
      ev_io_stop(server->get_loop(), &rev);
      return respond();
    }

    if (responding) {
      // discard
      continue;
    }

    head.append(buf.data(), nread);

    if (head.find("\r\n\r\n") != std::string::npos ||
        head.size() >= MAX_HEADER_SIZE) {
      if (!server->get_respond()) {
        ev_timer_stop(server->get_loop(), &rt);
        responding = true;
        head.clear();
        continue;
      }
      return respond();
    }
  }
}

int ServerConnection::respond() {
  if (responding) {
    return 0;
  }

  responding = true;

  ev_timer_stop(server->get_loop(), &rt);

  if (!server->get_respond()) {
    return 0;
  }

  return on_write();
}

int ServerConnection::on_write() {
  const auto len = str_size(RESPONSE);

  while (woffset < len) {
    ssize_t nwrite;
    while ((nwrite = write(fd, RESPONSE + woffset, len - woffset)) == -1 &&
           errno == EINTR)
      ;
    if (nwrite == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        ev_io_start(server->get_loop(), &wev);
        return 0;
      }
      return -1;
    }
    woffset += nwrite;
  }

  // The response is written.  Closing the connection tells the client
  // that the response is complete.
  return -1;
}

namespace {
void acceptcb(struct ev_loop *loop, ev_io *w, int revents) {
  auto server = static_cast<TargetServer *>(w->data);
  server->accept_connection();
}
} // namespace

namespace {
void stopcb(struct ev_loop *loop, ev_async *w, int revents) {
  ev_break(loop, EVBREAK_ALL);
}
} // namespace

TargetServer::TargetServer()
    : num_accepted_(0), max_conns_(0), loop_(ev_loop_new(0)), fd_(-1),
      port_(0), respond_(true), verbose_(false) {
  ev_io_init(&acceptev_, acceptcb, 0, EV_READ);
  acceptev_.data = this;

  ev_async_init(&stopev_, stopcb);
  stopev_.data = this;
  ev_async_start(loop_, &stopev_);
}

TargetServer::~TargetServer() {
  conns_.clear();
  ev_io_stop(loop_, &acceptev_);
  ev_async_stop(loop_, &stopev_);
  if (fd_ != -1) {
    close(fd_);
  }
  ev_loop_destroy(loop_);
}

int TargetServer::listen(const std::string &host, uint16_t port) {
  addrinfo hints{}, *res;

  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  auto service = util::utos(port);

  auto rv = getaddrinfo(host.empty() ? nullptr : host.c_str(),
                        service.c_str(), &hints, &res);
  if (rv != 0) {
    LOG(ERROR) << "getaddrinfo() failed for " << host << ": "
               << gai_strerror(rv);
    return -1;
  }

  auto res_d = defer(freeaddrinfo, res);

  for (auto rp = res; rp; rp = rp->ai_next) {
    int fd = util::create_nonblock_socket(rp->ai_family);
    if (fd == -1) {
      continue;
    }

    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &val,
                   static_cast<socklen_t>(sizeof(val))) == -1) {
      close(fd);
      continue;
    }

    if (bind(fd, rp->ai_addr, rp->ai_addrlen) != 0 ||
        ::listen(fd, SOMAXCONN) != 0) {
      auto error = errno;
      LOG(WARN) << "bind/listen failed: " << strerror(error);
      close(fd);
      continue;
    }

    sockaddr_storage ss;
    socklen_t sslen = sizeof(ss);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&ss), &sslen) != 0) {
      auto error = errno;
      LOG(ERROR) << "getsockname() failed: " << strerror(error);
      close(fd);
      return -1;
    }

    if (ss.ss_family == AF_INET6) {
      port_ = ntohs(reinterpret_cast<sockaddr_in6 *>(&ss)->sin6_port);
    } else {
      port_ = ntohs(reinterpret_cast<sockaddr_in *>(&ss)->sin_port);
    }

    fd_ = fd;

    ev_io_set(&acceptev_, fd_, EV_READ);
    ev_io_start(loop_, &acceptev_);

    if (verbose_) {
      LOG(NOTICE) << (rp->ai_family == AF_INET ? "IPv4" : "IPv6")
                  << ": listen on port " << port_;
    }

    return 0;
  }

  LOG(ERROR) << "Could not listen on " << host << ":" << port;

  return -1;
}

uint16_t TargetServer::get_port() const { return port_; }

void TargetServer::set_respond(bool f) { respond_ = f; }

bool TargetServer::get_respond() const { return respond_; }

void TargetServer::set_max_connections(size_t n) { max_conns_ = n; }

void TargetServer::set_verbose(bool f) { verbose_ = f; }

void TargetServer::run() { ev_run(loop_, 0); }

void TargetServer::stop() { ev_async_send(loop_, &stopev_); }

size_t TargetServer::get_num_accepted() const { return num_accepted_; }

struct ev_loop *TargetServer::get_loop() const { return loop_; }

void TargetServer::accept_connection() {
  for (;;) {
    sockaddr_storage ss;
    socklen_t sslen = sizeof(ss);

    auto fd = accept(fd_, reinterpret_cast<sockaddr *>(&ss), &sslen);
    if (fd == -1) {
      auto error = errno;
      switch (error) {
      case EINTR:
      case ECONNABORTED:
        continue;
      case EAGAIN:
#if EAGAIN != EWOULDBLOCK
      case EWOULDBLOCK:
#endif
        return;
      default:
        LOG(WARN) << "accept() failed: " << strerror(error);
        return;
      }
    }

    if (util::make_socket_nonblocking(fd) != 0 ||
        util::make_socket_closeonexec(fd) != 0) {
      close(fd);
      continue;
    }

    ++num_accepted_;

    auto conn = make_unique<ServerConnection>(this, fd);
    auto p = conn.get();
    conns_.emplace(p, std::move(conn));

    if (verbose_ && LOG_ENABLED(INFO)) {
      LOG(INFO) << "accepted connection fd=" << fd;
    }

    if (max_conns_ && num_accepted_ >= max_conns_) {
      stop_accepting();
      return;
    }
  }
}

void TargetServer::stop_accepting() {
  if (fd_ == -1) {
    return;
  }

  ev_io_stop(loop_, &acceptev_);
  close(fd_);
  fd_ = -1;

  if (verbose_) {
    LOG(NOTICE) << "accepted " << num_accepted_
                << " connections, no longer listening";
  }
}

void TargetServer::remove_connection(ServerConnection *conn) {
  conns_.erase(conn);
}

} // namespace h1load
