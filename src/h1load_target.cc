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
#include "h1load_target.h"

#include <cstring>

#include <http_parser.h>

#include "h1load_log.h"
#include "util.h"

namespace h1load {

Target::Target() : port(80) {}

std::string make_request(const std::string &authority,
                         const std::string &path) {
  std::string req;
  req += "GET ";
  req += path;
  req += " HTTP/1.1\r\nHost: ";
  req += authority;
  req += "\r\nConnection: close\r\n\r\n";
  return req;
}

namespace {
// Returns host[:port] part of |uri| as it is written, including the
// brackets around IPv6 address.
std::string get_authority(const char *uri, const http_parser_url &u) {
  auto &host = u.field_data[UF_HOST];
  size_t first = host.off;
  size_t last = host.off + host.len;

  if (first > 0 && uri[first - 1] == '[') {
    --first;
    ++last;
  }

  if (util::has_uri_field(u, UF_PORT)) {
    auto &port = u.field_data[UF_PORT];
    last = port.off + port.len;
  }

  return std::string(uri + first, uri + last);
}
} // namespace

int parse_target(Target &dst, const std::string &uri) {
  if (uri.empty()) {
    LOG(ERROR) << "empty URI";
    return ERR_INVALID_TARGET;
  }

  http_parser_url u{};
  if (http_parser_parse_url(uri.c_str(), uri.size(), 0, &u) != 0) {
    LOG(ERROR) << "invalid URI: " << uri;
    return ERR_INVALID_TARGET;
  }

  auto base = uri.c_str();

  if (util::has_uri_field(u, UF_SCHEMA)) {
    auto scheme = util::get_uri_field(base, u, UF_SCHEMA);
    if (!util::strieq("http", scheme)) {
      LOG(ERROR) << "unsupported scheme " << scheme
                 << ": only plain http is supported";
      return ERR_INVALID_TARGET;
    }
  }

  Target target;

  target.uri = uri;

  if (util::has_uri_field(u, UF_HOST)) {
    target.host = util::get_uri_field(base, u, UF_HOST);
    target.authority = get_authority(base, u);
  } else {
    target.host = "127.0.0.1";
    target.authority = target.host;
  }

  if (target.host.empty()) {
    LOG(ERROR) << "invalid URI: " << uri << ": empty host";
    return ERR_INVALID_TARGET;
  }

  if (util::has_uri_field(u, UF_PORT)) {
    if (u.port == 0) {
      LOG(ERROR) << "invalid URI: " << uri << ": port must be in [1, 65535]";
      return ERR_INVALID_TARGET;
    }
    target.port = u.port;
  }

  if (util::has_uri_field(u, UF_PATH)) {
    target.path = util::get_uri_field(base, u, UF_PATH);
  } else {
    target.path = "/";
  }

  if (util::has_uri_field(u, UF_QUERY)) {
    target.path += '?';
    target.path += util::get_uri_field(base, u, UF_QUERY);
  }

  target.request = make_request(target.authority, target.path);

  dst = std::move(target);

  return 0;
}

Addresses::Addresses() : addrs_(nullptr) {}

Addresses::~Addresses() {
  if (addrs_) {
    freeaddrinfo(addrs_);
  }
}

int Addresses::resolve(const Target &target) {
  if (addrs_) {
    freeaddrinfo(addrs_);
    addrs_ = nullptr;
  }

  addrinfo hints{}, *res;

  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = 0;

  auto rv = getaddrinfo(target.host.c_str(), util::utos(target.port).c_str(),
                        &hints, &res);
  if (rv != 0) {
    LOG(ERROR) << "getaddrinfo() failed for " << target.host << ": "
               << gai_strerror(rv);
    return -1;
  }
  if (res == nullptr) {
    LOG(ERROR) << "No address returned for " << target.host;
    return -1;
  }

  addrs_ = res;

  return 0;
}

const addrinfo *Addresses::get() const { return addrs_; }

} // namespace h1load
