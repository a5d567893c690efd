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
#ifndef H1LOAD_TARGET_H
#define H1LOAD_TARGET_H

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include <cstdint>
#include <string>

namespace h1load {

enum { ERR_INVALID_TARGET = -1 };

// The endpoint every request of a run is sent to, together with the
// rendered request.  Built once by parse_target() and read-only
// afterwards.
struct Target {
  // URI as given by user
  std::string uri;
  std::string host;
  // host[:port] as written in the URI.  Sent in Host header field.
  std::string authority;
  // path and query.  Never empty.
  std::string path;
  // The complete request: request line, Host and Connection header
  // fields, and the terminating CRLF.
  std::string request;
  uint16_t port;

  Target();
};

// Parses |uri| and fills |dst|.  Only "http" scheme is accepted; when
// scheme is omitted, "http" is assumed.  Returns 0 if it succeeds, or
// ERR_INVALID_TARGET.
int parse_target(Target &dst, const std::string &uri);

// Renders HTTP/1.1 GET request for |path| with "Connection: close".
std::string make_request(const std::string &authority,
                         const std::string &path);

// Resolved addresses of a Target.  Owns the result of getaddrinfo().
class Addresses {
public:
  Addresses();
  ~Addresses();
  Addresses(const Addresses &) = delete;
  Addresses &operator=(const Addresses &) = delete;

  // Resolves host and port of |target|.  Previously resolved
  // addresses are released.  Returns 0 if it succeeds, or -1.
  int resolve(const Target &target);
  const addrinfo *get() const;

private:
  addrinfo *addrs_;
};

} // namespace h1load

#endif // H1LOAD_TARGET_H
