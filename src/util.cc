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
#include "util.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <algorithm>
#include <iostream>
#include <limits>

namespace h1load {

namespace util {

std::string dtos(double n) {
  auto m = llround(100. * n);
  auto f = utos(m % 100);
  return utos(m / 100) + "." + (f.size() == 1 ? "0" : "") + f;
}

std::string format_decimal(double n, int prec) {
  char buf[64];
  auto len = snprintf(buf, sizeof(buf), "%.*f", prec, n);
  if (len < 0 || static_cast<size_t>(len) >= sizeof(buf)) {
    return "";
  }
  std::string res(buf, len);
  if (res.find('.') == std::string::npos) {
    return res;
  }
  while (res.back() == '0') {
    res.pop_back();
  }
  if (res.back() == '.') {
    res.pop_back();
  }
  return res;
}

std::string format_duration(const std::chrono::microseconds &u) {
  const char *unit = "us";
  int d = 0;
  auto t = u.count();
  if (t >= 1000000) {
    d = 1000000;
    unit = "s";
  } else if (t >= 1000) {
    d = 1000;
    unit = "ms";
  } else {
    return utos(t) + unit;
  }
  return dtos(static_cast<double>(t) / d) + unit;
}

std::string format_iso8601(const std::chrono::system_clock::time_point &tp) {
  auto t = std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
               .count();
  auto sec = static_cast<time_t>(t / 1000);

  tm tms;
  if (gmtime_r(&sec, &tms) == nullptr) {
    return "";
  }

  char buf[32];
  auto len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tms);
  if (len == 0) {
    return "";
  }

  auto ms = t % 1000;
  std::string res(buf, len);
  res += '.';
  res += static_cast<char>('0' + ms / 100);
  res += static_cast<char>('0' + (ms / 10) % 10);
  res += static_cast<char>('0' + ms % 10);
  res += 'Z';

  return res;
}

std::string
format_local_datetime(const std::chrono::system_clock::time_point &tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);

  tm tms;
  if (localtime_r(&t, &tms) == nullptr) {
    return "";
  }

  char buf[32];
  auto len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tms);

  return std::string(buf, len);
}

namespace {
// Calculates Damerau-Levenshtein distance between c-string a and b
// with given costs.  swapcost, subcost, addcost and delcost are cost
// to swap 2 adjacent characters, substitute characters, add character
// and delete character respectively.
int levenshtein(const char *a, int alen, const char *b, int blen, int swapcost,
                int subcost, int addcost, int delcost) {
  auto dp = std::vector<std::vector<int>>(3, std::vector<int>(blen + 1));
  for (int i = 0; i <= blen; ++i) {
    dp[1][i] = i;
  }
  for (int i = 1; i <= alen; ++i) {
    dp[0][0] = i;
    for (int j = 1; j <= blen; ++j) {
      dp[0][j] = dp[1][j - 1] + (a[i - 1] == b[j - 1] ? 0 : subcost);
      if (i >= 2 && j >= 2 && a[i - 1] != b[j - 1] && a[i - 2] == b[j - 1] &&
          a[i - 1] == b[j - 2]) {
        dp[0][j] = std::min(dp[0][j], dp[2][j - 2] + swapcost);
      }
      dp[0][j] = std::min(dp[0][j],
                          std::min(dp[1][j] + delcost, dp[0][j - 1] + addcost));
    }
    std::rotate(std::begin(dp), std::begin(dp) + 2, std::end(dp));
  }
  return dp[1][blen];
}
} // namespace

void show_candidates(const char *unkopt, const option *options) {
  for (; *unkopt == '-'; ++unkopt)
    ;
  if (*unkopt == '\0') {
    return;
  }
  auto unkoptend = unkopt;
  for (; *unkoptend && *unkoptend != '='; ++unkoptend)
    ;
  auto unkoptlen = unkoptend - unkopt;
  if (unkoptlen == 0) {
    return;
  }
  int prefix_match = 0;
  auto cands = std::vector<std::pair<int, const char *>>();
  for (size_t i = 0; options[i].name != nullptr; ++i) {
    auto optnamelen = strlen(options[i].name);
    // Use cost 0 for prefix match
    if (static_cast<size_t>(unkoptlen) <= optnamelen &&
        strieq(options[i].name, options[i].name + unkoptlen, unkopt,
               unkopt + unkoptlen)) {
      if (optnamelen == static_cast<size_t>(unkoptlen)) {
        // Exact match, then we don't show any candidates.
        return;
      }
      ++prefix_match;
      cands.emplace_back(0, options[i].name);
      continue;
    }
    // Use cost 0 for suffix match, but match at least 3 characters
    if (unkoptlen >= 3 && optnamelen >= static_cast<size_t>(unkoptlen) &&
        strieq(options[i].name + optnamelen - unkoptlen,
               options[i].name + optnamelen, unkopt, unkopt + unkoptlen)) {
      cands.emplace_back(0, options[i].name);
      continue;
    }
    // cost values are borrowed from git, help.c.
    int sim = levenshtein(unkopt, unkoptlen, options[i].name, optnamelen, 0,
                          2, 1, 3);
    cands.emplace_back(sim, options[i].name);
  }
  if (prefix_match == 1 || cands.empty()) {
    return;
  }
  std::sort(std::begin(cands), std::end(cands));
  int threshold = cands[0].first;
  // threshold value is a magic value.
  if (threshold > 6) {
    return;
  }
  std::cerr << "\nDid you mean:\n";
  for (auto &item : cands) {
    if (item.first > threshold) {
      break;
    }
    std::cerr << "\t--" << item.second << "\n";
  }
}

bool has_uri_field(const http_parser_url &u, http_parser_url_fields field) {
  return u.field_set & (1 << field);
}

std::string get_uri_field(const char *uri, const http_parser_url &u,
                          http_parser_url_fields field) {
  if (!has_uri_field(u, field)) {
    return "";
  }

  return std::string(uri + u.field_data[field].off, u.field_data[field].len);
}

int make_socket_closeonexec(int fd) {
  int flags;
  int rv;
  while ((flags = fcntl(fd, F_GETFD)) == -1 && errno == EINTR)
    ;
  while ((rv = fcntl(fd, F_SETFD, flags | FD_CLOEXEC)) == -1 && errno == EINTR)
    ;
  return rv;
}

int make_socket_nonblocking(int fd) {
  int flags;
  int rv;
  while ((flags = fcntl(fd, F_GETFL, 0)) == -1 && errno == EINTR)
    ;
  while ((rv = fcntl(fd, F_SETFL, flags | O_NONBLOCK)) == -1 && errno == EINTR)
    ;
  return rv;
}

int make_socket_nodelay(int fd) {
  int val = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<char *>(&val),
                 sizeof(val)) == -1) {
    return -1;
  }
  return 0;
}

int create_nonblock_socket(int family) {
#ifdef SOCK_NONBLOCK
  auto fd = socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);

  if (fd == -1) {
    return -1;
  }
#else  // !SOCK_NONBLOCK
  auto fd = socket(family, SOCK_STREAM, 0);

  if (fd == -1) {
    return -1;
  }

  make_socket_nonblocking(fd);
  make_socket_closeonexec(fd);
#endif // !SOCK_NONBLOCK

  if (family == AF_INET || family == AF_INET6) {
    make_socket_nodelay(fd);
  }

  return fd;
}

bool check_socket_connected(int fd) {
  int error;
  socklen_t len = sizeof(error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
    return false;
  }

  return error == 0;
}

int64_t parse_uint(const char *s) {
  if (*s == '\0') {
    return -1;
  }
  int64_t n = 0;
  for (; *s; ++s) {
    if (!is_digit(*s)) {
      return -1;
    }
    if (n > std::numeric_limits<int64_t>::max() / 10) {
      return -1;
    }
    n *= 10;
    if (n > std::numeric_limits<int64_t>::max() - (*s - '0')) {
      return -1;
    }
    n += *s - '0';
  }
  return n;
}

int64_t parse_uint(const std::string &s) { return parse_uint(s.c_str()); }

int parse_double(double &dst, const char *s) {
  if (*s == '\0') {
    return -1;
  }
  char *end;
  errno = 0;
  auto n = strtod(s, &end);
  if (errno != 0 || *end != '\0' || !std::isfinite(n)) {
    return -1;
  }
  dst = n;
  return 0;
}

double parse_duration_with_unit(const char *s) {
  constexpr auto err = std::numeric_limits<double>::infinity();

  if (!is_digit(*s)) {
    return err;
  }

  auto p = s;
  for (; is_digit(*p) || *p == '.'; ++p)
    ;

  double n;
  if (parse_double(n, std::string(s, p).c_str()) != 0) {
    return err;
  }

  switch (*p) {
  case '\0':
    return n;
  case 'S':
  case 's':
    // seconds
    if (p[1] != '\0') {
      return err;
    }
    return n;
  case 'M':
  case 'm':
    if (p[1] == '\0') {
      // minutes
      return n * 60;
    }

    if ((p[1] != 's' && p[1] != 'S') || p[2] != '\0') {
      return err;
    }

    // milliseconds
    return n / 1000.;
  case 'H':
  case 'h':
    // hours
    if (p[1] != '\0') {
      return err;
    }
    return n * 3600;
  default:
    return err;
  }
}

std::string duration_str(double t) {
  if (t == 0.) {
    return "0";
  }
  auto frac = static_cast<int64_t>(t * 1000) % 1000;
  if (frac > 0) {
    return utos(static_cast<int64_t>(t * 1000)) + "ms";
  }
  auto v = static_cast<int64_t>(t);
  if (v % 60) {
    return utos(v) + "s";
  }
  v /= 60;
  if (v % 60) {
    return utos(v) + "m";
  }
  v /= 60;
  return utos(v) + "h";
}

std::vector<std::string> split_str(const std::string &s, char delim) {
  std::vector<std::string> res;
  size_t first = 0;
  for (;;) {
    auto last = s.find(delim, first);
    if (last == std::string::npos) {
      last = s.size();
    }
    if (first != last) {
      res.emplace_back(s, first, last - first);
    }
    if (last == s.size()) {
      break;
    }
    first = last + 1;
  }
  return res;
}

} // namespace util

} // namespace h1load
