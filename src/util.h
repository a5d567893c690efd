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
#ifndef UTIL_H
#define UTIL_H

#include <getopt.h>
#include <sys/types.h>

#include <cstdint>
#include <cstring>
#include <iterator>
#include <chrono>
#include <string>
#include <vector>

#include <http_parser.h>

namespace h1load {

namespace util {

inline bool is_digit(const char c) { return '0' <= c && c <= '9'; }

inline char lowcase(char c) {
  return 'A' <= c && c <= 'Z' ? c + ('a' - 'A') : c;
}

template <typename InputIt1, typename InputIt2>
bool strieq(InputIt1 first1, InputIt1 last1, InputIt2 first2,
            InputIt2 last2) {
  if (std::distance(first1, last1) != std::distance(first2, last2)) {
    return false;
  }

  for (; first1 != last1; ++first1, ++first2) {
    if (lowcase(*first1) != lowcase(*first2)) {
      return false;
    }
  }

  return true;
}

inline bool strieq(const std::string &a, const std::string &b) {
  return strieq(std::begin(a), std::end(a), std::begin(b), std::end(b));
}

inline bool strieq(const char *a, const char *b) {
  return strieq(a, a + strlen(a), b, b + strlen(b));
}

inline bool strieq(const char *a, const std::string &b) {
  return strieq(a, a + strlen(a), std::begin(b), std::end(b));
}

template <typename T> std::string utos(T n) {
  std::string res;
  if (n == 0) {
    res = "0";
    return res;
  }
  int i = 0;
  T t = n;
  for (; t; t /= 10, ++i)
    ;
  res.resize(i);
  --i;
  for (; n; --i, n /= 10) {
    res[i] = (n % 10) + '0';
  }
  return res;
}

// Returns string representation of |n| with 2 fractional digits.
std::string dtos(double n);

// Returns string representation of |n| with |prec| fractional
// digits, without trailing zeros, like "12.5" or "3".
std::string format_decimal(double n, int prec);

// Returns duration string |u| in human readable form, like "1.25ms".
std::string format_duration(const std::chrono::microseconds &u);

// Returns given time |tp| in ISO 8601 format (e.g.,
// 2014-11-15T12:58:24.741Z) in UTC.
std::string format_iso8601(const std::chrono::system_clock::time_point &tp);

// Returns given time |tp| in local time as YYYY-MM-DDTHH:MM:SS without
// zone designator.
std::string
format_local_datetime(const std::chrono::system_clock::time_point &tp);

// Shows the list of long options similar to |unkopt| on stderr.
void show_candidates(const char *unkopt, const option *options);

bool has_uri_field(const http_parser_url &u, http_parser_url_fields field);

std::string get_uri_field(const char *uri, const http_parser_url &u,
                          http_parser_url_fields field);

int make_socket_closeonexec(int fd);
int make_socket_nonblocking(int fd);
int make_socket_nodelay(int fd);

int create_nonblock_socket(int family);

bool check_socket_connected(int fd);

// Parses |s| as unsigned integer and returns the parsed integer.
// This function returns -1 if |s| is not a valid unsigned integer or
// the value exceeds the maximum of int64_t.
int64_t parse_uint(const char *s);
int64_t parse_uint(const std::string &s);

// Parses |s| as floating point number.  Leading and trailing garbage
// is an error.  Returns 0 if it succeeds, or -1.
int parse_double(double &dst, const char *s);

// Parses NULL terminated string |s| as unsigned integer and returns
// the parsed integer casted to double.  If |s| ends with "s", the
// parsed value's unit is a second.  If |s| ends with "ms", the unit
// is millisecond.  Similarly, it also supports 'm' and 'h' for
// minutes and hours respectively.  If none of them are given, the
// unit is second.  A fractional part is allowed, like "0.5s".  This
// function returns std::numeric_limits<double>::infinity() if error
// occurs.
double parse_duration_with_unit(const char *s);

// Returns string representation of time duration |t|.  If t has
// fractional part (at least more than or equal to 1e-3), |t| is
// multiplied by 1000 and the unit "ms" is appended.  Otherwise, |t|
// is left as is and "s" is appended.
std::string duration_str(double t);

// Splits |s| by |delim|.  Empty elements are dropped.
std::vector<std::string> split_str(const std::string &s, char delim);

} // namespace util

} // namespace h1load

#endif // UTIL_H
