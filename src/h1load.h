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
#ifndef H1LOAD_H
#define H1LOAD_H

#include <cstddef>
#include <string>
#include <vector>

#include <ev.h>

namespace h1load {

struct Config {
  // concurrency levels of sweep mode
  std::vector<size_t> concurrencies;
  std::string uri;
  // preset profile name
  std::string profile;
  // path to JSON file overriding preset profiles
  std::string config_file;
  // path to CSV report written by preset mode
  std::string output;
  // The number of requests per run (closed, sweep)
  size_t nreqs;
  // closed: concurrency; open: concurrency cap.  0 means the default
  // of the mode.
  size_t concurrency;
  // The number of warmup requests (closed, sweep)
  size_t warmup;
  size_t repeat;
  // open-loop target rate
  double rps;
  // open-loop duration in seconds
  double duration;
  // open-loop warmup in seconds
  double warmup_sec;
  // timeout applied to connect, write and each read
  ev_tstamp timeout;
  enum { MODE_CLOSED, MODE_OPEN, MODE_SWEEP, MODE_PRESET } mode;
  bool quiet;
  bool verbose;

  Config();
};

} // namespace h1load

#endif // H1LOAD_H
