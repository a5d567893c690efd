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
#ifndef H1LOAD_RUNNER_H
#define H1LOAD_RUNNER_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <ev.h>

#include "h1load_target.h"
#include "h1load_stats.h"

namespace h1load {

struct ClosedLoopParams {
  ClosedLoopParams();
  // The number of requests per run
  size_t nreqs;
  // The maximum number of requests executing at once
  size_t concurrency;
  // timeout applied to connect, write and each read
  ev_tstamp timeout;
  // The number of warmup requests.  0 disables warmup.
  size_t warmup;
  size_t repeat;
  // true to suppress detail and summary output
  bool quiet;
};

struct OpenLoopParams {
  OpenLoopParams();
  // target arrival rate in requests per second
  double rps;
  // dispatch duration in seconds
  double duration;
  // The maximum number of requests executing at once
  size_t concurrency_cap;
  ev_tstamp timeout;
  // warmup duration in seconds.  0 disables warmup.
  double warmup_sec;
  size_t repeat;
  bool quiet;
};

struct SweepParams {
  SweepParams();
  // concurrency levels, run in this order
  std::vector<size_t> concurrencies;
  size_t nreqs;
  ev_tstamp timeout;
  size_t warmup;
  size_t repeat;
  // true to suppress the table output
  bool quiet;
};

// Pairs of concurrency and its result, in the order of
// SweepParams::concurrencies.
typedef std::vector<std::pair<size_t, RepeatedRunSummary>> SweepResult;

// Parses comma separated list of positive integers |s|, like
// "1,10,50", and stores them in |dst|.  Empty elements are ignored.
// Returns 0 if it succeeds, or -1.
int parse_concurrency_list(std::vector<size_t> &dst, const std::string &s);

// Runner executes runs against one Target.  The address of the
// target is resolved once on construction and shared by all runs.
// Human readable results are written to |out|.
class Runner {
public:
  Runner(const Target &target, std::ostream &out);
  Runner(const Runner &) = delete;
  Runner &operator=(const Runner &) = delete;

  // Runs closed-loop workload: optional warmup, then |params.repeat|
  // runs of |params.nreqs| requests each.  Returns 0 if it succeeds,
  // or -1 if parameters are invalid.
  int run_closed(RepeatedRunSummary &res, const ClosedLoopParams &params);
  // Runs open-loop workload.  Returns 0 if it succeeds, or -1 if
  // parameters are invalid.
  int run_open(RepeatedRunSummary &res, const OpenLoopParams &params);
  // Runs closed-loop workload quietly for each concurrency level.
  // Returns 0 if it succeeds, or -1 if parameters are invalid.  No
  // run is made in the latter case.
  int run_sweep(SweepResult &res, const SweepParams &params);

  const Target &get_target() const;
  std::ostream &get_output() const;
  // Returns true if the target address has been resolved.
  bool resolved() const;

private:
  RunSummary run_closed_once(size_t nreqs, size_t concurrency,
                             ev_tstamp timeout);
  RunSummary run_open_once(double rps, double duration, size_t cap,
                           ev_tstamp timeout);

  Addresses addrs_;
  const Target &target_;
  std::ostream &out_;
  // The number of Workers created so far
  uint32_t nworkers_;
  bool resolved_;
};

} // namespace h1load

#endif // H1LOAD_RUNNER_H
