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
#ifndef H1LOAD_STATS_H
#define H1LOAD_STATS_H

#include <cstddef>
#include <algorithm>
#include <chrono>
#include <vector>

namespace h1load {

template <typename Duration> struct LatencyStat {
  // min, max, mean and nearest-rank percentiles
  Duration min, p50, p90, p99, max, mean;
};

// Aggregate of a single run.
struct RunSummary {
  RunSummary();
  // The number of requests completed successfully.
  size_t req_success;
  // The number of requests failed for whatever reason.
  size_t req_failed;
  // The number of requests which could not connect.  This is subset
  // of req_failed.
  size_t req_connect_failed;
  // The number of requests failed due to timeout.  This is subset of
  // req_failed.
  size_t req_timedout;
  // wall time of the run
  std::chrono::microseconds duration;
  // latency statistics over successful requests only
  LatencyStat<std::chrono::nanoseconds> latency;
  // successful requests per second
  double rps;
  // The maximum number of requests dispatched but not yet completed.
  size_t peak_outstanding;
  // The maximum number of requests executing at once.
  size_t peak_executing;
};

// Median of RunSummary values across repeats.  Latency values are in
// milliseconds.
struct RepeatedRunSummary {
  RepeatedRunSummary();
  double rps;
  double min_ms, p50_ms, p90_ms, p99_ms, max_ms, mean_ms;
  // mean of req_failed across repeats
  double errors;
  std::vector<RunSummary> runs;
};

// Returns the value at nearest-rank index round(|q| * (n - 1)) of
// |sorted|, which must be sorted in ascending order.  Returns zero
// value if |sorted| is empty.
template <typename T> T percentile(const std::vector<T> &sorted, double q) {
  if (sorted.empty()) {
    return T();
  }
  auto last = sorted.size() - 1;
  auto x = q * last + 0.5;
  if (x <= 0) {
    return sorted[0];
  }
  auto idx = static_cast<size_t>(x);
  return sorted[std::min(idx, last)];
}

// Returns the median of |values|.  For even number of values, the
// mean of the two middle values is returned.  Returns 0 if |values|
// is empty.
double median(std::vector<double> values);

// Computes min, max, mean and percentiles of |samples|.  All fields
// are zero if |samples| is empty.
LatencyStat<std::chrono::nanoseconds>
compute_latency_stat(std::vector<std::chrono::nanoseconds> samples);

// Returns |nreq| / |duration| in requests per second, or 0 if
// |duration| is not positive.
double compute_rps(size_t nreq, const std::chrono::microseconds &duration);

// Returns |d| in milliseconds.
double to_ms(const std::chrono::nanoseconds &d);

// Computes median of each value of |runs|, and mean failure count.
RepeatedRunSummary summarize_runs(std::vector<RunSummary> runs);

} // namespace h1load

#endif // H1LOAD_STATS_H
