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
#include "h1load_stats.h"

#include <cstdint>
#include <algorithm>

namespace h1load {

RunSummary::RunSummary()
    : req_success(0), req_failed(0), req_connect_failed(0), req_timedout(0),
      duration(0), latency(), rps(0), peak_outstanding(0), peak_executing(0) {
}

RepeatedRunSummary::RepeatedRunSummary()
    : rps(0), min_ms(0), p50_ms(0), p90_ms(0), p99_ms(0), max_ms(0),
      mean_ms(0), errors(0) {}

double median(std::vector<double> values) {
  if (values.empty()) {
    return 0.;
  }
  std::sort(std::begin(values), std::end(values));
  auto mid = values.size() / 2;
  if (values.size() % 2) {
    return values[mid];
  }
  return 0.5 * (values[mid - 1] + values[mid]);
}

LatencyStat<std::chrono::nanoseconds>
compute_latency_stat(std::vector<std::chrono::nanoseconds> samples) {
  using Duration = std::chrono::nanoseconds;

  if (samples.empty()) {
    return {Duration::zero(), Duration::zero(), Duration::zero(),
            Duration::zero(), Duration::zero(), Duration::zero()};
  }

  std::sort(std::begin(samples), std::end(samples));

  int64_t sum = 0;
  for (const auto &t : samples) {
    sum += t.count();
  }

  LatencyStat<Duration> res;
  res.min = samples.front();
  res.p50 = percentile(samples, 0.5);
  res.p90 = percentile(samples, 0.9);
  res.p99 = percentile(samples, 0.99);
  res.max = samples.back();
  res.mean = Duration(sum / static_cast<int64_t>(samples.size()));

  return res;
}

double compute_rps(size_t nreq, const std::chrono::microseconds &duration) {
  if (duration.count() <= 0) {
    return 0.;
  }
  return nreq / (static_cast<double>(duration.count()) / 1000000.);
}

double to_ms(const std::chrono::nanoseconds &d) {
  return static_cast<double>(d.count()) / 1000000.;
}

RepeatedRunSummary summarize_runs(std::vector<RunSummary> runs) {
  RepeatedRunSummary res;

  if (runs.empty()) {
    return res;
  }

  std::vector<double> rps, min, p50, p90, p99, max, mean;
  double nfailed = 0;

  for (const auto &r : runs) {
    rps.push_back(r.rps);
    min.push_back(to_ms(r.latency.min));
    p50.push_back(to_ms(r.latency.p50));
    p90.push_back(to_ms(r.latency.p90));
    p99.push_back(to_ms(r.latency.p99));
    max.push_back(to_ms(r.latency.max));
    mean.push_back(to_ms(r.latency.mean));
    nfailed += r.req_failed;
  }

  res.rps = median(std::move(rps));
  res.min_ms = median(std::move(min));
  res.p50_ms = median(std::move(p50));
  res.p90_ms = median(std::move(p90));
  res.p99_ms = median(std::move(p99));
  res.max_ms = median(std::move(max));
  res.mean_ms = median(std::move(mean));
  res.errors = nfailed / runs.size();
  res.runs = std::move(runs);

  return res;
}

} // namespace h1load
