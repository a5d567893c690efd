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
#include "h1load_stats_test.h"

#include <CUnit/CUnit.h>

#include "h1load_stats.h"

using namespace std::chrono;

namespace h1load {

void test_h1load_stats_percentile(void) {
  std::vector<int> v{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

  // index 8 = round(0.9 * 9)
  CU_ASSERT(9 == percentile(v, 0.9));
  // index 5 = round(0.5 * 9), no interpolation
  CU_ASSERT(6 == percentile(v, 0.5));
  CU_ASSERT(10 == percentile(v, 0.99));
  CU_ASSERT(1 == percentile(v, 0.));
  CU_ASSERT(10 == percentile(v, 1.));
  // out of range is clamped
  CU_ASSERT(10 == percentile(v, 1.5));
  CU_ASSERT(1 == percentile(v, -0.5));

  CU_ASSERT(0 == percentile(std::vector<int>(), 0.5));

  CU_ASSERT(7 == percentile(std::vector<int>{7}, 0.99));
}

void test_h1load_stats_median(void) {
  CU_ASSERT(2. == median({3., 1., 2.}));
  CU_ASSERT(2.5 == median({4., 1., 3., 2.}));
  CU_ASSERT(5. == median({5.}));
  CU_ASSERT(0. == median({}));
}

void test_h1load_stats_compute_latency_stat(void) {
  std::vector<nanoseconds> samples;
  for (int i = 10; i >= 1; --i) {
    samples.push_back(milliseconds(i));
  }

  auto ls = compute_latency_stat(samples);

  CU_ASSERT(milliseconds(1) == ls.min);
  CU_ASSERT(milliseconds(10) == ls.max);
  CU_ASSERT(milliseconds(6) == ls.p50);
  CU_ASSERT(milliseconds(9) == ls.p90);
  CU_ASSERT(milliseconds(10) == ls.p99);
  CU_ASSERT(microseconds(5500) == ls.mean);

  ls = compute_latency_stat({});

  CU_ASSERT(microseconds::zero() == ls.min);
  CU_ASSERT(microseconds::zero() == ls.max);
  CU_ASSERT(microseconds::zero() == ls.p50);
  CU_ASSERT(microseconds::zero() == ls.p90);
  CU_ASSERT(microseconds::zero() == ls.p99);
  CU_ASSERT(microseconds::zero() == ls.mean);

  // loopback latencies below one microsecond keep their resolution
  ls = compute_latency_stat({nanoseconds(1500), nanoseconds(500),
                             nanoseconds(1200)});

  CU_ASSERT(nanoseconds(500) == ls.min);
  CU_ASSERT(nanoseconds(1200) == ls.p50);
  CU_ASSERT(nanoseconds(1500) == ls.max);
  CU_ASSERT(nanoseconds(1066) == ls.mean);
}

void test_h1load_stats_compute_rps(void) {
  CU_ASSERT(50. == compute_rps(100, seconds(2)));
  CU_ASSERT(0. == compute_rps(0, seconds(2)));
  CU_ASSERT(0. == compute_rps(100, microseconds::zero()));
  CU_ASSERT(2.5 == to_ms(microseconds(2500)));
  CU_ASSERT(0.0015 == to_ms(nanoseconds(1500)));
}

namespace {
RunSummary make_run(double rps, size_t failed, int64_t p50_us) {
  RunSummary s;
  s.rps = rps;
  s.req_failed = failed;
  s.latency.p50 = microseconds(p50_us);
  return s;
}
} // namespace

void test_h1load_stats_summarize_runs(void) {
  auto res = summarize_runs({make_run(100., 0, 1000), make_run(300., 3, 3000),
                             make_run(200., 6, 2000)});

  CU_ASSERT(200. == res.rps);
  CU_ASSERT(2. == res.p50_ms);
  CU_ASSERT(3. == res.errors);
  CU_ASSERT(3 == res.runs.size());
  // runs are kept in order
  CU_ASSERT(300. == res.runs[1].rps);

  res = summarize_runs({make_run(100., 1, 1000), make_run(300., 2, 4000)});

  CU_ASSERT(200. == res.rps);
  CU_ASSERT(2.5 == res.p50_ms);
  CU_ASSERT(1.5 == res.errors);

  res = summarize_runs({});

  CU_ASSERT(0. == res.rps);
  CU_ASSERT(0. == res.errors);
  CU_ASSERT(res.runs.empty());

  RunSummary fast;
  fast.latency.p50 = nanoseconds(250);
  res = summarize_runs({fast});

  CU_ASSERT(0.00025 == res.p50_ms);
}

} // namespace h1load
