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
#include "h1load_runner_test.h"

#include <sstream>

#include <CUnit/CUnit.h>

#include "h1load_runner.h"
#include "h1load_test_server.h"

namespace h1load {

void test_h1load_runner_parse_concurrency_list(void) {
  std::vector<size_t> res;

  CU_ASSERT(0 == parse_concurrency_list(res, "1,10,50"));
  CU_ASSERT(3 == res.size());
  CU_ASSERT(1 == res[0]);
  CU_ASSERT(10 == res[1]);
  CU_ASSERT(50 == res[2]);

  CU_ASSERT(0 == parse_concurrency_list(res, "5,,2,"));
  CU_ASSERT(2 == res.size());
  CU_ASSERT(5 == res[0]);
  CU_ASSERT(2 == res[1]);

  CU_ASSERT(-1 == parse_concurrency_list(res, ""));
  CU_ASSERT(-1 == parse_concurrency_list(res, ","));
  CU_ASSERT(-1 == parse_concurrency_list(res, "1,0"));
  CU_ASSERT(-1 == parse_concurrency_list(res, "1,x"));
  CU_ASSERT(-1 == parse_concurrency_list(res, "1, 2"));
  // unchanged on error
  CU_ASSERT(2 == res.size());
}

void test_h1load_runner_invalid_params(void) {
  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, get_refused_uri()));

  std::stringstream out;
  Runner runner(target, out);

  RepeatedRunSummary res;

  ClosedLoopParams closed;
  closed.nreqs = 1;
  closed.repeat = 0;
  CU_ASSERT(-1 == runner.run_closed(res, closed));

  closed.repeat = 1;
  closed.concurrency = 0;
  CU_ASSERT(-1 == runner.run_closed(res, closed));

  OpenLoopParams open;
  open.duration = 0.01;
  open.repeat = 0;
  CU_ASSERT(-1 == runner.run_open(res, open));

  open.repeat = 1;
  open.concurrency_cap = 0;
  CU_ASSERT(-1 == runner.run_open(res, open));

  SweepResult sweep;
  SweepParams sweep_params;
  sweep_params.nreqs = 1;
  sweep_params.concurrencies.clear();
  CU_ASSERT(-1 == runner.run_sweep(sweep, sweep_params));

  sweep_params.concurrencies = {1, 0};
  CU_ASSERT(-1 == runner.run_sweep(sweep, sweep_params));
  CU_ASSERT(sweep.empty());

  sweep_params.concurrencies = {1};
  sweep_params.repeat = 0;
  CU_ASSERT(-1 == runner.run_sweep(sweep, sweep_params));

  // nothing has run
  CU_ASSERT(out.str().empty());
}

void test_h1load_runner_run_closed(void) {
  TestServer server;
  CU_ASSERT_FATAL(0 == server.start());

  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, server.get_uri()));

  std::stringstream out;
  Runner runner(target, out);
  CU_ASSERT(runner.resolved());

  ClosedLoopParams params;
  params.nreqs = 30;
  params.concurrency = 5;
  params.warmup = 10;
  params.repeat = 3;

  RepeatedRunSummary res;
  CU_ASSERT(0 == runner.run_closed(res, params));

  CU_ASSERT(3 == res.runs.size());
  for (auto &s : res.runs) {
    CU_ASSERT(30 == s.req_success);
    CU_ASSERT(0 == s.req_failed);
    CU_ASSERT(s.peak_executing <= 5);
  }
  CU_ASSERT(res.rps > 0);
  CU_ASSERT(0. == res.errors);
  CU_ASSERT(res.p50_ms <= res.p99_ms);
  // warmup requests are sent, but not reported
  CU_ASSERT(10 + 3 * 30 == server.get_num_accepted());

  auto text = out.str();
  CU_ASSERT(std::string::npos != text.find("--- closed run 1/3 ---"));
  CU_ASSERT(std::string::npos != text.find("--- closed run 3/3 ---"));
  CU_ASSERT(std::string::npos != text.find("=== closed summary (median) ==="));
  CU_ASSERT(std::string::npos !=
            text.find("Total: 30, Concurrency: 5, Errors: 0"));

  std::stringstream quiet_out;
  Runner quiet_runner(target, quiet_out);

  params.warmup = 0;
  params.repeat = 1;
  params.quiet = true;

  CU_ASSERT(0 == quiet_runner.run_closed(res, params));
  CU_ASSERT(1 == res.runs.size());
  CU_ASSERT(quiet_out.str().empty());
}

void test_h1load_runner_run_closed_failures(void) {
  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, get_refused_uri()));

  std::stringstream out;
  Runner runner(target, out);

  ClosedLoopParams params;
  params.nreqs = 10;
  params.concurrency = 2;
  params.repeat = 2;

  RepeatedRunSummary res;
  CU_ASSERT(0 == runner.run_closed(res, params));

  CU_ASSERT(0. == res.rps);
  CU_ASSERT(10. == res.errors);
  CU_ASSERT(0. == res.p50_ms);
  CU_ASSERT(0. == res.p99_ms);

  auto text = out.str();
  CU_ASSERT(std::string::npos != text.find("Errors: 10"));
  CU_ASSERT(std::string::npos != text.find("Failures: 10 connect"));
  // no latency line without successes
  CU_ASSERT(std::string::npos == text.find("Latency: min="));
}

void test_h1load_runner_run_open(void) {
  TestServer server;
  CU_ASSERT_FATAL(0 == server.start());

  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, server.get_uri()));

  std::stringstream out;
  Runner runner(target, out);

  OpenLoopParams params;
  params.rps = 100.;
  params.duration = 0.3;
  params.concurrency_cap = 10;
  params.warmup_sec = 0.1;
  params.repeat = 2;

  RepeatedRunSummary res;
  CU_ASSERT(0 == runner.run_open(res, params));

  CU_ASSERT(2 == res.runs.size());
  for (auto &s : res.runs) {
    CU_ASSERT(s.req_success > 0);
    CU_ASSERT(0 == s.req_failed);
    CU_ASSERT(s.peak_executing <= 10);
  }
  CU_ASSERT(res.rps > 0);

  auto text = out.str();
  CU_ASSERT(std::string::npos != text.find("--- open run 2/2 ---"));
  CU_ASSERT(std::string::npos != text.find("=== open summary (median) ==="));
  CU_ASSERT(std::string::npos !=
            text.find("Mode: open-loop, Target: 100.0 rps for 0.3s, "
                      "Concurrency cap: 10"));
}

void test_h1load_runner_run_sweep(void) {
  TestServer server;
  CU_ASSERT_FATAL(0 == server.start());

  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, server.get_uri()));

  std::stringstream out;
  Runner runner(target, out);

  SweepParams params;
  params.concurrencies = {1, 10, 50};
  params.nreqs = 50;

  SweepResult res;
  CU_ASSERT(0 == runner.run_sweep(res, params));

  CU_ASSERT(3 == res.size());
  CU_ASSERT(1 == res[0].first);
  CU_ASSERT(10 == res[1].first);
  CU_ASSERT(50 == res[2].first);
  for (auto &point : res) {
    CU_ASSERT(point.second.rps > 0);
    CU_ASSERT(1 == point.second.runs.size());
    CU_ASSERT(50 == point.second.runs[0].req_success);
    CU_ASSERT(point.second.runs[0].peak_executing <= point.first);
  }

  auto text = out.str();
  CU_ASSERT(std::string::npos !=
            text.find("=== sweep (closed-loop medians) ==="));
  CU_ASSERT(std::string::npos != text.find("c=   1 -> thr="));
  CU_ASSERT(std::string::npos != text.find("c=  50 -> thr="));
  // sweep runs closed-loop quietly
  CU_ASSERT(std::string::npos == text.find("--- closed run"));
}

void test_h1load_runner_run_sweep_target_goes_away(void) {
  // The server stops listening in the middle of the second point.
  TestServer server(true, 15);
  CU_ASSERT_FATAL(0 == server.start());

  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, server.get_uri()));

  std::stringstream out;
  Runner runner(target, out);

  SweepParams params;
  params.concurrencies = {1, 2, 1};
  params.nreqs = 10;
  params.timeout = 2.;

  SweepResult res;
  CU_ASSERT(0 == runner.run_sweep(res, params));

  CU_ASSERT_FATAL(3 == res.size());

  // the first point is not affected by later failures
  auto &first = res[0].second.runs[0];
  CU_ASSERT(10 == first.req_success);
  CU_ASSERT(0 == first.req_failed);
  CU_ASSERT(0. == res[0].second.errors);
  CU_ASSERT(res[0].second.rps > 0);

  auto &second = res[1].second.runs[0];
  CU_ASSERT(10 == second.req_success + second.req_failed);
  CU_ASSERT(second.req_failed > 0);

  // the last point still runs, and every request fails
  CU_ASSERT(1 == res[2].first);
  auto &third = res[2].second.runs[0];
  CU_ASSERT(0 == third.req_success);
  CU_ASSERT(10 == third.req_failed);
  CU_ASSERT(10. == res[2].second.errors);
  CU_ASSERT(0. == res[2].second.rps);

  CU_ASSERT(15 == server.get_num_accepted());
}

} // namespace h1load
