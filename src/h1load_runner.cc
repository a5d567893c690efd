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
#include "h1load_runner.h"

#include <iomanip>

#include "h1load_worker.h"
#include "h1load_log.h"
#include "util.h"

namespace h1load {

ClosedLoopParams::ClosedLoopParams()
    : nreqs(1000), concurrency(100), timeout(5.), warmup(0), repeat(1),
      quiet(false) {}

OpenLoopParams::OpenLoopParams()
    : rps(1000.), duration(10.), concurrency_cap(500), timeout(5.),
      warmup_sec(0.), repeat(1), quiet(false) {}

SweepParams::SweepParams()
    : concurrencies{1, 2, 5, 10, 20, 50, 100, 200}, nreqs(1000), timeout(5.),
      warmup(0), repeat(1), quiet(false) {}

namespace {
void print_latencies(std::ostream &out, const RunSummary &s) {
  if (s.req_success == 0) {
    return;
  }
  out << std::fixed << std::setprecision(2)
      << "Latency: min=" << to_ms(s.latency.min)
      << "ms avg=" << to_ms(s.latency.mean)
      << "ms p50=" << to_ms(s.latency.p50)
      << "ms p90=" << to_ms(s.latency.p90)
      << "ms p99=" << to_ms(s.latency.p99)
      << "ms max=" << to_ms(s.latency.max) << "ms\n";
}
} // namespace

namespace {
void print_failures(std::ostream &out, const RunSummary &s) {
  if (s.req_failed == 0) {
    return;
  }
  out << "Failures: " << s.req_connect_failed << " connect, "
      << s.req_timedout << " timed out, "
      << s.req_failed - s.req_connect_failed - s.req_timedout << " I/O\n";
}
} // namespace

namespace {
void print_summary(std::ostream &out, const char *label,
                   const RepeatedRunSummary &s) {
  out << std::fixed << std::setprecision(1) << label << s.rps << " req/s\n"
      << std::setprecision(2) << "Latency: p50=" << s.p50_ms
      << "ms p90=" << s.p90_ms << "ms p99=" << s.p99_ms << "ms" << std::endl;
}
} // namespace

namespace {
double to_sec(const std::chrono::microseconds &d) {
  return std::chrono::duration<double>(d).count();
}
} // namespace

int parse_concurrency_list(std::vector<size_t> &dst, const std::string &s) {
  std::vector<size_t> res;

  for (auto &v : util::split_str(s, ',')) {
    auto n = util::parse_uint(v);
    if (n <= 0) {
      return -1;
    }
    res.push_back(n);
  }

  if (res.empty()) {
    return -1;
  }

  dst = std::move(res);

  return 0;
}

Runner::Runner(const Target &target, std::ostream &out)
    : target_(target), out_(out), nworkers_(0), resolved_(false) {
  if (addrs_.resolve(target_) != 0) {
    LOG(WARN) << "Could not resolve " << target_.host
              << "; all requests will fail";
    return;
  }
  resolved_ = true;
}

const Target &Runner::get_target() const { return target_; }

std::ostream &Runner::get_output() const { return out_; }

bool Runner::resolved() const { return resolved_; }

RunSummary Runner::run_closed_once(size_t nreqs, size_t concurrency,
                                   ev_tstamp timeout) {
  Worker worker(nworkers_++, &target_, addrs_.get(), concurrency, timeout);

  if (LOG_ENABLED(INFO)) {
    WLOG(INFO, worker.id) << "closed-loop: " << nreqs << " requests, "
                          << "concurrency " << concurrency;
  }

  worker.run_closed(nreqs);

  auto res = worker.get_summary();

  if (LOG_ENABLED(INFO)) {
    WLOG(INFO, worker.id) << "finished in "
                          << util::format_duration(res.duration) << ", "
                          << res.req_success << " succeeded, "
                          << res.req_failed << " failed, "
                          << worker.stats.bytes_total << " bytes received";
  }

  return res;
}

RunSummary Runner::run_open_once(double rps, double duration, size_t cap,
                                 ev_tstamp timeout) {
  Worker worker(nworkers_++, &target_, addrs_.get(), cap, timeout);

  if (LOG_ENABLED(INFO)) {
    WLOG(INFO, worker.id) << "open-loop: " << rps << " rps for " << duration
                          << "s, concurrency cap " << cap;
  }

  worker.run_open(rps, duration);

  auto res = worker.get_summary();

  if (LOG_ENABLED(INFO)) {
    WLOG(INFO, worker.id) << "finished in "
                          << util::format_duration(res.duration)
                          << ", dispatched " << worker.stats.req_todo
                          << " requests, peak outstanding "
                          << res.peak_outstanding << ", peak executing "
                          << res.peak_executing;
  }

  return res;
}

int Runner::run_closed(RepeatedRunSummary &res,
                       const ClosedLoopParams &params) {
  if (params.repeat == 0) {
    LOG(ERROR) << "closed-loop: repeat must be positive";
    return -1;
  }
  if (params.concurrency == 0) {
    LOG(ERROR) << "closed-loop: concurrency must be positive";
    return -1;
  }

  if (params.warmup > 0) {
    run_closed_once(params.warmup, params.concurrency, params.timeout);
  }

  std::vector<RunSummary> runs;

  for (size_t i = 0; i < params.repeat; ++i) {
    if (!params.quiet) {
      out_ << "--- closed run " << i + 1 << "/" << params.repeat << " ---\n";
    }

    auto s = run_closed_once(params.nreqs, params.concurrency, params.timeout);

    if (!params.quiet) {
      out_ << std::fixed << "URL: " << target_.uri << "\n"
           << "Total: " << params.nreqs
           << ", Concurrency: " << params.concurrency
           << ", Errors: " << s.req_failed << "\n"
           << std::setprecision(3) << "Wall time: " << to_sec(s.duration)
           << "s, Throughput: " << std::setprecision(1) << s.rps
           << " req/s\n";
      print_latencies(out_, s);
      print_failures(out_, s);
    }

    runs.push_back(std::move(s));
  }

  res = summarize_runs(std::move(runs));

  if (!params.quiet) {
    out_ << "=== closed summary (median) ===\n";
    print_summary(out_, "Throughput: ", res);
  }

  return 0;
}

int Runner::run_open(RepeatedRunSummary &res, const OpenLoopParams &params) {
  if (params.repeat == 0) {
    LOG(ERROR) << "open-loop: repeat must be positive";
    return -1;
  }
  if (params.concurrency_cap == 0) {
    LOG(ERROR) << "open-loop: concurrency cap must be positive";
    return -1;
  }

  if (params.warmup_sec > 0) {
    run_open_once(params.rps, params.warmup_sec, params.concurrency_cap,
                  params.timeout);
  }

  std::vector<RunSummary> runs;

  for (size_t i = 0; i < params.repeat; ++i) {
    if (!params.quiet) {
      out_ << "--- open run " << i + 1 << "/" << params.repeat << " ---\n";
    }

    auto s = run_open_once(params.rps, params.duration,
                           params.concurrency_cap, params.timeout);

    if (!params.quiet) {
      out_ << std::fixed << "URL: " << target_.uri << "\n"
           << std::setprecision(1) << "Mode: open-loop, Target: " << params.rps
           << " rps for " << params.duration
           << "s, Concurrency cap: " << params.concurrency_cap << "\n"
           << std::setprecision(3) << "Wall time: " << to_sec(s.duration)
           << "s, Achieved: " << std::setprecision(1) << s.rps
           << " req/s, Errors: " << s.req_failed << "\n";
      print_latencies(out_, s);
      print_failures(out_, s);
    }

    runs.push_back(std::move(s));
  }

  res = summarize_runs(std::move(runs));

  if (!params.quiet) {
    out_ << "=== open summary (median) ===\n";
    print_summary(out_, "Achieved: ", res);
  }

  return 0;
}

int Runner::run_sweep(SweepResult &res, const SweepParams &params) {
  if (params.concurrencies.empty()) {
    LOG(ERROR) << "sweep: no concurrency level given";
    return -1;
  }
  if (params.repeat == 0) {
    LOG(ERROR) << "sweep: repeat must be positive";
    return -1;
  }
  for (auto c : params.concurrencies) {
    if (c == 0) {
      LOG(ERROR) << "sweep: concurrency must be positive";
      return -1;
    }
  }

  ClosedLoopParams closed;
  closed.nreqs = params.nreqs;
  closed.timeout = params.timeout;
  closed.warmup = params.warmup;
  closed.repeat = params.repeat;
  closed.quiet = true;

  res.clear();

  if (!params.quiet) {
    out_ << "=== sweep (closed-loop medians) ===" << std::endl;
  }

  for (auto c : params.concurrencies) {
    closed.concurrency = c;

    RepeatedRunSummary s;
    if (run_closed(s, closed) != 0) {
      return -1;
    }

    if (!params.quiet) {
      out_ << std::fixed << "c=" << std::setw(4) << c
           << " -> thr=" << std::setw(8) << std::setprecision(1) << s.rps
           << " rps  p50=" << std::setw(7) << std::setprecision(2) << s.p50_ms
           << "ms  p90=" << std::setw(7) << s.p90_ms << "ms  p99="
           << std::setw(7) << s.p99_ms << "ms" << std::endl;
    }

    res.emplace_back(c, std::move(s));
  }

  return 0;
}

} // namespace h1load
