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
#include "h1load_preset_test.h"

#include <sstream>

#include <CUnit/CUnit.h>

#include "h1load_preset.h"
#include "h1load_test_server.h"

namespace h1load {

void test_h1load_preset_default_profile(void) {
  Profile profile;

  CU_ASSERT(0 == get_default_profile(profile, "smoke"));
  CU_ASSERT("smoke" == profile.name);
  CU_ASSERT((std::vector<size_t>{1, 10, 50, 100}) == profile.concurrencies);
  CU_ASSERT(1000 == profile.total_per_concurrency);
  CU_ASSERT(200 == profile.warmup);
  CU_ASSERT(2 == profile.repeat);
  CU_ASSERT(8. == profile.open_duration);
  CU_ASSERT(3. == profile.open_warmup_sec);

  CU_ASSERT(0 == get_default_profile(profile, "standard"));
  CU_ASSERT(9 == profile.concurrencies.size());
  CU_ASSERT(400 == profile.concurrencies.back());
  CU_ASSERT(5000 == profile.total_per_concurrency);
  CU_ASSERT(15. == profile.open_duration);

  CU_ASSERT(0 == get_default_profile(profile, "stress"));
  CU_ASSERT(
      (std::vector<size_t>{100, 200, 400, 800, 1200}) == profile.concurrencies);
  CU_ASSERT(15000 == profile.total_per_concurrency);
  CU_ASSERT(2000 == profile.warmup);
  CU_ASSERT(3 == profile.repeat);
  CU_ASSERT(25. == profile.open_duration);
  CU_ASSERT(8. == profile.open_warmup_sec);

  CU_ASSERT(-1 == get_default_profile(profile, "heavy"));
  CU_ASSERT("stress" == profile.name);

  CU_ASSERT(3 == get_profile_names().size());
}

void test_h1load_preset_override_profile(void) {
  Profile profile;
  CU_ASSERT_FATAL(0 == get_default_profile(profile, "smoke"));

  CU_ASSERT(0 == override_profile(profile, R"({
  "presets": {
    "smoke": {
      "closed": {"concurrencies": [2, 4], "repeat": 1},
      "open": {"duration": 1.5}
    },
    "stress": {
      "closed": {"total_per_c": 1}
    }
  }
})"));

  CU_ASSERT((std::vector<size_t>{2, 4}) == profile.concurrencies);
  CU_ASSERT(1 == profile.repeat);
  CU_ASSERT(1.5 == profile.open_duration);
  // absent keys keep their value
  CU_ASSERT(1000 == profile.total_per_concurrency);
  CU_ASSERT(200 == profile.warmup);
  CU_ASSERT(3. == profile.open_warmup_sec);

  // no section for this profile
  CU_ASSERT(0 == override_profile(profile, R"({"other": 1})"));
  CU_ASSERT(0 == override_profile(profile, R"({"presets": {"smoke": null}})"));
  CU_ASSERT((std::vector<size_t>{2, 4}) == profile.concurrencies);
}

void test_h1load_preset_override_profile_error(void) {
  Profile profile;
  CU_ASSERT_FATAL(0 == get_default_profile(profile, "smoke"));

  CU_ASSERT(-1 == override_profile(profile, "{"));
  CU_ASSERT(-1 == override_profile(profile, "[]"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": 1})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": []}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "closed": {"repeat": 2, "total_per_c": "many"}}}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "closed": {"concurrencies": []}}}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "closed": {"concurrencies": [1, 0]}}}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "closed": {"repeat": 0}}}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "open": {"duration": -1}}}})"));
  CU_ASSERT(-1 == override_profile(profile, R"({"presets": {"smoke": {
      "closed": {"repeat": 5}, "open": {"warmup_sec": "3s"}}}})"));

  // unchanged on error
  CU_ASSERT(2 == profile.repeat);
  CU_ASSERT(1000 == profile.total_per_concurrency);
  CU_ASSERT(4 == profile.concurrencies.size());
  CU_ASSERT(3. == profile.open_warmup_sec);

  CU_ASSERT(-1 == load_profile_config(profile, "/nonexistent-dir/cfg.json"));
}

namespace {
RepeatedRunSummary make_summary(double rps) {
  RepeatedRunSummary s;
  s.rps = rps;
  return s;
}
} // namespace

void test_h1load_preset_select_best(void) {
  SweepResult sweep;

  CU_ASSERT(nullptr == select_best(sweep));

  sweep.emplace_back(1, make_summary(100.));
  sweep.emplace_back(10, make_summary(900.));
  sweep.emplace_back(50, make_summary(400.));

  auto best = select_best(sweep);
  CU_ASSERT(nullptr != best);
  CU_ASSERT(10 == best->first);
  CU_ASSERT(900. == best->second.rps);

  // first one wins a tie
  sweep.emplace_back(100, make_summary(900.));
  best = select_best(sweep);
  CU_ASSERT(10 == best->first);

  // all failed
  sweep.clear();
  sweep.emplace_back(5, make_summary(0.));
  sweep.emplace_back(7, make_summary(0.));
  best = select_best(sweep);
  CU_ASSERT(5 == best->first);
}

void test_h1load_preset_derive_open_targets(void) {
  auto targets = derive_open_targets(1000.);
  CU_ASSERT(3 == targets.size());
  CU_ASSERT(500. == targets[0]);
  CU_ASSERT(900. == targets[1]);
  CU_ASSERT(1100. == targets[2]);

  // lower bound
  targets = derive_open_targets(80.);
  CU_ASSERT(50. == targets[0]);
  CU_ASSERT(72. == targets[1]);
  CU_ASSERT(88. == targets[2]);

  targets = derive_open_targets(0.);
  CU_ASSERT(50. == targets[0]);
  CU_ASSERT(50. == targets[1]);
  CU_ASSERT(50. == targets[2]);
}

void test_h1load_preset_derive_concurrency_cap(void) {
  CU_ASSERT(2 == derive_concurrency_cap(1));
  CU_ASSERT(7 == derive_concurrency_cap(3));
  CU_ASSERT(25 == derive_concurrency_cap(10));
  CU_ASSERT(2000 == derive_concurrency_cap(800));
  CU_ASSERT(2000 == derive_concurrency_cap(801));
  CU_ASSERT(2000 == derive_concurrency_cap(100000));
}

namespace {
// Keeps rows in memory.
class MemoryReport : public ReportSink {
public:
  virtual int write_row(const ReportRow &row) {
    rows.push_back(row);
    return 0;
  }

  std::vector<ReportRow> rows;
};
} // namespace

namespace {
class FailingReport : public ReportSink {
public:
  FailingReport() : nwritten(0) {}
  virtual int write_row(const ReportRow &row) {
    ++nwritten;
    return -1;
  }

  size_t nwritten;
};
} // namespace

void test_h1load_preset_run(void) {
  TestServer server;
  CU_ASSERT_FATAL(0 == server.start());

  Target target;
  CU_ASSERT_FATAL(0 == parse_target(target, server.get_uri()));

  std::stringstream out;
  Runner runner(target, out);

  Profile profile;
  profile.name = "tiny";
  profile.concurrencies = {1, 2};
  profile.total_per_concurrency = 10;
  profile.warmup = 2;
  profile.repeat = 1;
  profile.open_duration = 0.2;
  profile.open_warmup_sec = 0;

  MemoryReport report;
  PresetReport res;

  CU_ASSERT(0 == run_preset(res, runner, profile, 5., "2024-05-01T12:00:00",
                            &report));

  CU_ASSERT(2 == res.sweep.size());
  CU_ASSERT(res.best_concurrency == 1 || res.best_concurrency == 2);
  CU_ASSERT(res.calibrated_rps > 0);
  CU_ASSERT(derive_concurrency_cap(res.best_concurrency) ==
            res.concurrency_cap);
  CU_ASSERT(3 == res.open_targets.size());
  CU_ASSERT(3 == res.open_results.size());

  CU_ASSERT(5 == report.rows.size());
  CU_ASSERT(5 == res.rows.size());

  // sweep rows first
  CU_ASSERT("closed_sweep" == report.rows[0].phase);
  CU_ASSERT(1 == report.rows[0].concurrency);
  CU_ASSERT("closed_sweep" == report.rows[1].phase);
  CU_ASSERT(2 == report.rows[1].concurrency);
  CU_ASSERT(10 == report.rows[0].total_requests);
  CU_ASSERT(2. == report.rows[0].warmup);
  CU_ASSERT(report.rows[0].open_duration_sec < 0);
  CU_ASSERT(report.rows[0].open_target_rps < 0);

  for (size_t i = 2; i < 5; ++i) {
    auto &row = report.rows[i];
    CU_ASSERT("open_loop" == row.phase);
    CU_ASSERT("tiny" == row.profile);
    CU_ASSERT(target.uri == row.url);
    CU_ASSERT("2024-05-01T12:00:00" == row.timestamp);
    CU_ASSERT(static_cast<int64_t>(res.concurrency_cap) == row.concurrency);
    CU_ASSERT(row.total_requests < 0);
    CU_ASSERT(0.2 == row.open_duration_sec);
    CU_ASSERT(res.open_targets[i - 2] == row.open_target_rps);
    CU_ASSERT(row.open_target_rps >= MIN_OPEN_TARGET_RPS);
    CU_ASSERT(1 == row.repeat);
  }

  auto text = out.str();
  CU_ASSERT(std::string::npos != text.find("Calibrated from closed-loop: T*="));
  CU_ASSERT(std::string::npos != text.find("--- open target ~ "));

  // a sink failure stops the preset right after the sweep
  FailingReport failing;
  PresetReport res2;
  CU_ASSERT(-1 == run_preset(res2, runner, profile, 5., "", &failing));
  CU_ASSERT(1 == failing.nwritten);
  CU_ASSERT(res2.open_results.empty());

  // invalid profile
  profile.repeat = 0;
  PresetReport res3;
  CU_ASSERT(-1 == run_preset(res3, runner, profile, 5., "", nullptr));
}

} // namespace h1load
