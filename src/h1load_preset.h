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
#ifndef H1LOAD_PRESET_H
#define H1LOAD_PRESET_H

#include <cstddef>
#include <string>
#include <vector>

#include <ev.h>

#include "h1load_runner.h"
#include "h1load_report.h"

namespace h1load {

// Lower bound of the derived open-loop target rate
constexpr double MIN_OPEN_TARGET_RPS = 50.;
// Upper bound of the derived open-loop concurrency cap
constexpr size_t MAX_OPEN_CONCURRENCY_CAP = 2000;

// Parameters of a preset: closed-loop calibration sweep followed by
// open-loop runs around the calibrated capacity.
struct Profile {
  Profile();
  std::string name;
  // concurrency levels of the calibration sweep
  std::vector<size_t> concurrencies;
  // The number of requests per run of each sweep point
  size_t total_per_concurrency;
  // The number of warmup requests of each sweep point
  size_t warmup;
  // The number of repeats, used by both phases
  size_t repeat;
  // open-loop duration in seconds
  double open_duration;
  // open-loop warmup in seconds
  double open_warmup_sec;
};

// Returns the names of built-in profiles.
const std::vector<std::string> &get_profile_names();

// Fills |dst| with built-in profile |name|.  Returns 0 if it
// succeeds, or -1 if there is no such profile.
int get_default_profile(Profile &dst, const std::string &name);

// Overrides fields of |profile| with the values found under
// "presets"."<profile.name>" of JSON document |json|.  Keys which are
// not present keep their value.  Returns 0 if it succeeds, or -1 if
// |json| is malformed or a value has unexpected type.  |profile| is
// unchanged in the latter case.
int override_profile(Profile &profile, const std::string &json);

// Reads JSON config file |path| and overrides |profile| with it.
// Returns 0 if it succeeds, or -1.
int load_profile_config(Profile &profile, const std::string &path);

// Returns the sweep point with the highest throughput.  The first one
// wins a tie.  Returns nullptr if |sweep| is empty.
const SweepResult::value_type *select_best(const SweepResult &sweep);

// Returns the open-loop target rates derived from |calibrated_rps|:
// 0.5, 0.9 and 1.1 times of it, each at least MIN_OPEN_TARGET_RPS.
std::vector<double> derive_open_targets(double calibrated_rps);

// Returns the open-loop concurrency cap derived from the best
// closed-loop concurrency.
size_t derive_concurrency_cap(size_t best_concurrency);

struct PresetReport {
  PresetReport();
  size_t best_concurrency;
  double calibrated_rps;
  std::vector<double> open_targets;
  size_t concurrency_cap;
  SweepResult sweep;
  // results of open-loop runs, in the order of open_targets
  std::vector<RepeatedRunSummary> open_results;
  // All rows passed to the sink
  std::vector<ReportRow> rows;
};

// Runs preset |profile| using |runner|.  Rows are written to |sink|
// if it is not nullptr: sweep rows right after the sweep, and an
// open-loop row after each open-loop target.  All rows carry
// |timestamp|.  Returns 0 if it succeeds, or -1.
int run_preset(PresetReport &res, Runner &runner, const Profile &profile,
               ev_tstamp timeout, const std::string &timestamp,
               ReportSink *sink);

} // namespace h1load

#endif // H1LOAD_PRESET_H
