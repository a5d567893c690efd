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
#include "h1load_preset.h"

#include <cerrno>
#include <cstring>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "h1load_log.h"

namespace h1load {

Profile::Profile()
    : total_per_concurrency(0), warmup(0), repeat(0), open_duration(0),
      open_warmup_sec(0) {}

PresetReport::PresetReport()
    : best_concurrency(0), calibrated_rps(0), concurrency_cap(0) {}

namespace {
struct DefaultProfile {
  const char *name;
  std::vector<size_t> concurrencies;
  size_t total_per_concurrency;
  size_t warmup;
  size_t repeat;
  double open_duration;
  double open_warmup_sec;
};
} // namespace

namespace {
const std::vector<DefaultProfile> &get_default_profiles() {
  static const std::vector<DefaultProfile> profiles{
      {"smoke", {1, 10, 50, 100}, 1000, 200, 2, 8., 3.},
      {"standard", {1, 2, 5, 10, 20, 50, 100, 200, 400}, 5000, 1000, 3, 15.,
       5.},
      {"stress", {100, 200, 400, 800, 1200}, 15000, 2000, 3, 25., 8.},
  };
  return profiles;
}
} // namespace

const std::vector<std::string> &get_profile_names() {
  static std::vector<std::string> names;
  if (names.empty()) {
    for (auto &p : get_default_profiles()) {
      names.emplace_back(p.name);
    }
  }
  return names;
}

int get_default_profile(Profile &dst, const std::string &name) {
  for (auto &p : get_default_profiles()) {
    if (name != p.name) {
      continue;
    }
    dst.name = p.name;
    dst.concurrencies = p.concurrencies;
    dst.total_per_concurrency = p.total_per_concurrency;
    dst.warmup = p.warmup;
    dst.repeat = p.repeat;
    dst.open_duration = p.open_duration;
    dst.open_warmup_sec = p.open_warmup_sec;
    return 0;
  }

  LOG(ERROR) << "Unknown profile: " << name;
  return -1;
}

namespace {
// Returns nullptr if |name| is not found in |obj| or its value is
// null.
const rapidjson::Value *find_member(const rapidjson::Value &obj,
                                    const char *name) {
  auto it = obj.FindMember(name);
  if (it == obj.MemberEnd() || it->value.IsNull()) {
    return nullptr;
  }
  return &it->value;
}
} // namespace

namespace {
int read_size(size_t &dst, const rapidjson::Value &obj, const char *name) {
  auto v = find_member(obj, name);
  if (!v) {
    return 0;
  }
  if (!v->IsUint64()) {
    LOG(ERROR) << "config: " << name << " must be a non-negative integer";
    return -1;
  }
  dst = v->GetUint64();
  return 0;
}
} // namespace

namespace {
int read_seconds(double &dst, const rapidjson::Value &obj, const char *name) {
  auto v = find_member(obj, name);
  if (!v) {
    return 0;
  }
  if (!v->IsNumber() || v->GetDouble() < 0) {
    LOG(ERROR) << "config: " << name << " must be a non-negative number";
    return -1;
  }
  dst = v->GetDouble();
  return 0;
}
} // namespace

namespace {
int read_closed(Profile &profile, const rapidjson::Value &closed) {
  if (!closed.IsObject()) {
    LOG(ERROR) << "config: closed must be an object";
    return -1;
  }

  auto v = find_member(closed, "concurrencies");
  if (v) {
    if (!v->IsArray() || v->Empty()) {
      LOG(ERROR) << "config: concurrencies must be a non-empty array";
      return -1;
    }
    std::vector<size_t> concurrencies;
    for (auto it = v->Begin(); it != v->End(); ++it) {
      if (!it->IsUint64() || it->GetUint64() == 0) {
        LOG(ERROR) << "config: concurrencies must contain positive integers";
        return -1;
      }
      concurrencies.push_back(it->GetUint64());
    }
    profile.concurrencies = std::move(concurrencies);
  }

  if (read_size(profile.total_per_concurrency, closed, "total_per_c") != 0 ||
      read_size(profile.warmup, closed, "warmup") != 0 ||
      read_size(profile.repeat, closed, "repeat") != 0) {
    return -1;
  }

  if (profile.repeat == 0) {
    LOG(ERROR) << "config: repeat must be positive";
    return -1;
  }

  return 0;
}
} // namespace

namespace {
int read_open(Profile &profile, const rapidjson::Value &open) {
  if (!open.IsObject()) {
    LOG(ERROR) << "config: open must be an object";
    return -1;
  }

  if (read_seconds(profile.open_duration, open, "duration") != 0 ||
      read_seconds(profile.open_warmup_sec, open, "warmup_sec") != 0) {
    return -1;
  }

  return 0;
}
} // namespace

int override_profile(Profile &profile, const std::string &json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    LOG(ERROR) << "config: JSON parse error at offset " << doc.GetErrorOffset()
               << ": " << rapidjson::GetParseError_En(doc.GetParseError());
    return -1;
  }

  if (!doc.IsObject()) {
    LOG(ERROR) << "config: top-level value must be an object";
    return -1;
  }

  auto presets = find_member(doc, "presets");
  if (!presets) {
    return 0;
  }
  if (!presets->IsObject()) {
    LOG(ERROR) << "config: presets must be an object";
    return -1;
  }

  auto user = find_member(*presets, profile.name.c_str());
  if (!user) {
    return 0;
  }
  if (!user->IsObject()) {
    LOG(ERROR) << "config: presets." << profile.name << " must be an object";
    return -1;
  }

  auto merged = profile;

  auto closed = find_member(*user, "closed");
  if (closed && read_closed(merged, *closed) != 0) {
    return -1;
  }

  auto open = find_member(*user, "open");
  if (open && read_open(merged, *open) != 0) {
    return -1;
  }

  profile = std::move(merged);

  return 0;
}

int load_profile_config(Profile &profile, const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    auto error = errno;
    LOG(ERROR) << "Could not open config file " << path << ": "
               << strerror(error);
    return -1;
  }

  std::stringstream ss;
  ss << in.rdbuf();

  if (in.bad()) {
    LOG(ERROR) << "Could not read config file " << path;
    return -1;
  }

  if (override_profile(profile, ss.str()) != 0) {
    LOG(ERROR) << "Invalid config file " << path;
    return -1;
  }

  return 0;
}

const SweepResult::value_type *select_best(const SweepResult &sweep) {
  const SweepResult::value_type *best = nullptr;
  for (auto &point : sweep) {
    if (!best || point.second.rps > best->second.rps) {
      best = &point;
    }
  }
  return best;
}

std::vector<double> derive_open_targets(double calibrated_rps) {
  static constexpr double factors[] = {0.5, 0.9, 1.1};

  std::vector<double> res;
  for (auto f : factors) {
    res.push_back(std::max(MIN_OPEN_TARGET_RPS, f * calibrated_rps));
  }
  return res;
}

size_t derive_concurrency_cap(size_t best_concurrency) {
  return std::min(static_cast<size_t>(2.5 * best_concurrency),
                  MAX_OPEN_CONCURRENCY_CAP);
}

namespace {
ReportRow make_row(const char *phase, const Profile &profile,
                   const std::string &url, const std::string &timestamp,
                   const RepeatedRunSummary &s) {
  ReportRow row;
  row.phase = phase;
  row.profile = profile.name;
  row.url = url;
  row.timestamp = timestamp;
  row.repeat = profile.repeat;
  row.throughput_rps = s.rps;
  row.p50_ms = s.p50_ms;
  row.p90_ms = s.p90_ms;
  row.p99_ms = s.p99_ms;
  row.errors = s.errors;
  return row;
}
} // namespace

namespace {
int emit_row(PresetReport &res, ReportSink *sink, ReportRow row) {
  if (sink && sink->write_row(row) != 0) {
    return -1;
  }
  res.rows.push_back(std::move(row));
  return 0;
}
} // namespace

int run_preset(PresetReport &res, Runner &runner, const Profile &profile,
               ev_tstamp timeout, const std::string &timestamp,
               ReportSink *sink) {
  auto &out = runner.get_output();
  auto &url = runner.get_target().uri;

  SweepParams sweep_params;
  sweep_params.concurrencies = profile.concurrencies;
  sweep_params.nreqs = profile.total_per_concurrency;
  sweep_params.timeout = timeout;
  sweep_params.warmup = profile.warmup;
  sweep_params.repeat = profile.repeat;
  sweep_params.quiet = false;

  if (runner.run_sweep(res.sweep, sweep_params) != 0) {
    return -1;
  }

  for (auto &point : res.sweep) {
    auto row = make_row("closed_sweep", profile, url, timestamp, point.second);
    row.concurrency = point.first;
    row.total_requests = profile.total_per_concurrency;
    row.warmup = profile.warmup;

    if (emit_row(res, sink, std::move(row)) != 0) {
      return -1;
    }
  }

  auto best = select_best(res.sweep);
  if (!best) {
    LOG(ERROR) << "preset: sweep produced no result";
    return -1;
  }

  res.best_concurrency = best->first;
  res.calibrated_rps = best->second.rps;
  res.open_targets = derive_open_targets(res.calibrated_rps);
  res.concurrency_cap = derive_concurrency_cap(res.best_concurrency);

  if (res.concurrency_cap == 0) {
    LOG(ERROR) << "preset: derived concurrency cap is 0";
    return -1;
  }

  out << std::fixed << "\n=== preset: open-loop around calibrated capacity ===\n"
      << "Calibrated from closed-loop: T*=" << std::setprecision(1)
      << res.calibrated_rps << " rps at C*=" << res.best_concurrency
      << std::endl;

  OpenLoopParams open_params;
  open_params.duration = profile.open_duration;
  open_params.concurrency_cap = res.concurrency_cap;
  open_params.timeout = timeout;
  open_params.warmup_sec = profile.open_warmup_sec;
  open_params.repeat = profile.repeat;
  open_params.quiet = false;

  for (auto target : res.open_targets) {
    out << std::fixed << std::setprecision(0) << "\n--- open target ~ "
        << target << " rps for " << profile.open_duration << "s (cap "
        << res.concurrency_cap << ") ---" << std::endl;

    open_params.rps = target;

    RepeatedRunSummary s;
    if (runner.run_open(s, open_params) != 0) {
      return -1;
    }

    auto row = make_row("open_loop", profile, url, timestamp, s);
    row.concurrency = res.concurrency_cap;
    row.open_duration_sec = profile.open_duration;
    row.warmup = profile.open_warmup_sec;
    row.open_target_rps = target;

    res.open_results.push_back(std::move(s));

    if (emit_row(res, sink, std::move(row)) != 0) {
      return -1;
    }
  }

  return 0;
}

} // namespace h1load
