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
#include "h1load.h"

#include <getopt.h>
#include <signal.h>

#include <cmath>
#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <iomanip>

#include "h1load_target.h"
#include "h1load_runner.h"
#include "h1load_preset.h"
#include "h1load_report.h"
#include "h1load_log.h"
#include "util.h"

namespace h1load {

namespace {
constexpr size_t DEFAULT_CLOSED_CONCURRENCY = 100;
constexpr size_t DEFAULT_OPEN_CONCURRENCY = 500;
} // namespace

Config::Config()
    : concurrencies{1, 2, 5, 10, 20, 50, 100, 200},
      uri("http://127.0.0.1:8000/"), profile("standard"), nreqs(1000),
      concurrency(0), warmup(0), repeat(1), rps(1000.), duration(10.),
      warmup_sec(0.), timeout(5.), mode(MODE_CLOSED), quiet(false),
      verbose(false) {}

namespace {
Config config;
} // namespace

namespace {
void print_version(std::ostream &out) {
  out << "h1load " H1LOAD_VERSION << std::endl;
}
} // namespace

namespace {
void print_usage(std::ostream &out) {
  out << R"(Usage: h1load [OPTIONS]... <MODE> [<URI>]
load generator for HTTP/1.1 server)" << std::endl;
}
} // namespace

namespace {
std::string format_concurrencies(const std::vector<size_t> &v) {
  std::string res;
  for (auto c : v) {
    if (!res.empty()) {
      res += ',';
    }
    res += util::utos(c);
  }
  return res;
}
} // namespace

namespace {
void print_help(std::ostream &out) {
  print_usage(out);

  out << R"(
  <MODE>      One of the following:
              closed  Issue  fixed number  of  requests with  bounded
                      concurrency.
              open    Issue requests at fixed rate for fixed duration,
                      with bounded concurrency.
              sweep   Run closed  mode for each concurrency  level and
                      print one line per level.
              preset  Find  the  best  concurrency  with  sweep,  then
                      run  open   mode  around  the   measured  peak
                      throughput.  Results are written to CSV file.
  <URI>       Specify URI to access.  Only http scheme is supported.
              Default: )" << config.uri << R"(
Options:
  -n, --requests=<N>
              Number of requests per run (closed, sweep).
              Default: )" << config.nreqs << R"(
  -c, --concurrency=<N>
              Maximum  number of  requests  executing  at  once.   In
              open mode, this is the concurrency cap, and at most 4x
              <N> requests are dispatched but not completed.
              Default: )" << DEFAULT_CLOSED_CONCURRENCY << " (closed), "
      << DEFAULT_OPEN_CONCURRENCY << R"( (open)
  -T, --timeout=<DURATION>
              Timeout for connect, write  and each read of a request.
              A request which times out is counted as error.
              Default: )" << util::duration_str(config.timeout) << R"(
  -w, --warmup=<N>
              Number of warmup requests  issued before measurement, at
              the same concurrency (closed, sweep).
              Default: )" << config.warmup << R"(
  --warmup-sec=<DURATION>
              Duration of warmup run before measurement (open).
              Default: )" << util::duration_str(config.warmup_sec) << R"(
  -R, --repeat=<N>
              Number of runs.  The median of the runs is reported.
              Default: )" << config.repeat << R"(
  -r, --rps=<RATE>
              Target request rate per second (open).
              Default: )" << config.rps << R"(
  -D, --duration=<DURATION>
              Duration of dispatch (open).
              Default: )" << util::duration_str(config.duration) << R"(
  --concurrencies=<LIST>
              Comma separated list of concurrency levels (sweep).
              Default: )" << format_concurrencies(config.concurrencies)
      << R"(
  -P, --profile=<PROFILE>
              Preset profile.  One of smoke, standard and stress.
              Default: )" << config.profile << R"(
  --config=<PATH>
              JSON file overriding preset profiles.
  -o, --output=<PATH>
              Path to CSV file written by preset mode.
              Default: preset_<PROFILE>_<UNIXTIME>.csv
  -q, --quiet
              Don't print per run details (closed, open).
  -v, --verbose
              Output debug information.
  --log-level=<LEVEL>
              Set the severity  level of log output.   <LEVEL> must be
              one of INFO, NOTICE, WARN, ERROR and FATAL.
              Default: NOTICE

  The <DURATION>  argument is an integer  or a decimal and  an optional
  unit (e.g., 10s is 10 seconds, 500ms is 500 milliseconds and 1m is 1
  minute).  If a unit is omitted, a second is used as unit.

  --version   Display version information and exit.
  -h, --help  Display this help and exit.)" << std::endl;
}
} // namespace

namespace {
size_t parse_positive(int c, const char *optarg) {
  auto n = util::parse_uint(optarg);
  if (n <= 0) {
    std::cerr << "-" << static_cast<char>(c) << ": " << optarg
              << ": must be a positive integer" << std::endl;
    exit(EXIT_FAILURE);
  }
  return n;
}
} // namespace

namespace {
double parse_duration(const char *opt, const char *optarg, bool allow_zero) {
  auto t = util::parse_duration_with_unit(optarg);
  if (std::isinf(t) || t < 0 || (!allow_zero && t == 0)) {
    std::cerr << opt << ": bad duration: " << optarg << std::endl;
    exit(EXIT_FAILURE);
  }
  return t;
}
} // namespace

namespace {
int run_preset_mode(Runner &runner) {
  Profile profile;
  if (get_default_profile(profile, config.profile) != 0) {
    return -1;
  }

  if (!config.config_file.empty() &&
      load_profile_config(profile, config.config_file) != 0) {
    return -1;
  }

  auto now = std::chrono::system_clock::now();

  auto output = config.output;
  if (output.empty()) {
    output = "preset_" + config.profile + "_" +
             util::utos(std::chrono::system_clock::to_time_t(now)) + ".csv";
  }

  CsvReport report;
  if (report.open(output) != 0) {
    return -1;
  }

  PresetReport res;
  if (run_preset(res, runner, profile, config.timeout,
                 util::format_local_datetime(now), &report) != 0) {
    return -1;
  }

  std::cout << std::fixed << std::setprecision(1) << "\nSaved preset CSV to "
            << report.get_path() << "\nBest closed-loop: " << res.calibrated_rps
            << " rps at concurrency " << res.best_concurrency
            << "\nOpen-loop targets tested: [";
  for (size_t i = 0; i < res.open_targets.size(); ++i) {
    if (i > 0) {
      std::cout << ", ";
    }
    std::cout << static_cast<int64_t>(res.open_targets[i]);
  }
  std::cout << "] rps with cap " << res.concurrency_cap << std::endl;

  return 0;
}
} // namespace

int main(int argc, char **argv) {
  while (1) {
    static int flag = 0;
    static option long_options[] = {
        {"requests", required_argument, nullptr, 'n'},
        {"concurrency", required_argument, nullptr, 'c'},
        {"timeout", required_argument, nullptr, 'T'},
        {"warmup", required_argument, nullptr, 'w'},
        {"repeat", required_argument, nullptr, 'R'},
        {"rps", required_argument, nullptr, 'r'},
        {"duration", required_argument, nullptr, 'D'},
        {"profile", required_argument, nullptr, 'P'},
        {"output", required_argument, nullptr, 'o'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, &flag, 1},
        {"warmup-sec", required_argument, &flag, 2},
        {"concurrencies", required_argument, &flag, 3},
        {"config", required_argument, &flag, 4},
        {"log-level", required_argument, &flag, 5},
        {nullptr, 0, nullptr, 0}};
    int option_index = 0;
    auto c = getopt_long(argc, argv, "n:c:T:w:R:r:D:P:o:qvh", long_options,
                         &option_index);
    if (c == -1) {
      break;
    }
    switch (c) {
    case 'n': {
      auto n = util::parse_uint(optarg);
      if (n == -1) {
        std::cerr << "-n: bad number of requests: " << optarg << std::endl;
        exit(EXIT_FAILURE);
      }
      config.nreqs = n;
      break;
    }
    case 'c':
      config.concurrency = parse_positive(c, optarg);
      break;
    case 'T':
      config.timeout = parse_duration("-T", optarg, false);
      break;
    case 'w': {
      auto n = util::parse_uint(optarg);
      if (n == -1) {
        std::cerr << "-w: bad number of warmup requests: " << optarg
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      config.warmup = n;
      break;
    }
    case 'R':
      config.repeat = parse_positive(c, optarg);
      break;
    case 'r':
      if (util::parse_double(config.rps, optarg) != 0 || !(config.rps > 0) ||
          std::isinf(config.rps)) {
        std::cerr << "-r: the rate at which requests are made "
                  << "must be positive." << std::endl;
        exit(EXIT_FAILURE);
      }
      break;
    case 'D':
      config.duration = parse_duration("-D", optarg, false);
      break;
    case 'P': {
      auto &names = get_profile_names();
      if (std::find(std::begin(names), std::end(names), optarg) ==
          std::end(names)) {
        std::cerr << "-P: unknown profile " << optarg
                  << ": must be one of smoke, standard and stress"
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      config.profile = optarg;
      break;
    }
    case 'o':
      config.output = optarg;
      break;
    case 'q':
      config.quiet = true;
      break;
    case 'v':
      config.verbose = true;
      break;
    case 'h':
      print_help(std::cout);
      exit(EXIT_SUCCESS);
    case '?':
      util::show_candidates(argv[optind - 1], long_options);
      exit(EXIT_FAILURE);
    case 0:
      switch (flag) {
      case 1:
        // version option
        print_version(std::cout);
        exit(EXIT_SUCCESS);
      case 2:
        // warmup-sec option
        config.warmup_sec = parse_duration("--warmup-sec", optarg, true);
        break;
      case 3:
        // concurrencies option
        if (parse_concurrency_list(config.concurrencies, optarg) != 0) {
          std::cerr << "--concurrencies: bad list of concurrency levels: "
                    << optarg << std::endl;
          exit(EXIT_FAILURE);
        }
        break;
      case 4:
        // config option
        config.config_file = optarg;
        break;
      case 5:
        // log-level option
        if (Log::set_severity_level_by_name(optarg) == -1) {
          std::cerr << "--log-level: Invalid severity level: " << optarg
                    << std::endl;
          exit(EXIT_FAILURE);
        }
        break;
      }
      break;
    default:
      break;
    }
  }

  if (argc == optind) {
    std::cerr << "no MODE given" << std::endl;
    print_usage(std::cerr);
    exit(EXIT_FAILURE);
  }

  const char *mode = argv[optind++];
  if (util::strieq("closed", mode)) {
    config.mode = Config::MODE_CLOSED;
  } else if (util::strieq("open", mode)) {
    config.mode = Config::MODE_OPEN;
  } else if (util::strieq("sweep", mode)) {
    config.mode = Config::MODE_SWEEP;
  } else if (util::strieq("preset", mode)) {
    config.mode = Config::MODE_PRESET;
  } else {
    std::cerr << "unknown MODE " << mode
              << ": must be one of closed, open, sweep and preset"
              << std::endl;
    exit(EXIT_FAILURE);
  }

  if (optind < argc) {
    config.uri = argv[optind++];
  }

  if (optind < argc) {
    std::cerr << "too many arguments" << std::endl;
    exit(EXIT_FAILURE);
  }

  if (config.verbose) {
    Log::set_severity_level(INFO);
  }

  Target target;
  if (parse_target(target, config.uri) != 0) {
    std::cerr << "invalid URI: " << config.uri << std::endl;
    exit(EXIT_FAILURE);
  }

  struct sigaction act {};
  act.sa_handler = SIG_IGN;
  sigaction(SIGPIPE, &act, nullptr);

  Runner runner(target, std::cout);

  int rv = 0;

  switch (config.mode) {
  case Config::MODE_CLOSED: {
    ClosedLoopParams params;
    params.nreqs = config.nreqs;
    params.concurrency = config.concurrency ? config.concurrency
                                            : DEFAULT_CLOSED_CONCURRENCY;
    params.timeout = config.timeout;
    params.warmup = config.warmup;
    params.repeat = config.repeat;
    params.quiet = config.quiet;

    RepeatedRunSummary res;
    rv = runner.run_closed(res, params);
    break;
  }
  case Config::MODE_OPEN: {
    OpenLoopParams params;
    params.rps = config.rps;
    params.duration = config.duration;
    params.concurrency_cap =
        config.concurrency ? config.concurrency : DEFAULT_OPEN_CONCURRENCY;
    params.timeout = config.timeout;
    params.warmup_sec = config.warmup_sec;
    params.repeat = config.repeat;
    params.quiet = config.quiet;

    RepeatedRunSummary res;
    rv = runner.run_open(res, params);
    break;
  }
  case Config::MODE_SWEEP: {
    SweepParams params;
    params.concurrencies = config.concurrencies;
    params.nreqs = config.nreqs;
    params.timeout = config.timeout;
    params.warmup = config.warmup;
    params.repeat = config.repeat;

    SweepResult res;
    rv = runner.run_sweep(res, params);
    break;
  }
  case Config::MODE_PRESET:
    rv = run_preset_mode(runner);
    break;
  }

  if (rv != 0) {
    exit(EXIT_FAILURE);
  }

  return 0;
}

} // namespace h1load

int main(int argc, char **argv) { return h1load::main(argc, argv); }
