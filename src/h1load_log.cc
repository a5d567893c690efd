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
#include "h1load_log.h"

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <chrono>

#include "util.h"
#include "template.h"

namespace h1load {

namespace {
const char *SEVERITY_STR[] = {"INFO", "NOTICE", "WARN", "ERROR", "FATAL"};
} // namespace

namespace {
const char *SEVERITY_COLOR[] = {
    "\033[1;32m", // INFO
    "\033[1;36m", // NOTICE
    "\033[1;33m", // WARN
    "\033[1;31m", // ERROR
    "\033[1;35m", // FATAL
};
} // namespace

int Log::severity_thres_ = NOTICE;

void Log::set_severity_level(int severity) { severity_thres_ = severity; }

int Log::set_severity_level_by_name(const char *name) {
  for (size_t i = 0, max = array_size(SEVERITY_STR); i < max; ++i) {
    if (util::strieq(SEVERITY_STR[i], name)) {
      severity_thres_ = i;
      return 0;
    }
  }
  return -1;
}

Log::Log(int severity, const char *filename, int linenum)
    : filename_(filename), severity_(severity), linenum_(linenum) {}

Log::~Log() {
  if (!log_enabled(severity_)) {
    return;
  }

  auto msg = stream_.str();
  if (msg.empty()) {
    return;
  }

  auto tty = isatty(STDERR_FILENO);
  auto basename = strrchr(filename_, '/');
  basename = basename ? basename + 1 : filename_;

  // Log format: <datetime> <pid> <level> (<filename>:<line>) <msg>
  fprintf(stderr, "%s %d %s%s%s (%s:%d) %s\n",
          util::format_iso8601(std::chrono::system_clock::now()).c_str(),
          getpid(), tty ? SEVERITY_COLOR[severity_] : "",
          SEVERITY_STR[severity_], tty ? "\033[0m" : "", basename, linenum_,
          msg.c_str());
  fflush(stderr);
}

} // namespace h1load
