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
#include "h1load_report.h"

#include <cerrno>
#include <cstring>

#include "h1load_log.h"
#include "util.h"

namespace h1load {

ReportRow::ReportRow()
    : concurrency(-1), total_requests(-1), open_duration_sec(-1), warmup(-1),
      repeat(-1), open_target_rps(-1), throughput_rps(0), p50_ms(0),
      p90_ms(0), p99_ms(0), errors(0) {}

const std::vector<std::string> &get_report_columns() {
  static const std::vector<std::string> columns{
      "phase", "profile", "url", "timestamp", "concurrency",
      "total_requests", "open_duration_sec", "warmup", "repeat",
      "open_target_rps", "throughput_rps", "p50_ms", "p90_ms", "p99_ms",
      "errors"};
  return columns;
}

namespace {
std::string format_int(int64_t n) {
  if (n < 0) {
    return "";
  }
  return util::utos(n);
}
} // namespace

namespace {
std::string format_real(double n) {
  if (n < 0) {
    return "";
  }
  return util::format_decimal(n, 3);
}
} // namespace

std::vector<std::string> format_report_row(const ReportRow &row) {
  return {row.phase,
          row.profile,
          row.url,
          row.timestamp,
          format_int(row.concurrency),
          format_int(row.total_requests),
          format_real(row.open_duration_sec),
          format_real(row.warmup),
          format_int(row.repeat),
          format_real(row.open_target_rps),
          format_real(row.throughput_rps),
          format_real(row.p50_ms),
          format_real(row.p90_ms),
          format_real(row.p99_ms),
          format_real(row.errors)};
}

std::string quote_csv_field(const std::string &s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) {
    return s;
  }

  std::string res;
  res += '"';
  for (auto c : s) {
    if (c == '"') {
      res += '"';
    }
    res += c;
  }
  res += '"';

  return res;
}

namespace {
void write_fields(std::ostream &out, const std::vector<std::string> &fields) {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << quote_csv_field(fields[i]);
  }
  out << "\r\n";
}
} // namespace

CsvReport::CsvReport() {}

int CsvReport::open(const std::string &path) {
  out_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out_) {
    auto error = errno;
    LOG(ERROR) << "Could not open report file " << path << ": "
               << strerror(error);
    return -1;
  }

  path_ = path;

  write_fields(out_, get_report_columns());
  out_.flush();

  if (!out_) {
    LOG(ERROR) << "Could not write report file " << path_;
    return -1;
  }

  return 0;
}

int CsvReport::write_row(const ReportRow &row) {
  if (!out_.is_open()) {
    LOG(ERROR) << "Report file is not open";
    return -1;
  }

  write_fields(out_, format_report_row(row));
  out_.flush();

  if (!out_) {
    LOG(ERROR) << "Could not write report file " << path_;
    return -1;
  }

  return 0;
}

const std::string &CsvReport::get_path() const { return path_; }

} // namespace h1load
