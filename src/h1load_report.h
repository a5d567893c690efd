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
#ifndef H1LOAD_REPORT_H
#define H1LOAD_REPORT_H

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace h1load {

// One result row of a preset.  Numeric fields which do not apply to
// the phase hold a negative value and are written as empty field.
struct ReportRow {
  ReportRow();
  // "closed_sweep" or "open_loop"
  std::string phase;
  std::string profile;
  std::string url;
  // local time when the preset started, like 2024-05-01T12:00:00
  std::string timestamp;
  // sweep: tested concurrency; open-loop: concurrency cap
  int64_t concurrency;
  // sweep only
  int64_t total_requests;
  // open-loop only
  double open_duration_sec;
  // warmup requests (sweep), or warmup seconds (open-loop)
  double warmup;
  int64_t repeat;
  // open-loop only
  double open_target_rps;
  double throughput_rps;
  double p50_ms;
  double p90_ms;
  double p99_ms;
  // mean failures per run
  double errors;
};

// Receives report rows.
class ReportSink {
public:
  virtual ~ReportSink() {}
  // Returns 0 if it succeeds, or -1.
  virtual int write_row(const ReportRow &row) = 0;
};

// Returns the column names in the order they are written.
const std::vector<std::string> &get_report_columns();

// Returns fields of |row| rendered as strings, in the order of
// get_report_columns().
std::vector<std::string> format_report_row(const ReportRow &row);

// Returns |s| quoted as CSV field if it contains ',', '"', CR or LF.
// Otherwise returns |s| as is.
std::string quote_csv_field(const std::string &s);

// ReportSink writing rows to a CSV file.  The header row is written
// by open().  Each row is flushed so that a preset interrupted in the
// middle leaves the finished rows.
class CsvReport : public ReportSink {
public:
  CsvReport();
  // Creates or truncates |path| and writes header row.  Returns 0 if
  // it succeeds, or -1.
  int open(const std::string &path);
  virtual int write_row(const ReportRow &row);
  const std::string &get_path() const;

private:
  std::ofstream out_;
  std::string path_;
};

} // namespace h1load

#endif // H1LOAD_REPORT_H
