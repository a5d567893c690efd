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
#include "h1load_report_test.h"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <CUnit/CUnit.h>

#include "h1load_report.h"

namespace h1load {

void test_h1load_report_quote_csv_field(void) {
  CU_ASSERT("alpha" == quote_csv_field("alpha"));
  CU_ASSERT("" == quote_csv_field(""));
  CU_ASSERT("\"a,b\"" == quote_csv_field("a,b"));
  CU_ASSERT("\"a\"\"b\"" == quote_csv_field("a\"b"));
  CU_ASSERT("\"a\nb\"" == quote_csv_field("a\nb"));
}

void test_h1load_report_format_row(void) {
  ReportRow row;
  row.phase = "closed_sweep";
  row.profile = "smoke";
  row.url = "http://127.0.0.1:8000/";
  row.timestamp = "2024-05-01T12:00:00";
  row.concurrency = 10;
  row.total_requests = 1000;
  row.warmup = 200;
  row.repeat = 2;
  row.throughput_rps = 1234.56789;
  row.p50_ms = 1.5;
  row.p90_ms = 2.;
  row.p99_ms = 3.25;
  row.errors = 0.5;

  auto fields = format_report_row(row);

  CU_ASSERT(get_report_columns().size() == fields.size());
  CU_ASSERT("closed_sweep" == fields[0]);
  CU_ASSERT("smoke" == fields[1]);
  CU_ASSERT("10" == fields[4]);
  CU_ASSERT("1000" == fields[5]);
  // open_duration_sec does not apply
  CU_ASSERT("" == fields[6]);
  CU_ASSERT("200" == fields[7]);
  CU_ASSERT("2" == fields[8]);
  // open_target_rps does not apply
  CU_ASSERT("" == fields[9]);
  CU_ASSERT("1234.568" == fields[10]);
  CU_ASSERT("1.5" == fields[11]);
  CU_ASSERT("2" == fields[12]);
  CU_ASSERT("3.25" == fields[13]);
  CU_ASSERT("0.5" == fields[14]);

  row = ReportRow();
  row.phase = "open_loop";
  row.concurrency = 25;
  row.open_duration_sec = 8;
  row.warmup = 3;
  row.open_target_rps = 50;

  fields = format_report_row(row);

  CU_ASSERT("25" == fields[4]);
  CU_ASSERT("" == fields[5]);
  CU_ASSERT("8" == fields[6]);
  CU_ASSERT("3" == fields[7]);
  CU_ASSERT("" == fields[8]);
  CU_ASSERT("50" == fields[9]);
  CU_ASSERT("0" == fields[10]);
}

void test_h1load_report_csv_file(void) {
  char path[] = "/tmp/h1load_report_testXXXXXX";
  auto fd = mkstemp(path);
  CU_ASSERT_FATAL(fd != -1);
  close(fd);

  {
    CsvReport report;

    CU_ASSERT(-1 == report.write_row(ReportRow()));

    CU_ASSERT(0 == report.open(path));
    CU_ASSERT(path == report.get_path());

    ReportRow row;
    row.phase = "closed_sweep";
    row.profile = "smoke";
    row.url = "http://a/?x=1,2";
    row.timestamp = "2024-05-01T12:00:00";
    row.concurrency = 1;
    row.total_requests = 10;
    row.warmup = 0;
    row.repeat = 1;
    row.throughput_rps = 100;

    CU_ASSERT(0 == report.write_row(row));
  }

  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();

  CU_ASSERT("phase,profile,url,timestamp,concurrency,total_requests,"
            "open_duration_sec,warmup,repeat,open_target_rps,throughput_rps,"
            "p50_ms,p90_ms,p99_ms,errors\r\n"
            "closed_sweep,smoke,\"http://a/?x=1,2\",2024-05-01T12:00:00,1,10,,"
            "0,1,,100,0,0,0,0\r\n" == ss.str());

  unlink(path);

  CsvReport report;
  CU_ASSERT(-1 == report.open("/nonexistent-dir/report.csv"));
}

} // namespace h1load
