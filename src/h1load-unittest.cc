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
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <CUnit/Basic.h>
// include test cases' include files here
#include "h1load_stats_test.h"
#include "h1load_target_test.h"
#include "h1load_worker_test.h"
#include "h1load_runner_test.h"
#include "h1load_preset_test.h"
#include "h1load_report_test.h"
#include "h1load_log_test.h"
#include "h1load_log.h"
#include "util_test.h"
#include "template_test.h"

static int init_suite1(void) { return 0; }

static int clean_suite1(void) { return 0; }

int main(int argc, char *argv[]) {
  CU_pSuite pSuite = NULL;
  unsigned int num_tests_failed;

  struct sigaction act {};
  act.sa_handler = SIG_IGN;
  sigaction(SIGPIPE, &act, nullptr);

  // error paths are exercised on purpose
  h1load::Log::set_severity_level(h1load::FATAL);

  // initialize the CUnit test registry
  if (CUE_SUCCESS != CU_initialize_registry())
    return CU_get_error();

  // add a suite to the registry
  pSuite = CU_add_suite("h1load_TestSuite", init_suite1, clean_suite1);
  if (NULL == pSuite) {
    CU_cleanup_registry();
    return CU_get_error();
  }

  // add the tests to the suite
  if (!CU_add_test(pSuite, "template_defer", h1load::test_template_defer) ||
      !CU_add_test(pSuite, "template_literals",
                   h1load::test_template_literals) ||
      !CU_add_test(pSuite, "util_strieq", h1load::test_util_strieq) ||
      !CU_add_test(pSuite, "log_format", h1load::test_h1load_log_format) ||
      !CU_add_test(pSuite, "log_severity_by_name",
                   h1load::test_h1load_log_severity_by_name) ||
      !CU_add_test(pSuite, "util_utos", h1load::test_util_utos) ||
      !CU_add_test(pSuite, "util_format_decimal",
                   h1load::test_util_format_decimal) ||
      !CU_add_test(pSuite, "util_format_duration",
                   h1load::test_util_format_duration) ||
      !CU_add_test(pSuite, "util_parse_uint", h1load::test_util_parse_uint) ||
      !CU_add_test(pSuite, "util_parse_double",
                   h1load::test_util_parse_double) ||
      !CU_add_test(pSuite, "util_parse_duration_with_unit",
                   h1load::test_util_parse_duration_with_unit) ||
      !CU_add_test(pSuite, "util_duration_str",
                   h1load::test_util_duration_str) ||
      !CU_add_test(pSuite, "util_split_str", h1load::test_util_split_str) ||
      !CU_add_test(pSuite, "stats_percentile",
                   h1load::test_h1load_stats_percentile) ||
      !CU_add_test(pSuite, "stats_median", h1load::test_h1load_stats_median) ||
      !CU_add_test(pSuite, "stats_compute_latency_stat",
                   h1load::test_h1load_stats_compute_latency_stat) ||
      !CU_add_test(pSuite, "stats_compute_rps",
                   h1load::test_h1load_stats_compute_rps) ||
      !CU_add_test(pSuite, "stats_summarize_runs",
                   h1load::test_h1load_stats_summarize_runs) ||
      !CU_add_test(pSuite, "target_parse", h1load::test_h1load_target_parse) ||
      !CU_add_test(pSuite, "target_parse_defaults",
                   h1load::test_h1load_target_parse_defaults) ||
      !CU_add_test(pSuite, "target_parse_reject",
                   h1load::test_h1load_target_parse_reject) ||
      !CU_add_test(pSuite, "target_make_request",
                   h1load::test_h1load_target_make_request) ||
      !CU_add_test(pSuite, "target_resolve",
                   h1load::test_h1load_target_resolve) ||
      !CU_add_test(pSuite, "report_quote_csv_field",
                   h1load::test_h1load_report_quote_csv_field) ||
      !CU_add_test(pSuite, "report_format_row",
                   h1load::test_h1load_report_format_row) ||
      !CU_add_test(pSuite, "report_csv_file",
                   h1load::test_h1load_report_csv_file) ||
      !CU_add_test(pSuite, "worker_concurrency_gate",
                   h1load::test_h1load_worker_concurrency_gate) ||
      !CU_add_test(pSuite, "worker_closed_loop",
                   h1load::test_h1load_worker_closed_loop) ||
      !CU_add_test(pSuite, "worker_closed_loop_refused",
                   h1load::test_h1load_worker_closed_loop_refused) ||
      !CU_add_test(pSuite, "worker_closed_loop_timeout",
                   h1load::test_h1load_worker_closed_loop_timeout) ||
      !CU_add_test(pSuite, "worker_closed_loop_unresolved",
                   h1load::test_h1load_worker_closed_loop_unresolved) ||
      !CU_add_test(pSuite, "worker_open_loop_limits",
                   h1load::test_h1load_worker_open_loop_limits) ||
      !CU_add_test(pSuite, "worker_open_loop_rate",
                   h1load::test_h1load_worker_open_loop_rate) ||
      !CU_add_test(pSuite, "runner_parse_concurrency_list",
                   h1load::test_h1load_runner_parse_concurrency_list) ||
      !CU_add_test(pSuite, "runner_invalid_params",
                   h1load::test_h1load_runner_invalid_params) ||
      !CU_add_test(pSuite, "runner_run_closed",
                   h1load::test_h1load_runner_run_closed) ||
      !CU_add_test(pSuite, "runner_run_closed_failures",
                   h1load::test_h1load_runner_run_closed_failures) ||
      !CU_add_test(pSuite, "runner_run_open",
                   h1load::test_h1load_runner_run_open) ||
      !CU_add_test(pSuite, "runner_run_sweep",
                   h1load::test_h1load_runner_run_sweep) ||
      !CU_add_test(pSuite, "runner_run_sweep_target_goes_away",
                   h1load::test_h1load_runner_run_sweep_target_goes_away) ||
      !CU_add_test(pSuite, "preset_default_profile",
                   h1load::test_h1load_preset_default_profile) ||
      !CU_add_test(pSuite, "preset_override_profile",
                   h1load::test_h1load_preset_override_profile) ||
      !CU_add_test(pSuite, "preset_override_profile_error",
                   h1load::test_h1load_preset_override_profile_error) ||
      !CU_add_test(pSuite, "preset_select_best",
                   h1load::test_h1load_preset_select_best) ||
      !CU_add_test(pSuite, "preset_derive_open_targets",
                   h1load::test_h1load_preset_derive_open_targets) ||
      !CU_add_test(pSuite, "preset_derive_concurrency_cap",
                   h1load::test_h1load_preset_derive_concurrency_cap) ||
      !CU_add_test(pSuite, "preset_run", h1load::test_h1load_preset_run)) {
    CU_cleanup_registry();
    return CU_get_error();
  }

  // Run all tests using the CUnit Basic interface
  CU_basic_set_mode(CU_BRM_VERBOSE);
  CU_basic_run_tests();
  num_tests_failed = CU_get_number_of_tests_failed();
  CU_cleanup_registry();
  if (CU_get_error() == CUE_SUCCESS) {
    return num_tests_failed;
  } else {
    printf("CUnit Error: %s\n", CU_get_error_msg());
    return CU_get_error();
  }
}
