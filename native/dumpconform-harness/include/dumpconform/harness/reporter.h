// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file reporter.h
 * @brief Console reporting and the ordered result log.
 */

#include <ostream>
#include <string_view>
#include <vector>

#include "dumpconform/harness/test_result.h"

namespace dumpconform::harness {

/**
 * @brief Owns the result log of a run and prints progress as results arrive.
 *
 * Single writer; results are appended in the order they are recorded and never modified.
 */
class Reporter {
 public:
  /**
   * @param out Destination for all output (the CLI passes std::cout).
   * @param use_color Emit ANSI color escapes around status tags and headers.
   */
  Reporter(std::ostream& out, bool use_color);

  void PrintBanner(std::string_view title);
  void PrintSection(std::string_view title);
  void PrintInfo(std::string_view line);
  void PrintWarning(std::string_view line);
  void PrintError(std::string_view line);

  /**
   * @brief Appends @p result to the log and prints its status line (plus diagnostics on FAIL).
   */
  void Record(TestResult result);

  const std::vector<TestResult>& Results() const { return results_; }

  RunSummary Summary() const { return Summarize(results_); }

  /**
   * @brief Prints the Passed/Failed/Skipped/Total block.
   */
  void PrintSummary();

  int ExitCode() const { return ExitCodeFor(Summary()); }

 private:
  std::string_view Color(std::string_view code) const;

  std::ostream& out_;
  bool use_color_;
  std::vector<TestResult> results_;
};

} // namespace dumpconform::harness
