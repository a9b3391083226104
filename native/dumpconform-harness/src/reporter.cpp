// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file reporter.cpp
 * @brief Implementation of Reporter and the summary fold.
 */

#include "dumpconform/harness/reporter.h"

#include <string>
#include <utility>

namespace dumpconform::harness {

namespace {

constexpr std::string_view kGreen = "\033[92m";
constexpr std::string_view kRed = "\033[91m";
constexpr std::string_view kYellow = "\033[93m";
constexpr std::string_view kBlue = "\033[94m";
constexpr std::string_view kReset = "\033[0m";

std::string_view StatusColor(TestStatus status) {
  switch (status) {
    case TestStatus::kPass:
      return kGreen;
    case TestStatus::kFail:
      return kRed;
    case TestStatus::kSkip:
      return kYellow;
  }
  return kReset;
}

} // namespace

RunSummary Summarize(const std::vector<TestResult>& results) {
  RunSummary s;
  for (const auto& r : results) {
    switch (r.status) {
      case TestStatus::kPass:
        ++s.passed;
        break;
      case TestStatus::kFail:
        ++s.failed;
        break;
      case TestStatus::kSkip:
        ++s.skipped;
        break;
    }
  }
  return s;
}

int ExitCodeFor(const RunSummary& summary) {
  return summary.failed == 0 ? 0 : 1;
}

Reporter::Reporter(std::ostream& out, bool use_color) : out_(out), use_color_(use_color) {}

std::string_view Reporter::Color(std::string_view code) const {
  return use_color_ ? code : std::string_view();
}

void Reporter::PrintBanner(std::string_view title) {
  out_ << title << "\n" << std::string(50, '=') << "\n";
}

void Reporter::PrintSection(std::string_view title) {
  out_ << "\n" << Color(kBlue) << "=== " << title << " ===" << Color(kReset) << "\n\n";
}

void Reporter::PrintInfo(std::string_view line) {
  out_ << line << "\n";
}

void Reporter::PrintWarning(std::string_view line) {
  out_ << Color(kYellow) << "Warning: " << line << Color(kReset) << "\n";
}

void Reporter::PrintError(std::string_view line) {
  out_ << Color(kRed) << "Error: " << line << Color(kReset) << "\n";
}

void Reporter::Record(TestResult result) {
  out_ << Color(StatusColor(result.status)) << StatusTag(result.status) << Color(kReset) << " " << result.case_name;

  switch (result.status) {
    case TestStatus::kPass:
      out_ << "\n";
      break;
    case TestStatus::kSkip:
      out_ << " (" << result.diagnostic.value_or("skipped") << ")\n";
      break;
    case TestStatus::kFail:
      out_ << "\n";
      if (result.diagnostic) {
        out_ << *result.diagnostic << "\n";
      }
      break;
  }

  results_.push_back(std::move(result));
}

void Reporter::PrintSummary() {
  const RunSummary s = Summary();
  out_ << "\n" << Color(kBlue) << "=== Summary ===" << Color(kReset) << "\n";
  out_ << "Passed:  " << Color(kGreen) << s.passed << Color(kReset) << "\n";
  out_ << "Failed:  " << Color(kRed) << s.failed << Color(kReset) << "\n";
  out_ << "Skipped: " << Color(kYellow) << s.skipped << Color(kReset) << "\n";
  out_ << "Total:   " << s.Total() << "\n";
}

} // namespace dumpconform::harness
