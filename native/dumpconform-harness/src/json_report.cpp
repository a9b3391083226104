// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "dumpconform/harness/json_report.h"

#include <fstream>
#include <utility>

namespace dumpconform::harness {

nlohmann::json BuildJsonReport(const std::vector<TestResult>& results) {
  const RunSummary s = Summarize(results);

  nlohmann::json items = nlohmann::json::array();
  for (const auto& r : results) {
    nlohmann::json item;
    item["name"] = r.case_name;
    item["group"] = r.group;
    item["status"] = std::string(StatusTag(r.status));
    if (r.diagnostic) {
      item["diagnostic"] = *r.diagnostic;
    }
    if (r.error_code) {
      item["error_code"] = *r.error_code;
    }
    items.push_back(std::move(item));
  }

  nlohmann::json report;
  report["summary"] = {
      {"passed", s.passed},
      {"failed", s.failed},
      {"skipped", s.skipped},
      {"total", s.Total()},
  };
  report["results"] = std::move(items);
  report["exit_code"] = ExitCodeFor(s);
  return report;
}

bool WriteJsonReport(const std::string& path, const std::vector<TestResult>& results, std::string& out_error) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    out_error = "failed to open report file: " + path;
    return false;
  }

  // Subject output may contain arbitrary bytes; replace invalid UTF-8 rather than throwing.
  f << BuildJsonReport(results).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  f.flush();
  if (!f) {
    out_error = "failed to write report file: " + path;
    return false;
  }
  return true;
}

} // namespace dumpconform::harness
