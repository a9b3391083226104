// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file harness_options.h
 * @brief Options controlling a conformance run.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dumpconform/harness/binary_locator.h"

namespace dumpconform::harness {

struct HarnessOptions {
  // Candidate subject locations, tried in order.
  std::vector<BinaryPair> candidates = DefaultCandidatePairs();

  // Base directory for relative candidates.
  std::string search_root = ".";

  // Wall-clock budget for a single subject invocation.
  std::uint32_t timeout_ms = 5000;

  bool use_color = true;

  // Also run the --help, missing-input and -v checks after the fixture cases.
  bool run_cli_checks = false;

  // If set, the result log is written here as JSON once the run finishes.
  std::optional<std::string> json_report_path;
};

} // namespace dumpconform::harness
