// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file json_report.h
 * @brief Machine-readable form of a run's result log.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dumpconform/harness/test_result.h"

namespace dumpconform::harness {

/**
 * @brief Builds `{"summary": {...}, "results": [...], "exit_code": n}`.
 *
 * Optional fields of a result (diagnostic, error_code) are omitted when absent.
 */
nlohmann::json BuildJsonReport(const std::vector<TestResult>& results);

/**
 * @brief Writes BuildJsonReport(@p results) to @p path, pretty-printed.
 * @return false with @p out_error set if the file cannot be written.
 */
bool WriteJsonReport(const std::string& path, const std::vector<TestResult>& results, std::string& out_error);

} // namespace dumpconform::harness
