// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file process_harness.h
 * @brief Runs a subject binary against one fixture.
 */

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <dumpconform/fixtures/fixture_format.h>

#include "dumpconform/harness/invocation_outcome.h"
#include "dumpconform/harness/process_runner.h"

namespace dumpconform::harness {

/**
 * @brief Writes @p fixture to a temporary file, runs `binary_path <file>` and removes the file.
 *
 * Never throws for subject-side problems: a failure to write the fixture, spawn the subject,
 * or an exception escaping @p runner are all folded into InvocationOutcome::Error. The fixture
 * file is gone when this returns, whatever the outcome.
 */
InvocationOutcome InvokeWithFixture(const IProcessRunner& runner,
                                    const std::string& binary_path,
                                    std::span<const std::uint8_t> fixture,
                                    fixtures::FixtureFormat format,
                                    std::uint32_t timeout_ms);

/**
 * @brief As above, but runs `binary_path <leading_args...> <file>`.
 */
InvocationOutcome InvokeWithFixture(const IProcessRunner& runner,
                                    const std::string& binary_path,
                                    const std::vector<std::string>& leading_args,
                                    std::span<const std::uint8_t> fixture,
                                    fixtures::FixtureFormat format,
                                    std::uint32_t timeout_ms);

} // namespace dumpconform::harness
