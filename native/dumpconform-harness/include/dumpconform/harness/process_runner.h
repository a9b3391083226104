// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file process_runner.h
 * @brief Abstraction for running a child process under a wall-clock budget.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "dumpconform/harness/invocation_outcome.h"

namespace dumpconform::harness {

/**
 * @brief Spawns a program, captures its output and enforces a timeout.
 *
 * Kept abstract so the harness does not depend on how the timeout is implemented
 * (platform wait-with-deadline, watchdog thread, ...), and so tests can substitute it.
 */
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  /**
   * @brief Runs @p program with @p args and waits at most @p timeout_ms.
   *
   * The program is executed directly, never through a shell. Implementations must not throw
   * for spawn or I/O failures; those are reported through InvocationOutcome::Error.
   *
   * @param program Path to the executable.
   * @param args Arguments, not including argv[0].
   * @param timeout_ms Wall-clock budget; the child is killed when it is exceeded.
   */
  virtual InvocationOutcome RunWithTimeout(const std::string& program,
                                           const std::vector<std::string>& args,
                                           std::uint32_t timeout_ms) const = 0;
};

/**
 * @brief Returns the fork/exec based runner.
 */
const IProcessRunner& GetDefaultProcessRunner();

} // namespace dumpconform::harness
