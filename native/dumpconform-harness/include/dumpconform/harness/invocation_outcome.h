// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file invocation_outcome.h
 * @brief What one run of a subject binary produced.
 */

#include <string>
#include <utility>

namespace dumpconform::harness {

// Message placed in InvocationOutcome::stderr_text when the time budget is exceeded.
inline constexpr const char* kTimeoutMessage = "Timeout";

struct InvocationOutcome {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  bool timed_out = false;
  // Set when the subject could not be run at all; exit_code is -1 and stderr_text holds the reason.
  bool invocation_failed = false;

  static InvocationOutcome Completed(std::string stdout_text, std::string stderr_text, int exit_code) {
    InvocationOutcome o;
    o.stdout_text = std::move(stdout_text);
    o.stderr_text = std::move(stderr_text);
    o.exit_code = exit_code;
    return o;
  }

  static InvocationOutcome Timeout() {
    InvocationOutcome o;
    o.stderr_text = kTimeoutMessage;
    o.exit_code = -1;
    o.timed_out = true;
    return o;
  }

  // The subject never ran to completion (spawn failure, missing binary, I/O error).
  static InvocationOutcome Error(std::string message) {
    InvocationOutcome o;
    o.stderr_text = std::move(message);
    o.exit_code = -1;
    o.invocation_failed = true;
    return o;
  }
};

} // namespace dumpconform::harness
