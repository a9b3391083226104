// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file assertion_engine.cpp
 * @brief Implementation of the substring assertion engine.
 */

#include "dumpconform/harness/assertion_engine.h"

#include <algorithm>
#include <cctype>

namespace dumpconform::harness {

namespace {

std::string ToLowerAscii(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

Judgment Failed(std::string diagnostic, const char* error_code) {
  Judgment j;
  j.status = TestStatus::kFail;
  j.diagnostic = std::move(diagnostic);
  j.error_code = error_code;
  return j;
}

Judgment NonZeroExit(const InvocationOutcome& outcome) {
  const char* code = error_codes::kNonZeroExit;
  if (outcome.timed_out) {
    code = error_codes::kTimeout;
  } else if (outcome.invocation_failed) {
    code = error_codes::kInvocationError;
  }
  return Failed("  Non-zero exit code: " + std::to_string(outcome.exit_code) + "\n  stderr: " + outcome.stderr_text,
                code);
}

} // namespace

MatchPolicy MatchPolicyFor(fixtures::FixtureFormat format) {
  switch (format) {
    case fixtures::FixtureFormat::kAsn1Der:
      return MatchPolicy::kCaseSensitive;
    case fixtures::FixtureFormat::kCbor:
      return MatchPolicy::kCaseInsensitive;
  }
  return MatchPolicy::kCaseSensitive;
}

std::vector<std::string> FindMissingSubstrings(std::string_view haystack,
                                               const std::vector<std::string>& expected,
                                               MatchPolicy policy) {
  std::vector<std::string> missing;

  if (policy == MatchPolicy::kCaseSensitive) {
    for (const auto& needle : expected) {
      if (haystack.find(needle) == std::string_view::npos) {
        missing.push_back(needle);
      }
    }
    return missing;
  }

  const std::string lowered = ToLowerAscii(haystack);
  for (const auto& needle : expected) {
    if (lowered.find(ToLowerAscii(needle)) == std::string::npos) {
      missing.push_back(needle);
    }
  }
  return missing;
}

Judgment Judge(const InvocationOutcome& outcome, const std::vector<std::string>& expected, MatchPolicy policy) {
  if (outcome.exit_code != 0) {
    return NonZeroExit(outcome);
  }

  const auto missing = FindMissingSubstrings(outcome.stdout_text, expected, policy);
  if (missing.empty()) {
    Judgment j;
    j.status = TestStatus::kPass;
    return j;
  }

  return Failed("  Expected strings: " + FormatStringList(expected) + "\n  Missing: " + FormatStringList(missing) +
                    "\n  Got output:\n" + outcome.stdout_text,
                error_codes::kAssertionMismatch);
}

Judgment Judge(const InvocationOutcome& outcome,
               const std::vector<std::string>& expected,
               fixtures::FixtureFormat format) {
  return Judge(outcome, expected, MatchPolicyFor(format));
}

Judgment JudgeExpectingFailure(const InvocationOutcome& outcome, const std::vector<std::string>& expected) {
  if (outcome.timed_out) {
    return Failed("  stderr: " + outcome.stderr_text, error_codes::kTimeout);
  }
  if (outcome.invocation_failed) {
    return Failed("  stderr: " + outcome.stderr_text, error_codes::kInvocationError);
  }
  if (outcome.exit_code == 0) {
    return Failed("  Expected a non-zero exit code, got 0\n  Got output:\n" + outcome.stdout_text,
                  error_codes::kZeroExit);
  }

  const std::string combined = outcome.stdout_text + outcome.stderr_text;
  const auto missing = FindMissingSubstrings(combined, expected, MatchPolicy::kCaseInsensitive);
  if (missing.empty()) {
    Judgment j;
    j.status = TestStatus::kPass;
    return j;
  }

  return Failed("  Expected strings: " + FormatStringList(expected) + "\n  Missing: " + FormatStringList(missing) +
                    "\n  Got output:\n" + combined,
                error_codes::kAssertionMismatch);
}

Judgment JudgeAnyOf(const InvocationOutcome& outcome,
                    const std::vector<std::string>& alternatives,
                    MatchPolicy policy) {
  if (outcome.exit_code != 0) {
    return NonZeroExit(outcome);
  }

  const auto missing = FindMissingSubstrings(outcome.stdout_text, alternatives, policy);
  if (alternatives.empty() || missing.size() < alternatives.size()) {
    Judgment j;
    j.status = TestStatus::kPass;
    return j;
  }

  return Failed("  Expected any of: " + FormatStringList(alternatives) + "\n  Got output:\n" + outcome.stdout_text,
                error_codes::kAssertionMismatch);
}

std::string FormatStringList(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += "'" + values[i] + "'";
  }
  out += "]";
  return out;
}

} // namespace dumpconform::harness
