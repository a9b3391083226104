// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file assertion_engine.h
 * @brief Substring-based judgment of a subject's output.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <dumpconform/fixtures/fixture_format.h>

#include "dumpconform/harness/invocation_outcome.h"
#include "dumpconform/harness/test_result.h"

namespace dumpconform::harness {

enum class MatchPolicy {
  kCaseSensitive,
  // Both haystack and needle are ASCII-lowercased before searching.
  kCaseInsensitive,
};

/**
 * @brief Fixed per-format policy: ASN.1 output is matched exactly, CBOR output ignoring case.
 */
MatchPolicy MatchPolicyFor(fixtures::FixtureFormat format);

struct Judgment {
  TestStatus status = TestStatus::kFail;
  std::optional<std::string> diagnostic;
  std::optional<std::string> error_code;
};

/**
 * @brief Returns the expected substrings that do not occur in @p haystack.
 */
std::vector<std::string> FindMissingSubstrings(std::string_view haystack,
                                               const std::vector<std::string>& expected,
                                               MatchPolicy policy);

/**
 * @brief Judges one invocation.
 *
 * A nonzero exit code fails the case before stdout is examined. Otherwise every entry of
 * @p expected must occur in stdout under @p policy.
 */
Judgment Judge(const InvocationOutcome& outcome, const std::vector<std::string>& expected, MatchPolicy policy);

/**
 * @brief Convenience overload that applies MatchPolicyFor(@p format).
 */
Judgment Judge(const InvocationOutcome& outcome,
               const std::vector<std::string>& expected,
               fixtures::FixtureFormat format);

/**
 * @brief Judges an invocation that is supposed to be rejected by the subject.
 *
 * Passes only when the subject ran, exited nonzero, and every entry of @p expected occurs
 * (ignoring case) in stdout followed by stderr.
 */
Judgment JudgeExpectingFailure(const InvocationOutcome& outcome, const std::vector<std::string>& expected);

/**
 * @brief Like Judge, but passes when at least one of @p alternatives occurs in stdout.
 */
Judgment JudgeAnyOf(const InvocationOutcome& outcome,
                    const std::vector<std::string>& alternatives,
                    MatchPolicy policy);

/**
 * @brief Renders a list of strings as `['a', 'b']` for diagnostics.
 */
std::string FormatStringList(const std::vector<std::string>& values);

} // namespace dumpconform::harness
