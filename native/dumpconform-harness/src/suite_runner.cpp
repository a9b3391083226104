// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file suite_runner.cpp
 * @brief Implementation of the end-to-end conformance run.
 */

#include "dumpconform/harness/suite_runner.h"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "dumpconform/harness/assertion_engine.h"
#include "dumpconform/harness/json_report.h"
#include "dumpconform/harness/process_harness.h"

namespace dumpconform::harness {

namespace {

using fixtures::FixtureFormat;

constexpr std::string_view kBanner = "ASN.1/CBOR Tools Test Suite";

const std::string& BinaryFor(const BinaryPair& binaries, FixtureFormat format) {
  return format == FixtureFormat::kAsn1Der ? binaries.asn1_path : binaries.cbor_path;
}

TestResult FromJudgment(const std::string& name, const std::string& group, Judgment judgment) {
  switch (judgment.status) {
    case TestStatus::kPass:
      return TestResult::Pass(name, group);
    case TestStatus::kSkip:
      return TestResult::Skip(name, group, judgment.diagnostic.value_or("skipped"));
    case TestStatus::kFail:
      break;
  }
  return TestResult::Fail(name,
                          group,
                          judgment.diagnostic.value_or(""),
                          judgment.error_code.value_or(error_codes::kAssertionMismatch));
}

} // namespace

SuiteCollaborators SuiteCollaborators::Defaults() {
  return SuiteCollaborators{
      .asn1_encoder = &fixtures::GetDefaultAsn1DerEncoder(),
      .cbor_encoder = &fixtures::GetDefaultCborEncoder(),
      .runner = &GetDefaultProcessRunner(),
  };
}

SuiteRunner::SuiteRunner(HarnessOptions options, SuiteCollaborators collaborators, Reporter& reporter)
    : options_(std::move(options)), collaborators_(collaborators), reporter_(reporter) {}

const fixtures::IFixtureEncoder* SuiteRunner::EncoderFor(FixtureFormat format) const {
  return format == FixtureFormat::kAsn1Der ? collaborators_.asn1_encoder : collaborators_.cbor_encoder;
}

SuiteReport SuiteRunner::Run() {
  return Run(DefaultCatalog());
}

SuiteReport SuiteRunner::Run(const std::vector<TestCase>& cases) {
  reporter_.PrintBanner(kBanner);

  std::string error;
  const auto binaries = LocateBinaries(options_.candidates, options_.search_root, error);
  if (!binaries) {
    reporter_.PrintError(error);
    reporter_.PrintInfo("Please build the decoder binaries first.");
    return SuiteReport{.outcome = RunOutcome::kBinariesNotFound, .summary = {}, .exit_code = 1};
  }

  reporter_.PrintInfo("Using binaries:");
  reporter_.PrintInfo("  ASN.1: " + binaries->asn1_path);
  reporter_.PrintInfo("  CBOR:  " + binaries->cbor_path);

  const auto caps = fixtures::DetectCapabilities(collaborators_.asn1_encoder, collaborators_.cbor_encoder);
  for (const auto format : {FixtureFormat::kAsn1Der, FixtureFormat::kCbor}) {
    if (!caps.Supports(format)) {
      reporter_.PrintWarning(std::string(fixtures::FormatName(format)) +
                             " encoder not available; those cases will be skipped.");
    }
  }
  if (!caps.Any()) {
    reporter_.PrintError("No fixture encoder is available; nothing can be tested.");
    return SuiteReport{.outcome = RunOutcome::kNoCapabilities, .summary = {}, .exit_code = 1};
  }

  std::optional<FixtureFormat> current_section;
  for (const auto& test_case : cases) {
    if (current_section != test_case.format) {
      current_section = test_case.format;
      reporter_.PrintSection(std::string(fixtures::FormatName(test_case.format)) + " Tests");
    }
    reporter_.Record(RunCase(test_case, *binaries, caps));
  }

  if (options_.run_cli_checks) {
    reporter_.PrintSection("CLI Contract Tests");
    for (const auto& check : CliContractCases()) {
      reporter_.Record(RunCliCase(check, *binaries, caps));
    }
  }

  reporter_.PrintSummary();

  SuiteReport report{.outcome = RunOutcome::kCompleted, .summary = reporter_.Summary(), .exit_code = reporter_.ExitCode()};

  if (options_.json_report_path) {
    std::string write_error;
    if (!WriteJsonReport(*options_.json_report_path, reporter_.Results(), write_error)) {
      reporter_.PrintError(write_error);
      report.exit_code = 1;
    }
  }

  return report;
}

TestResult SuiteRunner::RunCase(const TestCase& test_case, const BinaryPair& binaries, const fixtures::Capabilities& caps) const {
  const std::string group(fixtures::FormatName(test_case.format));

  const auto* encoder = EncoderFor(test_case.format);
  if (!caps.Supports(test_case.format) || encoder == nullptr) {
    const std::string reason = encoder != nullptr ? std::string(encoder->LibraryName()) + " encoder not available"
                                                  : "no " + group + " encoder";
    return TestResult::Skip(test_case.name, group, reason);
  }

  try {
    std::string error;
    const auto bytes = encoder->Encode(test_case.fixture_value, error);
    if (!bytes) {
      return TestResult::Fail(test_case.name, group, "  Fixture encoding failed: " + error, error_codes::kEncodeError);
    }

    const auto outcome = InvokeWithFixture(*collaborators_.runner,
                                           BinaryFor(binaries, test_case.format),
                                           *bytes,
                                           test_case.format,
                                           options_.timeout_ms);
    return FromJudgment(test_case.name, group, Judge(outcome, test_case.expected_substrings, test_case.format));
  } catch (const std::exception& ex) {
    return TestResult::Fail(test_case.name, group, std::string("  Exception: ") + ex.what(), error_codes::kInvocationError);
  }
}

TestResult SuiteRunner::RunCliCase(const CliContractCase& test_case,
                                   const BinaryPair& binaries,
                                   const fixtures::Capabilities& caps) const {
  const std::string group = "CLI";
  const std::string& binary = BinaryFor(binaries, test_case.subject);

  try {
    InvocationOutcome outcome;
    MatchPolicy policy = MatchPolicy::kCaseInsensitive;

    if (test_case.fixture_value) {
      const auto* encoder = EncoderFor(test_case.subject);
      if (!caps.Supports(test_case.subject) || encoder == nullptr) {
        return TestResult::Skip(
            test_case.name, group, "no " + std::string(fixtures::FormatName(test_case.subject)) + " encoder");
      }

      std::string error;
      const auto bytes = encoder->Encode(*test_case.fixture_value, error);
      if (!bytes) {
        return TestResult::Fail(test_case.name, group, "  Fixture encoding failed: " + error, error_codes::kEncodeError);
      }
      outcome = InvokeWithFixture(
          *collaborators_.runner, binary, test_case.args, *bytes, test_case.subject, options_.timeout_ms);
      policy = MatchPolicyFor(test_case.subject);
    } else {
      outcome = collaborators_.runner->RunWithTimeout(binary, test_case.args, options_.timeout_ms);
    }

    Judgment judgment;
    if (!test_case.expect_success) {
      judgment = JudgeExpectingFailure(outcome, test_case.expected_substrings);
    } else if (test_case.match_any) {
      judgment = JudgeAnyOf(outcome, test_case.expected_substrings, policy);
    } else {
      judgment = Judge(outcome, test_case.expected_substrings, policy);
    }
    return FromJudgment(test_case.name, group, std::move(judgment));
  } catch (const std::exception& ex) {
    return TestResult::Fail(test_case.name, group, std::string("  Exception: ") + ex.what(), error_codes::kInvocationError);
  }
}

} // namespace dumpconform::harness
