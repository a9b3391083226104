// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file suite_runner.h
 * @brief Drives a full conformance run: locate binaries, detect encoders, run every case, summarize.
 */

#include <vector>

#include <dumpconform/fixtures/capabilities.h>
#include <dumpconform/fixtures/fixture_encoder.h>

#include "dumpconform/harness/binary_locator.h"
#include "dumpconform/harness/case_catalog.h"
#include "dumpconform/harness/harness_options.h"
#include "dumpconform/harness/process_runner.h"
#include "dumpconform/harness/reporter.h"
#include "dumpconform/harness/test_result.h"

namespace dumpconform::harness {

/**
 * @brief How a run ended.
 *
 * kBinariesNotFound and kNoCapabilities abort before any case executes.
 */
enum class RunOutcome {
  kCompleted,
  kBinariesNotFound,
  kNoCapabilities,
};

/**
 * @brief External collaborators of a run. Encoders may be null (treated as unavailable).
 */
struct SuiteCollaborators {
  const fixtures::IFixtureEncoder* asn1_encoder = nullptr;
  const fixtures::IFixtureEncoder* cbor_encoder = nullptr;
  const IProcessRunner* runner = nullptr;

  /**
   * @brief OpenSSL DER encoder, TinyCBOR encoder and the fork/exec runner.
   */
  static SuiteCollaborators Defaults();
};

struct SuiteReport {
  RunOutcome outcome = RunOutcome::kCompleted;
  RunSummary summary;
  int exit_code = 1;
};

class SuiteRunner final {
 public:
  /**
   * @param options Run configuration.
   * @param collaborators Encoders and process runner; `runner` must not be null.
   * @param reporter Receives every result; must outlive the runner.
   */
  SuiteRunner(HarnessOptions options, SuiteCollaborators collaborators, Reporter& reporter);

  /**
   * @brief Runs the default catalog (all ASN.1 cases, then all CBOR cases).
   */
  SuiteReport Run();

  /**
   * @brief Runs @p cases in order, printing a section header whenever the format changes.
   */
  SuiteReport Run(const std::vector<TestCase>& cases);

  /**
   * @brief Runs a single fixture case against already-located binaries.
   *
   * Never throws; every failure is turned into a FAIL (or SKIP) result.
   */
  TestResult RunCase(const TestCase& test_case, const BinaryPair& binaries, const fixtures::Capabilities& caps) const;

  /**
   * @brief Runs a single command-line contract check. Never throws.
   *
   * A check that carries a fixture is skipped when its subject's format cannot be encoded.
   */
  TestResult RunCliCase(const CliContractCase& test_case,
                        const BinaryPair& binaries,
                        const fixtures::Capabilities& caps) const;

 private:
  const fixtures::IFixtureEncoder* EncoderFor(fixtures::FixtureFormat format) const;

  HarnessOptions options_;
  SuiteCollaborators collaborators_;
  Reporter& reporter_;
};

} // namespace dumpconform::harness
