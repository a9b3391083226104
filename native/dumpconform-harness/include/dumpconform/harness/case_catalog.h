// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file case_catalog.h
 * @brief The static list of conformance cases.
 */

#include <optional>
#include <string>
#include <vector>

#include <dumpconform/fixtures/fixture_format.h>
#include <dumpconform/fixtures/fixture_value.h>

namespace dumpconform::harness {

struct TestCase {
  std::string name;
  fixtures::FixtureFormat format = fixtures::FixtureFormat::kAsn1Der;
  fixtures::FixtureValue fixture_value;
  std::vector<std::string> expected_substrings;
};

/**
 * @brief A check against a subject's command-line surface; no fixture is involved.
 */
struct CliContractCase {
  std::string name;
  // Which subject to run.
  fixtures::FixtureFormat subject = fixtures::FixtureFormat::kAsn1Der;
  std::vector<std::string> args;
  bool expect_success = true;
  // Searched in stdout when expect_success, otherwise in stdout + stderr.
  std::vector<std::string> expected_substrings;
  // If set, encoded in the subject's format and passed as the last argument after args.
  std::optional<fixtures::FixtureValue> fixture_value;
  // One expected substring suffices instead of all of them.
  bool match_any = false;
};

/**
 * @brief ASN.1 cases in run order.
 */
std::vector<TestCase> Asn1Cases();

/**
 * @brief CBOR cases in run order.
 */
std::vector<TestCase> CborCases();

/**
 * @brief Every fixture case: all ASN.1 cases followed by all CBOR cases.
 */
std::vector<TestCase> DefaultCatalog();

/**
 * @brief `--help`, missing-input and `-v <fixture>` checks for both subjects.
 */
std::vector<CliContractCase> CliContractCases();

} // namespace dumpconform::harness
