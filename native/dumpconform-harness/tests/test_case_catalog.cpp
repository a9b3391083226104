// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_case_catalog.cpp
 * @brief Tests for the static case list.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <dumpconform/fixtures/fixture_encoder.h>

#include "dumpconform/harness/case_catalog.h"

namespace {

using dumpconform::fixtures::FixtureFormat;

} // namespace

TEST_CASE("Catalog has ten ASN.1 cases followed by fourteen CBOR cases") {
  const auto cases = dumpconform::harness::DefaultCatalog();
  REQUIRE(cases.size() == 24);
  for (std::size_t i = 0; i < cases.size(); ++i) {
    INFO(cases[i].name);
    REQUIRE(cases[i].format == (i < 10 ? FixtureFormat::kAsn1Der : FixtureFormat::kCbor));
  }
  REQUIRE(cases.front().name == "ASN.1 Integer (42)");
  REQUIRE(cases[9].name == "ASN.1 OBJECT IDENTIFIER");
  REQUIRE(cases[10].name == "CBOR Unsigned Integer (42)");
  REQUIRE(cases.back().name == "CBOR Empty Map");
}

TEST_CASE("Case names are unique and every case has expectations") {
  std::set<std::string> names;
  for (const auto& c : dumpconform::harness::DefaultCatalog()) {
    INFO(c.name);
    REQUIRE(names.insert(c.name).second);
    REQUIRE_FALSE(c.expected_substrings.empty());
  }
}

TEST_CASE("Every catalog fixture is encodable by the default encoders") {
  for (const auto& c : dumpconform::harness::DefaultCatalog()) {
    const auto& encoder = c.format == FixtureFormat::kAsn1Der ? dumpconform::fixtures::GetDefaultAsn1DerEncoder()
                                                              : dumpconform::fixtures::GetDefaultCborEncoder();
    std::string error;
    const auto bytes = encoder.Encode(c.fixture_value, error);
    INFO(c.name << ": " << error);
    REQUIRE(bytes.has_value());
    REQUIRE_FALSE(bytes->empty());
  }
}

TEST_CASE("Known fixtures encode to the expected bytes") {
  const auto cases = dumpconform::harness::DefaultCatalog();
  std::string error;

  const auto integer = dumpconform::fixtures::GetDefaultAsn1DerEncoder().Encode(cases[0].fixture_value, error);
  REQUIRE(integer == std::vector<std::uint8_t>{0x02, 0x01, 0x2A});

  const auto empty_map = dumpconform::fixtures::GetDefaultCborEncoder().Encode(cases.back().fixture_value, error);
  REQUIRE(empty_map == std::vector<std::uint8_t>{0xA0});
}

TEST_CASE("CLI contract checks cover help, missing input and -v for both subjects") {
  const auto checks = dumpconform::harness::CliContractCases();
  REQUIRE(checks.size() == 6);

  int help = 0;
  int missing = 0;
  int verbose = 0;
  for (const auto& c : checks) {
    INFO(c.name);
    if (c.fixture_value) {
      ++verbose;
      REQUIRE(c.args == std::vector<std::string>{"-v"});
      REQUIRE(c.expect_success);
      REQUIRE(c.match_any);
      REQUIRE(c.fixture_value->kind == dumpconform::fixtures::ValueKind::kInteger);
      REQUIRE(c.fixture_value->integer == 42);
      REQUIRE(c.expected_substrings.front() == "Dumping");
    } else if (c.expect_success) {
      ++help;
      REQUIRE(c.args == std::vector<std::string>{"--help"});
      REQUIRE(c.expected_substrings == std::vector<std::string>{"Usage:"});
      REQUIRE_FALSE(c.match_any);
    } else {
      ++missing;
      REQUIRE(c.args.size() == 1);
      REQUIRE(c.expected_substrings == std::vector<std::string>{"error"});
    }
  }
  REQUIRE(help == 2);
  REQUIRE(missing == 2);
  REQUIRE(verbose == 2);
}

TEST_CASE("-v checks expect the decoded 42 in each subject's vocabulary") {
  const auto checks = dumpconform::harness::CliContractCases();
  const auto& asn1 = checks[checks.size() - 2];
  const auto& cbor = checks.back();

  REQUIRE(asn1.name == "ASN.1 -v option");
  REQUIRE(asn1.subject == FixtureFormat::kAsn1Der);
  REQUIRE(asn1.expected_substrings == std::vector<std::string>{"Dumping", "INTEGER"});

  REQUIRE(cbor.name == "CBOR -v option");
  REQUIRE(cbor.subject == FixtureFormat::kCbor);
  REQUIRE(cbor.expected_substrings == std::vector<std::string>{"Dumping", "unsigned", "42"});

  std::string error;
  REQUIRE(dumpconform::fixtures::GetDefaultAsn1DerEncoder().Encode(*asn1.fixture_value, error) ==
          std::vector<std::uint8_t>{0x02, 0x01, 0x2A});
  REQUIRE(dumpconform::fixtures::GetDefaultCborEncoder().Encode(*cbor.fixture_value, error) ==
          std::vector<std::uint8_t>{0x18, 0x2A});
}
