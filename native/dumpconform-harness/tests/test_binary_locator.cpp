// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_binary_locator.cpp
 * @brief Tests for subject binary discovery.
 */

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "dumpconform/harness/binary_locator.h"
#include "test_support.h"

namespace {

using dumpconform::harness::BinaryPair;
using dumpconform::harness::DefaultCandidatePairs;
using dumpconform::harness::LocateBinaries;
using dumpconform::harness::testing::ScratchDir;

} // namespace

TEST_CASE("Default candidates are release, debug, then the working directory") {
  const auto c = DefaultCandidatePairs();
  REQUIRE(c.size() == 3);
  REQUIRE(c[0].asn1_path == "target/release/dumpasn1");
  REQUIRE(c[0].cbor_path == "target/release/dumpcbor");
  REQUIRE(c[1].asn1_path == "target/debug/dumpasn1");
  REQUIRE(c[1].cbor_path == "target/debug/dumpcbor");
  REQUIRE(c[2].asn1_path == "./dumpasn1");
  REQUIRE(c[2].cbor_path == "./dumpcbor");
}

TEST_CASE("LocateBinaries prefers the release build") {
  ScratchDir dir;
  dir.WriteFile("target/release/dumpasn1", "x");
  dir.WriteFile("target/release/dumpcbor", "x");
  dir.WriteFile("target/debug/dumpasn1", "x");
  dir.WriteFile("target/debug/dumpcbor", "x");

  std::string error;
  const auto found = LocateBinaries(DefaultCandidatePairs(), dir.Path(), error);
  REQUIRE(found.has_value());
  REQUIRE(found->asn1_path == (dir.Path() / "target/release/dumpasn1").string());
  REQUIRE(found->cbor_path == (dir.Path() / "target/release/dumpcbor").string());
}

TEST_CASE("LocateBinaries skips a half-present pair") {
  ScratchDir dir;
  dir.WriteFile("target/release/dumpasn1", "x");
  dir.WriteFile("target/debug/dumpasn1", "x");
  dir.WriteFile("target/debug/dumpcbor", "x");

  std::string error;
  const auto found = LocateBinaries(DefaultCandidatePairs(), dir.Path(), error);
  REQUIRE(found.has_value());
  REQUIRE(found->asn1_path == (dir.Path() / "target/debug/dumpasn1").string());
}

TEST_CASE("LocateBinaries does not accept directories") {
  ScratchDir dir;
  std::filesystem::create_directories(dir.Path() / "dumpasn1");
  std::filesystem::create_directories(dir.Path() / "dumpcbor");

  std::string error;
  REQUIRE_FALSE(LocateBinaries(DefaultCandidatePairs(), dir.Path(), error).has_value());
}

TEST_CASE("LocateBinaries lists every tried pair on failure") {
  ScratchDir dir;
  std::string error;
  REQUIRE_FALSE(LocateBinaries(DefaultCandidatePairs(), dir.Path(), error).has_value());
  REQUIRE(error.find("Could not find binaries") != std::string::npos);
  REQUIRE(error.find("target/release/dumpasn1") != std::string::npos);
  REQUIRE(error.find("target/debug/dumpcbor") != std::string::npos);
  REQUIRE(error.find("dumpcbor") != std::string::npos);
}

TEST_CASE("LocateBinaries uses absolute candidates as given") {
  ScratchDir bins;
  const auto asn1 = bins.WriteFile("a/dumpasn1", "x");
  const auto cbor = bins.WriteFile("b/dumpcbor", "x");
  ScratchDir elsewhere;

  std::string error;
  const auto found =
      LocateBinaries({BinaryPair{asn1.string(), cbor.string()}}, elsewhere.Path(), error);
  REQUIRE(found.has_value());
  REQUIRE(found->asn1_path == asn1.string());
  REQUIRE(found->cbor_path == cbor.string());
}
