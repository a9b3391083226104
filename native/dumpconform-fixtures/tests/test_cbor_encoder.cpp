// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_cbor_encoder.cpp
 * @brief Tests for the TinyCBOR-backed fixture encoder.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "dumpconform/fixtures/fixture_encoder.h"

namespace {

using dumpconform::fixtures::FixtureValue;
using dumpconform::fixtures::MapEntry;
using Bytes = std::vector<std::uint8_t>;

Bytes EncodeOrFail(const FixtureValue& value) {
  std::string error;
  auto out = dumpconform::fixtures::GetDefaultCborEncoder().Encode(value, error);
  INFO(error);
  REQUIRE(out.has_value());
  return *out;
}

} // namespace

TEST_CASE("CBOR encoder reports TinyCBOR and is available") {
  const auto& enc = dumpconform::fixtures::GetDefaultCborEncoder();
  REQUIRE(enc.Format() == dumpconform::fixtures::FixtureFormat::kCbor);
  REQUIRE(enc.LibraryName() == "TinyCBOR");
  REQUIRE(enc.IsAvailable());
}

TEST_CASE("CBOR encoder: integers pick major type by sign") {
  REQUIRE(EncodeOrFail(FixtureValue::Integer(42)) == Bytes{0x18, 0x2A});
  REQUIRE(EncodeOrFail(FixtureValue::Integer(-100)) == Bytes{0x38, 0x63});
  REQUIRE(EncodeOrFail(FixtureValue::Integer(5)) == Bytes{0x05});
}

TEST_CASE("CBOR encoder: strings") {
  REQUIRE(EncodeOrFail(FixtureValue::Text("hello")) == Bytes{0x65, 0x68, 0x65, 0x6C, 0x6C, 0x6F});
  REQUIRE(EncodeOrFail(FixtureValue::Bytes({0x01, 0x02, 0x03, 0x04})) == Bytes{0x44, 0x01, 0x02, 0x03, 0x04});
}

TEST_CASE("CBOR encoder: simple values") {
  REQUIRE(EncodeOrFail(FixtureValue::Boolean(true)) == Bytes{0xF5});
  REQUIRE(EncodeOrFail(FixtureValue::Boolean(false)) == Bytes{0xF4});
  REQUIRE(EncodeOrFail(FixtureValue::Null()) == Bytes{0xF6});
}

TEST_CASE("CBOR encoder: float is written as double precision") {
  const auto out = EncodeOrFail(FixtureValue::Float(3.14159));
  REQUIRE(out.size() == 9);
  REQUIRE(out[0] == 0xFB);
  REQUIRE(out[1] == 0x40);
  REQUIRE(out[2] == 0x09);
}

TEST_CASE("CBOR encoder: containers") {
  REQUIRE(EncodeOrFail(FixtureValue::List({})) == Bytes{0x80});
  REQUIRE(EncodeOrFail(FixtureValue::Map({})) == Bytes{0xA0});

  const auto arr = FixtureValue::List({FixtureValue::Integer(1), FixtureValue::Integer(2), FixtureValue::Integer(3)});
  REQUIRE(EncodeOrFail(arr) == Bytes{0x83, 0x01, 0x02, 0x03});

  const auto map = FixtureValue::Map({MapEntry{FixtureValue::Text("a"), FixtureValue::Integer(1)}});
  REQUIRE(EncodeOrFail(map) == Bytes{0xA1, 0x61, 0x61, 0x01});
}

TEST_CASE("CBOR encoder: map keeps insertion order") {
  const auto map = FixtureValue::Map({
      MapEntry{FixtureValue::Text("b"), FixtureValue::Integer(2)},
      MapEntry{FixtureValue::Text("a"), FixtureValue::Integer(1)},
  });
  REQUIRE(EncodeOrFail(map) == Bytes{0xA2, 0x61, 0x62, 0x02, 0x61, 0x61, 0x01});
}

TEST_CASE("CBOR encoder grows its buffer for large values") {
  const auto out = EncodeOrFail(FixtureValue::Bytes(std::vector<std::uint8_t>(2000, 0xAB)));
  REQUIRE(out.size() == 3 + 2000);
  REQUIRE(out[0] == 0x59);
  REQUIRE(out[1] == 0x07);
  REQUIRE(out[2] == 0xD0);
  REQUIRE(out.back() == 0xAB);
}

TEST_CASE("CBOR encoder rejects OBJECT IDENTIFIER") {
  std::string error;
  auto out = dumpconform::fixtures::GetDefaultCborEncoder().Encode(
      FixtureValue::List({FixtureValue::ObjectIdentifier("2.5.4.3")}), error);
  REQUIRE_FALSE(out.has_value());
  REQUIRE(error.find("object identifier") != std::string::npos);
}
