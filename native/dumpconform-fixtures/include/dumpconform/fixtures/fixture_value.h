// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file fixture_value.h
 * @brief Format-neutral semantic value that the reference encoders turn into fixture bytes.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dumpconform::fixtures {

enum class ValueKind {
  kNull,
  kBoolean,
  kInteger,
  kFloat,
  kBytes,
  kText,
  kList,
  kMap,
  kObjectIdentifier,
};

std::string_view ValueKindName(ValueKind kind);

struct MapEntry;

// A small value tree covering what both encoders need to express.
//
// Mapping to the wire formats:
// - ASN.1: kBoolean -> BOOLEAN, kInteger -> INTEGER, kNull -> NULL, kBytes -> OCTET STRING,
//   kText -> UTF8String, kList -> SEQUENCE, kObjectIdentifier -> OBJECT IDENTIFIER.
// - CBOR: kInteger -> major type 0/1, kBytes -> 2, kText -> 3, kList -> 4, kMap -> 5,
//   kBoolean/kNull -> simple values, kFloat -> double.
// Kinds a format has no mapping for are rejected by that format's encoder.
struct FixtureValue {
  ValueKind kind = ValueKind::kNull;

  bool boolean = false;
  std::int64_t integer = 0;
  double real = 0.0;
  std::vector<std::uint8_t> bytes;

  // Text payload for kText, dotted-decimal form for kObjectIdentifier.
  std::string text;

  std::vector<FixtureValue> items;
  std::vector<MapEntry> entries;

  static FixtureValue Null();
  static FixtureValue Boolean(bool value);
  static FixtureValue Integer(std::int64_t value);
  static FixtureValue Float(double value);
  static FixtureValue Bytes(std::vector<std::uint8_t> value);
  static FixtureValue Text(std::string value);
  static FixtureValue List(std::vector<FixtureValue> items);
  static FixtureValue Map(std::vector<MapEntry> entries);
  static FixtureValue ObjectIdentifier(std::string dotted);
};

struct MapEntry {
  FixtureValue key;
  FixtureValue value;
};

} // namespace dumpconform::fixtures
