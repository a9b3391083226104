// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file fixture_value.cpp
 * @brief FixtureValue factory functions.
 */

#include "dumpconform/fixtures/fixture_value.h"

#include <utility>

namespace dumpconform::fixtures {

std::string_view ValueKindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBoolean:
      return "boolean";
    case ValueKind::kInteger:
      return "integer";
    case ValueKind::kFloat:
      return "float";
    case ValueKind::kBytes:
      return "bytes";
    case ValueKind::kText:
      return "text";
    case ValueKind::kList:
      return "list";
    case ValueKind::kMap:
      return "map";
    case ValueKind::kObjectIdentifier:
      return "object identifier";
  }
  return "unknown";
}

FixtureValue FixtureValue::Null() {
  return FixtureValue{};
}

FixtureValue FixtureValue::Boolean(bool value) {
  FixtureValue v;
  v.kind = ValueKind::kBoolean;
  v.boolean = value;
  return v;
}

FixtureValue FixtureValue::Integer(std::int64_t value) {
  FixtureValue v;
  v.kind = ValueKind::kInteger;
  v.integer = value;
  return v;
}

FixtureValue FixtureValue::Float(double value) {
  FixtureValue v;
  v.kind = ValueKind::kFloat;
  v.real = value;
  return v;
}

FixtureValue FixtureValue::Bytes(std::vector<std::uint8_t> value) {
  FixtureValue v;
  v.kind = ValueKind::kBytes;
  v.bytes = std::move(value);
  return v;
}

FixtureValue FixtureValue::Text(std::string value) {
  FixtureValue v;
  v.kind = ValueKind::kText;
  v.text = std::move(value);
  return v;
}

FixtureValue FixtureValue::List(std::vector<FixtureValue> items) {
  FixtureValue v;
  v.kind = ValueKind::kList;
  v.items = std::move(items);
  return v;
}

FixtureValue FixtureValue::Map(std::vector<MapEntry> entries) {
  FixtureValue v;
  v.kind = ValueKind::kMap;
  v.entries = std::move(entries);
  return v;
}

FixtureValue FixtureValue::ObjectIdentifier(std::string dotted) {
  FixtureValue v;
  v.kind = ValueKind::kObjectIdentifier;
  v.text = std::move(dotted);
  return v;
}

} // namespace dumpconform::fixtures
