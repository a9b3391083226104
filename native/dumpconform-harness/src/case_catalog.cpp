// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file case_catalog.cpp
 * @brief Fixture definitions and their expected substrings.
 */

#include "dumpconform/harness/case_catalog.h"

#include <cstdint>
#include <iterator>
#include <utility>

namespace dumpconform::harness {

namespace {

using fixtures::FixtureFormat;
using fixtures::FixtureValue;
using fixtures::MapEntry;

TestCase Asn1(std::string name, FixtureValue value, std::vector<std::string> expected) {
  return TestCase{std::move(name), FixtureFormat::kAsn1Der, std::move(value), std::move(expected)};
}

TestCase Cbor(std::string name, FixtureValue value, std::vector<std::string> expected) {
  return TestCase{std::move(name), FixtureFormat::kCbor, std::move(value), std::move(expected)};
}

MapEntry Entry(std::string key, FixtureValue value) {
  return MapEntry{FixtureValue::Text(std::move(key)), std::move(value)};
}

// Name of a file that is never created; used to provoke the subjects' error path.
constexpr const char* kMissingInput = "dumpconform-nonexistent-input.bin";

} // namespace

std::vector<TestCase> Asn1Cases() {
  std::vector<TestCase> cases;

  cases.push_back(Asn1("ASN.1 Integer (42)", FixtureValue::Integer(42), {"INTEGER", "42"}));
  cases.push_back(Asn1("ASN.1 Integer (-100)", FixtureValue::Integer(-100), {"INTEGER", "-100"}));
  cases.push_back(Asn1("ASN.1 Boolean (true)", FixtureValue::Boolean(true), {"BOOLEAN", "TRUE"}));
  cases.push_back(Asn1("ASN.1 Boolean (false)", FixtureValue::Boolean(false), {"BOOLEAN", "FALSE"}));
  cases.push_back(Asn1("ASN.1 NULL", FixtureValue::Null(), {"NULL"}));

  const std::string hello = "Hello, World!";
  cases.push_back(Asn1("ASN.1 OCTET STRING",
                       FixtureValue::Bytes(std::vector<std::uint8_t>(hello.begin(), hello.end())),
                       {"OCTET STRING", "Hello"}));

  cases.push_back(Asn1("ASN.1 UTF8String", FixtureValue::Text("Testing"), {"UTF8String", "Testing"}));

  cases.push_back(Asn1("ASN.1 SEQUENCE",
                       FixtureValue::List({FixtureValue::Integer(1), FixtureValue::Integer(2), FixtureValue::Integer(3)}),
                       {"SEQUENCE", "INTEGER"}));

  cases.push_back(Asn1("ASN.1 Nested SEQUENCE",
                       FixtureValue::List({FixtureValue::List({FixtureValue::Integer(42)})}),
                       {"SEQUENCE", "INTEGER"}));

  cases.push_back(
      Asn1("ASN.1 OBJECT IDENTIFIER", FixtureValue::ObjectIdentifier("2.5.4.3"), {"OBJECT IDENTIFIER", "2.5.4.3"}));

  return cases;
}

std::vector<TestCase> CborCases() {
  std::vector<TestCase> cases;

  cases.push_back(Cbor("CBOR Unsigned Integer (42)", FixtureValue::Integer(42), {"unsigned", "42"}));
  cases.push_back(Cbor("CBOR Negative Integer (-100)", FixtureValue::Integer(-100), {"negative", "-100"}));
  cases.push_back(Cbor("CBOR Text String", FixtureValue::Text("Hello, World!"), {"text", "Hello"}));
  cases.push_back(Cbor("CBOR Byte String", FixtureValue::Bytes({0x01, 0x02, 0x03, 0x04}), {"bytes"}));

  cases.push_back(Cbor("CBOR Array",
                       FixtureValue::List({FixtureValue::Integer(1),
                                           FixtureValue::Integer(2),
                                           FixtureValue::Integer(3),
                                           FixtureValue::Integer(4),
                                           FixtureValue::Integer(5)}),
                       {"array", "5"}));

  cases.push_back(Cbor("CBOR Map",
                       FixtureValue::Map({Entry("name", FixtureValue::Text("Alice")), Entry("age", FixtureValue::Integer(30))}),
                       {"map", "name", "Alice"}));

  const auto user = FixtureValue::Map({
      Entry("name", FixtureValue::Text("Bob")),
      Entry("roles", FixtureValue::List({FixtureValue::Text("admin"), FixtureValue::Text("user")})),
  });
  cases.push_back(
      Cbor("CBOR Nested Structure", FixtureValue::Map({Entry("user", user)}), {"map", "user", "name", "Bob", "array"}));

  cases.push_back(Cbor("CBOR Boolean (true)", FixtureValue::Boolean(true), {"true"}));
  cases.push_back(Cbor("CBOR Boolean (false)", FixtureValue::Boolean(false), {"false"}));
  cases.push_back(Cbor("CBOR Null", FixtureValue::Null(), {"null"}));
  cases.push_back(Cbor("CBOR Float", FixtureValue::Float(3.14159), {"float", "3.14"}));

  cases.push_back(Cbor("CBOR Mixed Array",
                       FixtureValue::List({FixtureValue::Integer(1),
                                           FixtureValue::Text("hello"),
                                           FixtureValue::Boolean(true),
                                           FixtureValue::Null(),
                                           FixtureValue::Float(3.14)}),
                       {"array", "text", "hello", "true", "null"}));

  cases.push_back(Cbor("CBOR Empty Array", FixtureValue::List({}), {"array", "0"}));
  cases.push_back(Cbor("CBOR Empty Map", FixtureValue::Map({}), {"map", "0"}));

  return cases;
}

std::vector<TestCase> DefaultCatalog() {
  auto cases = Asn1Cases();
  auto cbor = CborCases();
  cases.insert(cases.end(), std::make_move_iterator(cbor.begin()), std::make_move_iterator(cbor.end()));
  return cases;
}

std::vector<CliContractCase> CliContractCases() {
  std::vector<CliContractCase> cases;
  for (const auto subject : {FixtureFormat::kAsn1Der, FixtureFormat::kCbor}) {
    const std::string label = std::string(fixtures::FormatName(subject));
    cases.push_back(CliContractCase{label + " --help prints usage", subject, {"--help"}, true, {"Usage:"}});
    cases.push_back(CliContractCase{label + " missing input reports an error", subject, {kMissingInput}, false, {"error"}});
  }
  cases.push_back(CliContractCase{"ASN.1 -v option",
                                  FixtureFormat::kAsn1Der,
                                  {"-v"},
                                  true,
                                  {"Dumping", "INTEGER"},
                                  FixtureValue::Integer(42),
                                  true});
  cases.push_back(CliContractCase{"CBOR -v option",
                                  FixtureFormat::kCbor,
                                  {"-v"},
                                  true,
                                  {"Dumping", "unsigned", "42"},
                                  FixtureValue::Integer(42),
                                  true});
  return cases;
}

} // namespace dumpconform::harness
