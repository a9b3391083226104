// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file asn1_der_encoder.cpp
 * @brief ASN.1 DER fixture encoder backed by OpenSSL's ASN.1 layer.
 */

#include "dumpconform/fixtures/fixture_encoder.h"

#include <string>
#include <vector>

#include <openssl/asn1.h>
#include <openssl/objects.h>

#include "internal/openssl_utils.h"

namespace dumpconform::fixtures {

namespace {

using internal::Asn1IntegerPtr;
using internal::Asn1ObjectPtr;
using internal::Asn1StringPtr;
using internal::Asn1TypePtr;

// OpenSSL only checks the value pointer for null-ness when setting a BOOLEAN.
int kBooleanTrueMarker = 1;

bool SetPrimitive(ASN1_TYPE* out, const FixtureValue& value, std::string& out_error) {
  switch (value.kind) {
    case ValueKind::kNull:
      ASN1_TYPE_set(out, V_ASN1_NULL, nullptr);
      return true;

    case ValueKind::kBoolean:
      ASN1_TYPE_set(out, V_ASN1_BOOLEAN, value.boolean ? &kBooleanTrueMarker : nullptr);
      return true;

    case ValueKind::kInteger: {
      Asn1IntegerPtr integer(ASN1_INTEGER_new(), &ASN1_INTEGER_free);
      if (!integer || ASN1_INTEGER_set_int64(integer.get(), value.integer) != 1) {
        out_error = internal::LastOpenSslError("ASN1_INTEGER_set_int64 failed");
        return false;
      }
      ASN1_TYPE_set(out, V_ASN1_INTEGER, integer.release());
      return true;
    }

    case ValueKind::kBytes: {
      Asn1StringPtr octets(ASN1_OCTET_STRING_new(), &ASN1_STRING_free);
      if (!octets ||
          ASN1_OCTET_STRING_set(octets.get(), value.bytes.data(), static_cast<int>(value.bytes.size())) != 1) {
        out_error = internal::LastOpenSslError("ASN1_OCTET_STRING_set failed");
        return false;
      }
      ASN1_TYPE_set(out, V_ASN1_OCTET_STRING, octets.release());
      return true;
    }

    case ValueKind::kText: {
      Asn1StringPtr utf8(ASN1_UTF8STRING_new(), &ASN1_STRING_free);
      if (!utf8 || ASN1_STRING_set(utf8.get(), value.text.data(), static_cast<int>(value.text.size())) != 1) {
        out_error = internal::LastOpenSslError("ASN1_STRING_set failed");
        return false;
      }
      ASN1_TYPE_set(out, V_ASN1_UTF8STRING, utf8.release());
      return true;
    }

    case ValueKind::kObjectIdentifier: {
      // no_name = 1: accept dotted-decimal only, never short or long names.
      Asn1ObjectPtr oid(OBJ_txt2obj(value.text.c_str(), 1), &ASN1_OBJECT_free);
      if (!oid) {
        out_error = "invalid OBJECT IDENTIFIER: " + value.text;
        return false;
      }
      ASN1_TYPE_set(out, V_ASN1_OBJECT, oid.release());
      return true;
    }

    case ValueKind::kFloat:
    case ValueKind::kMap:
    case ValueKind::kList:
      break;
  }

  out_error = "ASN.1 DER has no mapping for value kind '" + std::string(ValueKindName(value.kind)) + "'";
  return false;
}

std::optional<std::vector<std::uint8_t>> EncodeValue(const FixtureValue& value, std::string& out_error) {
  if (value.kind == ValueKind::kList) {
    std::vector<std::uint8_t> body;
    for (const auto& item : value.items) {
      auto encoded = EncodeValue(item, out_error);
      if (!encoded) {
        return std::nullopt;
      }
      body.insert(body.end(), encoded->begin(), encoded->end());
    }
    return internal::WrapInSequence(body, out_error);
  }

  Asn1TypePtr type(ASN1_TYPE_new(), &ASN1_TYPE_free);
  if (!type) {
    out_error = "ASN1_TYPE_new failed";
    return std::nullopt;
  }
  if (!SetPrimitive(type.get(), value, out_error)) {
    return std::nullopt;
  }
  return internal::EncodeAsn1Type(type.get(), out_error);
}

} // namespace

class OpenSslAsn1DerEncoder final : public IFixtureEncoder {
 public:
  FixtureFormat Format() const override { return FixtureFormat::kAsn1Der; }

  std::string_view LibraryName() const override { return "OpenSSL"; }

  bool IsAvailable() const override {
    // INTEGER 0 has exactly one DER encoding.
    static const std::vector<std::uint8_t> kExpected = {0x02, 0x01, 0x00};
    std::string error;
    const auto sample = Encode(FixtureValue::Integer(0), error);
    return sample.has_value() && *sample == kExpected;
  }

  std::optional<std::vector<std::uint8_t>> Encode(const FixtureValue& value, std::string& out_error) const override {
    out_error.clear();
    return EncodeValue(value, out_error);
  }
};

const IFixtureEncoder& GetDefaultAsn1DerEncoder() {
  static OpenSslAsn1DerEncoder e;
  return e;
}

} // namespace dumpconform::fixtures
