#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/asn1.h>
#include <openssl/objects.h>

namespace dumpconform::internal {

using Asn1TypePtr = std::unique_ptr<ASN1_TYPE, decltype(&ASN1_TYPE_free)>;
using Asn1IntegerPtr = std::unique_ptr<ASN1_INTEGER, decltype(&ASN1_INTEGER_free)>;
using Asn1StringPtr = std::unique_ptr<ASN1_STRING, decltype(&ASN1_STRING_free)>;
using Asn1ObjectPtr = std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)>;

// Serializes a single ASN1_TYPE (universal tag + length + content) to DER.
std::optional<std::vector<std::uint8_t>> EncodeAsn1Type(const ASN1_TYPE* value, std::string& out_error);

// Wraps already-encoded DER elements in a SEQUENCE header.
std::optional<std::vector<std::uint8_t>> WrapInSequence(std::span<const std::uint8_t> body, std::string& out_error);

// Drains the OpenSSL error queue into a single line, or returns @p fallback when it is empty.
std::string LastOpenSslError(const char* fallback);

} // namespace dumpconform::internal
