// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file fixture_format.h
 * @brief Encoding formats a fixture can be produced in.
 */

#include <string_view>

namespace dumpconform::fixtures {

enum class FixtureFormat {
  kAsn1Der,
  kCbor,
};

inline std::string_view FormatName(FixtureFormat format) {
  switch (format) {
    case FixtureFormat::kAsn1Der:
      return "ASN.1";
    case FixtureFormat::kCbor:
      return "CBOR";
  }
  return "unknown";
}

// File suffix used for transient fixture files, including the leading dot.
inline std::string_view FileSuffix(FixtureFormat format) {
  switch (format) {
    case FixtureFormat::kAsn1Der:
      return ".der";
    case FixtureFormat::kCbor:
      return ".cbor";
  }
  return ".bin";
}

} // namespace dumpconform::fixtures
