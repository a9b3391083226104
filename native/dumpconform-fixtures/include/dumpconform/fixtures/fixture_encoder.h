// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file fixture_encoder.h
 * @brief Abstraction over the trusted reference encoders that produce fixture bytes.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dumpconform/fixtures/fixture_format.h"
#include "dumpconform/fixtures/fixture_value.h"

namespace dumpconform::fixtures {

/**
 * @brief Turns a FixtureValue into correctly encoded bytes for one format.
 *
 * Encoders are treated as an oracle: the harness never checks their output, it only
 * feeds it to the decoder under test.
 */
class IFixtureEncoder {
 public:
  virtual ~IFixtureEncoder() = default;

  virtual FixtureFormat Format() const = 0;

  /**
   * @brief Human-readable name of the library backing this encoder (e.g. "OpenSSL").
   */
  virtual std::string_view LibraryName() const = 0;

  /**
   * @brief Reports whether the backing library can actually encode.
   *
   * Implementations run a small self-test; callers should evaluate this once per run.
   */
  virtual bool IsAvailable() const = 0;

  /**
   * @brief Encodes @p value.
   *
   * @param value Value to encode.
   * @param out_error Human-readable error message on failure.
   * @return Encoded bytes on success; std::nullopt on failure.
   */
  virtual std::optional<std::vector<std::uint8_t>> Encode(const FixtureValue& value,
                                                          std::string& out_error) const = 0;
};

/**
 * @brief Returns the OpenSSL-backed ASN.1 DER encoder.
 */
const IFixtureEncoder& GetDefaultAsn1DerEncoder();

/**
 * @brief Returns the TinyCBOR-backed CBOR encoder.
 */
const IFixtureEncoder& GetDefaultCborEncoder();

} // namespace dumpconform::fixtures
