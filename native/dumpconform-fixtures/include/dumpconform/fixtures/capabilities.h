// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file capabilities.h
 * @brief Which fixture formats can be produced in this run.
 */

#include "dumpconform/fixtures/fixture_encoder.h"
#include "dumpconform/fixtures/fixture_format.h"

namespace dumpconform::fixtures {

struct Capabilities {
  bool asn1 = false;
  bool cbor = false;

  bool Supports(FixtureFormat format) const {
    switch (format) {
      case FixtureFormat::kAsn1Der:
        return asn1;
      case FixtureFormat::kCbor:
        return cbor;
    }
    return false;
  }

  bool Any() const { return asn1 || cbor; }
};

/**
 * @brief Checks each encoder once.
 *
 * A null encoder, or one whose Format() does not match its slot, counts as unavailable.
 */
Capabilities DetectCapabilities(const IFixtureEncoder* asn1_encoder, const IFixtureEncoder* cbor_encoder);

} // namespace dumpconform::fixtures
