// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "dumpconform/fixtures/capabilities.h"

namespace dumpconform::fixtures {

namespace {

bool IsUsable(const IFixtureEncoder* encoder, FixtureFormat expected) {
  return encoder != nullptr && encoder->Format() == expected && encoder->IsAvailable();
}

} // namespace

Capabilities DetectCapabilities(const IFixtureEncoder* asn1_encoder, const IFixtureEncoder* cbor_encoder) {
  Capabilities caps;
  caps.asn1 = IsUsable(asn1_encoder, FixtureFormat::kAsn1Der);
  caps.cbor = IsUsable(cbor_encoder, FixtureFormat::kCbor);
  return caps;
}

} // namespace dumpconform::fixtures
