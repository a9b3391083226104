// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file cbor_encoder.cpp
 * @brief CBOR fixture encoder backed by TinyCBOR.
 */

#include "dumpconform/fixtures/fixture_encoder.h"

#include <string>
#include <vector>

#include <tinycbor/cbor.h>

#include "internal/cbor_buffer.h"

namespace dumpconform::fixtures {

namespace {

CborError EncodeItem(CborEncoder* enc, const FixtureValue& value, std::string& out_error) {
  switch (value.kind) {
    case ValueKind::kNull:
      return cbor_encode_null(enc);

    case ValueKind::kBoolean:
      return cbor_encode_boolean(enc, value.boolean);

    case ValueKind::kInteger:
      return cbor_encode_int(enc, value.integer);

    case ValueKind::kFloat:
      return cbor_encode_double(enc, value.real);

    case ValueKind::kBytes:
      return cbor_encode_byte_string(enc, value.bytes.data(), value.bytes.size());

    case ValueKind::kText:
      return cbor_encode_text_string(enc, value.text.data(), value.text.size());

    case ValueKind::kList: {
      CborEncoder arr;
      CborError err = cbor_encoder_create_array(enc, &arr, value.items.size());
      if (err != CborNoError) return err;

      for (const auto& item : value.items) {
        err = EncodeItem(&arr, item, out_error);
        if (err != CborNoError) return err;
      }
      return cbor_encoder_close_container(enc, &arr);
    }

    case ValueKind::kMap: {
      CborEncoder map;
      CborError err = cbor_encoder_create_map(enc, &map, value.entries.size());
      if (err != CborNoError) return err;

      for (const auto& entry : value.entries) {
        err = EncodeItem(&map, entry.key, out_error);
        if (err != CborNoError) return err;

        err = EncodeItem(&map, entry.value, out_error);
        if (err != CborNoError) return err;
      }
      return cbor_encoder_close_container(enc, &map);
    }

    case ValueKind::kObjectIdentifier:
      break;
  }

  out_error = "CBOR has no mapping for value kind '" + std::string(ValueKindName(value.kind)) + "'";
  return CborErrorUnsupportedType;
}

} // namespace

class TinyCborEncoder final : public IFixtureEncoder {
 public:
  FixtureFormat Format() const override { return FixtureFormat::kCbor; }

  std::string_view LibraryName() const override { return "TinyCBOR"; }

  bool IsAvailable() const override {
    // Unsigned 0 encodes to the single initial byte 0x00.
    static const std::vector<std::uint8_t> kExpected = {0x00};
    std::string error;
    const auto sample = Encode(FixtureValue::Integer(0), error);
    return sample.has_value() && *sample == kExpected;
  }

  std::optional<std::vector<std::uint8_t>> Encode(const FixtureValue& value, std::string& out_error) const override {
    out_error.clear();
    return internal::EncodeBytesOrResize(
        [&](std::uint8_t* buf, std::size_t cap, std::size_t& used) {
          CborEncoder enc;
          cbor_encoder_init(&enc, buf, cap, 0);

          const CborError err = EncodeItem(&enc, value, out_error);
          if (err != CborNoError) return err;

          used = cbor_encoder_get_buffer_size(&enc, buf);
          return CborNoError;
        },
        out_error);
  }
};

const IFixtureEncoder& GetDefaultCborEncoder() {
  static TinyCborEncoder e;
  return e;
}

} // namespace dumpconform::fixtures
