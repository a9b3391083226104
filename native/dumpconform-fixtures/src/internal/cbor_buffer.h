#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <tinycbor/cbor.h>

namespace dumpconform::internal {

// Runs @p encode against a growing buffer until TinyCBOR stops reporting CborErrorOutOfMemory.
// @p encode must write the number of bytes used into its last argument on success.
inline std::optional<std::vector<std::uint8_t>> EncodeBytesOrResize(
    const std::function<CborError(std::uint8_t*, std::size_t, std::size_t&)>& encode,
    std::string& out_error) {
  std::vector<std::uint8_t> buf(512);
  while (true) {
    std::size_t used = 0;
    const CborError err = encode(buf.data(), buf.size(), used);
    if (err == CborErrorOutOfMemory) {
      buf.resize(buf.size() * 2);
      continue;
    }
    if (err != CborNoError) {
      if (out_error.empty()) {
        out_error = std::string("CBOR encode failed: ") + cbor_error_string(err);
      }
      return std::nullopt;
    }
    buf.resize(used);
    return buf;
  }
}

} // namespace dumpconform::internal
