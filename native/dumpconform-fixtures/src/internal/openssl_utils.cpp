#include "openssl_utils.h"

#include <cstring>

#include <openssl/err.h>

namespace dumpconform::internal {

std::optional<std::vector<std::uint8_t>> EncodeAsn1Type(const ASN1_TYPE* value, std::string& out_error) {
  const int len = i2d_ASN1_TYPE(value, nullptr);
  if (len <= 0) {
    out_error = LastOpenSslError("i2d_ASN1_TYPE failed");
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(static_cast<std::size_t>(len));
  unsigned char* p = out.data();
  if (i2d_ASN1_TYPE(value, &p) != len) {
    out_error = "i2d_ASN1_TYPE wrote unexpected length";
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> WrapInSequence(std::span<const std::uint8_t> body, std::string& out_error) {
  const int body_len = static_cast<int>(body.size());
  const int total = ASN1_object_size(1, body_len, V_ASN1_SEQUENCE);
  if (total <= 0) {
    out_error = "ASN1_object_size failed";
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(static_cast<std::size_t>(total));
  unsigned char* p = out.data();
  ASN1_put_object(&p, 1, body_len, V_ASN1_SEQUENCE, V_ASN1_UNIVERSAL);

  const auto header_len = static_cast<std::size_t>(p - out.data());
  if (header_len + body.size() != out.size()) {
    out_error = "ASN1_put_object wrote unexpected header length";
    return std::nullopt;
  }
  if (!body.empty()) {
    std::memcpy(p, body.data(), body.size());
  }
  return out;
}

std::string LastOpenSslError(const char* fallback) {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return fallback;
  }

  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  std::string message(buf);

  // Only the first error is meaningful to a caller; discard the rest.
  ERR_clear_error();
  return message;
}

} // namespace dumpconform::internal
