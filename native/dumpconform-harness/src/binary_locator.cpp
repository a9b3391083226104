// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "dumpconform/harness/binary_locator.h"

#include <system_error>

namespace dumpconform::harness {

namespace {

std::filesystem::path Resolve(const std::filesystem::path& search_root, const std::string& candidate) {
  const std::filesystem::path p(candidate);
  if (p.is_absolute() || search_root.empty()) {
    return p;
  }
  return search_root / p;
}

bool IsRegularFile(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec) && !ec;
}

} // namespace

std::vector<BinaryPair> DefaultCandidatePairs() {
  return {
      {"target/release/dumpasn1", "target/release/dumpcbor"},
      {"target/debug/dumpasn1", "target/debug/dumpcbor"},
      {"./dumpasn1", "./dumpcbor"},
  };
}

std::optional<BinaryPair> LocateBinaries(const std::vector<BinaryPair>& candidates,
                                         const std::filesystem::path& search_root,
                                         std::string& out_error) {
  out_error.clear();

  std::string tried;
  for (const auto& candidate : candidates) {
    const auto asn1 = Resolve(search_root, candidate.asn1_path);
    const auto cbor = Resolve(search_root, candidate.cbor_path);
    if (IsRegularFile(asn1) && IsRegularFile(cbor)) {
      return BinaryPair{asn1.string(), cbor.string()};
    }
    tried += "\n  " + asn1.string() + ", " + cbor.string();
  }

  out_error = "Could not find binaries. Tried:" + (tried.empty() ? std::string(" (no candidates)") : tried);
  return std::nullopt;
}

} // namespace dumpconform::harness
