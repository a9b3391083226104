// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file binary_locator.h
 * @brief Finds the two decoder executables under test.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dumpconform::harness {

struct BinaryPair {
  std::string asn1_path;
  std::string cbor_path;
};

/**
 * @brief Default search order: release build, debug build, current directory.
 */
std::vector<BinaryPair> DefaultCandidatePairs();

/**
 * @brief Returns the first pair whose two paths are both regular files.
 *
 * Relative candidates are resolved against @p search_root. The returned paths are the resolved ones.
 *
 * @param candidates Pairs in priority order.
 * @param search_root Base directory for relative candidates.
 * @param out_error On failure, lists every pair that was tried.
 * @return The winning pair; std::nullopt if no pair is complete.
 */
std::optional<BinaryPair> LocateBinaries(const std::vector<BinaryPair>& candidates,
                                         const std::filesystem::path& search_root,
                                         std::string& out_error);

} // namespace dumpconform::harness
