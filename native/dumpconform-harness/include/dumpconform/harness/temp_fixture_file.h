// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file temp_fixture_file.h
 * @brief Scoped temporary file holding one encoded fixture.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dumpconform::harness {

/**
 * @brief Owns a uniquely-named temporary file and removes it when destroyed.
 *
 * Move-only. A moved-from instance owns nothing.
 */
class TempFixtureFile {
 public:
  /**
   * @brief Creates the file in the system temporary directory and writes @p bytes to it verbatim.
   *
   * @param bytes Fixture content.
   * @param suffix File name suffix including the dot (e.g. ".der").
   * @param out_error Human-readable error message on failure.
   * @return The owning handle; std::nullopt on failure (no file is left behind).
   */
  static std::optional<TempFixtureFile> Create(std::span<const std::uint8_t> bytes,
                                               std::string_view suffix,
                                               std::string& out_error);

  TempFixtureFile(const TempFixtureFile&) = delete;
  TempFixtureFile& operator=(const TempFixtureFile&) = delete;

  TempFixtureFile(TempFixtureFile&& other) noexcept;
  TempFixtureFile& operator=(TempFixtureFile&& other) noexcept;

  ~TempFixtureFile();

  const std::filesystem::path& Path() const { return path_; }

  /**
   * @brief Removes the file now. Safe to call more than once.
   * @return false if the file existed but could not be removed.
   */
  bool Remove(std::string& out_error);

 private:
  explicit TempFixtureFile(std::filesystem::path path);

  std::filesystem::path path_;
};

} // namespace dumpconform::harness
