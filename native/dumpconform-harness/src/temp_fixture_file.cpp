// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file temp_fixture_file.cpp
 * @brief Implementation of TempFixtureFile.
 */

#include "dumpconform/harness/temp_fixture_file.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "internal/unique_fd.h"

namespace dumpconform::harness {

namespace {

bool WriteAll(int fd, std::span<const std::uint8_t> bytes, std::string& out_error) {
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + offset, bytes.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      out_error = std::string("write failed: ") + std::strerror(errno);
      return false;
    }
    offset += static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace

TempFixtureFile::TempFixtureFile(std::filesystem::path path) : path_(std::move(path)) {}

TempFixtureFile::TempFixtureFile(TempFixtureFile&& other) noexcept : path_(std::exchange(other.path_, {})) {}

TempFixtureFile& TempFixtureFile::operator=(TempFixtureFile&& other) noexcept {
  if (this != &other) {
    std::string error;
    if (!Remove(error)) {
      std::cerr << "warning: " << error << "\n";
    }
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

TempFixtureFile::~TempFixtureFile() {
  std::string error;
  if (!Remove(error)) {
    std::cerr << "warning: " << error << "\n";
  }
}

std::optional<TempFixtureFile> TempFixtureFile::Create(std::span<const std::uint8_t> bytes,
                                                       std::string_view suffix,
                                                       std::string& out_error) {
  out_error.clear();

  std::error_code ec;
  const auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    out_error = "no temporary directory: " + ec.message();
    return std::nullopt;
  }

  std::string pattern = (dir / "dumpconform-XXXXXX").string();
  pattern.append(suffix.data(), suffix.size());

  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  internal::UniqueFd fd(::mkstemps(buf.data(), static_cast<int>(suffix.size())));
  if (!fd.Valid()) {
    out_error = std::string("mkstemps failed: ") + std::strerror(errno);
    return std::nullopt;
  }

  // From here on the file exists; the handle removes it on every failure path.
  TempFixtureFile file{std::filesystem::path(buf.data())};

  if (!WriteAll(fd.Get(), bytes, out_error)) {
    return std::nullopt;
  }

  if (::close(fd.Release()) != 0) {
    out_error = std::string("close failed: ") + std::strerror(errno);
    return std::nullopt;
  }

  return std::optional<TempFixtureFile>(std::move(file));
}

bool TempFixtureFile::Remove(std::string& out_error) {
  if (path_.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    out_error = "failed to remove fixture file " + path_.string() + ": " + ec.message();
    return false;
  }

  path_.clear();
  return true;
}

} // namespace dumpconform::harness
