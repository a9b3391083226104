// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "dumpconform/harness/process_harness.h"

#include <exception>
#include <string>
#include <vector>

#include "dumpconform/harness/temp_fixture_file.h"

namespace dumpconform::harness {

InvocationOutcome InvokeWithFixture(const IProcessRunner& runner,
                                    const std::string& binary_path,
                                    std::span<const std::uint8_t> fixture,
                                    fixtures::FixtureFormat format,
                                    std::uint32_t timeout_ms) {
  return InvokeWithFixture(runner, binary_path, {}, fixture, format, timeout_ms);
}

InvocationOutcome InvokeWithFixture(const IProcessRunner& runner,
                                    const std::string& binary_path,
                                    const std::vector<std::string>& leading_args,
                                    std::span<const std::uint8_t> fixture,
                                    fixtures::FixtureFormat format,
                                    std::uint32_t timeout_ms) {
  std::string error;
  auto file = TempFixtureFile::Create(fixture, fixtures::FileSuffix(format), error);
  if (!file) {
    return InvocationOutcome::Error("failed to write fixture: " + error);
  }

  std::vector<std::string> args = leading_args;
  args.push_back(file->Path().string());

  try {
    return runner.RunWithTimeout(binary_path, args, timeout_ms);
  } catch (const std::exception& ex) {
    return InvocationOutcome::Error(ex.what());
  }
}

} // namespace dumpconform::harness
