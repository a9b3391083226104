// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file command_line.h
 * @brief Turns the dumpconform command line into HarnessOptions.
 */

#include <string>
#include <vector>

#include "dumpconform/harness/harness_options.h"

namespace dumpconform::harness {

enum class CommandLineAction {
  kRun,
  kShowHelp,
  kUsageError,
};

struct CommandLine {
  CommandLineAction action = CommandLineAction::kRun;
  HarnessOptions options;
  // Set when action is kUsageError.
  std::string error;
};

/**
 * @brief Parses @p args (argv without the program name).
 *
 * Options taking a value consume the next argument verbatim, even if it starts with "--".
 * `--asn1-bin`/`--cbor-bin` must be given together and, when present, replace the default
 * candidate pairs so a wrong path aborts the run instead of falling back to a build directory.
 */
CommandLine ParseCommandLine(const std::vector<std::string>& args);

} // namespace dumpconform::harness
