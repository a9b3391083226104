// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "dumpconform/harness/command_line.h"

#include <cstdint>
#include <exception>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace dumpconform::harness {

namespace {

const std::set<std::string> kValueOptions = {"--root", "--asn1-bin", "--cbor-bin", "--timeout-ms", "--json-report"};
const std::set<std::string> kFlags = {"--no-color", "--cli-checks"};

struct ParsedArgs {
  std::map<std::string, std::string> values;
  std::set<std::string> flags;
};

std::string GetArgValue(const ParsedArgs& parsed, const std::string& name) {
  const auto it = parsed.values.find(name);
  return it == parsed.values.end() ? std::string() : it->second;
}

bool HasFlag(const ParsedArgs& parsed, const std::string& name) {
  return parsed.flags.count(name) != 0;
}

CommandLine UsageError(std::string message) {
  CommandLine cl;
  cl.action = CommandLineAction::kUsageError;
  cl.error = std::move(message);
  return cl;
}

bool ParseTimeout(const std::string& s, std::uint32_t& out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  unsigned long long value = 0;
  try {
    value = std::stoull(s);
  } catch (const std::exception&) {
    return false;
  }
  if (value == 0 || value > static_cast<unsigned long long>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

} // namespace

CommandLine ParseCommandLine(const std::vector<std::string>& args) {
  ParsedArgs parsed;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      CommandLine cl;
      cl.action = CommandLineAction::kShowHelp;
      return cl;
    }
    if (kValueOptions.count(arg) != 0) {
      if (i + 1 >= args.size()) {
        return UsageError("missing value for " + arg);
      }
      parsed.values[arg] = args[++i];
      continue;
    }
    if (kFlags.count(arg) != 0) {
      parsed.flags.insert(arg);
      continue;
    }
    return UsageError("unknown argument: " + arg);
  }

  CommandLine cl;
  HarnessOptions& options = cl.options;

  const std::string root = GetArgValue(parsed, "--root");
  if (!root.empty()) {
    options.search_root = root;
  }

  const std::string asn1Bin = GetArgValue(parsed, "--asn1-bin");
  const std::string cborBin = GetArgValue(parsed, "--cbor-bin");
  if (asn1Bin.empty() != cborBin.empty()) {
    return UsageError("--asn1-bin and --cbor-bin must be given together");
  }
  if (!asn1Bin.empty()) {
    options.candidates = {BinaryPair{asn1Bin, cborBin}};
  }

  const std::string timeout = GetArgValue(parsed, "--timeout-ms");
  if (!timeout.empty() && !ParseTimeout(timeout, options.timeout_ms)) {
    return UsageError("invalid --timeout-ms value: " + timeout);
  }

  const std::string jsonReport = GetArgValue(parsed, "--json-report");
  if (!jsonReport.empty()) {
    options.json_report_path = jsonReport;
  }

  options.use_color = !HasFlag(parsed, "--no-color");
  options.run_cli_checks = HasFlag(parsed, "--cli-checks");
  return cl;
}

} // namespace dumpconform::harness
