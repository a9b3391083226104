#include <dumpconform/harness/command_line.h>
#include <dumpconform/harness/reporter.h>
#include <dumpconform/harness/suite_runner.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void PrintUsageAndExit(const char* exe) {
  std::cerr << "Usage:\n"
            << "  " << exe << " [--root <dir>] [--asn1-bin <path> --cbor-bin <path>] [--timeout-ms <n>]\n"
            << "        [--no-color] [--cli-checks] [--json-report <file>]\n"
            << "\n"
            << "Runs the ASN.1/CBOR conformance cases against dumpasn1 and dumpcbor.\n"
            << "Binaries are looked up under <dir> (default: current directory) in\n"
            << "target/release, target/debug and ./ unless --asn1-bin/--cbor-bin are given.\n";
  std::exit(2);
}

} // namespace

int main(int argc, char** argv) {
  try {
    auto cl = dumpconform::harness::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (cl.action == dumpconform::harness::CommandLineAction::kUsageError) {
      std::cerr << cl.error << "\n";
      PrintUsageAndExit(argv[0]);
    }
    if (cl.action == dumpconform::harness::CommandLineAction::kShowHelp) {
      PrintUsageAndExit(argv[0]);
    }

    dumpconform::harness::Reporter reporter(std::cout, cl.options.use_color);
    dumpconform::harness::SuiteRunner runner(
        std::move(cl.options), dumpconform::harness::SuiteCollaborators::Defaults(), reporter);

    const auto report = runner.Run();
    std::cout.flush();
    return report.exit_code;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}
