/***
 * Name: wrapcc-classify main
 * Purpose: Entry point for the wrapcc-classify CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on any error).
 * Theory of Operation:
 *   Parse wrapcc options, then classify the remaining compiler arguments and print
 *   the partition. A malformed invocation (missing flag argument) or a bad rule is
 *   reported on stderr.
 */
#include <exception>
#include <iostream>

#include "wrapcc/driver/app.h"
#include "wrapcc/driver/cli.h"
#include "wrapcc/exceptions/wrapcc_exception.h"

using wrapcc::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using wrapcc::driver::ParseCli;
    using wrapcc::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    return wrapcc::driver::RunClassify(opts, std::cout, std::cerr);
  } catch (const wrapcc::exceptions::WrapccException& ex) {
    std::cerr << "wrapcc: error: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "wrapcc: internal error: " << ex.what() << '\n';
    return 2;
  }
}
