/**
 * @file Cli.hpp
 * @brief The pathmap command-line tool as a callable function
 *
 * main() forwards its arguments here; tests call it directly with
 * string streams in place of stdout/stderr.
 *
 * Exit codes:
 * - 0: success (exists: the path was found)
 * - 1: operation failed, path not found, or document IO failed
 * - 2: usage error (bad option, unknown command, wrong argument count,
 *      --write without --file, --write with --out, or either one on a
 *      command that does not produce a new tree)
 */

#ifndef PATHMAP_CLI_HPP
#define PATHMAP_CLI_HPP

#include <iosfwd>
#include <string>
#include <vector>

namespace pathmap {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/**
 * @brief Run one pathmap command
 * @param args Command-line arguments without the program name
 * @param out Receives printed values and trees
 * @param err Receives diagnostics
 * @return Process exit code
 */
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace pathmap

#endif // PATHMAP_CLI_HPP
