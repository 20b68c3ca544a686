#ifndef RECPOOL_CLI_COMMANDS_H_
#define RECPOOL_CLI_COMMANDS_H_

#include <ostream>
#include <string>
#include <vector>

namespace Recpool {

/**
 * Entry point of recpool-cli, separated from main() so it can be driven from
 * tests.
 * @param args Command-line arguments, args[0] being the program name
 * @param out Receives command output and help text
 * @param err Receives "Error: ..." diagnostics
 * @return Process exit status (0 on success, 1 on error)
 */
int RunCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace Recpool

#endif // RECPOOL_CLI_COMMANDS_H_
