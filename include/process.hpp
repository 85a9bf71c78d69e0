#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

namespace Rampart {
namespace Process {

/**
 * @brief Result of a child process whose standard output was captured.
 */
struct CaptureResult
{
    int exitCode = -1;
    std::string output;
};

/**
 * @brief Runs a program, inheriting the terminal, and waits for it.
 *
 * @param args       argv of the child; args[0] is looked up in PATH.
 * @param workingDir Directory the child changes into first (empty = inherit).
 * @return The child's exit status, or 128 + signal number if it was killed.
 *         127 means the program could not be executed.
 * @throws std::system_error if fork() or waitpid() fails.
 */
int run(const std::vector<std::string>& args,
        const std::string& workingDir = "");

/**
 * @brief Runs a program and collects everything it writes to standard output.
 *
 * Standard error stays attached to the terminal.
 */
CaptureResult capture(const std::vector<std::string>& args,
                      const std::string& workingDir = "");

/**
 * @brief Renders argv as a single printable command line for diagnostics.
 */
std::string describe(const std::vector<std::string>& args);

} // namespace Process
} // namespace Rampart

#endif // PROCESS_HPP
