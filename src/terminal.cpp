#include "terminal.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <iostream>
#include <utility>

namespace Rampart {

StdinLineReader::StdinLineReader(std::istream& in)
    : in_(in)
{
}

std::string StdinLineReader::readLine()
{
    std::string line;
    if (!std::getline(in_, line)) {
        // Nobody is left to answer; treat it as the operator walking away.
        throw AuditAborted("Input closed, exiting...");
    }
    return toLower(trim(line));
}

ProcessShellLauncher::ProcessShellLauncher(std::string shell)
    : shell_(std::move(shell))
{
}

void ProcessShellLauncher::openShell(const std::filesystem::path& directory)
{
    std::cerr << "Exit the shell with `logout` or Ctrl-D..." << std::endl;
    int status = Process::run({shell_}, directory.string());
    if (status != 0) {
        log_warning("Shell " + shell_ + " exited with status " + std::to_string(status));
    }
}

} // namespace Rampart
