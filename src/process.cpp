#include "process.hpp"

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <system_error>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // chdir, fork, execvp, _exit, pipe
#include <errno.h>
#include <cstring>     // strerror
#include <cstdlib>     // EXIT_FAILURE

namespace Rampart {
namespace Process {

    namespace {

        // Exit status a child reports when execvp itself failed.
        constexpr int kExecFailed = 127;

        // Never returns. Runs in the forked child only.
        [[noreturn]] void execChild(const std::vector<std::string>& args,
                                    const std::string& workingDir) {
            if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
                std::cerr << "chdir to " << workingDir << " failed: "
                          << strerror(errno) << std::endl;
                _exit(kExecFailed);
            }

            std::vector<char*> argv;
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr); // Null terminator

            execvp(argv[0], argv.data());

            // If execvp returns, an error occurred
            std::cerr << "execvp failed for command " << args[0] << ": "
                      << strerror(errno) << std::endl;
            _exit(kExecFailed);
        }

        int waitForChild(pid_t pid) {
            int status = 0;
            pid_t waited;
            do {
                waited = waitpid(pid, &status, 0);
            } while (waited < 0 && errno == EINTR);

            if (waited < 0) {
                throw std::system_error(errno, std::system_category(), "waitpid failed");
            }

            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

    } // namespace

    int run(const std::vector<std::string>& args, const std::string& workingDir)
    {
        if (args.empty() || args[0].empty()) {
            throw std::invalid_argument("Process::run called without a command");
        }

        std::cout.flush();
        std::cerr.flush();

        pid_t pid = fork();
        if (pid < 0) {
            throw std::system_error(errno, std::system_category(), "Fork failed");
        }
        if (pid == 0) {
            execChild(args, workingDir);
        }
        return waitForChild(pid);
    }

    CaptureResult capture(const std::vector<std::string>& args, const std::string& workingDir)
    {
        if (args.empty() || args[0].empty()) {
            throw std::invalid_argument("Process::capture called without a command");
        }

        int fds[2];
        if (pipe(fds) != 0) {
            throw std::system_error(errno, std::system_category(), "pipe failed");
        }

        std::cout.flush();
        std::cerr.flush();

        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            close(fds[0]);
            close(fds[1]);
            throw std::system_error(err, std::system_category(), "Fork failed");
        }

        // --- Child Process ---
        if (pid == 0) {
            close(fds[0]);
            if (dup2(fds[1], STDOUT_FILENO) < 0) {
                _exit(kExecFailed);
            }
            close(fds[1]);
            execChild(args, workingDir);
        }

        // --- Parent Process ---
        close(fds[1]);
        CaptureResult result;
        char buffer[4096];
        while (true) {
            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                int err = errno;
                close(fds[0]);
                // Reap the child; the read error is what gets reported.
                static_cast<void>(waitForChild(pid));
                throw std::system_error(err, std::system_category(), "read from child failed");
            }
        }
        close(fds[0]);

        result.exitCode = waitForChild(pid);
        return result;
    }

    std::string describe(const std::vector<std::string>& args)
    {
        std::string line;
        for (const auto& arg : args) {
            if (!line.empty()) {
                line += ' ';
            }
            if (arg.find_first_of(" \t'\"") != std::string::npos) {
                line += "'" + arg + "'";
            } else {
                line += arg;
            }
        }
        return line;
    }

} // namespace Process
} // namespace Rampart
