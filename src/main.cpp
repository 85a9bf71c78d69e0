#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#include <curl/curl.h>

#include "config.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "install.hpp"
#include "metadata.hpp"
#include "package_manager.hpp"
#include "build.hpp"
#include "review.hpp"
#include "tar_check.hpp"
#include "terminal.hpp"
#include "utils.hpp"

namespace {

void printHelp()
{
    std::cout << "Rampart (x86_64)\n"
              << "Usage: rampart [--config <path>] [-v|--verbose] <command> ...\n\n"
              << "Rampart builds packages from the AUR in a confined sandbox and makes\n"
              << "you review every recipe and every built archive before it is installed.\n\n"
              << "Useful commands:\n"
              << "  install [--offline] [--asdeps] <target>...   Build and install targets\n"
              << "  tarcheck <archive>...                        Audit local package archives\n"
              << "  config                                       Show the effective configuration\n"
              << "  help                                         Show this message\n";
}

// Owns libcurl's process-wide state for the lifetime of main().
class CurlGlobal
{
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

int runInstall(const Rampart::Config& config, const std::vector<std::string>& args)
{
    bool offline = false;
    bool asDependency = false;
    std::vector<std::string> targets;

    for (const auto& arg : args) {
        if (arg == "--offline") {
            offline = true;
        }
        else if (arg == "--asdeps") {
            asDependency = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "' for 'install'.\n";
            return Rampart::EXIT_FATAL;
        }
        else {
            targets.push_back(arg);
        }
    }

    if (targets.empty()) {
        std::cerr << "Usage: rampart install [--offline] [--asdeps] <target> [target ...]\n";
        return Rampart::EXIT_FATAL;
    }

    Rampart::Layout layout = Rampart::Layout::fromConfig(config);
    Rampart::StdinLineReader input(std::cin);
    Rampart::ProcessShellLauncher shell(config.resolvedShell());
    Rampart::ArchiveAuditor auditor(input, shell, std::cerr);
    Rampart::AurRpcClient metadata(config.rpcUrl);
    Rampart::PacmanClient packages(config.privilegeCommand);
    Rampart::BubblewrapBuilder builder(config);
    Rampart::GitRecipeReviewer reviewer(config, input, shell, std::cerr);

    Rampart::Installer installer(layout, {metadata, packages, builder, reviewer, auditor, input},
                                 std::cerr);
    installer.install(targets, offline, asDependency);

    Rampart::log_message("Installed " + Rampart::join(targets, ", "));
    return Rampart::EXIT_OK;
}

int runTarcheck(const Rampart::Config& config, const std::vector<std::string>& args)
{
    if (args.empty()) {
        std::cerr << "Usage: rampart tarcheck <archive> [archive ...]\n";
        return Rampart::EXIT_FATAL;
    }

    Rampart::StdinLineReader input(std::cin);
    Rampart::ProcessShellLauncher shell(config.resolvedShell());
    Rampart::ArchiveAuditor auditor(input, shell, std::cerr);

    for (const auto& archive : args) {
        auditor.audit(archive);
    }
    Rampart::log_message("Finished checking package: " + Rampart::join(args, ", "));
    return Rampart::EXIT_OK;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string configPath;
    bool verbose = false;
    int i = 1;

    // Global options come before the command
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 < argc) {
                configPath = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a file argument.\n";
                return Rampart::EXIT_FATAL;
            }
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else {
            break;
        }
    }

    // If no command is supplied, show the help message
    if (i >= argc) {
        printHelp();
        return Rampart::EXIT_OK;
    }

    std::string command = argv[i];
    std::vector<std::string> args(argv + i + 1, argv + argc);

    if (command == "help" || command == "--help" || command == "-h") {
        printHelp();
        return Rampart::EXIT_OK;
    }

    // Builds and reviews run as the invoking user; only pacman is privileged
    if (geteuid() == 0) {
        std::cerr << "Error: rampart must not be run as root.\n";
        return Rampart::EXIT_FATAL;
    }

    CurlGlobal curl;

    try {
        if (configPath.empty()) {
            configPath = Rampart::Config::defaultPath();
        }
        Rampart::Config config = Rampart::Config::loadFromFile(configPath);
        Rampart::setVerbose(verbose || config.verbose);
        Rampart::log_debug("Using configuration " + configPath);

        // -------------------------------------------------------------
        // Install Command
        // -------------------------------------------------------------
        if (command == "install") {
            return runInstall(config, args);
        }
        // -------------------------------------------------------------
        // Tarcheck Command
        // -------------------------------------------------------------
        else if (command == "tarcheck") {
            return runTarcheck(config, args);
        }
        // -------------------------------------------------------------
        // Config Command
        // -------------------------------------------------------------
        else if (command == "config") {
            config.print();
            return Rampart::EXIT_OK;
        }

        std::cerr << "Unknown command: " << command << "\n";
        printHelp();
        return Rampart::EXIT_FATAL;
    }
    catch (const Rampart::PackagesNotFound& e) {
        Rampart::log_error(e.what());
        return e.exitCode();
    }
    catch (const Rampart::AuditAborted& e) {
        std::cerr << e.what() << std::endl;
        return e.exitCode();
    }
    catch (const Rampart::RampartError& e) {
        Rampart::log_error(e.what());
        return e.exitCode();
    }
    catch (const std::exception& e) {
        Rampart::log_error(std::string("Unexpected error: ") + e.what());
        return Rampart::EXIT_FATAL;
    }
}
