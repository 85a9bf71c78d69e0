#include "package_manager.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <utility>

namespace Rampart {

PacmanClient::PacmanClient(std::string privilegeCommand)
    : privilegeCommand_(std::move(privilegeCommand))
{
}

std::vector<std::string> PacmanClient::privileged(std::vector<std::string> args) const
{
    if (!privilegeCommand_.empty()) {
        args.insert(args.begin(), privilegeCommand_);
    }
    return args;
}

/**
 * @brief `pacman -T` prints nothing and exits 0 when the dependency is satisfied.
 */
bool PacmanClient::isInstalled(const std::string& dependency)
{
    Process::CaptureResult result = Process::capture({"pacman", "-T", dependency});
    return result.exitCode == 0;
}

/**
 * @brief Asks pacman to resolve the dependency against the sync databases
 *        without touching the system.
 */
bool PacmanClient::isInstallable(const std::string& dependency)
{
    Process::CaptureResult result =
        Process::capture({"pacman", "-Sddp", "--print-format", "%n", dependency});
    return result.exitCode == 0;
}

void PacmanClient::installRepoPackages(const std::vector<std::string>& names)
{
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (!isInstalled(name)) {
            missing.push_back(name);
        }
    }
    if (missing.empty()) {
        log_debug("All pacman dependencies are already installed");
        return;
    }

    std::vector<std::string> args = {"pacman", "-S", "--needed", "--asdeps"};
    args.insert(args.end(), missing.begin(), missing.end());
    args = privileged(args);

    log_message("Installing pacman dependencies: " + join(missing, " "));
    int status = Process::run(args);
    if (status != 0) {
        throw PackageManagerFailure("Failed to install pacman dependencies (`" +
                                    Process::describe(args) + "` exited with " +
                                    std::to_string(status) + ")");
    }
}

std::vector<std::string> PacmanClient::localInstallCommand(const std::vector<ArchiveToInstall>& archives,
                                                           bool asDependency) const
{
    std::vector<std::string> args = {"pacman", "-U"};
    if (asDependency) {
        args.push_back("--asdeps");
    }
    for (const auto& archive : archives) {
        args.push_back(archive.second.string());
    }
    return privileged(args);
}

void PacmanClient::installLocalArchives(const std::vector<ArchiveToInstall>& archives,
                                        bool asDependency)
{
    if (archives.empty()) {
        return;
    }

    std::vector<std::string> args = localInstallCommand(archives, asDependency);
    log_debug("Running " + Process::describe(args));
    int status = Process::run(args);
    if (status != 0) {
        throw PackageManagerFailure("Failed to install built packages (`" +
                                    Process::describe(args) + "` exited with " +
                                    std::to_string(status) + ")");
    }

    // Every representative target must be installed once the transaction is done.
    for (const auto& archive : archives) {
        if (!isInstalled(archive.first)) {
            throw PackageManagerFailure("Package " + archive.first + " (" +
                                        archive.second.string() +
                                        ") is not installed after pacman -U");
        }
    }
}

} // namespace Rampart
