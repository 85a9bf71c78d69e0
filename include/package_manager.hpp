#ifndef PACKAGE_MANAGER_HPP
#define PACKAGE_MANAGER_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Rampart {

/**
 * @brief One archive to install, paired with a target name it provides.
 */
using ArchiveToInstall = std::pair<std::string, std::filesystem::path>;

/**
 * @class PackageManager
 * @brief The system package manager, which owns privileged installation.
 */
class PackageManager
{
public:
    virtual ~PackageManager() = default;

    /**
     * @brief True if the dependency (possibly version-constrained) is already satisfied.
     */
    virtual bool isInstalled(const std::string& dependency) = 0;

    /**
     * @brief True if the dependency can be installed from the system repositories.
     */
    virtual bool isInstallable(const std::string& dependency) = 0;

    /**
     * @brief Installs repository packages as dependencies, skipping those already present.
     *
     * @throws PackageManagerFailure if the installation fails.
     */
    virtual void installRepoPackages(const std::vector<std::string>& names) = 0;

    /**
     * @brief Installs locally built archives in a single transaction.
     *
     * @param archives     Archive files, each tagged with a target it provides.
     * @param asDependency Mark the packages as installed as dependencies.
     * @throws PackageManagerFailure if the installation fails.
     */
    virtual void installLocalArchives(const std::vector<ArchiveToInstall>& archives,
                                      bool asDependency) = 0;
};

/**
 * @class PacmanClient
 * @brief PackageManager driving the pacman command-line tool.
 */
class PacmanClient : public PackageManager
{
public:
    /**
     * @param privilegeCommand Prefix for privileged calls, e.g. "sudo". Empty runs pacman directly.
     */
    explicit PacmanClient(std::string privilegeCommand);

    bool isInstalled(const std::string& dependency) override;
    bool isInstallable(const std::string& dependency) override;
    void installRepoPackages(const std::vector<std::string>& names) override;
    void installLocalArchives(const std::vector<ArchiveToInstall>& archives,
                              bool asDependency) override;

    /**
     * @brief argv of the local archive installation, exposed for diagnostics and tests.
     */
    std::vector<std::string> localInstallCommand(const std::vector<ArchiveToInstall>& archives,
                                                 bool asDependency) const;

private:
    std::string privilegeCommand_;

    std::vector<std::string> privileged(std::vector<std::string> args) const;
};

} // namespace Rampart

#endif // PACKAGE_MANAGER_HPP
