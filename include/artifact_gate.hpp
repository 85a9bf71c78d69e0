#ifndef ARTIFACT_GATE_HPP
#define ARTIFACT_GATE_HPP

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Rampart {

class ArtifactAuditor;
class Layout;

/**
 * @brief Builds the expected artifact name prefixes, one "{target}-{version}" per target.
 */
std::vector<std::string> buildWhitelist(const std::map<std::string, std::string>& targetVersions);

/**
 * @brief True when `fileName` starts with one of the whitelist prefixes.
 */
bool matchesWhitelist(const std::string& fileName, const std::vector<std::string>& whitelist);

/**
 * @brief Lists the regular files of `directory` whose names match the whitelist.
 *
 * @return Matching paths, sorted by file name.
 * @throws FilesystemError if the directory cannot be read.
 */
std::vector<std::filesystem::path> selectArtifacts(const std::filesystem::path& directory,
                                                   const std::vector<std::string>& whitelist);

/**
 * @class StagingArea
 * @brief Scoped ownership of a package-base's checked-artifact directory.
 *
 * Acquiring wipes whatever the previous batch left behind and recreates
 * the directory empty. Until commit() is called the area is provisional:
 * if it is destroyed uncommitted (an exception unwinds through the gate)
 * every admitted file is renamed back to where it came from and the
 * directory is removed again, so a partial batch can never be picked up
 * by the installer and no audited build output is lost. A file that
 * cannot be moved back keeps the directory alive.
 */
class StagingArea
{
public:
    /**
     * @throws FilesystemError if the directory cannot be cleared or created.
     */
    static StagingArea acquireFresh(const std::filesystem::path& directory);

    StagingArea(StagingArea&& other) noexcept;
    StagingArea& operator=(StagingArea&&) = delete;
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    ~StagingArea();

    const std::filesystem::path& path() const { return directory_; }

    /**
     * @brief Moves a file into the area, keeping its file name.
     *
     * @return The new location.
     * @throws FilesystemError if the rename fails.
     */
    std::filesystem::path admit(const std::filesystem::path& file);

    /**
     * @brief Marks the batch complete; the directory now outlives this object.
     */
    void commit() { committed_ = true; }

private:
    explicit StagingArea(std::filesystem::path directory);

    std::filesystem::path directory_;
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> admitted_; // origin, destination
    bool committed_ = false;
    bool owns_ = true;
};

/**
 * @brief Lists the files currently held in a checked-artifact directory, sorted.
 *
 * @throws FilesystemError if the directory cannot be read.
 */
std::vector<std::filesystem::path> listCheckedArtifacts(const std::filesystem::path& directory);

/**
 * @class ArtifactGate
 * @brief Audits a package-base's build output and promotes it to the checked directory.
 */
class ArtifactGate
{
public:
    ArtifactGate(const Layout& layout, ArtifactAuditor& auditor);

    /**
     * @brief Filters, audits and moves the build artifacts of one package-base.
     *
     * Every whitelisted file is audited before anything moves; a failed or
     * aborted audit propagates and leaves the build directory untouched.
     *
     * @return The paths of the artifacts now in the checked directory.
     */
    std::vector<std::filesystem::path> checkAndMove(const std::string& pkgbase,
                                                    const std::vector<std::string>& whitelist);

private:
    const Layout& layout_;
    ArtifactAuditor& auditor_;
};

} // namespace Rampart

#endif // ARTIFACT_GATE_HPP
