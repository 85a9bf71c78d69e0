#ifndef BUILD_HPP
#define BUILD_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Rampart {

class Config;

/**
 * @class Builder
 * @brief Runs a recipe's build steps inside its build working directory.
 */
class Builder
{
public:
    virtual ~Builder() = default;

    /**
     * @brief Builds the recipe found in `directory`; outputs land in the same directory.
     *
     * @param offline Build without network access once sources are fetched.
     * @throws BuildFailure if any build step fails.
     */
    virtual void build(const std::filesystem::path& directory, bool offline) = 0;
};

/**
 * @class BubblewrapBuilder
 * @brief Builder confining makepkg with bubblewrap.
 *
 * The host filesystem is mounted read-only, /tmp is private and only the
 * build directory is writable. Offline builds first download the sources
 * with network access, then build in a fresh network namespace.
 *
 * makepkg always runs with PKGEXT, PKGDEST, SRCDEST and BUILDDIR pinned, so
 * packages land in the build directory as xz-compressed tarballs whatever
 * makepkg.conf says.
 */
class BubblewrapBuilder : public Builder
{
public:
    enum class Stage
    {
        FetchSources,
        Build
    };

    /// Archive suffix every build is forced to produce.
    static const char* const kPackageExtension;

    explicit BubblewrapBuilder(const Config& config);

    void build(const std::filesystem::path& directory, bool offline) override;

    /**
     * @brief argv for one stage of the build.
     */
    std::vector<std::string> command(const std::filesystem::path& directory,
                                     Stage stage, bool offline) const;

    /**
     * @brief makepkg variables fixed for a build in `directory`, in argv order.
     */
    static std::vector<std::pair<std::string, std::string>>
    pinnedEnvironment(const std::filesystem::path& directory);

private:
    std::string makepkg_;
    bool confine_;
    std::vector<std::string> extraArgs_;
};

} // namespace Rampart

#endif // BUILD_HPP
