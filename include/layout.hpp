#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include <filesystem>
#include <string>

namespace Rampart {

class Config;

/**
 * @class Layout
 * @brief Computes the on-disk working directories rampart keeps per package-base.
 *
 *   <configRoot>/pkg/<pkgbase>            reviewed recipe (git checkout)
 *   <cacheRoot>/build                     shared build root
 *   <cacheRoot>/build/<pkgbase>           build working directory
 *   <cacheRoot>/checked_tars/<pkgbase>    audited archives awaiting install
 */
class Layout
{
public:
    Layout(std::filesystem::path configRoot, std::filesystem::path cacheRoot);

    /**
     * @brief Builds a layout from the configuration, falling back to XDG directories.
     */
    static Layout fromConfig(const Config& config);

    /**
     * @brief $XDG_CONFIG_HOME, or ~/.config when unset.
     */
    static std::filesystem::path xdgConfigHome();

    /**
     * @brief $XDG_CACHE_HOME, or ~/.cache when unset.
     */
    static std::filesystem::path xdgCacheHome();

    std::filesystem::path reviewDir(const std::string& pkgbase) const;
    std::filesystem::path globalBuildDir() const;
    std::filesystem::path buildDir(const std::string& pkgbase) const;
    std::filesystem::path checkedTarsDir(const std::string& pkgbase) const;

private:
    std::filesystem::path configRoot_;
    std::filesystem::path cacheRoot_;
};

} // namespace Rampart

#endif // LAYOUT_HPP
