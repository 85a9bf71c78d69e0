#include "layout.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <utility>

namespace fs = std::filesystem;

namespace Rampart {

namespace {

fs::path homeDirectory()
{
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw ConfigError("HOME is not set; cannot locate rampart directories");
    }
    return fs::path(home);
}

fs::path xdgOr(const char* variable, const char* fallback)
{
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    return homeDirectory() / fallback;
}

} // namespace

Layout::Layout(fs::path configRoot, fs::path cacheRoot)
    : configRoot_(std::move(configRoot)), cacheRoot_(std::move(cacheRoot))
{
}

Layout Layout::fromConfig(const Config& config)
{
    fs::path configRoot = config.configDir.empty()
                              ? xdgConfigHome() / "rampart"
                              : fs::path(config.configDir);
    fs::path cacheRoot  = config.cacheDir.empty()
                              ? xdgCacheHome() / "rampart"
                              : fs::path(config.cacheDir);
    return Layout(configRoot, cacheRoot);
}

fs::path Layout::xdgConfigHome()
{
    return xdgOr("XDG_CONFIG_HOME", ".config");
}

fs::path Layout::xdgCacheHome()
{
    return xdgOr("XDG_CACHE_HOME", ".cache");
}

fs::path Layout::reviewDir(const std::string& pkgbase) const
{
    return configRoot_ / "pkg" / pkgbase;
}

fs::path Layout::globalBuildDir() const
{
    return cacheRoot_ / "build";
}

fs::path Layout::buildDir(const std::string& pkgbase) const
{
    return globalBuildDir() / pkgbase;
}

fs::path Layout::checkedTarsDir(const std::string& pkgbase) const
{
    return cacheRoot_ / "checked_tars" / pkgbase;
}

} // namespace Rampart
