#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

namespace Rampart {

class Config
{
public:
    /**
     * @brief Base URL of the AUR RPC endpoint.
     */
    std::string rpcUrl = "https://aur.archlinux.org/rpc/";

    /**
     * @brief Base URL under which "<pkgbase>.git" recipe repositories live.
     */
    std::string gitUrl = "https://aur.archlinux.org/";

    /**
     * @brief Root of the per-package review directories. Empty means XDG default.
     */
    std::string configDir;

    /**
     * @brief Root of the build and checked-artifact directories. Empty means XDG default.
     */
    std::string cacheDir;

    /**
     * @brief Shell spawned for interactive inspection. Empty means $SHELL, then bash.
     */
    std::string shell;

    /**
     * @brief Recipe build tool invoked inside the sandbox.
     */
    std::string makepkg = "makepkg";

    /**
     * @brief Whether builds are confined with bubblewrap.
     */
    bool bubblewrap = true;

    /**
     * @brief Extra arguments appended to every bwrap invocation.
     */
    std::vector<std::string> bwrapArgs;

    /**
     * @brief Command prefix used for privileged package-manager calls.
     */
    std::string privilegeCommand = "sudo";

    /**
     * @brief Enables debug logging.
     */
    bool verbose = false;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file yields the defaults.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file exists but is not valid.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration from YAML text.
     * @throws ConfigError on malformed content.
     */
    static Config loadFromString(const std::string& yaml);

    /**
     * @brief Returns $XDG_CONFIG_HOME/rampart/config.yaml (or ~/.config/...).
     */
    static std::string defaultPath();

    /**
     * @brief Returns the shell to spawn, resolving the empty default.
     */
    std::string resolvedShell() const;

    /**
     * @brief Prints the effective configuration to standard output.
     */
    void print() const;
};

} // namespace Rampart

#endif // CONFIG_HPP
