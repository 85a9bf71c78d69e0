#include "config.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include <iostream>
#include <filesystem>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Rampart {

    namespace {

        // Reads an optional scalar key into `target`, rejecting non-scalar values.
        template <typename T>
        void readScalar(const YAML::Node& root, const char* key, T& target) {
            const YAML::Node node = root[key];
            if (!node || node.IsNull()) {
                return;
            }
            if (!node.IsScalar()) {
                throw ConfigError(std::string("Configuration key '") + key + "' must be a scalar");
            }
            target = node.as<T>();
        }

        Config fromNode(const YAML::Node& root) {
            Config config;

            if (!root || root.IsNull()) {
                return config;
            }
            if (!root.IsMap()) {
                throw ConfigError("Configuration root must be a mapping");
            }

            try {
                readScalar(root, "rpc_url", config.rpcUrl);
                readScalar(root, "git_url", config.gitUrl);
                readScalar(root, "config_dir", config.configDir);
                readScalar(root, "cache_dir", config.cacheDir);
                readScalar(root, "shell", config.shell);
                readScalar(root, "makepkg", config.makepkg);
                readScalar(root, "bubblewrap", config.bubblewrap);
                readScalar(root, "privilege_command", config.privilegeCommand);
                readScalar(root, "verbose", config.verbose);

                const YAML::Node extra = root["bwrap_args"];
                if (extra && !extra.IsNull()) {
                    if (!extra.IsSequence()) {
                        throw ConfigError("Configuration key 'bwrap_args' must be a list");
                    }
                    for (const auto& arg : extra) {
                        config.bwrapArgs.push_back(arg.as<std::string>());
                    }
                }
            } catch (const YAML::Exception& e) {
                throw ConfigError(std::string("Invalid configuration value: ") + e.what());
            }

            if (!config.rpcUrl.empty() && config.rpcUrl.back() != '/') {
                config.rpcUrl += '/';
            }
            if (!config.gitUrl.empty() && config.gitUrl.back() != '/') {
                config.gitUrl += '/';
            }
            return config;
        }

    } // namespace

    Config Config::loadFromFile(const std::string& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Config{};
        }

        try {
            return fromNode(YAML::LoadFile(path));
        } catch (const YAML::Exception& e) {
            throw ConfigError("Unable to parse configuration file " + path + ": " + e.what());
        }
    }

    Config Config::loadFromString(const std::string& yaml) {
        try {
            return fromNode(YAML::Load(yaml));
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Unable to parse configuration: ") + e.what());
        }
    }

    std::string Config::defaultPath() {
        return (Layout::xdgConfigHome() / "rampart" / "config.yaml").string();
    }

    std::string Config::resolvedShell() const {
        if (!shell.empty()) {
            return shell;
        }
        const char* env = std::getenv("SHELL");
        if (env && *env) {
            return env;
        }
        return "bash";
    }

    void Config::print() const {
        std::cout << "rpc_url: " << rpcUrl << "\n"
                  << "git_url: " << gitUrl << "\n"
                  << "config_dir: " << (configDir.empty() ? "(default)" : configDir) << "\n"
                  << "cache_dir: " << (cacheDir.empty() ? "(default)" : cacheDir) << "\n"
                  << "shell: " << resolvedShell() << "\n"
                  << "makepkg: " << makepkg << "\n"
                  << "bubblewrap: " << (bubblewrap ? "true" : "false") << "\n"
                  << "privilege_command: " << privilegeCommand << "\n"
                  << "verbose: " << (verbose ? "true" : "false") << std::endl;

        if (!bwrapArgs.empty()) {
            std::cout << "bwrap_args:" << std::endl;
            for (const auto& arg : bwrapArgs) {
                std::cout << "  - " << arg << std::endl;
            }
        }
    }
}
