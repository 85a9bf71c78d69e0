#include "config.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>

using namespace Rampart;
using RampartTest::TempDir;

TEST_CASE("Defaults apply when no configuration exists", "[config]") {
    TempDir tmp;
    Config config = Config::loadFromFile((tmp.path() / "absent.yaml").string());

    REQUIRE(config.rpcUrl == "https://aur.archlinux.org/rpc/");
    REQUIRE(config.gitUrl == "https://aur.archlinux.org/");
    REQUIRE(config.makepkg == "makepkg");
    REQUIRE(config.bubblewrap);
    REQUIRE(config.privilegeCommand == "sudo");
    REQUIRE_FALSE(config.verbose);
    REQUIRE(config.bwrapArgs.empty());
}

TEST_CASE("Every key is read from YAML", "[config]") {
    Config config = Config::loadFromString(
        "rpc_url: http://localhost:8080/rpc\n"
        "git_url: http://localhost:8080\n"
        "config_dir: /srv/rampart/config\n"
        "cache_dir: /srv/rampart/cache\n"
        "shell: zsh\n"
        "makepkg: /opt/makepkg\n"
        "bubblewrap: false\n"
        "bwrap_args: [--bind, /srv/ccache, /srv/ccache]\n"
        "privilege_command: doas\n"
        "verbose: true\n");

    REQUIRE(config.rpcUrl == "http://localhost:8080/rpc/");
    REQUIRE(config.gitUrl == "http://localhost:8080/");
    REQUIRE(config.configDir == "/srv/rampart/config");
    REQUIRE(config.cacheDir == "/srv/rampart/cache");
    REQUIRE(config.resolvedShell() == "zsh");
    REQUIRE(config.makepkg == "/opt/makepkg");
    REQUIRE_FALSE(config.bubblewrap);
    REQUIRE(config.bwrapArgs == std::vector<std::string>{"--bind", "/srv/ccache", "/srv/ccache"});
    REQUIRE(config.privilegeCommand == "doas");
    REQUIRE(config.verbose);
}

TEST_CASE("Empty document keeps the defaults", "[config]") {
    REQUIRE(Config::loadFromString("").makepkg == "makepkg");
}

TEST_CASE("Invalid configuration is a ConfigError", "[config]") {
    REQUIRE_THROWS_AS(Config::loadFromString("- just\n- a list\n"), ConfigError);
    REQUIRE_THROWS_AS(Config::loadFromString("bubblewrap: perhaps\n"), ConfigError);
    REQUIRE_THROWS_AS(Config::loadFromString("bwrap_args: --unshare-all\n"), ConfigError);
    REQUIRE_THROWS_AS(Config::loadFromString("shell: [bash, zsh]\n"), ConfigError);
    REQUIRE_THROWS_AS(Config::loadFromString("rpc_url: [unterminated\n"), ConfigError);

    TempDir tmp;
    fs::path file = tmp.writeFile("config.yaml", "makepkg: {broken\n");
    REQUIRE_THROWS_AS(Config::loadFromFile(file.string()), ConfigError);
}

TEST_CASE("Configuration file is loaded from disk", "[config]") {
    TempDir tmp;
    fs::path file = tmp.writeFile("config.yaml", "privilege_command: ''\nverbose: yes\n");
    Config config = Config::loadFromFile(file.string());
    REQUIRE(config.privilegeCommand.empty());
    REQUIRE(config.verbose);
}

TEST_CASE("Layout places every directory under its root", "[config][layout]") {
    Layout layout("/home/u/.config/rampart", "/home/u/.cache/rampart");

    REQUIRE(layout.reviewDir("foo") == fs::path("/home/u/.config/rampart/pkg/foo"));
    REQUIRE(layout.globalBuildDir() == fs::path("/home/u/.cache/rampart/build"));
    REQUIRE(layout.buildDir("foo") == fs::path("/home/u/.cache/rampart/build/foo"));
    REQUIRE(layout.checkedTarsDir("foo") == fs::path("/home/u/.cache/rampart/checked_tars/foo"));
}

TEST_CASE("Layout honours configured directories", "[config][layout]") {
    Config config;
    config.configDir = "/srv/review";
    config.cacheDir  = "/srv/cache";

    Layout layout = Layout::fromConfig(config);
    REQUIRE(layout.reviewDir("bar") == fs::path("/srv/review/pkg/bar"));
    REQUIRE(layout.checkedTarsDir("bar") == fs::path("/srv/cache/checked_tars/bar"));
}

TEST_CASE("XDG variables take precedence over HOME", "[config][layout]") {
    ::setenv("XDG_CACHE_HOME", "/xdg/cache", 1);
    REQUIRE(Layout::xdgCacheHome() == fs::path("/xdg/cache"));
    ::unsetenv("XDG_CACHE_HOME");

    const char* home = std::getenv("HOME");
    if (home && *home) {
        REQUIRE(Layout::xdgCacheHome() == fs::path(home) / ".cache");
    }
}
