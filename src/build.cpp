#include "build.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace Rampart {

const char* const BubblewrapBuilder::kPackageExtension = ".pkg.tar.xz";

BubblewrapBuilder::BubblewrapBuilder(const Config& config)
    : makepkg_(config.makepkg),
      confine_(config.bubblewrap),
      extraArgs_(config.bwrapArgs)
{
}

std::vector<std::pair<std::string, std::string>>
BubblewrapBuilder::pinnedEnvironment(const fs::path& directory)
{
    // makepkg.conf and the caller's environment must not move or recompress the output
    const std::string dir = directory.string();
    return {
        {"PKGEXT", kPackageExtension},
        {"PKGDEST", dir},
        {"SRCDEST", dir},
        {"BUILDDIR", dir},
    };
}

std::vector<std::string> BubblewrapBuilder::command(const fs::path& directory,
                                                    Stage stage, bool offline) const
{
    std::vector<std::string> args;
    const auto environment = pinnedEnvironment(directory);

    if (confine_) {
        const std::string dir = directory.string();
        args = {
            "bwrap",
            "--ro-bind", "/", "/",
            "--dev", "/dev",
            "--proc", "/proc",
            "--tmpfs", "/tmp",
            "--bind", dir, dir,
            "--chdir", dir,
            "--unshare-ipc",
            "--unshare-pid",
            "--unshare-uts",
            "--unshare-cgroup-try",
            "--new-session",
            "--die-with-parent",
        };
        if (stage == Stage::Build && offline) {
            args.push_back("--unshare-net");
        }
        for (const auto& [name, value] : environment) {
            args.push_back("--setenv");
            args.push_back(name);
            args.push_back(value);
        }
        args.insert(args.end(), extraArgs_.begin(), extraArgs_.end());
    } else {
        args.push_back("env");
        for (const auto& [name, value] : environment) {
            args.push_back(name + "=" + value);
        }
    }

    args.push_back(makepkg_);
    if (stage == Stage::FetchSources) {
        args.push_back("--verifysource");
    } else {
        args.push_back("--force");
        args.push_back("--nodeps");
    }
    args.push_back("--noconfirm");
    return args;
}

void BubblewrapBuilder::build(const fs::path& directory, bool offline)
{
    if (!confine_) {
        log_warning("bubblewrap is disabled, building " + directory.string() + " unconfined");
    }

    std::vector<Stage> stages;
    if (offline) {
        stages.push_back(Stage::FetchSources);
    }
    stages.push_back(Stage::Build);

    for (Stage stage : stages) {
        std::vector<std::string> args = command(directory, stage, offline);
        log_debug("Running " + Process::describe(args));

        int status = Process::run(args, directory.string());
        if (status != 0) {
            throw BuildFailure("Build failed in " + directory.string() + " (`" +
                               Process::describe(args) + "` exited with " +
                               std::to_string(status) + ")");
        }
    }
}

} // namespace Rampart
