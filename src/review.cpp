#include "review.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "terminal.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Rampart {

namespace {

const char* kReviewedMarker = "rampart-reviewed";

fs::path markerPath(const fs::path& reviewDir)
{
    return reviewDir / ".git" / kReviewedMarker;
}

} // namespace

GitRecipeReviewer::GitRecipeReviewer(const Config& config, LineReader& input,
                                     ShellLauncher& shell, std::ostream& out)
    : gitUrl_(config.gitUrl), input_(input), shell_(shell), out_(out)
{
}

std::optional<std::string> GitRecipeReviewer::reviewedCommit(const fs::path& reviewDir)
{
    std::ifstream marker(markerPath(reviewDir));
    if (!marker) {
        return std::nullopt;
    }
    std::string commit;
    std::getline(marker, commit);
    commit = trim(commit);
    if (commit.empty()) {
        return std::nullopt;
    }
    return commit;
}

void GitRecipeReviewer::markReviewed(const fs::path& reviewDir, const std::string& commit)
{
    fs::path path = markerPath(reviewDir);
    std::ofstream marker(path, std::ios::trunc);
    if (!marker) {
        throw FilesystemError("Unable to record reviewed commit", path.string());
    }
    marker << commit << "\n";
    if (!marker.flush()) {
        throw FilesystemError("Unable to record reviewed commit", path.string());
    }
}

void GitRecipeReviewer::runGit(const std::vector<std::string>& args, const fs::path& reviewDir) const
{
    int status = Process::run(args, reviewDir.string());
    if (status != 0) {
        throw ReviewFailure("`" + Process::describe(args) + "` failed with status " +
                            std::to_string(status) + " in " + reviewDir.string());
    }
}

void GitRecipeReviewer::fetch(const std::string& pkgbase, const fs::path& reviewDir) const
{
    std::error_code ec;
    if (fs::exists(reviewDir / ".git", ec)) {
        log_message("Updating recipe of " + pkgbase);
        runGit({"git", "pull", "--ff-only", "--quiet"}, reviewDir);
        return;
    }

    fs::create_directories(reviewDir, ec);
    if (ec) {
        throw FilesystemError("Failed to create repository dir for " + pkgbase +
                              " (" + ec.message() + ")", reviewDir.string());
    }

    std::string url = gitUrl_ + pkgbase + ".git";
    log_message("Fetching recipe of " + pkgbase + " from " + url);
    runGit({"git", "clone", "--quiet", url, reviewDir.string()}, reviewDir.parent_path());
}

std::string GitRecipeReviewer::headCommit(const fs::path& reviewDir) const
{
    Process::CaptureResult result =
        Process::capture({"git", "rev-parse", "HEAD"}, reviewDir.string());
    std::string commit = trim(result.output);
    if (result.exitCode != 0 || commit.empty()) {
        throw ReviewFailure("Cannot determine the checked out commit in " + reviewDir.string() +
                            " (is the recipe repository empty?)");
    }
    return commit;
}

void GitRecipeReviewer::review(const std::string& pkgbase, const fs::path& reviewDir)
{
    fetch(pkgbase, reviewDir);

    const std::string head = headCommit(reviewDir);
    const std::optional<std::string> previous = reviewedCommit(reviewDir);
    if (previous && *previous == head) {
        log_debug("Recipe of " + pkgbase + " already reviewed at " + head);
        return;
    }

    while (true) {
        out_ << "Reviewing recipe " << pkgbase << " at " << head.substr(0, 12) << ". "
             << "[V]=view PKGBUILD, ";
        if (previous) {
            out_ << "[D]=diff against last review, ";
        }
        out_ << "[T]=run shell to inspect, [O]=ok, use package, [Q]=quit. " << std::flush;

        std::string answer = input_.readLine();
        out_ << std::endl;

        if (answer == "v") {
            std::ifstream pkgbuild(reviewDir / "PKGBUILD");
            if (!pkgbuild) {
                log_warning("No PKGBUILD found in " + reviewDir.string());
                continue;
            }
            std::ostringstream contents;
            contents << pkgbuild.rdbuf();
            out_ << contents.str() << std::endl;
        } else if (answer == "d" && previous) {
            runGit({"git", "--no-pager", "diff", *previous, head}, reviewDir);
        } else if (answer == "t") {
            shell_.openShell(reviewDir);
        } else if (answer == "o") {
            markReviewed(reviewDir, head);
            return;
        } else if (answer == "q") {
            throw AuditAborted("Review of " + pkgbase + " aborted, exiting...");
        }
    }
}

} // namespace Rampart
