#include "review.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

using namespace Rampart;
using RampartTest::RecordingShell;
using RampartTest::ScriptedLineReader;
using RampartTest::TempDir;

TEST_CASE("Reviewed commit is remembered per recipe", "[review]") {
    TempDir tmp;
    fs::create_directories(tmp.path() / ".git");

    REQUIRE_FALSE(GitRecipeReviewer::reviewedCommit(tmp.path()).has_value());

    GitRecipeReviewer::markReviewed(tmp.path(), "0123456789abcdef0123456789abcdef01234567");
    REQUIRE(GitRecipeReviewer::reviewedCommit(tmp.path()) ==
            std::string("0123456789abcdef0123456789abcdef01234567"));

    GitRecipeReviewer::markReviewed(tmp.path(), "fedcba9876543210fedcba9876543210fedcba98");
    REQUIRE(GitRecipeReviewer::reviewedCommit(tmp.path()) ==
            std::string("fedcba9876543210fedcba9876543210fedcba98"));
}

TEST_CASE("Empty marker counts as never reviewed", "[review]") {
    TempDir tmp;
    tmp.writeFile(".git/rampart-reviewed", "\n");
    REQUIRE_FALSE(GitRecipeReviewer::reviewedCommit(tmp.path()).has_value());
}

namespace {

// A local recipe repository served over file://.
class Upstream
{
public:
    explicit Upstream(const TempDir& tmp)
        : root_(tmp.path() / "aur"), repo_(root_ / "foo.git")
    {
        fs::create_directories(repo_);
        git({"init", "--quiet"});
        commit("pkgname=foo\npkgver=1.0\npkgrel=1\n", "initial");
    }

    std::string url() const { return "file://" + root_.string() + "/"; }

    void commit(const std::string& pkgbuild, const std::string& message)
    {
        std::ofstream(repo_ / "PKGBUILD", std::ios::trunc) << pkgbuild;
        git({"add", "PKGBUILD"});
        git({"-c", "user.name=Rampart Test", "-c", "user.email=test@localhost",
             "commit", "--quiet", "-m", message});
    }

private:
    void git(std::vector<std::string> args) const
    {
        args.insert(args.begin(), "git");
        REQUIRE(Process::run(args, repo_.string()) == 0);
    }

    fs::path root_;
    fs::path repo_;
};

std::string head(const fs::path& dir)
{
    return trim(Process::capture({"git", "rev-parse", "HEAD"}, dir.string()).output);
}

} // namespace

TEST_CASE("Recipe review loop", "[review]") {
    TempDir tmp;
    Upstream upstream(tmp);
    Config config;
    config.gitUrl = upstream.url();
    RecordingShell shell;
    fs::path reviewDir = tmp.path() / "git" / "foo";

    std::ostringstream firstOut;
    ScriptedLineReader firstAnswers({"v", "t", "o"});
    GitRecipeReviewer first(config, firstAnswers, shell, firstOut);
    first.review("foo", reviewDir);

    REQUIRE(fs::exists(reviewDir / "PKGBUILD"));
    REQUIRE(GitRecipeReviewer::reviewedCommit(reviewDir) == head(reviewDir));
    REQUIRE(firstOut.str().find("pkgver=1.0") != std::string::npos);
    REQUIRE(firstOut.str().find("[D]") == std::string::npos);
    REQUIRE(shell.opened == std::vector<fs::path>{reviewDir});
    const std::string reviewed = head(reviewDir);

    SECTION("unchanged recipe is not asked about again") {
        std::ostringstream out;
        ScriptedLineReader none(std::vector<std::string>{});
        GitRecipeReviewer again(config, none, shell, out);
        REQUIRE_NOTHROW(again.review("foo", reviewDir));
        REQUIRE(none.consumed() == 0);
        REQUIRE(out.str().empty());
    }

    SECTION("quitting after an upstream change keeps the old mark") {
        upstream.commit("pkgname=foo\npkgver=1.1\npkgrel=1\n", "update");

        std::ostringstream out;
        ScriptedLineReader answers({"q"});
        GitRecipeReviewer again(config, answers, shell, out);
        REQUIRE_THROWS_AS(again.review("foo", reviewDir), AuditAborted);

        REQUIRE(out.str().find("[D]=diff against last review") != std::string::npos);
        REQUIRE(head(reviewDir) != reviewed);
        REQUIRE(GitRecipeReviewer::reviewedCommit(reviewDir) == reviewed);
    }

    SECTION("diff then accept moves the mark to the new commit") {
        upstream.commit("pkgname=foo\npkgver=1.2\npkgrel=1\n", "update");

        std::ostringstream out;
        ScriptedLineReader answers({"d", "o"});
        GitRecipeReviewer again(config, answers, shell, out);
        again.review("foo", reviewDir);

        REQUIRE(answers.consumed() == 2);
        REQUIRE(GitRecipeReviewer::reviewedCommit(reviewDir) == head(reviewDir));
        REQUIRE(head(reviewDir) != reviewed);
    }
}

TEST_CASE("Missing recipe repository is a review failure", "[review]") {
    TempDir tmp;
    Config config;
    config.gitUrl = "file://" + (tmp.path() / "nowhere").string() + "/";
    RecordingShell shell;
    std::ostringstream out;
    ScriptedLineReader answers(std::vector<std::string>{});
    GitRecipeReviewer reviewer(config, answers, shell, out);

    REQUIRE_THROWS_AS(reviewer.review("foo", tmp.path() / "git" / "foo"), ReviewFailure);
}
