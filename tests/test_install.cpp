#include "install.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <sstream>

using namespace Rampart;
using namespace RampartTest;

namespace {

// foo (AUR) needs libbar (AUR) and glibc (repositories).
struct InstallFixture {
    TempDir tmp;
    Layout layout{tmp.path() / "config", tmp.path() / "cache"};
    EventLog events;
    FakeMetadata metadata;
    FakePackageManager packages{&events};
    FakeBuilder builder{&events};
    FakeReviewer reviewer{&events};
    RecordingAuditor auditor{&events};
    std::ostringstream out;

    InstallFixture()
    {
        metadata.add("foo", "foo", "1.0-1", {"libbar", "glibc"});
        metadata.add("libbar", "libbar", "2.1-1", {"glibc>=2.30"});
        packages.installable.insert("glibc");

        builder.outputs["foo"] = {"foo-1.0-1-x86_64.pkg.tar.xz"};
        builder.outputs["libbar"] = {"libbar-2.1-1-x86_64.pkg.tar.xz",
                                     "libbar-debug-2.1-1-x86_64.pkg.tar.xz"};
    }

    Installer installer(LineReader& input)
    {
        return Installer(layout, {metadata, packages, builder, reviewer, auditor, input}, out);
    }
};

} // namespace

TEST_CASE("Dependencies are built, audited and installed before their dependents", "[install]") {
    InstallFixture f;
    ScriptedLineReader input({"yes", "o"});
    Installer installer = f.installer(input);

    installer.install({"foo"}, false, false);

    REQUIRE(installer.phase() == Installer::Phase::Done);
    REQUIRE(f.events == EventLog{
        "review:libbar",
        "review:foo",
        "repo:glibc",
        "build:libbar",
        "audit:libbar-2.1-1-x86_64.pkg.tar.xz",
        "install:libbar-2.1-1-x86_64.pkg.tar.xz:asdeps",
        "build:foo",
        "audit:foo-1.0-1-x86_64.pkg.tar.xz",
        "install:foo-1.0-1-x86_64.pkg.tar.xz",
    });

    // Representative targets travel with the archives
    REQUIRE(f.packages.localInstalls.size() == 2);
    REQUIRE(f.packages.localInstalls[0].first[0].first == "libbar");
    REQUIRE(f.packages.localInstalls[1].first[0].first == "foo");
    REQUIRE(f.packages.localInstalls[1].first[0].second ==
            f.layout.checkedTarsDir("foo") / "foo-1.0-1-x86_64.pkg.tar.xz");

    // The unlisted debug package is neither audited nor installed
    REQUIRE(fs::exists(f.layout.buildDir("libbar") / "libbar-debug-2.1-1-x86_64.pkg.tar.xz"));

    // Summary lists the system dependency and the depths, deepest first
    const std::string summary = f.out.str();
    REQUIRE(summary.find("glibc") != std::string::npos);
    REQUIRE(summary.find("libbar (depth 1)") < summary.find("foo (depth 0)"));
}

TEST_CASE("Summary lists split package bases once with their depth", "[install]") {
    InstallFixture f;
    f.metadata.add("app", "app", "1-1", {"libfoo-a", "libfoo-b"});
    f.metadata.add("libfoo-a", "libfoo", "3-1");
    f.metadata.add("libfoo-b", "libfoo", "3-1");
    f.builder.outputs["app"] = {"app-1-1-x86_64.pkg.tar.xz"};
    f.builder.outputs["libfoo"] = {"libfoo-a-3-1-x86_64.pkg.tar.xz",
                                   "libfoo-b-3-1-x86_64.pkg.tar.xz"};
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    installer.install({"app"}, false, false);

    const std::string summary = f.out.str();
    const auto base = summary.find("  libfoo (depth 1)\n");
    REQUIRE(base != std::string::npos);
    REQUIRE(summary.find("  libfoo (depth 1)\n", base + 1) == std::string::npos);
    REQUIRE(summary.find("libfoo-a (depth") == std::string::npos);
    REQUIRE(base < summary.find("  app (depth 0)\n"));
}

TEST_CASE("Requested targets are marked as dependencies on request", "[install]") {
    InstallFixture f;
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    installer.install({"foo"}, true, true);

    REQUIRE(f.packages.localInstalls.size() == 2);
    REQUIRE(f.packages.localInstalls[0].second);
    REQUIRE(f.packages.localInstalls[1].second);
    REQUIRE(f.builder.offlineFlags == std::vector<bool>{true, true});
}

TEST_CASE("Build directory is a fresh copy of the reviewed recipe", "[install]") {
    InstallFixture f;
    f.tmp.writeFile("cache/build/foo/leftover.log", "old run");
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    installer.install({"foo"}, false, false);

    fs::path buildDir = f.layout.buildDir("foo");
    REQUIRE(fs::exists(buildDir / "PKGBUILD"));
    REQUIRE_FALSE(fs::exists(buildDir / ".git"));
    REQUIRE_FALSE(fs::exists(buildDir / "leftover.log"));
    REQUIRE(fs::exists(f.layout.reviewDir("foo") / ".git"));
}

TEST_CASE("Unknown targets stop the run before anything is built", "[install]") {
    InstallFixture f;
    f.metadata.add("app", "app", "1", {"ghost"});
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    REQUIRE_THROWS_AS(installer.install({"app"}, false, false), PackagesNotFound);
    REQUIRE(installer.phase() == Installer::Phase::Aborted);
    REQUIRE(f.events.empty());
    REQUIRE(input.consumed() == 0);
}

TEST_CASE("Closing the input at the summary aborts the run", "[install]") {
    InstallFixture f;
    ScriptedLineReader input({"n", "maybe"});
    Installer installer = f.installer(input);

    REQUIRE_THROWS_AS(installer.install({"foo"}, false, false), AuditAborted);
    REQUIRE(installer.phase() == Installer::Phase::Aborted);
    REQUIRE(f.events.empty());
}

TEST_CASE("A rejected artifact stops the run without installing its tier", "[install]") {
    InstallFixture f;
    f.auditor.rejected.insert("foo-1.0-1-x86_64.pkg.tar.xz");
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    REQUIRE_THROWS_AS(installer.install({"foo"}, false, false), AuditAborted);
    REQUIRE(installer.phase() == Installer::Phase::Aborted);

    // libbar's tier was already complete
    REQUIRE(f.packages.localInstalls.size() == 1);
    REQUIRE(f.events.back() == "audit:foo-1.0-1-x86_64.pkg.tar.xz");
    REQUIRE(fs::exists(f.layout.buildDir("foo") / "foo-1.0-1-x86_64.pkg.tar.xz"));
    REQUIRE_FALSE(fs::exists(f.layout.checkedTarsDir("foo")));
}

TEST_CASE("A build that produces no expected archive fails", "[install]") {
    InstallFixture f;
    f.builder.outputs["libbar"] = {"something-else-1-any.pkg.tar.xz"};
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    REQUIRE_THROWS_AS(installer.install({"foo"}, false, false), BuildFailure);
    REQUIRE(f.packages.localInstalls.empty());
    REQUIRE(std::find(f.events.begin(), f.events.end(), "build:foo") == f.events.end());
}

TEST_CASE("Targets installed from the repositories need no build", "[install]") {
    InstallFixture f;
    f.packages.installed.insert("libbar");
    ScriptedLineReader input({"o"});
    Installer installer = f.installer(input);

    installer.install({"foo"}, false, false);

    REQUIRE(f.events == EventLog{
        "review:foo",
        "repo:glibc",
        "build:foo",
        "audit:foo-1.0-1-x86_64.pkg.tar.xz",
        "install:foo-1.0-1-x86_64.pkg.tar.xz",
    });
}
