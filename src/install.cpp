//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // Class definition and public methods
#include "artifact_gate.hpp"   // Audit + move of build artifacts
#include "build.hpp"           // Confined build collaborator
#include "errors.hpp"          // Fatal error taxonomy
#include "layout.hpp"          // Working directory layout
#include "package_manager.hpp" // Privileged installation
#include "resolver.hpp"        // Dependency resolution
#include "review.hpp"          // Recipe review collaborator
#include "tar_check.hpp"       // ArtifactAuditor
#include "terminal.hpp"        // LineReader
#include "utils.hpp"           // Logging helpers

#include <filesystem>          // Modern C++ filesystem operations
#include <functional>          // std::greater
#include <map>                 // Ordered maps (tiers by depth)
#include <set>                 // Ordered sets
#include <system_error>        // std::error_code
#include <utility>             // std::pair

// Alias for easier filesystem usage
namespace fs = std::filesystem;

namespace Rampart {

    //========================================================================
    // InstallPlan
    //========================================================================

    /**
     * ------------------------------------------------------------------------
     * InstallPlan::fromGraph
     *
     * Keeps, for every package-base, the deepest of its targets. The first
     * target (in name order) seen at that depth becomes the representative.
     * Units are then grouped into tiers, deepest tier first.
     * ------------------------------------------------------------------------
     */
    InstallPlan InstallPlan::fromGraph(const ResolvedGraph& graph) {
        std::map<std::string, BuildUnit> best;
        std::map<std::string, std::vector<std::string>> targetsOfBase;

        for (const auto& [target, info] : graph.sourceTargets) {
            auto depthIt = graph.depths.find(target);
            if (depthIt == graph.depths.end()) {
                throw ResolutionFailure("Internal error: target " + target +
                                        " doesn't have a recursive depth");
            }
            int depth = depthIt->second;
            targetsOfBase[info.packageBase].push_back(target);

            auto current = best.find(info.packageBase);
            if (current == best.end()) {
                best.emplace(info.packageBase, BuildUnit{info.packageBase, depth, target, {}});
            } else if (depth > current->second.depth) {
                current->second.depth = depth;
                current->second.representativeTarget = target;
            }
        }

        std::map<int, Tier, std::greater<int>> byDepth;
        for (auto& [pkgbase, unit] : best) {
            unit.targets = targetsOfBase[pkgbase];

            Tier& tier = byDepth[unit.depth];
            tier.depth = unit.depth;
            for (const auto& target : unit.targets) {
                tier.whitelist.push_back(target + "-" + graph.sourceTargets.at(target).version);
            }
            tier.units.push_back(unit);
        }

        InstallPlan plan;
        for (auto& entry : byDepth) {
            plan.tiers_.push_back(std::move(entry.second));
        }
        return plan;
    }

    std::vector<std::string> InstallPlan::packageBases() const {
        std::vector<std::string> bases;
        for (const auto& tier : tiers_) {
            for (const auto& unit : tier.units) {
                bases.push_back(unit.packageBase);
            }
        }
        return bases;
    }

    //========================================================================
    // Installer
    //========================================================================

    const char* phaseName(Installer::Phase phase) {
        switch (phase) {
            case Installer::Phase::Idle:       return "idle";
            case Installer::Phase::Resolving:  return "resolving";
            case Installer::Phase::Confirming: return "confirming";
            case Installer::Phase::Building:   return "building";
            case Installer::Phase::Auditing:   return "auditing";
            case Installer::Phase::Installing: return "installing";
            case Installer::Phase::Done:       return "done";
            case Installer::Phase::Aborted:    return "aborted";
        }
        return "unknown";
    }

    Installer::Installer(const Layout& layout, Collaborators collaborators, std::ostream& out)
        : layout_(layout), with_(collaborators), out_(out) {
    }

    void Installer::enter(Phase phase, int depth) {
        phase_ = phase;
        if (depth >= 0) {
            log_debug(std::string("Phase ") + phaseName(phase) + " (depth " +
                      std::to_string(depth) + ")");
        } else {
            log_debug(std::string("Phase ") + phaseName(phase));
        }
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::confirm
     *
     * Prints the pacman dependencies and the package-bases to build (deepest first)
     * and loops until the operator answers "o". There is no "no": the only
     * way out is Ctrl-C.
     * ------------------------------------------------------------------------
     */
    void Installer::confirm(const ResolvedGraph& graph, const InstallPlan& plan) {
        out_ << "\nIn order to install all targets, the following pacman packages "
                "will need to be installed:\n";
        for (const auto& dep : graph.systemDependencies) {
            out_ << "  " << dep << "\n";
        }

        out_ << "And the following AUR package bases will need to be built and installed:\n";
        for (const auto& tier : plan.tiers()) {
            for (const auto& unit : tier.units) {
                out_ << "  " << unit.packageBase << " (depth " << unit.depth << ")\n";
            }
        }
        out_ << std::endl;

        while (true) {
            out_ << "Proceed? [O]=ok, Ctrl-C=abort. " << std::flush;
            if (with_.input.readLine() == "o") {
                return;
            }
        }
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::prepareBuildDir
     *
     * Drops whatever a previous build left behind, copies the reviewed
     * recipe in and strips its version-control metadata.
     * ------------------------------------------------------------------------
     */
    void Installer::prepareBuildDir(const Layout& layout, const std::string& pkgbase) {
        fs::path reviewDir = layout.reviewDir(pkgbase);
        fs::path buildDir  = layout.buildDir(pkgbase);
        std::error_code ec;

        fs::remove_all(buildDir, ec);
        if (ec) {
            throw FilesystemError("Failed to remove old build dir (" + ec.message() + ")",
                                  buildDir.string());
        }

        fs::create_directories(layout.globalBuildDir(), ec);
        if (ec) {
            throw FilesystemError("Failed to create build dir (" + ec.message() + ")",
                                  layout.globalBuildDir().string());
        }

        fs::copy(reviewDir, buildDir,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) {
            throw FilesystemError("Failed to copy reviewed dir " + reviewDir.string() +
                                  " to build dir (" + ec.message() + ")", buildDir.string());
        }

        fs::remove_all(buildDir / ".git", ec);
        if (ec) {
            throw FilesystemError("Failed to remove .git (" + ec.message() + ")",
                                  (buildDir / ".git").string());
        }
    }

    void Installer::reviewRecipes(const InstallPlan& plan) {
        for (const auto& pkgbase : plan.packageBases()) {
            fs::path dir = layout_.reviewDir(pkgbase);
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                throw FilesystemError("Failed to create repository dir for " + pkgbase +
                                      " (" + ec.message() + ")", dir.string());
            }
            with_.reviewer.review(pkgbase, dir);
        }
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::processTier
     *
     * Builds every package-base of the tier, then audits all of their
     * artifacts, then installs the whole tier in a single package manager
     * transaction. Requested targets (depth 0) are only marked as
     * dependencies when the user asked for it.
     * ------------------------------------------------------------------------
     */
    void Installer::processTier(const Tier& tier, bool offline, bool asDependency) {
        enter(Phase::Building, tier.depth);
        for (const auto& unit : tier.units) {
            log_message("Building " + unit.packageBase + " (depth " +
                        std::to_string(tier.depth) + ")");
            prepareBuildDir(layout_, unit.packageBase);
            with_.builder.build(layout_.buildDir(unit.packageBase), offline);
        }

        enter(Phase::Auditing, tier.depth);
        log_debug("Expected archive files: " + join(tier.whitelist, ", "));
        ArtifactGate gate(layout_, with_.auditor);
        for (const auto& unit : tier.units) {
            gate.checkAndMove(unit.packageBase, tier.whitelist);
        }

        enter(Phase::Installing, tier.depth);
        // All archives of a package-base are bound to its representative target;
        // the package manager only uses the pairing to verify the install.
        std::vector<ArchiveToInstall> filesToInstall;
        for (const auto& unit : tier.units) {
            std::vector<fs::path> checked = listCheckedArtifacts(layout_.checkedTarsDir(unit.packageBase));
            if (checked.empty()) {
                throw BuildFailure("Build of " + unit.packageBase +
                                   " produced no archive matching " + join(unit.targets, ", "));
            }
            for (const auto& file : checked) {
                filesToInstall.emplace_back(unit.representativeTarget, file);
            }
        }
        with_.packages.installLocalArchives(filesToInstall, asDependency || tier.depth > 0);
    }

    /**
     * ------------------------------------------------------------------------
     * Installer::install
     * ------------------------------------------------------------------------
     */
    void Installer::install(const std::vector<std::string>& targets, bool offline, bool asDependency) {
        try {
            enter(Phase::Resolving);
            DependencyResolver resolver(with_.metadata, with_.packages);
            ResolvedGraph graph = resolver.resolve(targets);
            InstallPlan plan = InstallPlan::fromGraph(graph);

            enter(Phase::Confirming);
            confirm(graph, plan);

            reviewRecipes(plan);
            with_.packages.installRepoPackages(
                std::vector<std::string>(graph.systemDependencies.begin(),
                                         graph.systemDependencies.end()));

            for (const auto& tier : plan.tiers()) {
                processTier(tier, offline, asDependency);
            }

            enter(Phase::Done);
        } catch (const std::exception&) {
            phase_ = Phase::Aborted;
            throw;
        }
    }

} // namespace Rampart
