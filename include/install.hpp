#ifndef INSTALL_HPP
#define INSTALL_HPP

#include <string>            // For std::string
#include <vector>            // For std::vector
#include <ostream>           // For std::ostream

namespace Rampart {

class ArtifactAuditor;
class Builder;
class Layout;
class LineReader;
class MetadataSource;
class PackageManager;
class RecipeReviewer;
struct ResolvedGraph;

/**
 * @brief One package-base scheduled for building.
 */
struct BuildUnit
{
    std::string packageBase;
    int depth = 0;                      // maximum depth over the base's targets
    std::string representativeTarget;   // target reported to the package manager
    std::vector<std::string> targets;   // every resolved target this base produces
};

/**
 * @brief All package-bases sharing one depth; built, audited and installed together.
 */
struct Tier
{
    int depth = 0;
    std::vector<BuildUnit> units;
    std::vector<std::string> whitelist; // "{target}-{version}" of every target in the tier
};

/**
 * @class InstallPlan
 * @brief Build order derived from a resolved dependency graph.
 *
 * Each package-base appears exactly once, at the maximum depth among the
 * targets it produces. Tiers are ordered by strictly descending depth so
 * the deepest dependencies are installed first.
 */
class InstallPlan
{
public:
    static InstallPlan fromGraph(const ResolvedGraph& graph);

    const std::vector<Tier>& tiers() const { return tiers_; }

    /**
     * @brief Every distinct package-base of the plan, deepest first.
     */
    std::vector<std::string> packageBases() const;

private:
    std::vector<Tier> tiers_;
};

/**
 * @class Installer
 * @brief Drives a full install run: resolve, confirm, review, then build,
 *        audit and install tier by tier.
 *
 * Runs through Resolving → Confirming → { Building → Auditing → Installing }
 * per tier → Done. Any exception leaves the installer in Aborted and is
 * propagated unchanged; nothing is retried and no later tier is started.
 */
class Installer
{
public:
    enum class Phase
    {
        Idle,
        Resolving,
        Confirming,
        Building,
        Auditing,
        Installing,
        Done,
        Aborted
    };

    /**
     * @brief External systems the installer relies on.
     */
    struct Collaborators
    {
        MetadataSource& metadata;
        PackageManager& packages;
        Builder& builder;
        RecipeReviewer& reviewer;
        ArtifactAuditor& auditor;
        LineReader& input;
    };

    Installer(const Layout& layout, Collaborators collaborators, std::ostream& out);

    /**
     * @brief Installs the requested targets and everything they need.
     *
     * @param targets      Target names requested by the user.
     * @param offline      Build without network access once sources are fetched.
     * @param asDependency Mark even the requested targets as dependencies.
     */
    void install(const std::vector<std::string>& targets, bool offline, bool asDependency);

    Phase phase() const { return phase_; }

    /**
     * @brief Lists what will be installed and waits for the operator's "o".
     *
     * @throws AuditAborted if the input closes before confirmation.
     */
    void confirm(const ResolvedGraph& graph, const InstallPlan& plan);

    /**
     * @brief Replaces the build directory of `pkgbase` with a fresh copy of its reviewed recipe.
     *
     * @throws FilesystemError naming the directory that could not be prepared.
     */
    static void prepareBuildDir(const Layout& layout, const std::string& pkgbase);

private:
    const Layout& layout_;
    Collaborators with_;
    std::ostream& out_;
    Phase phase_ = Phase::Idle;

    void enter(Phase phase, int depth = -1);
    void reviewRecipes(const InstallPlan& plan);
    void processTier(const Tier& tier, bool offline, bool asDependency);
};

/**
 * @brief Human readable name of a phase, for logs.
 */
const char* phaseName(Installer::Phase phase);

} // namespace Rampart

#endif // INSTALL_HPP
