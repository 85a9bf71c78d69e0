#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include "metadata.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace Rampart {

class PackageManager;

/**
 * @brief Outcome of a dependency resolution run.
 */
struct ResolvedGraph
{
    /**
     * @brief Every target that must be built from source, with its metadata.
     */
    std::map<std::string, PackageInfo> sourceTargets;

    /**
     * @brief Dependencies the system package manager can install directly.
     */
    std::set<std::string> systemDependencies;

    /**
     * @brief Depth of every source target; requested roots are at 0.
     */
    std::map<std::string, int> depths;

    /**
     * @brief Target names mapped to their resolved versions.
     */
    std::map<std::string, std::string> targetVersions() const;
};

/**
 * @class DependencyResolver
 * @brief Recursively discovers what has to be built to install a set of targets.
 *
 * Resolution proceeds breadth first, one metadata request per layer. A
 * dependency already installed on the system is dropped, one available from
 * the system repositories is handed to the package manager, anything else is
 * a source target one level deeper than its dependent. When a target is
 * reached again along a longer path its depth is raised and its own
 * dependencies are revisited, so depths end up at the maximum over all paths.
 */
class DependencyResolver
{
public:
    DependencyResolver(MetadataSource& metadata, PackageManager& packages);

    /**
     * @brief Resolves the full transitive build set of `roots`.
     *
     * @throws ResolutionFailure if the metadata source fails or a dependency cycle is found.
     * @throws PackagesNotFound listing every name the metadata source does not know.
     */
    ResolvedGraph resolve(const std::vector<std::string>& roots);

private:
    enum class Provider
    {
        Installed,
        SystemRepository,
        Source
    };

    MetadataSource& metadata_;
    PackageManager& packages_;
    std::map<std::string, Provider> providerCache_;

    Provider classify(const std::string& dependency);
};

} // namespace Rampart

#endif // RESOLVER_HPP
