#include "resolver.hpp"
#include "errors.hpp"
#include "package_manager.hpp"
#include "utils.hpp"

#include <set>
#include <utility>

namespace Rampart {

std::map<std::string, std::string> ResolvedGraph::targetVersions() const
{
    std::map<std::string, std::string> versions;
    for (const auto& [target, info] : sourceTargets) {
        versions.emplace(target, info.version);
    }
    return versions;
}

DependencyResolver::DependencyResolver(MetadataSource& metadata, PackageManager& packages)
    : metadata_(metadata), packages_(packages)
{
}

DependencyResolver::Provider DependencyResolver::classify(const std::string& dependency)
{
    auto cached = providerCache_.find(dependency);
    if (cached != providerCache_.end()) {
        return cached->second;
    }

    Provider provider = Provider::Source;
    if (packages_.isInstalled(dependency)) {
        provider = Provider::Installed;
    } else if (packages_.isInstallable(dependency)) {
        provider = Provider::SystemRepository;
    }
    providerCache_.emplace(dependency, provider);
    return provider;
}

ResolvedGraph DependencyResolver::resolve(const std::vector<std::string>& roots)
{
    ResolvedGraph graph;
    std::map<std::string, PackageInfo> known;
    std::set<std::string> requested;
    std::set<std::string> missing;

    std::vector<std::string> layer;
    for (const auto& root : roots) {
        if (graph.depths.emplace(root, 0).second) {
            layer.push_back(root);
        }
    }

    while (!layer.empty()) {
        // One metadata round trip per layer, only for names not asked before.
        std::vector<std::string> toFetch;
        for (const auto& name : layer) {
            if (requested.insert(name).second) {
                toFetch.push_back(name);
            }
        }
        if (!toFetch.empty()) {
            log_debug("Resolving " + join(toFetch, ", "));
            for (auto& [name, info] : metadata_.info(toFetch)) {
                known.emplace(name, info);
            }
        }

        std::vector<std::string> next;
        std::set<std::string> queued;
        for (const auto& name : layer) {
            auto found = known.find(name);
            if (found == known.end()) {
                missing.insert(name);
                continue;
            }

            int childDepth = graph.depths.at(name) + 1;
            for (const auto& dependency : found->second.allDependencies()) {
                std::string depName = stripVersionConstraint(dependency);
                if (depName.empty()) {
                    continue;
                }

                Provider provider = classify(dependency);
                if (provider == Provider::Installed) {
                    continue;
                }
                if (provider == Provider::SystemRepository) {
                    graph.systemDependencies.insert(depName);
                    continue;
                }

                auto current = graph.depths.find(depName);
                if (current != graph.depths.end() && current->second >= childDepth) {
                    continue;
                }

                // No simple path is longer than the number of distinct targets.
                if (childDepth > static_cast<int>(graph.depths.size())) {
                    throw ResolutionFailure("Dependency cycle detected involving " + depName +
                                            " (required by " + name + ")");
                }

                graph.depths[depName] = childDepth;
                if (queued.insert(depName).second) {
                    next.push_back(depName);
                }
            }
        }
        layer = std::move(next);
    }

    if (!missing.empty()) {
        throw PackagesNotFound(std::vector<std::string>(missing.begin(), missing.end()));
    }

    for (const auto& entry : graph.depths) {
        graph.sourceTargets.emplace(entry.first, known.at(entry.first));
        log_debug("depth " + std::to_string(entry.second) + ": " + entry.first);
    }
    return graph;
}

} // namespace Rampart
