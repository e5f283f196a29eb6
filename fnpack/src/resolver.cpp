#include "resolver.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <set>

namespace {

void collect_requirements(const PackageIndex& index, const Distribution& dist,
                          std::set<std::string, std::less<>>& visited, DependencySet& result) {
    for (const auto& requirement : dist.requirements) {
        if (visited.contains(requirement)) continue;

        auto dep = index.find(requirement);
        if (!dep) {
            throw UnresolvedDependencyError(string_format("error.unresolved_dependency", requirement, dist.project_name));
        }

        // mark before recursing so a cycle back to this key stops here
        visited.insert(requirement);
        visited.insert(dep->key);
        result.push_back(*dep);
        collect_requirements(index, *dep, visited, result);
    }
}

} // anonymous namespace

DependencySet resolve_dependencies(const PackageIndex& index, std::string_view root_name) {
    auto root = index.find(root_name);
    if (!root) {
        throw UnresolvedDependencyError(string_format("error.root_not_installed", std::string(root_name)));
    }

    std::set<std::string, std::less<>> visited{root->key};
    DependencySet result{*root};
    collect_requirements(index, *root, visited, result);

    log_info(string_format("info.dependencies_resolved", root->project_name, result.size() - 1));
    return result;
}
