#pragma once

#include "distribution.hpp"

#include <string_view>
#include <vector>

// Root first, then every transitively required distribution in discovery
// order. Each canonical key appears once.
using DependencySet = std::vector<Distribution>;

// Throws UnresolvedDependencyError when the root or any declared requirement
// is missing from the index. Requirement cycles are tolerated.
DependencySet resolve_dependencies(const PackageIndex& index, std::string_view root_name);
