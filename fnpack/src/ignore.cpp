#include "ignore.hpp"

#include <fnmatch.h>

#include <utility>

namespace {
const std::vector<std::string> DEFAULT_IGNORED = {
    "__pycache__",
    ".git",
    "__pycache__/*",
    ".git/*",
    "*/__pycache__/*",
    "*/.git/*",
};
}

IgnorePatternSet::IgnorePatternSet() : patterns_(DEFAULT_IGNORED) {}

IgnorePatternSet::IgnorePatternSet(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

bool IgnorePatternSet::matches_any(const std::string& candidate) const {
    for (const auto& pattern : patterns_) {
        if (fnmatch(pattern.c_str(), candidate.c_str(), 0) == 0) return true;
    }
    return false;
}

bool IgnorePatternSet::matches(std::string_view relative_path) const {
    std::string path(relative_path);
    while (path.starts_with("./")) path.erase(0, 2);
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (path.empty()) return false;

    if (matches_any(path)) return true;

    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start && matches_any(path.substr(start, end - start))) return true;
        start = end + 1;
    }
    return false;
}
