#pragma once

#include <string>
#include <string_view>
#include <vector>

// Glob patterns for files that never belong in a deployable tree
// (version-control metadata, bytecode caches). Checked at every copy
// and extract site.
class IgnorePatternSet {
public:
    IgnorePatternSet();
    explicit IgnorePatternSet(std::vector<std::string> patterns);

    // True when the relative path, or any single component of it, matches a pattern.
    bool matches(std::string_view relative_path) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    bool matches_any(const std::string& candidate) const;

    std::vector<std::string> patterns_;
};
