#pragma once

#include "distribution.hpp"
#include "ignore.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

// Top-level module names a distribution owns, or nullopt if this layout
// convention does not apply.
using ManifestDetector = std::function<std::optional<std::vector<std::string>>(const Distribution&)>;

// Ownership manifest conventions in priority order: unpacked egg, adjacent
// egg-info, embedded egg's EGG-INFO, dist-info top_level.txt, dist-info RECORD.
const std::vector<ManifestDetector>& manifest_detectors();

std::optional<std::vector<std::string>> locate_top_level(const Distribution& dist);

// A "{Name}-{version}-py*.egg" bundle file inside the distribution's location.
std::optional<std::filesystem::path> find_embedded_egg(const Distribution& dist);

// Members of an egg to ship for one top-level name. Ignored members are
// dropped, and a .py member is dropped when its .pyc sibling is present.
std::vector<std::string> select_egg_members(const std::vector<std::string>& members, const std::string& top_level,
                                            const IgnorePatternSet& ignored);

// Recursive copy that skips (and does not descend into) ignored entries.
void copy_tree_filtered(const std::filesystem::path& source, const std::filesystem::path& destination,
                        const IgnorePatternSet& ignored);

// Installs an already-installed distribution into a staging tree by copying
// only the top-level modules it owns.
class LocalUnpacker {
public:
    LocalUnpacker() = default;
    explicit LocalUnpacker(IgnorePatternSet ignored) : ignored_(std::move(ignored)) {}

    // Throws UnsupportedLocalLayoutError or OwnershipManifestMissingError.
    void install(const std::filesystem::path& staging, const Distribution& dist) const;

    void install_from_egg(const std::filesystem::path& staging, const std::filesystem::path& egg_path) const;
    void install_from_directory(const std::filesystem::path& staging, const Distribution& dist) const;

    const IgnorePatternSet& ignored() const { return ignored_; }

private:
    void copy_top_level(const std::filesystem::path& staging, const std::filesystem::path& location,
                        const std::string& name) const;

    IgnorePatternSet ignored_;
};
