#pragma once

#include "markers.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

// An installed package as read from the host's package index.
struct Distribution {
    std::string project_name;               // as registered, e.g. "Jinja2"
    std::string key;                        // canonical_name(project_name)
    std::string version;
    std::filesystem::path location;         // site dir, .egg dir, .egg file, or empty
    std::vector<std::string> requirements;  // canonical keys of declared requirements
};

// Lookup of installed distributions by (case-insensitive) name.
class PackageIndex {
public:
    virtual ~PackageIndex() = default;
    virtual std::optional<Distribution> find(std::string_view name) const = 0;
};

// Index built by scanning site-packages style directories for dist-info,
// egg-info and egg metadata. Earlier directories win on duplicate keys.
// Requirements are kept only when their markers hold for env.
class InstalledPackageIndex : public PackageIndex {
public:
    InstalledPackageIndex(const std::vector<std::filesystem::path>& site_dirs, MarkerEnvironment env);

    std::optional<Distribution> find(std::string_view name) const override;
    size_t size() const { return dists_.size(); }

private:
    void scan_site_dir(const std::filesystem::path& dir);
    void add(Distribution dist);

    MarkerEnvironment env_;
    std::map<std::string, Distribution, std::less<>> dists_;
};

// Reduces a requirement line ("Foo[bar] (>=1.0); python_version < '3'") to
// the canonical key of the project it names. Empty when the marker does not
// hold for env, which includes lines that only apply to an optional extra.
std::string requirement_key(std::string_view line, const MarkerEnvironment& env);

// Parses an RFC 822 style metadata file (METADATA, PKG-INFO).
Distribution parse_metadata(std::string_view text, const MarkerEnvironment& env);

// Requirement keys from an egg-info requires.txt: the unconditional section
// and "[:marker]" sections whose marker holds. Extra sections are skipped.
std::vector<std::string> parse_requires_txt(std::string_view text, const MarkerEnvironment& env);
