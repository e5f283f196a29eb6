#pragma once

#include "distribution.hpp"

#include <map>
#include <optional>
#include <string>
#include <filesystem>

struct ArtifactRecord {
    std::string name;
    std::string version;
    std::string runtime;
    std::string platform_tag;
    std::filesystem::path path;  // physical archive
};

// Read-only store of prebuilt archives known to work on a target runtime,
// keyed by (canonical name, runtime). Loaded from a JSON manifest:
//   { "psycopg2": { "python3.6": { "version": "2.7.1", "path": "psycopg2-2.7.1.tar.gz" } } }
// Relative paths resolve against the manifest's directory.
class ArtifactStore {
public:
    ArtifactStore() = default;

    static ArtifactStore load(const std::filesystem::path& manifest_path);

    void add(ArtifactRecord record);
    bool empty() const { return records_.empty(); }

    // Strict lookup compares versions too; relaxed lookup accepts whatever
    // version the store carries for this runtime.
    std::optional<ArtifactRecord> find(const Distribution& dist, const std::string& runtime,
                                       bool require_exact_version) const;

private:
    std::map<std::string, std::map<std::string, ArtifactRecord>, std::less<>> records_;
};

// Conventional cache file name: "{key}-{version}-{platform_tag}"
std::string wheel_filename(const Distribution& dist, const std::string& platform_tag);

// Every *.whl below cache_dir, by file name. Rescanned on every call.
std::map<std::string, std::filesystem::path> load_cached_wheels(const std::filesystem::path& cache_dir);

std::optional<ArtifactRecord> find_cached_wheel(const std::filesystem::path& cache_dir, const Distribution& dist,
                                                const std::string& runtime, const std::string& platform_tag);
