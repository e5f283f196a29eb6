#include "artifact_store.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

ArtifactStore ArtifactStore::load(const fs::path& manifest_path) {
    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.open_file_failed", manifest_path.string()));
    }

    ArtifactStore store;
    const fs::path base_dir = manifest_path.parent_path();
    try {
        const json manifest = json::parse(file);
        for (const auto& [name, runtimes] : manifest.items()) {
            for (const auto& [runtime, entry] : runtimes.items()) {
                ArtifactRecord record;
                record.name = canonical_name(name);
                record.runtime = runtime;
                record.version = entry.at("version").get<std::string>();
                record.platform_tag = entry.value("platform_tag", "");
                fs::path path = entry.at("path").get<std::string>();
                record.path = path.is_absolute() ? path : base_dir / path;
                store.add(std::move(record));
            }
        }
    } catch (const json::exception& e) {
        throw FnpackException(string_format("error.artifact_store_invalid", manifest_path.string(), e.what()));
    }

    return store;
}

void ArtifactStore::add(ArtifactRecord record) {
    record.name = canonical_name(record.name);
    auto& by_runtime = records_[record.name];
    by_runtime[record.runtime] = std::move(record);
}

std::optional<ArtifactRecord> ArtifactStore::find(const Distribution& dist, const std::string& runtime,
                                                  bool require_exact_version) const {
    auto it = records_.find(dist.key);
    if (it == records_.end()) return std::nullopt;

    auto rit = it->second.find(runtime);
    if (rit == it->second.end()) return std::nullopt;

    if (require_exact_version && rit->second.version != dist.version) return std::nullopt;
    return rit->second;
}

std::string wheel_filename(const Distribution& dist, const std::string& platform_tag) {
    return dist.key + "-" + dist.version + "-" + platform_tag;
}

std::map<std::string, fs::path> load_cached_wheels(const fs::path& cache_dir) {
    std::map<std::string, fs::path> wheels;
    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) return wheels;

    for (auto it = fs::recursive_directory_iterator(cache_dir, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && it->path().extension() == ".whl") {
            wheels.try_emplace(it->path().filename().string(), it->path());
        }
    }
    return wheels;
}

std::optional<ArtifactRecord> find_cached_wheel(const fs::path& cache_dir, const Distribution& dist,
                                                const std::string& runtime, const std::string& platform_tag) {
    const auto wheels = load_cached_wheels(cache_dir);
    auto it = wheels.find(wheel_filename(dist, platform_tag));
    if (it == wheels.end()) return std::nullopt;

    return ArtifactRecord{
        .name = dist.key,
        .version = dist.version,
        .runtime = runtime,
        .platform_tag = platform_tag,
        .path = it->second,
    };
}
