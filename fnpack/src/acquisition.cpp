#include "acquisition.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <unistd.h>

namespace fs = std::filesystem;

BundledArtifactStrategy::BundledArtifactStrategy(const ArtifactStore& store, std::string runtime,
                                                 IgnorePatternSet ignored, bool require_exact_version)
    : store_(store), runtime_(std::move(runtime)), ignored_(std::move(ignored)),
      require_exact_version_(require_exact_version) {}

std::string BundledArtifactStrategy::name() const {
    return require_exact_version_ ? "bundled-exact" : "bundled-any";
}

StrategyResult BundledArtifactStrategy::try_install(const fs::path& staging, const Distribution& dep) {
    auto record = store_.find(dep, runtime_, require_exact_version_);
    if (!record) return StrategyResult::NotApplicable;

    if (record->version != dep.version) {
        log_warning(string_format("warning.bundled_version_mismatch", dep.project_name, dep.version, record->version));
    }
    log_info(string_format("info.installing_bundled", dep.project_name, record->version, record->path.string()));
    extract_archive(record->path, staging, ignored_);
    return StrategyResult::Installed;
}

WheelCacheStrategy::WheelCacheStrategy(std::vector<fs::path> cache_dirs, std::string runtime,
                                       std::string platform_tag, IgnorePatternSet ignored)
    : cache_dirs_(std::move(cache_dirs)), runtime_(std::move(runtime)), platform_tag_(std::move(platform_tag)),
      ignored_(std::move(ignored)) {}

StrategyResult WheelCacheStrategy::try_install(const fs::path& staging, const Distribution& dep) {
    for (const auto& dir : cache_dirs_) {
        if (dir.empty()) continue;
        auto record = find_cached_wheel(dir, dep, runtime_, platform_tag_);
        if (!record) continue;

        log_info(string_format("info.installing_cached_wheel", dep.project_name, record->path.string()));
        extract_archive(record->path, staging, ignored_);
        return StrategyResult::Installed;
    }
    return StrategyResult::NotApplicable;
}

RegistryDownloadStrategy::RegistryDownloadStrategy(PackageRegistry& registry, fs::path cache_dir,
                                                   std::string platform_tag, IgnorePatternSet ignored)
    : registry_(registry), cache_dir_(std::move(cache_dir)), platform_tag_(std::move(platform_tag)),
      ignored_(std::move(ignored)) {}

StrategyResult RegistryDownloadStrategy::try_install(const fs::path& staging, const Distribution& dep) {
    ensure_dir_exists(cache_dir_);

    const auto metadata = registry_.fetch_metadata(dep.key);
    const auto file = find_release_file(metadata, dep.version, platform_tag_);
    if (!file) {
        log_info(string_format("info.no_registry_artifact", dep.project_name, dep.version, platform_tag_));
        return StrategyResult::NotApplicable;
    }

    // Download under a private name and rename into place: concurrent runs
    // sharing the cache race last-writer-wins, never on a partial file.
    const fs::path wheel_path = cache_dir_ / wheel_filename(dep, platform_tag_);
    const fs::path partial_path = wheel_path.string() + ".part" + std::to_string(getpid());
    try {
        registry_.download(file->url, partial_path);
        if (!file->sha256.empty()) {
            const std::string actual = calculate_sha256(partial_path);
            if (actual != file->sha256) {
                throw RegistryError(string_format("error.hash_mismatch", file->url, file->sha256, actual));
            }
        }
        fs::rename(partial_path, wheel_path);
    } catch (...) {
        std::error_code ec;
        fs::remove(partial_path, ec);
        throw;
    }

    extract_archive(wheel_path, staging, ignored_);
    return StrategyResult::Installed;
}

StrategyResult LocalInstallStrategy::try_install(const fs::path& staging, const Distribution& dep) {
    std::error_code ec;
    if (dep.location.empty() || !fs::exists(dep.location, ec)) {
        return StrategyResult::NotApplicable;
    }
    log_warning(string_format("warning.using_local_install", dep.project_name, dep.version));
    unpacker_.install(staging, dep);
    return StrategyResult::Installed;
}

void AcquisitionChain::add(std::unique_ptr<AcquisitionStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
}

std::vector<std::string> AcquisitionChain::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& strategy : strategies_) names.push_back(strategy->name());
    return names;
}

std::string AcquisitionChain::acquire(const fs::path& staging, const Distribution& dep) {
    std::string attempted;
    for (const auto& strategy : strategies_) {
        if (!attempted.empty()) attempted += ", ";
        attempted += strategy->name();

        if (strategy->try_install(staging, dep) == StrategyResult::Installed) {
            log_info(string_format("info.dependency_installed", dep.project_name, dep.version, strategy->name()));
            return strategy->name();
        }
    }
    throw NoSuitableArtifactError(string_format("error.no_suitable_artifact", dep.project_name, dep.version, attempted));
}

AcquisitionChain make_default_chain(const PackagerConfig& config, const ArtifactStore& store,
                                    PackageRegistry& registry, const LocalUnpacker& unpacker) {
    const std::string platform_tag = get_platform_tag(config);
    const IgnorePatternSet& ignored = unpacker.ignored();

    AcquisitionChain chain;
    chain.add(std::make_unique<BundledArtifactStrategy>(store, config.runtime, ignored, true));
    chain.add(std::make_unique<WheelCacheStrategy>(std::vector<fs::path>{config.wheel_cache_dir, config.cache_dir},
                                                   config.runtime, platform_tag, ignored));
    if (!config.offline) {
        chain.add(std::make_unique<RegistryDownloadStrategy>(registry, config.cache_dir, platform_tag, ignored));
    }
    chain.add(std::make_unique<BundledArtifactStrategy>(store, config.runtime, ignored, false));
    chain.add(std::make_unique<LocalInstallStrategy>(unpacker));
    return chain;
}
