#pragma once

#include "artifact_store.hpp"
#include "config.hpp"
#include "distribution.hpp"
#include "ignore.hpp"
#include "registry.hpp"
#include "unpacker.hpp"

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

enum class StrategyResult {
    Installed,
    NotApplicable,
};

// One way of getting a dependency into the staging tree. Fatal conditions
// are thrown and abort the whole chain.
class AcquisitionStrategy {
public:
    virtual ~AcquisitionStrategy() = default;

    virtual std::string name() const = 0;
    virtual StrategyResult try_install(const std::filesystem::path& staging, const Distribution& dep) = 0;
};

// Prebuilt archive from the bundled store, exact version or any version.
class BundledArtifactStrategy : public AcquisitionStrategy {
public:
    BundledArtifactStrategy(const ArtifactStore& store, std::string runtime, IgnorePatternSet ignored,
                            bool require_exact_version);

    std::string name() const override;
    StrategyResult try_install(const std::filesystem::path& staging, const Distribution& dep) override;

private:
    const ArtifactStore& store_;
    std::string runtime_;
    IgnorePatternSet ignored_;
    bool require_exact_version_;
};

// "{key}-{version}-{platform_tag}" found in one of the cache directories.
class WheelCacheStrategy : public AcquisitionStrategy {
public:
    WheelCacheStrategy(std::vector<std::filesystem::path> cache_dirs, std::string runtime, std::string platform_tag,
                       IgnorePatternSet ignored);

    std::string name() const override { return "wheel-cache"; }
    StrategyResult try_install(const std::filesystem::path& staging, const Distribution& dep) override;

private:
    std::vector<std::filesystem::path> cache_dirs_;
    std::string runtime_;
    std::string platform_tag_;
    IgnorePatternSet ignored_;
};

// Downloads the matching wheel from the registry into the private cache.
class RegistryDownloadStrategy : public AcquisitionStrategy {
public:
    RegistryDownloadStrategy(PackageRegistry& registry, std::filesystem::path cache_dir, std::string platform_tag,
                             IgnorePatternSet ignored);

    std::string name() const override { return "registry-download"; }
    StrategyResult try_install(const std::filesystem::path& staging, const Distribution& dep) override;

private:
    PackageRegistry& registry_;
    std::filesystem::path cache_dir_;
    std::string platform_tag_;
    IgnorePatternSet ignored_;
};

// Whatever is installed on the build machine. No compatibility guarantee.
class LocalInstallStrategy : public AcquisitionStrategy {
public:
    explicit LocalInstallStrategy(const LocalUnpacker& unpacker) : unpacker_(unpacker) {}

    std::string name() const override { return "local"; }
    StrategyResult try_install(const std::filesystem::path& staging, const Distribution& dep) override;

private:
    const LocalUnpacker& unpacker_;
};

class AcquisitionChain {
public:
    void add(std::unique_ptr<AcquisitionStrategy> strategy);

    // Tries each strategy in order and returns the name of the one that
    // installed dep. Throws NoSuitableArtifactError when none applies.
    std::string acquire(const std::filesystem::path& staging, const Distribution& dep);

    std::vector<std::string> strategy_names() const;

private:
    std::vector<std::unique_ptr<AcquisitionStrategy>> strategies_;
};

// bundled-exact, wheel-cache, registry-download (unless offline), bundled-any, local.
// The chain keeps references to store, registry and unpacker.
AcquisitionChain make_default_chain(const PackagerConfig& config, const ArtifactStore& store,
                                    PackageRegistry& registry, const LocalUnpacker& unpacker);
