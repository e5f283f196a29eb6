#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <filesystem>

struct ReleaseFile {
    std::string url;
    std::string filename;
    std::string sha256;  // empty when the registry publishes no digest
};

// A package registry serving release metadata and artifact downloads.
class PackageRegistry {
public:
    virtual ~PackageRegistry() = default;

    // Release metadata for a project. Throws RegistryError on any failure.
    virtual nlohmann::json fetch_metadata(const std::string& name) = 0;
    virtual void download(const std::string& url, const std::filesystem::path& output_path) = 0;
};

// PyPI-style JSON API: GET {base_url}/{name}/json
class HttpPackageRegistry : public PackageRegistry {
public:
    explicit HttpPackageRegistry(std::string base_url);

    nlohmann::json fetch_metadata(const std::string& name) override;
    void download(const std::string& url, const std::filesystem::path& output_path) override;

private:
    std::string base_url_;
};

// First artifact listed for the version whose URL ends with suffix.
std::optional<ReleaseFile> find_release_file(const nlohmann::json& metadata, const std::string& version,
                                             const std::string& suffix);
