#pragma once

#include "config.hpp"
#include "distribution.hpp"
#include "registry.hpp"

#include <string>
#include <string_view>
#include <filesystem>

// Copies a finished archive to a local path or file:// URL. Other URL
// schemes (s3://, ...) throw NotImplementedError.
void output_bundle(const std::filesystem::path& archive_path, const std::string& destination);

// Resolves root_name in the index, stages it with its dependencies in a
// private temporary directory, and writes the archive to destination.
// Nothing is written to destination unless every step succeeds.
void package(const PackageIndex& index, PackageRegistry& registry, const std::string& root_name,
             std::string_view entry, const std::string& destination, const PackagerConfig& config);

// Same, with the site-directory index and HTTP registry from config.
void package(const std::string& root_name, std::string_view entry, const std::string& destination,
             const PackagerConfig& config);
