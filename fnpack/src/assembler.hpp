#pragma once

#include "acquisition.hpp"
#include "config.hpp"
#include "resolver.hpp"
#include "unpacker.hpp"

#include <string>
#include <string_view>
#include <filesystem>

// Entry-point shim written at the root of every staging tree
inline constexpr std::string_view SHIM_FILENAME = "index.py";

// Acquires every dependency except the root through the chain.
void install_dependencies(const std::filesystem::path& staging, const Distribution& root,
                          const DependencySet& dependencies, AcquisitionChain& chain);

// The project itself always comes from the local install.
void install_project(const std::filesystem::path& staging, const Distribution& root, const LocalUnpacker& unpacker);

// Removes __pycache__ directories and every .py that has a .pyc sibling.
// Returns the number of source files removed.
size_t prune_sources(const std::filesystem::path& staging);

void insert_shim(const std::filesystem::path& staging, std::string_view entry);

// Dependencies, project, bytecode, prune, shim, in that order.
void populate_directory(const std::filesystem::path& staging, const Distribution& root, std::string_view entry,
                        const DependencySet& dependencies, AcquisitionChain& chain, const LocalUnpacker& unpacker,
                        const PackagerConfig& config);
