#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Global paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path CONFIG_FILE;

// Settings for one packaging run. Passed explicitly to every component.
struct PackagerConfig {
    std::string runtime = "python3.6";
    std::string platform_tag;               // empty: derived from runtime
    std::filesystem::path cache_dir;        // private download cache
    std::filesystem::path wheel_cache_dir;  // well-known binary cache, read only
    std::filesystem::path artifact_store;   // bundled store manifest, optional
    std::string registry_url = "https://pypi.org/pypi";
    std::string compile_command = "python3";
    bool compile = true;
    bool offline = false;
    std::vector<std::filesystem::path> site_dirs;
};

PackagerConfig default_config();

// Reads "key = value" lines into config. Unknown keys throw.
void load_config_file(const std::filesystem::path& path, PackagerConfig& config);
void apply_config_value(PackagerConfig& config, const std::string& key, const std::string& value);

std::string platform_tag_for_runtime(const std::string& runtime);
std::string get_platform_tag(const PackagerConfig& config);
