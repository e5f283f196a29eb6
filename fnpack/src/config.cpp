#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = FNPACK_CONF_DIR;
fs::path L10N_DIR = FNPACK_L10N_DIR;
fs::path CONFIG_FILE = fs::path(FNPACK_CONF_DIR) / "fnpack.conf";

namespace {

fs::path default_wheel_cache_dir() {
    if (const char* xdg = getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "pip";
    }
    if (const char* home = getenv("HOME"); home && *home) {
        return fs::path(home) / ".cache/pip";
    }
    return {};
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw FnpackException(string_format("error.config_invalid_bool", key, value));
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

PackagerConfig default_config() {
    PackagerConfig config;
    config.cache_dir = fs::temp_directory_path() / "fnpack_cache";
    config.wheel_cache_dir = default_wheel_cache_dir();
    return config;
}

void apply_config_value(PackagerConfig& config, const std::string& key, const std::string& value) {
    if (key == "runtime") config.runtime = value;
    else if (key == "platform_tag") config.platform_tag = value;
    else if (key == "cache_dir") config.cache_dir = value;
    else if (key == "wheel_cache_dir") config.wheel_cache_dir = value;
    else if (key == "artifact_store") config.artifact_store = value;
    else if (key == "registry_url") config.registry_url = value;
    else if (key == "compile_command") config.compile_command = value;
    else if (key == "compile") config.compile = parse_bool(key, value);
    else if (key == "offline") config.offline = parse_bool(key, value);
    else if (key == "site_dir") config.site_dirs.emplace_back(value);
    else throw FnpackException(string_format("error.config_unknown_key", key));
}

void load_config_file(const fs::path& path, PackagerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw FnpackException(string_format("error.config_syntax", path.string(), line_no));
        }
        apply_config_value(config, trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
    }
}

std::string platform_tag_for_runtime(const std::string& runtime) {
    static const std::regex runtime_regex(R"(^python(\d)\.(\d+)$)");
    std::smatch match;
    if (!std::regex_match(runtime, match, runtime_regex)) {
        throw FnpackException(string_format("error.unsupported_runtime", runtime));
    }

    const int major = std::stoi(match[1]);
    const int minor = std::stoi(match[2]);
    std::string abi = "cp" + match[1].str() + match[2].str();
    if (major == 2) {
        abi += "mu";
    } else if (major == 3 && minor <= 7) {
        abi += "m";
    } else if (major != 3) {
        throw FnpackException(string_format("error.unsupported_runtime", runtime));
    }
    return abi + "-manylinux1_x86_64.whl";
}

std::string get_platform_tag(const PackagerConfig& config) {
    if (!config.platform_tag.empty()) {
        return config.platform_tag;
    }
    return platform_tag_for_runtime(config.runtime);
}
