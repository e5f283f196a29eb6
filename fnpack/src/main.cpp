#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "packager.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

namespace {

std::string read_entry_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.open_file_failed", path));
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0], string_format("info.usage", argv[0]));
        options.positional_help("<package>");

        options.add_options()
            ("h,help", get_string("help.help"))
            ("e,entry", get_string("help.entry"), cxxopts::value<std::string>())
            ("entry-file", get_string("help.entry_file"), cxxopts::value<std::string>())
            ("o,output", get_string("help.output"), cxxopts::value<std::string>())
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("runtime", get_string("help.runtime"), cxxopts::value<std::string>())
            ("platform-tag", get_string("help.platform_tag"), cxxopts::value<std::string>())
            ("cache-dir", get_string("help.cache_dir"), cxxopts::value<std::string>())
            ("wheel-cache-dir", get_string("help.wheel_cache_dir"), cxxopts::value<std::string>())
            ("artifact-store", get_string("help.artifact_store"), cxxopts::value<std::string>())
            ("registry", get_string("help.registry"), cxxopts::value<std::string>())
            ("site-dir", get_string("help.site_dir"), cxxopts::value<std::vector<std::string>>())
            ("python", get_string("help.python"), cxxopts::value<std::string>())
            ("no-compile", get_string("help.no_compile"), cxxopts::value<bool>()->default_value("false"))
            ("offline", get_string("help.offline"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("package", "", cxxopts::value<std::string>());

        options.parse_positional({"package"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_quiet_mode(result["quiet"].as<bool>());

        if (!result.count("package") || !result.count("output")) {
            print_usage(options);
            return 1;
        }
        if (result.count("entry") == result.count("entry-file")) {
            log_error(get_string("error.entry_required"));
            return 1;
        }

        PackagerConfig config = default_config();
        if (result.count("config")) {
            load_config_file(result["config"].as<std::string>(), config);
        } else if (std::filesystem::exists(CONFIG_FILE)) {
            load_config_file(CONFIG_FILE, config);
        }

        if (result.count("runtime")) config.runtime = result["runtime"].as<std::string>();
        if (result.count("platform-tag")) config.platform_tag = result["platform-tag"].as<std::string>();
        if (result.count("cache-dir")) config.cache_dir = result["cache-dir"].as<std::string>();
        if (result.count("wheel-cache-dir")) config.wheel_cache_dir = result["wheel-cache-dir"].as<std::string>();
        if (result.count("artifact-store")) config.artifact_store = result["artifact-store"].as<std::string>();
        if (result.count("registry")) config.registry_url = result["registry"].as<std::string>();
        if (result.count("python")) config.compile_command = result["python"].as<std::string>();
        if (result["no-compile"].as<bool>()) config.compile = false;
        if (result["offline"].as<bool>()) config.offline = true;
        if (result.count("site-dir")) {
            config.site_dirs.clear();
            for (const auto& dir : result["site-dir"].as<std::vector<std::string>>()) {
                config.site_dirs.emplace_back(dir);
            }
        }

        const std::string entry = result.count("entry") ? result["entry"].as<std::string>()
                                                        : read_entry_file(result["entry-file"].as<std::string>());

        const std::string& package_name = result["package"].as<std::string>();
        log_info(string_format("info.packaging", package_name, config.runtime));
        package(package_name, entry, result["output"].as<std::string>(), config);
        log_info(get_string("info.package_complete"));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const FnpackException& e) {
        log_error(string_format("error.fnpack_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
