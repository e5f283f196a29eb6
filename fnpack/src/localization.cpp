#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace {

constexpr std::string_view DEFAULT_LANG = "en";

std::unordered_map<std::string, std::string> translations;
std::unordered_map<std::string, std::string> missing_key_placeholders;

// Merges <L10N_DIR>/<lang>.txt into the table. Later loads override earlier ones.
bool load_strings(std::string_view lang) {
    std::ifstream file(L10N_DIR / (std::string(lang) + ".txt"));
    if (!file.is_open()) return false;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.front() == '#') continue;
        const auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        translations.insert_or_assign(line.substr(0, pos), line.substr(pos + 1));
    }
    return true;
}

// "de_DE.UTF-8" -> "de"; "C" and "POSIX" select the default
std::string language_from_env() {
    const char* lang_env = getenv("LANG");
    if (!lang_env) return std::string(DEFAULT_LANG);

    std::string_view lang = lang_env;
    if (auto pos = lang.find_first_of("_.@"); pos != std::string_view::npos) lang = lang.substr(0, pos);
    if (lang.empty() || lang == "C" || lang == "POSIX") return std::string(DEFAULT_LANG);
    return std::string(lang);
}

} // anonymous namespace

void init_localization() {
    if (const char* dir_env = getenv("FNPACK_L10N_DIR"); dir_env && *dir_env) {
        L10N_DIR = dir_env;
    }

    translations.clear();
    // English is the base layer so a partial translation still has every key
    load_strings(DEFAULT_LANG);

    const std::string lang = language_from_env();
    if (lang != DEFAULT_LANG && !load_strings(lang)) {
        log_warning("Could not open localization file for " + lang + ", falling back to English.");
    }
}

const std::string& get_string(const std::string& key) {
    if (auto it = translations.find(key); it != translations.end()) {
        return it->second;
    }
    return missing_key_placeholders.try_emplace(key, "[MISSING_STRING: " + key + "]").first->second;
}
