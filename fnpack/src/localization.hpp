#pragma once

#include <format>
#include <string>

// Loads en.txt from L10N_DIR (or $FNPACK_L10N_DIR), then overlays the
// language named by $LANG when a file for it exists.
void init_localization();

// Message template for key. Unknown keys yield "[MISSING_STRING: key]".
const std::string& get_string(const std::string& key);

// Fills the "{}" slots of a message template. A template that does not fit
// its arguments is returned unformatted, tagged with the key.
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    const std::string& pattern = get_string(key);
    try {
        return std::vformat(pattern, std::make_format_args(args...));
    } catch (const std::format_error&) {
        return "[" + key + "] " + pattern;
    }
}
