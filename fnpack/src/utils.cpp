#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>

namespace {
    bool quiet_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (quiet_mode) return;
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (quiet_mode || !is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

bool get_quiet_mode() {
    return quiet_mode;
}

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
    std::string templ = (fs::temp_directory_path() / (std::string(prefix) + "XXXXXX")).string();
    if (mkdtemp(templ.data()) == nullptr) {
        throw FnpackException(string_format("error.create_dir_failed", templ) + ": " + strerror(errno));
    }
    path_ = templ;
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning(string_format("warning.cleanup_failed", path_.string(), ec.message()));
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw FnpackException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw FnpackException(string_format("error.path_not_dir", path.string()));
    }
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
        if (!line.empty()) result.emplace_back(line);
        start = end + 1;
    }
    return result;
}

std::vector<std::string> read_lines_from_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.open_file_failed", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return split_lines(content);
}

void write_text_file(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.create_file_failed", path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw FnpackException(string_format("error.write_file_failed", path.string()));
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
         throw FnpackException(string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
             throw FnpackException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string canonical_name(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    bool in_separator_run = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.') {
            key.push_back(static_cast<char>(std::tolower(uc)));
            in_separator_run = false;
        } else if (!in_separator_run) {
            key.push_back('-');
            in_separator_run = true;
        }
    }
    return key;
}

std::string filename_safe_name(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    bool in_separator_run = false;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.') {
            result.push_back(c);
            in_separator_run = false;
        } else if (!in_separator_run) {
            result.push_back('_');
            in_separator_run = true;
        }
    }
    return result;
}
