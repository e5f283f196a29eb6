#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Suppresses log_info and progress output
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// Private scratch directory removed on destruction (one per packaging run)
class ScopedTempDir {
public:
    explicit ScopedTempDir(std::string_view prefix = "fnpack_");
    ~ScopedTempDir();
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::vector<std::string> read_lines_from_file(const fs::path& path);
std::vector<std::string> split_lines(std::string_view text);
void write_text_file(const fs::path& path, std::string_view content);
fs::path validate_path(const fs::path& path, const fs::path& root);

// Package naming
std::string canonical_name(std::string_view name);
std::string filename_safe_name(std::string_view name);
