#pragma once

#include <string>
#include <filesystem>

// Both throw RegistryError on transport failures and non-2xx responses. No retries.
void download_file(const std::string& url, const std::filesystem::path& output_path, bool show_progress = true);
std::string http_get(const std::string& url);
