#pragma once

#include "ignore.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

using MemberFilter = std::function<bool(const std::string&)>;

// Extracts every member of a zip or tarball into output_dir, skipping ignored
// members and, when given, members the filter rejects. Returns the number of
// files written.
size_t extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir,
                       const IgnorePatternSet& ignored, const MemberFilter& filter = {});

// Relative paths of the regular-file members, in archive order.
std::vector<std::string> list_archive_members(const std::filesystem::path& archive_path);

std::optional<std::string> read_archive_member(const std::filesystem::path& archive_path, const std::string& internal_path);

// Writes every regular file under source_dir into a deflate zip. Entries are
// sorted by relative path and carry fixed timestamps, so equal trees yield
// equal archives.
void write_zip_archive(const std::filesystem::path& source_dir, const std::filesystem::path& output_path);
