#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const {
        if (entry) archive_entry_free(entry);
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

// 1980-01-01T00:00:00Z, the earliest time a zip entry can carry
constexpr time_t FIXED_ENTRY_MTIME = 315532800;

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : get_string(fallback_key);
}

ArchiveReadHandle open_for_reading(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw FnpackException(string_format("error.open_archive_failed", archive_path.string()) + ": " +
                              archive_error(a.get(), "error.unknown"));
    }
    return a;
}

std::string member_name(struct archive_entry* entry) {
    const char* raw = archive_entry_pathname(entry);
    if (!raw) return "";
    std::string path = raw;
    // Remove leading ./ if present
    while (path.starts_with("./")) path = path.substr(2);
    return path;
}

} // anonymous namespace

size_t extract_archive(const fs::path& archive_path, const fs::path& output_dir,
                       const IgnorePatternSet& ignored, const MemberFilter& filter) {
    ArchiveReadHandle a = open_for_reading(archive_path);

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT
    );

    ensure_dir_exists(output_dir);

    struct archive_entry* entry;
    size_t count = 0;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                      archive_error(a.get(), "error.fatal_read"));
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        const std::string name = member_name(entry);
        if (name.empty() || ignored.matches(name)) continue;
        if (filter && (archive_entry_filetype(entry) == AE_IFDIR || !filter(name))) continue;

        // Entries must stay inside the output directory
        fs::path dest_path;
        try {
            dest_path = validate_path(name, output_dir);
        } catch (const FnpackException&) {
            throw FnpackException(string_format("error.malicious_path_in_archive", name, archive_path.string()));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            std::string link = hardlink;
            while (link.starts_with("./")) link = link.substr(2);
            archive_entry_set_hardlink(entry, validate_path(link, output_dir).c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                      archive_error(ext.get(), "error.fatal_write"));
            }
            log_warning(archive_error(ext.get(), "error.unknown"));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                          archive_error(a.get(), "error.data_block_read"));
                }
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                          archive_error(ext.get(), "error.data_block_write"));
                }
            }
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                  archive_error(ext.get(), "error.fatal_write"));
        }

        if (archive_entry_filetype(entry) == AE_IFREG) ++count;
    }

    return count;
}

std::vector<std::string> list_archive_members(const fs::path& archive_path) {
    ArchiveReadHandle a = open_for_reading(archive_path);

    std::vector<std::string> members;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) == AE_IFREG) {
            members.push_back(member_name(entry));
        }
        archive_read_data_skip(a.get());
    }
    if (r != ARCHIVE_EOF) {
        throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                              archive_error(a.get(), "error.fatal_read"));
    }
    return members;
}

std::optional<std::string> read_archive_member(const fs::path& archive_path, const std::string& internal_path) {
    ArchiveReadHandle a = open_for_reading(archive_path);

    struct archive_entry* entry;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        if (member_name(entry) == internal_path) {
            std::string content;
            char buffer[8192];
            la_ssize_t n;
            while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
                content.append(buffer, static_cast<size_t>(n));
            }
            if (n < 0) {
                throw FnpackException(string_format("error.extract_failed", archive_path.string()) + ": " +
                                      archive_error(a.get(), "error.data_block_read"));
            }
            return content;
        }
        archive_read_data_skip(a.get());
    }

    return std::nullopt;
}

void write_zip_archive(const fs::path& source_dir, const fs::path& output_path) {
    std::vector<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
        if (!entry.is_regular_file()) continue;
        files.push_back(entry.path().lexically_relative(source_dir).generic_string());
    }
    std::ranges::sort(files);

    ArchiveWriteHandle a(archive_write_new());
    archive_write_set_format_zip(a.get());
    archive_write_set_format_option(a.get(), "zip", "compression", "deflate");

    if (archive_write_open_filename(a.get(), output_path.c_str()) != ARCHIVE_OK) {
        throw FnpackException(string_format("error.create_file_failed", output_path.string()) + ": " +
                              archive_error(a.get(), "error.unknown"));
    }

    for (std::string name : files) {
        const fs::path physical = source_dir / name;
        while (name.starts_with("/")) name.erase(0, 1);

        const auto size = fs::file_size(physical);
        const auto perms = fs::status(physical).permissions();
        const bool executable = (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) != fs::perms::none;

        ArchiveEntryHandle entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), executable ? 0755 : 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
        archive_entry_set_mtime(entry.get(), FIXED_ENTRY_MTIME, 0);

        if (archive_write_header(a.get(), entry.get()) != ARCHIVE_OK) {
            throw FnpackException(string_format("error.archive_write_failed", name) + ": " +
                                  archive_error(a.get(), "error.unknown"));
        }

        std::ifstream f(physical, std::ios::binary);
        if (!f) {
            throw FnpackException(string_format("error.open_file_failed", physical.string()));
        }
        char buffer[8192];
        while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
            if (archive_write_data(a.get(), buffer, static_cast<size_t>(f.gcount())) < 0) {
                throw FnpackException(string_format("error.archive_write_failed", name) + ": " +
                                      archive_error(a.get(), "error.unknown"));
            }
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw FnpackException(string_format("error.archive_write_failed", output_path.string()) + ": " +
                              archive_error(a.get(), "error.unknown"));
    }
}
