#include "unpacker.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view SOURCE_SUFFIX = ".py";
constexpr std::string_view TOP_LEVEL_FILE = "top_level.txt";

// Spellings a distribution's metadata folders are found under
std::vector<std::string> name_variants(const Distribution& dist) {
    std::vector<std::string> variants;
    for (auto candidate : {dist.key, filename_safe_name(dist.project_name), filename_safe_name(dist.key)}) {
        if (!candidate.empty() && std::ranges::find(variants, candidate) == variants.end()) {
            variants.push_back(std::move(candidate));
        }
    }
    return variants;
}

// Children of dir whose names start with prefix and end with suffix, sorted
std::vector<fs::path> matching_children(const fs::path& dir, const std::string& prefix, std::string_view suffix) {
    std::vector<fs::path> result;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return result;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with(prefix) && name.ends_with(suffix)) result.push_back(entry.path());
    }
    std::ranges::sort(result);
    return result;
}

std::optional<std::vector<std::string>> read_top_level(const fs::path& metadata_dir) {
    const fs::path path = metadata_dir / TOP_LEVEL_FILE;
    if (!fs::is_regular_file(path)) return std::nullopt;
    log_info(string_format("info.found_manifest", path.string()));
    return read_lines_from_file(path);
}

std::vector<fs::path> dist_info_dirs(const Distribution& dist) {
    std::vector<fs::path> dirs;
    for (const auto& variant : name_variants(dist)) {
        fs::path candidate = dist.location / (variant + "-" + dist.version + ".dist-info");
        if (fs::is_directory(candidate)) dirs.push_back(candidate);
    }
    return dirs;
}

std::optional<std::vector<std::string>> detect_unpacked_egg(const Distribution& dist) {
    if (dist.location.extension() != ".egg" || !fs::is_directory(dist.location)) return std::nullopt;
    return read_top_level(dist.location / "EGG-INFO");
}

std::optional<std::vector<std::string>> detect_egg_info(const Distribution& dist) {
    if (auto names = read_top_level(dist.location / (dist.key + ".egg-info"))) return names;
    for (const auto& variant : name_variants(dist)) {
        for (const auto& dir : matching_children(dist.location, variant + "-" + filename_safe_name(dist.version), ".egg-info")) {
            if (auto names = read_top_level(dir)) return names;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> detect_embedded_egg_info(const Distribution& dist) {
    for (const auto& variant : name_variants(dist)) {
        for (const auto& egg : matching_children(dist.location, variant + "-" + filename_safe_name(dist.version), ".egg")) {
            if (!fs::is_directory(egg)) continue;
            if (auto names = read_top_level(egg / "EGG-INFO")) return names;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> detect_dist_info(const Distribution& dist) {
    for (const auto& dir : dist_info_dirs(dist)) {
        if (auto names = read_top_level(dir)) return names;
    }
    return std::nullopt;
}

// RECORD lists every installed file; its first path components are the owned names
std::optional<std::vector<std::string>> detect_dist_info_record(const Distribution& dist) {
    for (const auto& dir : dist_info_dirs(dist)) {
        const fs::path record = dir / "RECORD";
        if (!fs::is_regular_file(record)) continue;

        std::vector<std::string> names;
        for (std::string line : read_lines_from_file(record)) {
            std::string path;
            if (line.starts_with("\"")) {
                auto close = line.find('"', 1);
                path = line.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            } else {
                path = line.substr(0, line.find(','));
            }

            std::string top = path.substr(0, path.find('/'));
            if (top.empty() || top.starts_with("..") || top == "__pycache__" ||
                top.ends_with(".dist-info") || top.ends_with(".data")) {
                continue;
            }
            if (std::ranges::find(names, top) == names.end()) names.push_back(std::move(top));
        }
        if (!names.empty()) {
            log_info(string_format("info.found_manifest", record.string()));
            return names;
        }
    }
    return std::nullopt;
}

bool is_module_file_for(const std::string& filename, const std::string& top_level) {
    // "six.py", "six.pyc", "_speedups.cpython-36m-x86_64-linux-gnu.so"
    return filename.substr(0, filename.find('.')) == top_level && filename.find('.') != std::string::npos;
}

} // anonymous namespace

const std::vector<ManifestDetector>& manifest_detectors() {
    static const std::vector<ManifestDetector> detectors = {
        detect_unpacked_egg,
        detect_egg_info,
        detect_embedded_egg_info,
        detect_dist_info,
        detect_dist_info_record,
    };
    return detectors;
}

std::optional<std::vector<std::string>> locate_top_level(const Distribution& dist) {
    for (const auto& detector : manifest_detectors()) {
        if (auto names = detector(dist)) return names;
    }
    return std::nullopt;
}

std::optional<fs::path> find_embedded_egg(const Distribution& dist) {
    for (const auto& variant : name_variants(dist)) {
        for (const auto& egg : matching_children(dist.location, variant + "-" + filename_safe_name(dist.version) + "-py", ".egg")) {
            if (fs::is_regular_file(egg)) return egg;
        }
    }
    return std::nullopt;
}

std::vector<std::string> select_egg_members(const std::vector<std::string>& members, const std::string& top_level,
                                            const IgnorePatternSet& ignored) {
    std::set<std::string, std::less<>> candidates;
    for (const auto& member : members) {
        const bool in_package = member.starts_with(top_level + "/");
        const bool is_module = member.find('/') == std::string::npos && is_module_file_for(member, top_level);
        if ((in_package || is_module) && !ignored.matches(member)) candidates.insert(member);
    }

    std::vector<std::string> selected;
    for (const auto& member : candidates) {
        if (member.ends_with(SOURCE_SUFFIX) && candidates.contains(member + "c")) continue;
        selected.push_back(member);
    }
    return selected;
}

void copy_tree_filtered(const fs::path& source, const fs::path& destination, const IgnorePatternSet& ignored) {
    ensure_dir_exists(destination);
    for (auto it = fs::recursive_directory_iterator(source, fs::directory_options::follow_directory_symlink);
         it != fs::recursive_directory_iterator(); ++it) {
        const fs::path rel = it->path().lexically_relative(source);
        if (ignored.matches(rel.generic_string())) {
            if (it->is_directory()) it.disable_recursion_pending();
            continue;
        }

        const fs::path target = destination / rel;
        if (it->is_directory()) {
            ensure_dir_exists(target);
        } else if (it->is_regular_file()) {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing);
        }
    }
}

void LocalUnpacker::install(const fs::path& staging, const Distribution& dist) const {
    const fs::path& location = dist.location;

    if (!location.empty() && fs::is_regular_file(location)) {
        if (location.extension() == ".egg") {
            install_from_egg(staging, location);
            return;
        }
        throw UnsupportedLocalLayoutError(string_format("error.unsupported_local_file", dist.project_name, location.string()));
    }

    if (!location.empty() && fs::is_directory(location)) {
        if (auto egg = find_embedded_egg(dist)) {
            install_from_egg(staging, *egg);
            return;
        }
        install_from_directory(staging, dist);
        return;
    }

    throw UnsupportedLocalLayoutError(string_format("error.unsupported_local_location", dist.project_name, location.string()));
}

void LocalUnpacker::install_from_directory(const fs::path& staging, const Distribution& dist) const {
    auto top_level = locate_top_level(dist);
    if (!top_level) {
        throw OwnershipManifestMissingError(string_format("error.manifest_missing", dist.project_name, dist.location.string()));
    }

    for (const auto& name : *top_level) {
        copy_top_level(staging, dist.location, name);
    }
}

void LocalUnpacker::copy_top_level(const fs::path& staging, const fs::path& location, const std::string& name) const {
    if (ignored_.matches(name)) return;

    const fs::path source = validate_path(name, location);
    const fs::path destination = validate_path(name, staging);

    if (fs::is_directory(source)) {
        log_info(string_format("info.copying", source.string(), destination.string()));
        copy_tree_filtered(source, destination, ignored_);
        return;
    }
    if (fs::is_regular_file(source)) {
        log_info(string_format("info.copying", source.string(), destination.string()));
        ensure_dir_exists(destination.parent_path());
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        return;
    }

    // A module rather than a package: name.py, name.<abi>.so, ...
    bool found = false;
    for (const auto& entry : fs::directory_iterator(location)) {
        const std::string filename = entry.path().filename().string();
        if (!entry.is_regular_file() || !is_module_file_for(filename, name) || ignored_.matches(filename)) continue;
        log_info(string_format("info.copying", entry.path().string(), (staging / filename).string()));
        fs::copy_file(entry.path(), staging / filename, fs::copy_options::overwrite_existing);
        found = true;
    }
    if (!found) {
        log_warning(string_format("warning.top_level_not_found", name, location.string()));
    }
}

void LocalUnpacker::install_from_egg(const fs::path& staging, const fs::path& egg_path) const {
    auto manifest = read_archive_member(egg_path, "EGG-INFO/top_level.txt");
    if (!manifest) {
        throw OwnershipManifestMissingError(string_format("error.manifest_missing", egg_path.filename().string(), egg_path.string()));
    }

    const auto members = list_archive_members(egg_path);
    std::set<std::string, std::less<>> to_extract;
    for (const auto& top_level : split_lines(*manifest)) {
        for (auto& member : select_egg_members(members, top_level, ignored_)) {
            to_extract.insert(std::move(member));
        }
    }

    log_info(string_format("info.extracting_egg", egg_path.string(), to_extract.size()));
    extract_archive(egg_path, staging, ignored_, [&to_extract](const std::string& member) {
        return to_extract.contains(member);
    });
}
