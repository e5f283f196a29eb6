#include "distribution.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FnpackException(string_format("error.open_file_failed", path.string()));
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// A marker that cannot be evaluated is reported and treated as satisfied,
// so the requirement is still resolved.
bool marker_holds(std::string_view marker, const MarkerEnvironment& env, std::string_view context) {
    try {
        return evaluate_marker(marker, env);
    } catch (const FnpackException& e) {
        log_warning(string_format("warning.invalid_marker", std::string(context), e.what()));
        return true;
    }
}

void add_requirement(Distribution& dist, std::string_view line, const MarkerEnvironment& env) {
    std::string key = requirement_key(line, env);
    if (!key.empty() && std::ranges::find(dist.requirements, key) == dist.requirements.end()) {
        dist.requirements.push_back(std::move(key));
    }
}

} // anonymous namespace

std::string requirement_key(std::string_view line, const MarkerEnvironment& env) {
    if (auto pos = line.find(';'); pos != std::string_view::npos) {
        if (!marker_holds(line.substr(pos + 1), env, line)) return "";
        line = line.substr(0, pos);
    }

    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) ++start;
    size_t end = start;
    while (end < line.size()) {
        const unsigned char c = static_cast<unsigned char>(line[end]);
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') break;
        ++end;
    }
    if (end == start) return "";
    return canonical_name(line.substr(start, end - start));
}

Distribution parse_metadata(std::string_view text, const MarkerEnvironment& env) {
    Distribution dist;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        start = end + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) break; // end of headers, the long description follows
        if (line.front() == ' ' || line.front() == '\t') continue; // folded continuation

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        const std::string_view field = line.substr(0, colon);
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);

        if (field == "Name") dist.project_name = std::string(value);
        else if (field == "Version") dist.version = std::string(value);
        else if (field == "Requires-Dist") add_requirement(dist, value, env);
    }
    dist.key = canonical_name(dist.project_name);
    return dist;
}

std::vector<std::string> parse_requires_txt(std::string_view text, const MarkerEnvironment& env) {
    Distribution dist;
    bool active = true;
    for (const auto& line : split_lines(text)) {
        if (line.starts_with("#")) continue;
        if (line.starts_with("[")) {
            // "[extra]", "[extra:marker]" or "[:marker]"
            std::string_view section(line);
            section.remove_prefix(1);
            if (section.ends_with("]")) section.remove_suffix(1);
            active = section.starts_with(":") && marker_holds(section.substr(1), env, line);
            continue;
        }
        if (active) add_requirement(dist, line, env);
    }
    return dist.requirements;
}

InstalledPackageIndex::InstalledPackageIndex(const std::vector<fs::path>& site_dirs, MarkerEnvironment env)
    : env_(std::move(env)) {
    for (const auto& dir : site_dirs) {
        if (!fs::is_directory(dir)) {
            log_warning(string_format("warning.site_dir_missing", dir.string()));
            continue;
        }
        scan_site_dir(dir);
    }
}

void InstalledPackageIndex::add(Distribution dist) {
    if (dist.key.empty() || dist.version.empty()) return;
    // first site directory wins, like the interpreter's import order
    dists_.try_emplace(dist.key, std::move(dist));
}

void InstalledPackageIndex::scan_site_dir(const fs::path& dir) {
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(dir)) entries.push_back(entry.path());
    std::ranges::sort(entries);

    for (const auto& path : entries) {
        const std::string ext = path.extension().string();
        try {
            if (ext == ".dist-info" && fs::is_directory(path)) {
                Distribution dist = parse_metadata(read_file(path / "METADATA"), env_);
                dist.location = dir;
                add(std::move(dist));
            } else if (ext == ".egg-info" && fs::is_directory(path)) {
                Distribution dist = parse_metadata(read_file(path / "PKG-INFO"), env_);
                if (fs::exists(path / "requires.txt")) {
                    dist.requirements = parse_requires_txt(read_file(path / "requires.txt"), env_);
                }
                dist.location = dir;
                add(std::move(dist));
            } else if (ext == ".egg" && fs::is_directory(path)) {
                Distribution dist = parse_metadata(read_file(path / "EGG-INFO/PKG-INFO"), env_);
                if (fs::exists(path / "EGG-INFO/requires.txt")) {
                    dist.requirements = parse_requires_txt(read_file(path / "EGG-INFO/requires.txt"), env_);
                }
                dist.location = path;
                add(std::move(dist));
            } else if (ext == ".egg" && fs::is_regular_file(path)) {
                auto pkg_info = read_archive_member(path, "EGG-INFO/PKG-INFO");
                if (!pkg_info) continue;
                Distribution dist = parse_metadata(*pkg_info, env_);
                if (auto requires_txt = read_archive_member(path, "EGG-INFO/requires.txt")) {
                    dist.requirements = parse_requires_txt(*requires_txt, env_);
                }
                dist.location = path;
                add(std::move(dist));
            }
        } catch (const FnpackException& e) {
            log_warning(string_format("warning.bad_metadata", path.string(), e.what()));
        }
    }
}

std::optional<Distribution> InstalledPackageIndex::find(std::string_view name) const {
    auto it = dists_.find(canonical_name(name));
    if (it == dists_.end()) return std::nullopt;
    return it->second;
}
