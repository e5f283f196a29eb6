#include "registry.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

HttpPackageRegistry::HttpPackageRegistry(std::string base_url) : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json HttpPackageRegistry::fetch_metadata(const std::string& name) {
    const std::string url = base_url_ + "/" + name + "/json";
    log_info(string_format("info.querying_registry", url));

    const std::string body = http_get(url);
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw RegistryError(string_format("error.registry_bad_response", url, e.what()));
    }
}

void HttpPackageRegistry::download(const std::string& url, const fs::path& output_path) {
    log_info(string_format("info.downloading_artifact", url));
    download_file(url, output_path, true);
}

std::optional<ReleaseFile> find_release_file(const json& metadata, const std::string& version,
                                             const std::string& suffix) {
    try {
        const auto releases = metadata.find("releases");
        if (releases == metadata.end() || !releases->is_object()) {
            throw RegistryError(get_string("error.registry_no_releases"));
        }

        const auto files = releases->find(version);
        if (files == releases->end()) return std::nullopt;

        for (const auto& info : *files) {
            const std::string url = info.at("url").get<std::string>();
            if (!url.ends_with(suffix)) continue;

            ReleaseFile file{.url = url, .filename = info.value("filename", ""), .sha256 = ""};
            if (auto digests = info.find("digests"); digests != info.end() && digests->is_object()) {
                file.sha256 = digests->value("sha256", "");
            }
            return file;
        }
    } catch (const json::exception& e) {
        throw RegistryError(string_format("error.registry_bad_response", version, e.what()));
    }
    return std::nullopt;
}
