#include "packager.hpp"
#include "acquisition.hpp"
#include "archive.hpp"
#include "artifact_store.hpp"
#include "assembler.hpp"
#include "exception.hpp"
#include "interpreter.hpp"
#include "localization.hpp"
#include "resolver.hpp"
#include "unpacker.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

void output_bundle(const fs::path& archive_path, const std::string& destination) {
    std::string target = destination;
    if (const auto scheme_end = target.find("://"); scheme_end != std::string::npos) {
        if (!target.starts_with("file://")) {
            throw NotImplementedError(string_format("error.destination_not_supported", target.substr(0, scheme_end), destination));
        }
        target = target.substr(7);
    }

    const fs::path target_path = target;
    if (target_path.has_parent_path()) {
        ensure_dir_exists(target_path.parent_path());
    }
    fs::copy_file(archive_path, target_path, fs::copy_options::overwrite_existing);
    log_info(string_format("info.archive_written", target_path.string()));
}

void package(const PackageIndex& index, PackageRegistry& registry, const std::string& root_name,
             std::string_view entry, const std::string& destination, const PackagerConfig& config) {
    // resolution fails before anything touches the disk
    const DependencySet dependencies = resolve_dependencies(index, root_name);
    const Distribution& root = dependencies.front();

    const ArtifactStore store = config.artifact_store.empty() ? ArtifactStore{} : ArtifactStore::load(config.artifact_store);
    const LocalUnpacker unpacker;
    AcquisitionChain chain = make_default_chain(config, store, registry, unpacker);

    ScopedTempDir work_dir("fnpack_");
    const fs::path staging = work_dir.path() / "staging";
    ensure_dir_exists(staging);

    populate_directory(staging, root, entry, dependencies, chain, unpacker, config);

    const fs::path archive_path = work_dir.path() / "bundle.zip";
    log_info(string_format("info.writing_archive", archive_path.string()));
    write_zip_archive(staging, archive_path);

    output_bundle(archive_path, destination);
}

void package(const std::string& root_name, std::string_view entry, const std::string& destination,
             const PackagerConfig& config) {
    std::vector<fs::path> site_dirs = config.site_dirs;
    if (site_dirs.empty()) {
        site_dirs = interpreter_site_dirs(config.compile_command);
    }
    if (site_dirs.empty()) {
        throw FnpackException(get_string("error.no_site_dirs"));
    }
    const InstalledPackageIndex index(site_dirs, marker_environment_for_runtime(config.runtime));
    HttpPackageRegistry registry(config.registry_url);
    package(index, registry, root_name, entry, destination, config);
}
