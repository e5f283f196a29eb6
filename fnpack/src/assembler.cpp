#include "assembler.hpp"
#include "interpreter.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <vector>

namespace fs = std::filesystem;

void install_dependencies(const fs::path& staging, const Distribution& root,
                          const DependencySet& dependencies, AcquisitionChain& chain) {
    for (const auto& dep : dependencies) {
        // never download or override the project's own code
        if (dep.key == root.key) continue;
        chain.acquire(staging, dep);
    }
}

void install_project(const fs::path& staging, const Distribution& root, const LocalUnpacker& unpacker) {
    log_info(string_format("info.installing_project", root.project_name, root.version));
    unpacker.install(staging, root);
}

size_t prune_sources(const fs::path& staging) {
    std::vector<fs::path> sources;
    std::vector<fs::path> cache_dirs;
    for (auto it = fs::recursive_directory_iterator(staging); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory() && it->path().filename() == "__pycache__") {
            cache_dirs.push_back(it->path());
            it.disable_recursion_pending();
        } else if (it->is_regular_file() && it->path().extension() == ".py") {
            sources.push_back(it->path());
        }
    }

    for (const auto& dir : cache_dirs) {
        fs::remove_all(dir);
    }

    size_t removed = 0;
    for (const auto& source : sources) {
        fs::path compiled = source;
        compiled += "c";
        if (fs::exists(compiled)) {
            fs::remove(source);
            ++removed;
        }
    }
    return removed;
}

void insert_shim(const fs::path& staging, std::string_view entry) {
    write_text_file(staging / SHIM_FILENAME, entry);
}

void populate_directory(const fs::path& staging, const Distribution& root, std::string_view entry,
                        const DependencySet& dependencies, AcquisitionChain& chain, const LocalUnpacker& unpacker,
                        const PackagerConfig& config) {
    install_dependencies(staging, root, dependencies, chain);
    install_project(staging, root, unpacker);

    if (config.compile) {
        compile_tree(staging, config.compile_command);
    }

    const size_t pruned = prune_sources(staging);
    log_info(string_format("info.pruned_sources", pruned));

    insert_shim(staging, entry);
}
