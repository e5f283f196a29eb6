#include <gtest/gtest.h>
#include "assembler.hpp"
#include "interpreter.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {

// Installs a marker file instead of fetching anything
class RecordingStrategy : public AcquisitionStrategy {
public:
    std::vector<std::string> installed;

    std::string name() const override { return "recording"; }
    StrategyResult try_install(const fs::path& staging, const Distribution& dep) override {
        installed.push_back(dep.key);
        write_text_file(staging / (dep.key + ".py"), "# " + dep.version + "\n");
        return StrategyResult::Installed;
    }
};

} // anonymous namespace

class AssemblerTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path site_dir;
    fs::path staging;

    void SetUp() override {
        set_quiet_mode(true);
        init_localization();

        suite_work_dir = fs::absolute("tmp_assembler_test");
        site_dir = suite_work_dir / "site-packages";
        staging = suite_work_dir / "staging";
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(site_dir);
        fs::create_directories(staging);
    }

    void TearDown() override {
        set_quiet_mode(false);
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::binary);
        f << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    Distribution make_dist(const std::string& name, const std::string& version) {
        Distribution dist;
        dist.project_name = name;
        dist.key = canonical_name(name);
        dist.version = version;
        dist.location = site_dir;
        return dist;
    }

    std::vector<std::string> staged_files() {
        std::vector<std::string> files;
        for (const auto& entry : fs::recursive_directory_iterator(staging)) {
            if (entry.is_regular_file()) files.push_back(entry.path().lexically_relative(staging).generic_string());
        }
        std::ranges::sort(files);
        return files;
    }

    static bool have_python3() {
        for (const char* dir : {"/usr/bin", "/usr/local/bin", "/bin"}) {
            if (fs::exists(fs::path(dir) / "python3")) return true;
        }
        return false;
    }
};

TEST_F(AssemblerTest, PruneRemovesShadowedSourcesAndCaches) {
    write_file(staging / "pkg/__init__.py", "");
    write_file(staging / "pkg/__init__.pyc", "c");
    write_file(staging / "pkg/only_source.py", "");
    write_file(staging / "pkg/only_compiled.pyc", "c");
    write_file(staging / "pkg/__pycache__/__init__.cpython-36.pyc", "c");
    write_file(staging / "top.py", "");
    write_file(staging / "top.pyc", "c");

    EXPECT_EQ(prune_sources(staging), 2u);
    EXPECT_EQ(staged_files(), (std::vector<std::string>{
        "pkg/__init__.pyc", "pkg/only_compiled.pyc", "pkg/only_source.py", "top.pyc"}));
}

TEST_F(AssemblerTest, ShimIsWrittenVerbatim) {
    const std::string entry = "from app import handler\n\ndef main(event, context):\n    return handler(event)\n";
    insert_shim(staging, entry);
    EXPECT_EQ(read_file(staging / SHIM_FILENAME), entry);

    insert_shim(staging, "pass\n");
    EXPECT_EQ(read_file(staging / "index.py"), "pass\n");
}

TEST_F(AssemblerTest, DependenciesSkipTheRoot) {
    auto recorder = std::make_unique<RecordingStrategy>();
    RecordingStrategy* raw = recorder.get();
    AcquisitionChain chain;
    chain.add(std::move(recorder));

    Distribution root = make_dist("app", "1.0");
    DependencySet deps = {root, make_dist("six", "1.11"), make_dist("idna", "2.7")};
    install_dependencies(staging, root, deps, chain);

    EXPECT_EQ(raw->installed, (std::vector<std::string>{"six", "idna"}));
}

TEST_F(AssemblerTest, PopulateWithoutCompilation) {
    write_file(site_dir / "app-1.0.dist-info/top_level.txt", "app\n");
    write_file(site_dir / "app/__init__.py", "VALUE = 1\n");
    write_file(site_dir / "app/__pycache__/__init__.cpython-36.pyc", "");

    auto recorder = std::make_unique<RecordingStrategy>();
    AcquisitionChain chain;
    chain.add(std::move(recorder));

    PackagerConfig config;
    config.compile = false;

    Distribution root = make_dist("app", "1.0");
    DependencySet deps = {root, make_dist("six", "1.11")};
    populate_directory(staging, root, "import app\n", deps, chain, LocalUnpacker(), config);

    EXPECT_EQ(staged_files(), (std::vector<std::string>{"app/__init__.py", "index.py", "six.py"}));
    EXPECT_EQ(read_file(staging / "index.py"), "import app\n");
}

TEST_F(AssemblerTest, CompileProducesLegacyBytecode) {
    if (!have_python3()) GTEST_SKIP() << "python3 not available";

    write_file(staging / "pkg/__init__.py", "");
    write_file(staging / "pkg/mod.py", "def f():\n    return 42\n");

    EXPECT_TRUE(compile_tree(staging, "python3"));
    EXPECT_TRUE(fs::exists(staging / "pkg/mod.pyc"));
    EXPECT_EQ(prune_sources(staging), 2u);
    EXPECT_EQ(staged_files(), (std::vector<std::string>{"pkg/__init__.pyc", "pkg/mod.pyc"}));
}

TEST_F(AssemblerTest, MissingInterpreterThrows) {
    write_file(staging / "a.py", "");
    EXPECT_THROW(compile_tree(staging, "fnpack-no-such-python"), FnpackException);
}
