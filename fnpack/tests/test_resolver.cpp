#include <gtest/gtest.h>
#include "resolver.hpp"
#include "distribution.hpp"
#include "archive.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace {

class MemoryIndex : public PackageIndex {
public:
    void add(const std::string& name, const std::string& version, std::vector<std::string> requirements) {
        Distribution dist;
        dist.project_name = name;
        dist.key = canonical_name(name);
        dist.version = version;
        dist.requirements = std::move(requirements);
        dists_[dist.key] = dist;
    }

    std::optional<Distribution> find(std::string_view name) const override {
        auto it = dists_.find(canonical_name(name));
        if (it == dists_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, Distribution> dists_;
};

std::vector<std::string> keys_of(const DependencySet& deps) {
    std::vector<std::string> keys;
    for (const auto& d : deps) keys.push_back(d.key);
    return keys;
}

} // anonymous namespace

class ResolverTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path site_dir;
    MarkerEnvironment env = marker_environment_for_runtime("python3.6");

    void SetUp() override {
        set_quiet_mode(true);
        init_localization();

        suite_work_dir = fs::absolute("tmp_resolver_test");
        site_dir = suite_work_dir / "site-packages";
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(site_dir);
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
};

TEST_F(ResolverTest, RootComesFirstAndDependenciesFollowInDiscoveryOrder) {
    MemoryIndex index;
    index.add("Flask", "1.0", {"werkzeug", "jinja2"});
    index.add("Werkzeug", "0.14", {});
    index.add("Jinja2", "2.10", {"markupsafe"});
    index.add("MarkupSafe", "1.0", {});

    auto deps = resolve_dependencies(index, "flask");
    EXPECT_EQ(keys_of(deps), (std::vector<std::string>{"flask", "werkzeug", "jinja2", "markupsafe"}));
    EXPECT_EQ(deps.front().project_name, "Flask");
}

TEST_F(ResolverTest, CyclesTerminateWithoutDuplicates) {
    MemoryIndex index;
    index.add("a", "1", {"b"});
    index.add("b", "1", {"c"});
    index.add("c", "1", {"a", "b"});

    auto deps = resolve_dependencies(index, "a");
    ASSERT_EQ(deps.size(), 3u);
    const auto keys = keys_of(deps);
    std::set<std::string> unique(keys.begin(), keys.end());
    EXPECT_EQ(unique.size(), 3u);
}

TEST_F(ResolverTest, SharedDependencyAppearsOnce) {
    MemoryIndex index;
    index.add("app", "1", {"left", "right"});
    index.add("left", "1", {"six"});
    index.add("right", "1", {"six"});
    index.add("six", "1.11", {});

    auto deps = resolve_dependencies(index, "app");
    EXPECT_EQ(keys_of(deps), (std::vector<std::string>{"app", "left", "six", "right"}));
}

TEST_F(ResolverTest, NameLookupIgnoresCase) {
    MemoryIndex index;
    index.add("PyYAML", "3.12", {});

    auto deps = resolve_dependencies(index, "pyyaml");
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].project_name, "PyYAML");
}

TEST_F(ResolverTest, MissingRequirementNamesRequirementAndDeclarer) {
    MemoryIndex index;
    index.add("app", "1", {"ghost"});

    try {
        resolve_dependencies(index, "app");
        FAIL() << "expected UnresolvedDependencyError";
    } catch (const UnresolvedDependencyError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("ghost"), std::string::npos);
        EXPECT_NE(msg.find("app"), std::string::npos);
    }
}

TEST_F(ResolverTest, MissingRootThrows) {
    MemoryIndex index;
    EXPECT_THROW(resolve_dependencies(index, "nothing"), UnresolvedDependencyError);
}

TEST_F(ResolverTest, RequirementKeyStripsSpecifiersAndExtras) {
    EXPECT_EQ(requirement_key("Jinja2 (>=2.10)", env), "jinja2");
    EXPECT_EQ(requirement_key("requests[security]>=2.0", env), "requests");
    EXPECT_EQ(requirement_key("pytest; extra == 'test'", env), "");
    EXPECT_EQ(requirement_key("zope_interface", env), "zope-interface");
}

TEST_F(ResolverTest, RequirementKeyEvaluatesMarkersForTargetRuntime) {
    EXPECT_EQ(requirement_key("enum34; python_version < '3.4'", env), "");
    EXPECT_EQ(requirement_key("dataclasses; python_version < \"3.7\"", env), "dataclasses");
    EXPECT_EQ(requirement_key("pywin32; sys_platform == 'win32'", env), "");
    EXPECT_EQ(requirement_key("uvloop; platform_system != 'Windows' and os_name == 'posix'", env), "uvloop");

    const auto py27 = marker_environment_for_runtime("python2.7");
    EXPECT_EQ(requirement_key("enum34; python_version < '3.4'", py27), "enum34");
    EXPECT_EQ(requirement_key("dataclasses; python_version < \"3.7\"", py27), "dataclasses");
}

TEST_F(ResolverTest, InvalidMarkerKeepsRequirement) {
    EXPECT_EQ(requirement_key("oddity; python_version <<< '3'", env), "oddity");
}

TEST_F(ResolverTest, MarkerExcludedRequirementNeedNotBeInstalled) {
    auto app = parse_metadata(
        "Name: app\nVersion: 1.0\nRequires-Dist: requests\n"
        "Requires-Dist: importlib-metadata; python_version < \"3.8\"\n\n",
        marker_environment_for_runtime("python3.9"));
    EXPECT_EQ(app.requirements, (std::vector<std::string>{"requests"}));

    MemoryIndex index;
    index.add(app.project_name, app.version, app.requirements);
    index.add("requests", "2.20", {});

    auto deps = resolve_dependencies(index, "app");
    EXPECT_EQ(deps.size(), 2u);
    EXPECT_EQ(keys_of(deps), (std::vector<std::string>{"app", "requests"}));
}

TEST_F(ResolverTest, ParseMetadataStopsAtBody) {
    auto dist = parse_metadata(
        "Metadata-Version: 2.1\n"
        "Name: Flask\n"
        "Version: 1.0.2\n"
        "Requires-Dist: Werkzeug (>=0.14)\n"
        "Requires-Dist: click (>=5.1)\n"
        "Requires-Dist: coverage; extra == 'dev'\n"
        "\n"
        "Requires-Dist: not-a-header\n",
        env);
    EXPECT_EQ(dist.project_name, "Flask");
    EXPECT_EQ(dist.key, "flask");
    EXPECT_EQ(dist.version, "1.0.2");
    EXPECT_EQ(dist.requirements, (std::vector<std::string>{"werkzeug", "click"}));
}

TEST_F(ResolverTest, ParseRequiresTxtSkipsExtraSections) {
    auto reqs = parse_requires_txt("six>=1.9\nsetuptools\n\n[security]\npyOpenSSL\n", env);
    EXPECT_EQ(reqs, (std::vector<std::string>{"six", "setuptools"}));
}

TEST_F(ResolverTest, ParseRequiresTxtHonoursMarkerSections) {
    const std::string text =
        "six\n"
        "[:python_version < \"3.4\"]\nenum34\n"
        "[:sys_platform == \"linux\"]\ninotify\n"
        "[socks:python_version >= \"3\"]\nPySocks\n"
        "[security]\npyOpenSSL\n";
    EXPECT_EQ(parse_requires_txt(text, env), (std::vector<std::string>{"six", "inotify"}));
    EXPECT_EQ(parse_requires_txt(text, marker_environment_for_runtime("python2.7")),
              (std::vector<std::string>{"six", "enum34", "inotify"}));
}

TEST_F(ResolverTest, InstalledIndexReadsSiteDirectory) {
    write_file(site_dir / "Flask-1.0.2.dist-info/METADATA",
               "Name: Flask\nVersion: 1.0.2\nRequires-Dist: itsdangerous\n");
    write_file(site_dir / "itsdangerous-0.24.egg-info/PKG-INFO", "Name: itsdangerous\nVersion: 0.24\n");
    write_file(site_dir / "legacy-1.0-py3.6.egg/EGG-INFO/PKG-INFO", "Name: legacy\nVersion: 1.0\n");
    write_file(site_dir / "legacy-1.0-py3.6.egg/EGG-INFO/requires.txt", "six\n");

    // zipped egg
    fs::path egg_src = suite_work_dir / "zipped_src";
    write_file(egg_src / "EGG-INFO/PKG-INFO", "Name: Zipped\nVersion: 2.0\n");
    write_file(egg_src / "zipped/__init__.py", "");
    write_zip_archive(egg_src, site_dir / "Zipped-2.0-py3.6.egg");

    InstalledPackageIndex index({site_dir}, env);
    EXPECT_EQ(index.size(), 4u);

    auto flask = index.find("FLASK");
    ASSERT_TRUE(flask.has_value());
    EXPECT_EQ(flask->version, "1.0.2");
    EXPECT_EQ(flask->location, site_dir);
    EXPECT_EQ(flask->requirements, (std::vector<std::string>{"itsdangerous"}));

    auto legacy = index.find("legacy");
    ASSERT_TRUE(legacy.has_value());
    EXPECT_EQ(legacy->location, site_dir / "legacy-1.0-py3.6.egg");
    EXPECT_EQ(legacy->requirements, (std::vector<std::string>{"six"}));

    auto zipped = index.find("zipped");
    ASSERT_TRUE(zipped.has_value());
    EXPECT_EQ(zipped->location, site_dir / "Zipped-2.0-py3.6.egg");

    auto deps = resolve_dependencies(index, "flask");
    EXPECT_EQ(keys_of(deps), (std::vector<std::string>{"flask", "itsdangerous"}));
}

TEST_F(ResolverTest, FirstSiteDirectoryWins) {
    fs::path user_site = suite_work_dir / "user-site";
    write_file(user_site / "six-1.12.0.dist-info/METADATA", "Name: six\nVersion: 1.12.0\n");
    write_file(site_dir / "six-1.11.0.dist-info/METADATA", "Name: six\nVersion: 1.11.0\n");

    InstalledPackageIndex index({user_site, site_dir, suite_work_dir / "missing"}, env);
    auto six = index.find("six");
    ASSERT_TRUE(six.has_value());
    EXPECT_EQ(six->version, "1.12.0");
}

TEST_F(ResolverTest, UnreadableMetadataIsSkipped) {
    fs::create_directories(site_dir / "broken-1.0.dist-info");
    write_file(site_dir / "ok-1.0.dist-info/METADATA", "Name: ok\nVersion: 1.0\n");

    InstalledPackageIndex index({site_dir}, env);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_FALSE(index.find("broken").has_value());
}
