#include <gtest/gtest.h>
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

class ArchiveTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path source_dir;

    void SetUp() override {
        set_quiet_mode(true);
        init_localization();

        suite_work_dir = fs::absolute("tmp_archive_test");
        source_dir = suite_work_dir / "src";
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(source_dir);
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
};

TEST_F(ArchiveTest, ZipContainsRelativeSortedFilesOnly) {
    write_file(source_dir / "index.py", "import handler\n");
    write_file(source_dir / "pkg/__init__.pyc", "bytecode");
    write_file(source_dir / "pkg/sub/mod.pyc", "more bytecode");
    write_file(source_dir / "b.txt", "b");
    fs::create_directories(source_dir / "empty");

    fs::path zip = suite_work_dir / "out.zip";
    write_zip_archive(source_dir, zip);

    auto members = list_archive_members(zip);
    EXPECT_EQ(members, (std::vector<std::string>{"b.txt", "index.py", "pkg/__init__.pyc", "pkg/sub/mod.pyc"}));
    for (const auto& m : members) {
        EXPECT_FALSE(m.starts_with("/")) << m;
    }
}

TEST_F(ArchiveTest, ExtractRestoresContent) {
    write_file(source_dir / "pkg/data.txt", "payload");
    write_file(source_dir / "top.py", "x = 1\n");

    fs::path zip = suite_work_dir / "out.zip";
    write_zip_archive(source_dir, zip);

    fs::path out = suite_work_dir / "out";
    size_t count = extract_archive(zip, out, IgnorePatternSet());
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(read_file(out / "pkg/data.txt"), "payload");
    EXPECT_EQ(read_file(out / "top.py"), "x = 1\n");
}

TEST_F(ArchiveTest, EqualTreesProduceIdenticalArchives) {
    write_file(source_dir / "a/one.py", "1");
    write_file(source_dir / "z.py", "2");

    fs::path first = suite_work_dir / "first.zip";
    write_zip_archive(source_dir, first);

    fs::last_write_time(source_dir / "z.py", fs::file_time_type::clock::now() - std::chrono::hours(24));
    fs::path second = suite_work_dir / "second.zip";
    write_zip_archive(source_dir, second);

    EXPECT_EQ(read_file(first), read_file(second));
}

TEST_F(ArchiveTest, ExtractSkipsIgnoredMembers) {
    write_file(source_dir / "pkg/__init__.py", "");
    write_file(source_dir / "pkg/__pycache__/__init__.cpython-36.pyc", "");
    write_file(source_dir / ".git/HEAD", "ref");

    fs::path zip = suite_work_dir / "out.zip";
    write_zip_archive(source_dir, zip);

    fs::path out = suite_work_dir / "out";
    size_t count = extract_archive(zip, out, IgnorePatternSet());
    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(fs::exists(out / "pkg/__init__.py"));
    EXPECT_FALSE(fs::exists(out / "pkg/__pycache__"));
    EXPECT_FALSE(fs::exists(out / ".git"));
}

TEST_F(ArchiveTest, ExtractWithFilterWritesOnlySelectedMembers) {
    write_file(source_dir / "keep/a.py", "a");
    write_file(source_dir / "drop/b.py", "b");

    fs::path zip = suite_work_dir / "out.zip";
    write_zip_archive(source_dir, zip);

    fs::path out = suite_work_dir / "out";
    size_t count = extract_archive(zip, out, IgnorePatternSet(),
                                   [](const std::string& member) { return member.starts_with("keep/"); });
    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(fs::exists(out / "keep/a.py"));
    EXPECT_FALSE(fs::exists(out / "drop"));
}

TEST_F(ArchiveTest, ReadSingleMember) {
    write_file(source_dir / "EGG-INFO/top_level.txt", "pkg\n");
    write_file(source_dir / "pkg/__init__.py", "");

    fs::path zip = suite_work_dir / "pkg.egg";
    write_zip_archive(source_dir, zip);

    auto content = read_archive_member(zip, "EGG-INFO/top_level.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "pkg\n");
    EXPECT_FALSE(read_archive_member(zip, "EGG-INFO/missing.txt").has_value());
}

TEST_F(ArchiveTest, OpeningMissingArchiveThrows) {
    EXPECT_THROW(list_archive_members(suite_work_dir / "nope.zip"), FnpackException);
}
