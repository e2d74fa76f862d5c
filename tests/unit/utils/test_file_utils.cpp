//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/utils/file_utils.h"
#include <filesystem>

using namespace insight::utils;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "insight_file_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    [[nodiscard]] std::string test_path(const std::string& filename) const {
        return (temp_dir / filename).string();
    }

    fs::path temp_dir;
};

TEST_F(FileUtilsTest, ReadMissingFile) {
    EXPECT_FALSE(read_file(test_path("missing.txt")).has_value());
    EXPECT_FALSE(file_exists(test_path("missing.txt")));
}

TEST_F(FileUtilsTest, WriteCreatesParentDirectories) {
    const auto path = test_path("a/b/c.txt");

    ASSERT_TRUE(write_file(path, "content"));
    EXPECT_TRUE(file_exists(path));
    EXPECT_EQ(read_file(path).value_or(""), "content");
}

TEST_F(FileUtilsTest, AtomicWriteReplacesContent) {
    const auto path = test_path("state.json");
    ASSERT_TRUE(write_file(path, "old"));

    ASSERT_TRUE(write_file_atomic(path, "new"));
    EXPECT_EQ(read_file(path).value_or(""), "new");
    EXPECT_FALSE(file_exists(path + ".tmp"));
}

TEST_F(FileUtilsTest, RemoveFile) {
    const auto path = test_path("gone.txt");
    ASSERT_TRUE(write_file(path, "x"));

    EXPECT_TRUE(remove_file(path));
    EXPECT_FALSE(file_exists(path));
    EXPECT_FALSE(remove_file(path));
}

TEST_F(FileUtilsTest, DirectoryIsNotAFile) {
    EXPECT_FALSE(file_exists(temp_dir.string()));
}
