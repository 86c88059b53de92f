#include <gtest/gtest.h>
#include "core/backup_manager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

class BackupManagerTest : public ::testing::Test {
protected:
    std::string root_;
    std::string tree_;

    void SetUp() override {
        root_ = "/tmp/pubsub-updater-backup-" + std::to_string(getpid());
        tree_ = root_ + "/app";
        fs::remove_all(root_);
        fs::create_directories(tree_ + "/.git/objects");
        fs::create_directories(tree_ + "/lib/nested");
        write(tree_ + "/main.py", "print('hi')\n");
        write(tree_ + "/lib/nested/util.py", "x = 1\n");
        write(tree_ + "/.git/HEAD", "ref: refs/heads/main\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static void write(const std::string& path, const std::string& content) {
        std::ofstream(path) << content;
    }

    static std::string read(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(BackupManagerTest, CopiesTreeWithoutGit) {
    auto result = BackupManager(tree_).create_backup();
    ASSERT_TRUE(result.success) << result.error;

    fs::path backup(result.path);
    EXPECT_EQ(backup.parent_path(), fs::path(root_));
    EXPECT_EQ(backup.filename().string().rfind("app-backup-", 0), 0u);
    EXPECT_EQ(read(result.path + "/main.py"), "print('hi')\n");
    EXPECT_EQ(read(result.path + "/lib/nested/util.py"), "x = 1\n");
    EXPECT_FALSE(fs::exists(result.path + "/.git"));
}

TEST_F(BackupManagerTest, SymlinksStayLinks) {
    fs::create_symlink("main.py", tree_ + "/entry.py");
    auto result = BackupManager(tree_).create_backup();
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(fs::is_symlink(result.path + "/entry.py"));
    EXPECT_EQ(fs::read_symlink(result.path + "/entry.py"), fs::path("main.py"));
}

TEST_F(BackupManagerTest, SameSecondGetsSuffix) {
    auto first = BackupManager(tree_).create_backup();
    auto second = BackupManager(tree_ + "/").create_backup();
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.path, second.path);
    EXPECT_TRUE(fs::exists(first.path + "/main.py"));
    EXPECT_TRUE(fs::exists(second.path + "/main.py"));
}

TEST_F(BackupManagerTest, MissingTreeFails) {
    auto result = BackupManager(root_ + "/nope").create_backup();
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(BackupNameTest, Format) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 5;
    tm.tm_hour = 7;
    tm.tm_min = 8;
    tm.tm_sec = 9;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    EXPECT_EQ(BackupManager::backup_name("svc", t), "svc-backup-20240305-070809");
}
