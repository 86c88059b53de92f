#include <gtest/gtest.h>

#include <cstdlib>

#include "core/cli.hpp"
#include "git_fixture.hpp"

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, NoArgs_ReturnsTUI) {
    char* argv[] = { (char*)"pubsub-updater" };
    EXPECT_EQ(CLI::run(1, argv), -1);
}

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, VersionOutput) {
    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(output.rfind("pubsub-updater ", 0), 0u);
}

TEST(CLIDispatch, Serve_ReturnsDaemonCode) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"serve" };
    EXPECT_EQ(CLI::run(2, argv), -2);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, UpdateUnknownOption_ReturnsError) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--yes" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

TEST(CLIDispatch, UpdateRestartAndRelaunch_ReturnsError) {
    char* argv[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--restart", (char*)"--relaunch" };
    EXPECT_EQ(CLI::run(4, argv), 1);
}

TEST(CLIDispatch, HelpListsCommands) {
    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"help" };
    CLI::run(2, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("check"), std::string::npos);
    EXPECT_NE(output.find("update"), std::string::npos);
    EXPECT_NE(output.find("serve"), std::string::npos);
    EXPECT_NE(output.find("--force"), std::string::npos);
}

// ── Commands against a real working tree ────────────────────

class CLIRepoTest : public GitFixture {
protected:
    void SetUp() override {
        GitFixture::SetUp();
        env_.set("PUBSUB_UPDATER_REPO", work_);
    }
};

TEST_F(CLIRepoTest, CheckReportsUpdate) {
    publish_branch("release/1.0.1", {});
    clone_work();

    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"check" };
    int rc = CLI::run(2, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, CLI::kUpdateAvailable);
    EXPECT_NE(output.find("Installed: 1.0.0"), std::string::npos);
    EXPECT_NE(output.find("Latest:    1.0.1"), std::string::npos);
}

TEST_F(CLIRepoTest, CheckUpToDate) {
    clone_work();
    char* argv[] = { (char*)"pubsub-updater", (char*)"check" };
    EXPECT_EQ(CLI::run(2, argv), CLI::kUpToDate);
}

TEST_F(CLIRepoTest, CheckNetworkFailure) {
    clone_work();
    ASSERT_EQ(git(work_, "remote set-url origin " + q(root_ + "/gone.git")), 0);
    char* argv[] = { (char*)"pubsub-updater", (char*)"check" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST_F(CLIRepoTest, UpdateNothingToDo) {
    clone_work();
    char* argv[] = { (char*)"pubsub-updater", (char*)"update" };
    EXPECT_EQ(CLI::run(2, argv), CLI::kNoUpdate);
}

TEST_F(CLIRepoTest, UpdateAfterInPlaceRestartSucceeds) {
    publish_branch("release/1.0", {});
    clone_work();
    env_.set(CLI::kRestartedEnv, "1.0");

    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--restart" };
    int rc = CLI::run(3, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0) << output;
    EXPECT_NE(output.find("Restarted after updating to 1.0"), std::string::npos);
    EXPECT_EQ(std::getenv(CLI::kRestartedEnv), nullptr);

    // Without the marker the same state is plain "nothing to do"
    EXPECT_EQ(CLI::run(3, argv), CLI::kNoUpdate);
}

TEST_F(CLIRepoTest, UpdateApplies) {
    publish_branch("release/1.0.1", {{"app.txt", "1.0.1\n"}});
    clone_work();

    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--no-backup" };
    int rc = CLI::run(3, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0) << output;
    EXPECT_EQ(read_file(work_ + "/app.txt"), "1.0.1\n");
    EXPECT_NE(output.find("==> Fetching"), std::string::npos);
    EXPECT_NE(output.find("Restart the application"), std::string::npos);
}

TEST_F(CLIRepoTest, UpdateRefusesDirtyTreeUnlessForced) {
    publish_branch("release/1.0.1", {{"app.txt", "1.0.1\n"}});
    clone_work();
    write_file(work_ + "/app.txt", "local\n");

    char* safe[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--no-backup" };
    EXPECT_EQ(CLI::run(3, safe), CLI::kUpdateFailed);
    EXPECT_EQ(read_file(work_ + "/app.txt"), "local\n");

    char* forced[] = { (char*)"pubsub-updater", (char*)"update", (char*)"--force", (char*)"--no-backup" };
    EXPECT_EQ(CLI::run(4, forced), 0);
    EXPECT_EQ(read_file(work_ + "/app.txt"), "1.0.1\n");
}

TEST_F(CLIRepoTest, StatusInWorkingTree) {
    clone_work();
    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pubsub-updater", (char*)"status" };
    int rc = CLI::run(2, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_NE(output.find("Version:      1.0.0 (from VERSION file)"), std::string::npos);
    EXPECT_NE(output.find("Branch:       main"), std::string::npos);
}

TEST_F(CLIRepoTest, StatusOutsideRepository) {
    fs::create_directories(work_);
    char* argv[] = { (char*)"pubsub-updater", (char*)"status" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}
