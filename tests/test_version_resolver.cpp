#include "git_fixture.hpp"
#include "core/version_resolver.hpp"

class VersionResolverTest : public GitFixture {};

TEST_F(VersionResolverTest, ReleaseBranchBeatsVersionFile) {
    publish_branch("release/2.0.0", {{"app.txt", "two\n"}});
    clone_work();
    ASSERT_EQ(git(work_, "checkout -q -b release/2.0.0 origin/release/2.0.0"), 0);

    // VERSION on this branch still says 1.0.0
    auto resolved = VersionResolver().resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "2.0.0");
    EXPECT_EQ(resolved->source, "branch");
}

TEST_F(VersionResolverTest, CustomPrefix) {
    publish_branch("Release/3.1", {});
    clone_work();
    ASSERT_EQ(git(work_, "checkout -q -b Release/3.1 origin/Release/3.1"), 0);

    auto resolved = VersionResolver(std::vector<std::string>{"Release/"}).resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "3.1");
}

TEST_F(VersionResolverTest, VersionFileBeatsTags) {
    clone_work();
    ASSERT_EQ(git(work_, "tag v0.5.0"), 0);

    auto resolved = VersionResolver().resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "1.0.0");
    EXPECT_EQ(resolved->source, "VERSION file");
}

TEST_F(VersionResolverTest, VersionFileFirstLineTrimmed) {
    clone_work();
    write_file(work_ + "/VERSION", "  1.7.2 \nsecond line\n");

    auto resolved = VersionResolver().resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "1.7.2");
}

TEST_F(VersionResolverTest, DescribeNormalized) {
    clone_work();
    ASSERT_EQ(git(work_, "rm -q VERSION"), 0);
    ASSERT_EQ(commit_all(work_, "drop VERSION"), 0);
    ASSERT_EQ(git(work_, "tag v1.4.0"), 0);
    write_file(work_ + "/app.txt", "after tag\n");
    ASSERT_EQ(commit_all(work_, "after tag"), 0);

    auto resolved = VersionResolver().resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "1.4.0");
    EXPECT_EQ(resolved->source, "git describe");
}

TEST_F(VersionResolverTest, FallsBackToBranchName) {
    clone_work();
    ASSERT_EQ(git(work_, "rm -q VERSION"), 0);
    ASSERT_EQ(commit_all(work_, "drop VERSION"), 0);

    auto resolved = VersionResolver().resolve(work_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "main");
    EXPECT_EQ(resolved->source, "branch name");
}

TEST_F(VersionResolverTest, PlainDirectoryWithVersionFile) {
    std::string dir = root_ + "/plain";
    write_file(dir + "/VERSION", "4.2\n");

    auto resolved = VersionResolver().resolve(dir);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->version.literal(), "4.2");
}

TEST_F(VersionResolverTest, NothingToGoOn) {
    std::string dir = root_ + "/empty";
    fs::create_directories(dir);
    EXPECT_FALSE(VersionResolver().resolve(dir).has_value());
}

TEST(VersionResolverStaticTest, StripReleasePrefix) {
    std::vector<std::string> prefixes = {"release/", "Release/"};
    EXPECT_EQ(VersionResolver::strip_release_prefix("release/1.2.3", prefixes).value_or(""), "1.2.3");
    EXPECT_EQ(VersionResolver::strip_release_prefix("Release/0.9", prefixes).value_or(""), "0.9");
    EXPECT_FALSE(VersionResolver::strip_release_prefix("main", prefixes).has_value());
    EXPECT_FALSE(VersionResolver::strip_release_prefix("release/", prefixes).has_value());
    EXPECT_FALSE(VersionResolver::strip_release_prefix("feature/release/1.0", prefixes).has_value());
}

TEST(VersionResolverStaticTest, NormalizeDescribe) {
    EXPECT_EQ(VersionResolver::normalize_describe("v1.4.0-3-gabc1234"), "1.4.0");
    EXPECT_EQ(VersionResolver::normalize_describe("V2.0"), "2.0");
    EXPECT_EQ(VersionResolver::normalize_describe("1.0.0"), "1.0.0");
}
