#include "git_fixture.hpp"
#include "core/update_coordinator.hpp"
#include "core/update_lock.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

class UpdateCoordinatorTest : public GitFixture {};

TEST_F(UpdateCoordinatorTest, CheckFindsNewerRelease) {
    publish_branch("release/1.0.1", {});
    publish_branch("release/0.9.0", {});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    auto result = coordinator.check();

    ASSERT_EQ(result.status, CheckStatus::UpdateAvailable) << result.message;
    EXPECT_TRUE(result.update_available());
    ASSERT_TRUE(result.current.has_value());
    EXPECT_EQ(result.current->literal(), "1.0.0");
    EXPECT_EQ(result.current_source, "VERSION file");
    ASSERT_TRUE(result.latest.has_value());
    EXPECT_EQ(result.latest->remote_ref, "origin/release/1.0.1");
}

TEST_F(UpdateCoordinatorTest, CheckUpToDate) {
    publish_branch("release/1.0", {});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    EXPECT_EQ(coordinator.check().status, CheckStatus::UpToDate);
}

TEST_F(UpdateCoordinatorTest, CheckAhead) {
    publish_branch("release/0.9.0", {});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    auto result = coordinator.check();
    EXPECT_EQ(result.status, CheckStatus::Ahead);
    EXPECT_FALSE(result.update_available());
}

TEST_F(UpdateCoordinatorTest, CheckNoReleases) {
    clone_work();
    UpdateCoordinator coordinator(work_config());
    EXPECT_EQ(coordinator.check().status, CheckStatus::NoReleases);
}

TEST_F(UpdateCoordinatorTest, CheckNetworkFailure) {
    clone_work();
    ASSERT_EQ(git(work_, "remote set-url origin " + q(root_ + "/gone.git")), 0);

    UpdateCoordinator coordinator(work_config());
    auto result = coordinator.check();
    EXPECT_EQ(result.status, CheckStatus::NetworkFailure);
    EXPECT_TRUE(result.current.has_value());
}

TEST_F(UpdateCoordinatorTest, CheckVersionUndetectable) {
    std::string dir = root_ + "/empty";
    fs::create_directories(dir);
    auto cfg = work_config();
    cfg.repo_path = dir;

    UpdateCoordinator coordinator(cfg);
    auto result = coordinator.check();
    EXPECT_EQ(result.status, CheckStatus::VersionUndetectable);
    EXPECT_FALSE(result.current.has_value());
}

TEST_F(UpdateCoordinatorTest, UpdateThenUpToDate) {
    publish_branch("release/1.0.1", {{"app.txt", "1.0.1\n"}});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    auto check = coordinator.check();
    ASSERT_TRUE(check.latest.has_value());

    auto outcome = coordinator.run(*check.latest, SessionMode::Safe);
    ASSERT_TRUE(outcome.succeeded()) << outcome.summary;
    EXPECT_FALSE(coordinator.is_running());
    ASSERT_TRUE(coordinator.last_outcome().has_value());
    EXPECT_EQ(coordinator.last_outcome()->summary, outcome.summary);

    auto after = coordinator.check();
    EXPECT_EQ(after.status, CheckStatus::UpToDate) << after.message;
    EXPECT_EQ(after.current_source, "branch");
}

TEST_F(UpdateCoordinatorTest, SecondStartRejectedWhileRunning) {
    publish_branch("release/1.0.1", {});
    clone_work();

    std::promise<void> entered;
    std::promise<void> release_worker;
    auto released = release_worker.get_future().share();

    ProgressCallbacks cb;
    cb.on_state = [&entered, released](UpdateState s) {
        if (s == UpdateState::Fetching) {
            entered.set_value();
            released.wait();
        }
    };

    UpdateCoordinator coordinator(work_config());
    ASSERT_EQ(coordinator.run_async(release("1.0.1"), SessionMode::Safe, cb), StartResult::Started);
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(30)), std::future_status::ready);

    EXPECT_TRUE(coordinator.is_running());
    ASSERT_TRUE(coordinator.active_state().has_value());
    EXPECT_EQ(*coordinator.active_state(), UpdateState::Fetching);

    EXPECT_EQ(coordinator.run_async(release("1.0.1"), SessionMode::Safe), StartResult::AlreadyRunning);
    auto rejected = coordinator.run(release("1.0.1"), SessionMode::Safe);
    EXPECT_EQ(rejected.state, UpdateState::Failed);
    EXPECT_EQ(rejected.error, UpdateError::AlreadyRunning);

    release_worker.set_value();
    coordinator.wait();

    EXPECT_FALSE(coordinator.is_running());
    ASSERT_TRUE(coordinator.last_outcome().has_value());
    EXPECT_TRUE(coordinator.last_outcome()->succeeded()) << coordinator.last_outcome()->summary;

    // The guard is free again
    EXPECT_EQ(coordinator.run_async(release("1.0.1"), SessionMode::Safe), StartResult::Started);
    coordinator.wait();
}

TEST_F(UpdateCoordinatorTest, CancelRunningSession) {
    publish_branch("release/1.0.1", {});
    clone_work();

    std::promise<void> entered;
    std::promise<void> release_worker;
    auto released = release_worker.get_future().share();

    ProgressCallbacks cb;
    cb.on_state = [&entered, released](UpdateState s) {
        if (s == UpdateState::Fetching) {
            entered.set_value();
            released.wait();
        }
    };

    UpdateCoordinator coordinator(work_config());
    ASSERT_EQ(coordinator.run_async(release("1.0.1"), SessionMode::Safe, cb), StartResult::Started);
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(30)), std::future_status::ready);

    EXPECT_TRUE(coordinator.cancel());
    release_worker.set_value();
    coordinator.wait();

    ASSERT_TRUE(coordinator.last_outcome().has_value());
    EXPECT_EQ(coordinator.last_outcome()->state, UpdateState::Cancelled);
    EXPECT_FALSE(coordinator.cancel());
}

TEST_F(UpdateCoordinatorTest, CancelAsSoonAsRunningReachesNewSession) {
    publish_branch("release/1.0.1", {});
    publish_branch("release/1.0.2", {});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    ASSERT_TRUE(coordinator.run(release("1.0.1"), SessionMode::Safe).succeeded());

    // Cancel the instant the guard is taken, possibly before the new
    // session object exists
    std::atomic<bool> cancelled{false};
    std::thread canceller([&] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (!coordinator.is_running() && std::chrono::steady_clock::now() < deadline) {
        }
        cancelled = coordinator.cancel();
    });

    ASSERT_EQ(coordinator.run_async(release("1.0.2"), SessionMode::Safe), StartResult::Started);
    canceller.join();
    coordinator.wait();

    ASSERT_TRUE(cancelled.load());
    ASSERT_TRUE(coordinator.last_outcome().has_value());
    EXPECT_EQ(coordinator.last_outcome()->target.version.literal(), "1.0.2");
    EXPECT_EQ(coordinator.last_outcome()->state, UpdateState::Cancelled);
}

TEST_F(UpdateCoordinatorTest, CancelWhenIdle) {
    publish_branch("release/1.0.1", {});
    clone_work();

    UpdateCoordinator coordinator(work_config());
    EXPECT_FALSE(coordinator.cancel());
    ASSERT_TRUE(coordinator.run(release("1.0.1"), SessionMode::Safe).succeeded());
    EXPECT_FALSE(coordinator.cancel());
}

TEST_F(UpdateCoordinatorTest, LockHeldByAnotherUpdater) {
    publish_branch("release/1.0.1", {});
    clone_work();

    auto foreign = UpdateLock::try_acquire(work_);
    ASSERT_NE(foreign, nullptr);

    UpdateCoordinator coordinator(work_config());
    EXPECT_EQ(coordinator.run_async(release("1.0.1"), SessionMode::Safe), StartResult::LockHeld);
    EXPECT_FALSE(coordinator.is_running());
    EXPECT_EQ(coordinator.run(release("1.0.1"), SessionMode::Safe).error, UpdateError::AlreadyRunning);

    foreign.reset();
    EXPECT_TRUE(coordinator.run(release("1.0.1"), SessionMode::Safe).succeeded());
}

TEST_F(UpdateCoordinatorTest, TargetForBranch) {
    clone_work();
    UpdateCoordinator coordinator(work_config());

    auto rel = coordinator.target_for_branch("release/2.0");
    EXPECT_EQ(rel.version.literal(), "2.0");
    EXPECT_EQ(rel.remote_ref, "origin/release/2.0");

    auto main = coordinator.target_for_branch("main");
    EXPECT_EQ(main.version.literal(), "main");
    EXPECT_EQ(main.branch, "main");
    EXPECT_EQ(main.remote_ref, "origin/main");
}

TEST_F(UpdateCoordinatorTest, SessionOptionsFollowConfig) {
    auto cfg = work_config();
    cfg.backup = true;
    cfg.fetch_depth = 1;
    cfg.deps_enabled = true;
    cfg.deps_manifest = "deps.txt";
    UpdateCoordinator coordinator(cfg);

    auto o = coordinator.session_options(SessionMode::DiscardAndForce);
    EXPECT_EQ(o.mode, SessionMode::DiscardAndForce);
    EXPECT_TRUE(o.create_backup);
    EXPECT_EQ(o.fetch_depth, 1);
    EXPECT_TRUE(o.sync_dependencies);
    EXPECT_EQ(o.deps_manifest, "deps.txt");
}

TEST_F(UpdateCoordinatorTest, RelauncherPath) {
    auto cfg = work_config();
    cfg.relauncher_path = "/opt/tools/pubsub-relauncher";
    EXPECT_EQ(UpdateCoordinator(cfg).relauncher_path(), "/opt/tools/pubsub-relauncher");

    cfg.relauncher_path.clear();
    std::string derived = UpdateCoordinator(cfg).relauncher_path();
    EXPECT_EQ(fs::path(derived).filename(), "pubsub-relauncher");
}
