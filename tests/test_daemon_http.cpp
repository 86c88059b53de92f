#include "git_fixture.hpp"
#include "daemon/daemon.hpp"
#include "daemon/webhook_signature.hpp"
#include "core/process_runner.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <signal.h>

using json = nlohmann::json;

static const char* kPushBody =
    R"({"ref":"refs/heads/main","commits":[{"message":"Fix the frobnicator"},{"message":"Bump"}]})";

class DaemonHttpTest : public GitFixture {
protected:
    Config config_;
    std::unique_ptr<Daemon> daemon_;
    std::thread thread_;
    std::unique_ptr<httplib::Client> client_;

    void TearDown() override {
        if (daemon_) {
            daemon_->request_stop();
            if (thread_.joinable()) thread_.join();
            daemon_.reset();
        }
        GitFixture::TearDown();
    }

    void start(const std::function<void(AppConfig&)>& tweak = {}) {
        clone_work();
        config_.data() = work_config();
        config_.data().webhook_host = "127.0.0.1";
        config_.data().webhook_port = 0;
        if (tweak) tweak(config_.data());

        daemon_ = std::make_unique<Daemon>(config_);
        thread_ = std::thread([this] { daemon_->run(); });
        ASSERT_TRUE(daemon_->wait_until_listening(5000));
        client_ = std::make_unique<httplib::Client>("127.0.0.1", daemon_->port());
        client_->set_read_timeout(10, 0);
    }

    httplib::Result post_webhook(const std::string& event, const std::string& body,
                                 const std::string& signature = "") {
        httplib::Headers headers = {{"X-GitHub-Event", event}, {"X-GitHub-Delivery", "test-delivery"}};
        if (!signature.empty()) headers.emplace("X-Hub-Signature-256", signature);
        return client_->Post("/webhook", headers, body, "application/json");
    }

    bool wait_for_file(const std::string& path, const std::string& content, int seconds) {
        for (int i = 0; i < seconds * 10; ++i) {
            if (read_file(path) == content) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return false;
    }
};

TEST_F(DaemonHttpTest, Health) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto res = client_->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["service"], "pubsub-updater");
    EXPECT_EQ(body["update_path_present"], true);
    EXPECT_EQ(body["secret_configured"], false);
    EXPECT_EQ(body["signature_required"], false);
    EXPECT_EQ(body["target_branch"], "main");
    EXPECT_EQ(body["session_active"], false);
    EXPECT_EQ(body["version"], "1.0.0");
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(DaemonHttpTest, Index) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto res = client_->Get("/");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(json::parse(res->body).contains("endpoints"));
}

TEST_F(DaemonHttpTest, PushToTargetBranchUpdatesTree) {
    ASSERT_NO_FATAL_FAILURE(start());
    push_commit("main", "app.txt", "pushed\n");

    auto res = post_webhook("push", kPushBody);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["status"], "accepted");
    EXPECT_EQ(body["branch"], "main");

    EXPECT_TRUE(wait_for_file(work_ + "/app.txt", "pushed\n", 30));

    // The push event recorded its commit summary
    bool found = false;
    for (const auto& e : daemon_->events().recent(100)) {
        if (e.data.is_object() && e.data.contains("commits")) {
            EXPECT_EQ(e.data["commits"], 2);
            EXPECT_EQ(e.data["messages"][0], "Fix the frobnicator");
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(DaemonHttpTest, PushDiscardsLocalEdits) {
    ASSERT_NO_FATAL_FAILURE(start());
    push_commit("main", "app.txt", "pushed\n");
    write_file(work_ + "/app.txt", "hand edit\n");

    auto res = post_webhook("push", kPushBody);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(wait_for_file(work_ + "/app.txt", "pushed\n", 30));
}

TEST_F(DaemonHttpTest, PushToOtherBranchIgnored) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto res = post_webhook("push", R"({"ref":"refs/heads/feature/x"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["status"], "ignored");
}

TEST_F(DaemonHttpTest, LatestReleaseMatchesAnyReleaseBranch) {
    ASSERT_NO_FATAL_FAILURE(start([](AppConfig& c) { c.webhook_target_branch = "latest-release"; }));

    auto release = post_webhook("push", R"({"ref":"refs/heads/release/2.0"})");
    ASSERT_TRUE(release);
    EXPECT_EQ(release->status, 202);

    auto main = post_webhook("push", R"({"ref":"refs/heads/main"})");
    ASSERT_TRUE(main);
    EXPECT_EQ(main->status, 200);
}

TEST_F(DaemonHttpTest, PingAndOtherEvents) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto ping = post_webhook("ping", "{}");
    ASSERT_TRUE(ping);
    EXPECT_EQ(ping->status, 200);
    EXPECT_EQ(json::parse(ping->body)["status"], "pong");

    auto issue = post_webhook("issues", "{}");
    ASSERT_TRUE(issue);
    EXPECT_EQ(issue->status, 200);
    EXPECT_EQ(json::parse(issue->body)["status"], "ignored");
}

TEST_F(DaemonHttpTest, InvalidJson) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto res = post_webhook("push", "{not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(DaemonHttpTest, SignatureEnforcedWithSecret) {
    ASSERT_NO_FATAL_FAILURE(start([](AppConfig& c) { c.webhook_secret = "s3cret"; }));

    auto missing = post_webhook("push", kPushBody);
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 401);

    std::string good = "sha256=" + WebhookSignature::hmac_sha256_hex("s3cret", kPushBody);
    std::string bad = good;
    bad.back() = bad.back() == '0' ? '1' : '0';
    auto wrong = post_webhook("push", kPushBody, bad);
    ASSERT_TRUE(wrong);
    EXPECT_EQ(wrong->status, 401);

    std::string ping_body = "{}";
    auto ok = post_webhook("ping", ping_body,
                           "sha256=" + WebhookSignature::hmac_sha256_hex("s3cret", ping_body));
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 200);

    auto health = json::parse(client_->Get("/health")->body);
    EXPECT_EQ(health["secret_configured"], true);
    EXPECT_EQ(health["signature_required"], true);
}

TEST_F(DaemonHttpTest, RequiredSignatureWithoutSecret) {
    ASSERT_NO_FATAL_FAILURE(start([](AppConfig& c) { c.webhook_require_signature = true; }));
    auto res = post_webhook("push", kPushBody);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
}

TEST_F(DaemonHttpTest, UnsignedAcceptedWithWarning) {
    ASSERT_NO_FATAL_FAILURE(start());
    auto res = post_webhook("ping", "{}");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto warnings = daemon_->events().recent(100, "warning");
    ASSERT_FALSE(warnings.empty());
    EXPECT_NE(warnings.back().message.find("unsigned"), std::string::npos);
}

TEST_F(DaemonHttpTest, ManualTrigger) {
    ASSERT_NO_FATAL_FAILURE(start());
    push_commit("main", "app.txt", "triggered\n");

    auto res = client_->Post("/trigger", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(wait_for_file(work_ + "/app.txt", "triggered\n", 30));
}

TEST_F(DaemonHttpTest, UpdateRestartsTrackedApplication) {
    std::string pid_file = root_ + "/app.pid";
    pid_t old_app = ProcessRunner::spawn_detached({"/bin/sleep", "60"}, "");
    ASSERT_GT(old_app, 0);
    write_file(pid_file, std::to_string(old_app) + "\n");

    ASSERT_NO_FATAL_FAILURE(start([&](AppConfig& c) {
        c.app_command = {"/bin/sleep", "60"};
        c.app_pid_file = pid_file;
        c.app_stop_timeout_sec = 5;
    }));
    push_commit("main", "app.txt", "restarted\n");

    auto res = client_->Post("/trigger", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(wait_for_file(work_ + "/app.txt", "restarted\n", 30));

    pid_t new_app = -1;
    for (int i = 0; i < 100; ++i) {
        std::string recorded = read_file(pid_file);
        if (!recorded.empty() && recorded != std::to_string(old_app) + "\n") {
            new_app = static_cast<pid_t>(std::stol(recorded));
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ASSERT_GT(new_app, 0);
    EXPECT_FALSE(ProcessRunner::is_alive(old_app));
    EXPECT_TRUE(ProcessRunner::is_alive(new_app));

    kill(new_app, SIGKILL);
    kill(old_app, SIGKILL);
}

TEST_F(DaemonHttpTest, SupervisedCrashIsLogged) {
    ASSERT_NO_FATAL_FAILURE(start([](AppConfig& c) {
        c.supervise_application = true;
        c.app_command = {"/bin/sh", "-c", "exit 3"};
    }));

    bool found = false;
    for (int i = 0; i < 50 && !found; ++i) {
        for (const auto& e : daemon_->events().recent(100)) {
            if (e.level == "error" && e.data.is_object() && e.data.contains("exit_code")) {
                EXPECT_EQ(e.data["exit_code"], 3);
                found = true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    EXPECT_TRUE(found);
}

TEST_F(DaemonHttpTest, NonStringFieldsInPushPayload) {
    ASSERT_NO_FATAL_FAILURE(start());

    auto bad_ref = post_webhook("push", R"({"ref":42})");
    ASSERT_TRUE(bad_ref);
    EXPECT_EQ(bad_ref->status, 400);

    bool logged = false;
    for (const auto& e : daemon_->events().recent(100)) {
        if (e.level == "error" && e.message.find("'ref'") != std::string::npos) logged = true;
    }
    EXPECT_TRUE(logged);

    // Odd commit entries do not spoil an otherwise valid push
    auto odd_commits = post_webhook("push", R"({"ref":"refs/heads/main","commits":[{"message":7},"x"]})");
    ASSERT_TRUE(odd_commits);
    EXPECT_EQ(odd_commits->status, 202);
}

TEST_F(DaemonHttpTest, Logs) {
    ASSERT_NO_FATAL_FAILURE(start());
    post_webhook("ping", "{}");
    post_webhook("push", "{not json");

    auto all = client_->Get("/logs");
    ASSERT_TRUE(all);
    EXPECT_EQ(all->status, 200);
    auto body = json::parse(all->body);
    EXPECT_GE(body["total_stored"].get<int>(), 3);
    EXPECT_EQ(body["total_entries"].get<size_t>(), body["log_entries"].size());

    auto limited = json::parse(client_->Get("/logs?limit=2")->body);
    EXPECT_EQ(limited["log_entries"].size(), 2u);

    auto errors = json::parse(client_->Get("/logs?level=error")->body);
    ASSERT_FALSE(errors["log_entries"].empty());
    for (const auto& e : errors["log_entries"]) EXPECT_EQ(e["level"], "error");

    auto bad = client_->Get("/logs?limit=lots");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
}
