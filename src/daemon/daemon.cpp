#include "daemon/daemon.hpp"
#include "daemon/webhook_signature.hpp"
#include "core/app_instance.hpp"
#include "core/process_runner.hpp"
#include "core/version_resolver.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <filesystem>

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

static constexpr const char* kLatestRelease = "latest-release";

struct Daemon::Http {
    httplib::Server server;
};

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

static void reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static std::string iso_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

static std::string level_for(const SessionOutcome& outcome) {
    if (outcome.state == UpdateState::Failed) return "error";
    if (outcome.state == UpdateState::Cancelled || !outcome.warnings.empty()) return "warning";
    return "info";
}

// ════════════════════════════════════════════════════════════
// Daemon
// ════════════════════════════════════════════════════════════

Daemon::Daemon(Config& config)
    : config_(config),
      coordinator_(config.data()),
      events_(config.data().webhook_log_capacity > 0
                  ? static_cast<size_t>(config.data().webhook_log_capacity) : 100),
      http_(std::make_unique<Http>()) {
    setup_routes();
}

Daemon::~Daemon() {
    request_stop();
    if (http_) http_->server.stop();
    trigger_cv_.notify_all();
    if (maintenance_thread_.joinable()) maintenance_thread_.join();
}

bool Daemon::signature_configured() const {
    return !config_.data().webhook_secret.empty();
}

bool Daemon::branch_matches_target(const std::string& branch) const {
    const auto& cfg = config_.data();
    if (cfg.webhook_target_branch == kLatestRelease) {
        return VersionResolver::strip_release_prefix(branch, cfg.release_prefixes).has_value();
    }
    return branch == cfg.webhook_target_branch;
}

bool Daemon::wait_until_listening(int timeout_ms) const {
    for (int waited = 0; waited < timeout_ms; waited += 20) {
        if (port_.load() > 0 && http_->server.is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

// ── Routes ──────────────────────────────────────────────────

void Daemon::setup_routes() {
    auto& svr = http_->server;
    const auto& cfg = config_.data();

    svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response&) {
        spdlog::info("[Webhook] {} {} from {} ua='{}' event='{}' delivery='{}' length={}",
                     req.method, req.path, req.remote_addr,
                     req.get_header_value("User-Agent"),
                     req.get_header_value("X-GitHub-Event"),
                     req.get_header_value("X-GitHub-Delivery"),
                     req.get_header_value("Content-Length"));
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Post(cfg.webhook_path, [this](const httplib::Request& req, httplib::Response& res) {
        const auto& c = config_.data();

        if (signature_configured()) {
            std::string header = req.get_header_value("X-Hub-Signature-256");
            if (header.empty()) {
                events_.add("warning", "Webhook rejected: missing signature",
                            {{"remote", req.remote_addr}});
                reply(res, 401, {{"error", "Missing X-Hub-Signature-256 header"}});
                return;
            }
            if (!WebhookSignature::verify(c.webhook_secret, req.body, header)) {
                events_.add("warning", "Webhook rejected: invalid signature",
                            {{"remote", req.remote_addr}});
                reply(res, 401, {{"error", "Invalid signature"}});
                return;
            }
        } else if (c.webhook_require_signature) {
            events_.add("error", "Webhook rejected: signatures required but no secret configured");
            reply(res, 403, {{"error", "Webhook secret not configured"}});
            return;
        } else {
            events_.add("warning", "Accepting unsigned webhook (no secret configured)",
                        {{"remote", req.remote_addr}});
        }

        std::string event = req.get_header_value("X-GitHub-Event");
        if (event == "ping") {
            events_.add("info", "Ping received");
            reply(res, 200, {{"status", "pong"}});
            return;
        }
        if (event != "push") {
            events_.add("info", "Ignoring event '" + event + "'");
            reply(res, 200, {{"status", "ignored"}, {"reason", "event '" + event + "' is not a push"}});
            return;
        }

        json payload;
        try {
            payload = json::parse(req.body);
        } catch (const json::parse_error& e) {
            events_.add("error", "Webhook body is not valid JSON", {{"error", e.what()}});
            reply(res, 400, {{"error", "Invalid JSON payload"}});
            return;
        }

        std::string ref;
        if (payload.is_object() && payload.contains("ref")) {
            if (!payload["ref"].is_string()) {
                events_.add("error", "Webhook payload has a non-string 'ref'",
                            {{"ref_type", payload["ref"].type_name()}});
                reply(res, 400, {{"error", "Invalid push payload: 'ref' must be a string"}});
                return;
            }
            ref = payload["ref"].get<std::string>();
        }
        static const std::string heads = "refs/heads/";
        std::string branch = ref.compare(0, heads.size(), heads) == 0 ? ref.substr(heads.size()) : ref;
        if (!branch_matches_target(branch)) {
            events_.add("info", "Ignoring push to '" + branch + "'",
                        {{"target_branch", c.webhook_target_branch}});
            reply(res, 200, {{"status", "ignored"},
                             {"reason", "push to '" + branch + "', tracking '" + c.webhook_target_branch + "'"}});
            return;
        }

        json commits = json::array();
        size_t commit_count = 0;
        if (payload.contains("commits") && payload["commits"].is_array()) {
            commit_count = payload["commits"].size();
            for (const auto& commit : payload["commits"]) {
                if (commits.size() >= 3) break;
                std::string msg;
                if (commit.is_object() && commit.contains("message") && commit["message"].is_string()) {
                    msg = commit["message"].get<std::string>();
                }
                commits.push_back(msg.substr(0, 50));
            }
        }
        events_.add("info", "Push to '" + branch + "' with " + std::to_string(commit_count) + " commit(s)",
                    {{"branch", branch}, {"commits", commit_count}, {"messages", commits},
                     {"delivery", req.get_header_value("X-GitHub-Delivery")}});

        bool fresh = queue_update("webhook:" + branch);
        reply(res, 202, {{"status", fresh ? "accepted" : "queued"}, {"branch", branch}});
    });

    auto trigger = [this](const httplib::Request& req, httplib::Response& res) {
        events_.add("info", "Manual trigger", {{"remote", req.remote_addr}});
        bool fresh = queue_update("manual");
        reply(res, 202, {{"status", fresh ? "accepted" : "queued"}});
    };
    svr.Get("/trigger", trigger);
    svr.Post("/trigger", trigger);

    svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        const auto& c = config_.data();
        std::error_code ec;
        json body = {
            {"status", "healthy"},
            {"service", "pubsub-updater"},
            {"timestamp", iso_now()},
            {"update_path_present", fs::exists(fs::path(coordinator_.repo_path()) / ".git", ec)},
            {"secret_configured", signature_configured()},
            {"signature_required", signature_configured() || c.webhook_require_signature},
            {"target_branch", c.webhook_target_branch},
            {"session_active", coordinator_.is_running()},
            {"supervising", process_mgr_.is_running()},
            {"version", nullptr},
            {"updater_version", APP_VERSION},
        };
        if (auto state = coordinator_.active_state()) {
            body["session_state"] = to_string(*state);
        }
        if (auto v = coordinator_.current_version()) {
            body["version"] = v->literal();
        }
        reply(res, 200, body);
    });

    svr.Get("/logs", [this](const httplib::Request& req, httplib::Response& res) {
        size_t limit = 50;
        if (req.has_param("limit")) {
            try {
                long parsed = std::stol(req.get_param_value("limit"));
                limit = parsed > 0 ? static_cast<size_t>(parsed) : 0;
            } catch (const std::exception&) {
                reply(res, 400, {{"error", "limit must be a number"}});
                return;
            }
        }
        if (limit > events_.capacity()) limit = events_.capacity();
        std::string level = req.has_param("level") ? req.get_param_value("level") : "";

        auto entries = events_.recent(limit, level);
        json list = json::array();
        for (const auto& e : entries) list.push_back(EventLog::to_json(e));
        reply(res, 200, {{"log_entries", list},
                         {"total_entries", entries.size()},
                         {"total_stored", events_.size()}});
    });

    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, {
            {"service", "pubsub-updater"},
            {"version", APP_VERSION},
            {"endpoints", {
                {"POST " + config_.data().webhook_path, "push event receiver"},
                {"GET /health", "service health"},
                {"GET /logs?limit=&level=", "recent events"},
                {"GET|POST /trigger", "manual update"},
            }},
        });
    });
}

// ── Updates ─────────────────────────────────────────────────

bool Daemon::queue_update(const std::string& source) {
    bool fresh;
    {
        std::lock_guard<std::mutex> lock(trigger_mutex_);
        fresh = !trigger_pending_ && !coordinator_.is_running();
        trigger_pending_ = true;
        trigger_source_ = source;
    }
    if (!fresh) {
        events_.add("info", "Update already in progress, trigger coalesced", {{"source", source}});
    }
    trigger_cv_.notify_all();
    return fresh;
}

std::optional<ReleaseRef> Daemon::resolve_trigger_target(const std::string& source) {
    const auto& cfg = config_.data();
    const std::string& branch = cfg.webhook_target_branch;

    if (branch != kLatestRelease) {
        return coordinator_.target_for_branch(branch);
    }

    auto check = coordinator_.check();
    if (check.status == CheckStatus::UpdateAvailable) return check.latest;

    events_.add(check.status == CheckStatus::NetworkFailure ||
                check.status == CheckStatus::VersionUndetectable ? "error" : "info",
                "No update applied: " + check.message, {{"source", source}});
    return std::nullopt;
}

void Daemon::start_triggered_update(const std::string& source) {
    auto target = resolve_trigger_target(source);
    if (!target) return;

    ProgressCallbacks cb;
    cb.on_state = [this](UpdateState state) {
        events_.add(state == UpdateState::Failed ? "error" : "info",
                    std::string("Update state: ") + to_string(state));
    };
    cb.on_finished = [this](const SessionOutcome& outcome) { on_session_finished(outcome); };

    auto started = coordinator_.run_async(*target, SessionMode::DiscardAndForce, std::move(cb));
    if (started == StartResult::Started) {
        events_.add("info", "Update to " + target->version.literal() + " started",
                    {{"source", source}, {"ref", target->remote_ref}});
    } else {
        events_.add("warning", std::string("Update not started: ") + to_string(started), {{"source", source}});
    }
}

void Daemon::on_session_finished(const SessionOutcome& outcome) {
    json data = {{"state", to_string(outcome.state)}, {"error", to_string(outcome.error)}};
    if (!outcome.backup_path.empty()) data["backup"] = outcome.backup_path;
    events_.add(level_for(outcome), outcome.summary, data);

    if (!outcome.succeeded()) return;

    const auto& cfg = config_.data();
    if (cfg.supervise_application && !process_mgr_.command().empty()) {
        events_.add("info", "Restarting supervised application");
        if (!process_mgr_.restart()) {
            events_.add("error", "Supervised application failed to restart");
        }
    } else if (!cfg.app_pid_file.empty() && !cfg.app_command.empty()) {
        ApplicationInstance app(cfg, coordinator_.repo_path());
        events_.add("info", "Restarting application", {{"pid_file", app.pid_file()}});
        if (!app.stop_recorded()) {
            events_.add("error", "Previous application instance did not stop");
            return;
        }
        std::string log_path;
        if (!cfg.log_file.empty()) log_path = Config::expand_home(cfg.log_file) + ".app";
        pid_t pid = app.start(log_path);
        if (pid > 0) {
            events_.add("info", "Application started", {{"pid", pid}});
        } else {
            events_.add("error", "Application failed to start");
        }
    } else {
        events_.add("info", "Restart recommended: the application still runs the previous version");
    }
}

void Daemon::maintenance_loop() {
    const int interval_min = config_.data().check_interval_min;
    auto next_check = std::chrono::steady_clock::now() + std::chrono::minutes(interval_min);

    while (!stop_flag_.load()) {
        std::string source;
        {
            std::unique_lock<std::mutex> lock(trigger_mutex_);
            trigger_cv_.wait_for(lock, std::chrono::milliseconds(200));
            if (stop_flag_.load()) break;
            if (trigger_pending_ && !coordinator_.is_running()) {
                trigger_pending_ = false;
                source = trigger_source_;
            }
        }

        if (!source.empty()) {
            start_triggered_update(source);
            continue;
        }

        if (interval_min > 0 && std::chrono::steady_clock::now() >= next_check) {
            next_check = std::chrono::steady_clock::now() + std::chrono::minutes(interval_min);
            if (coordinator_.is_running()) continue;

            auto check = coordinator_.check();
            if (check.update_available()) {
                events_.add("info", check.message);
                if (config_.data().webhook_target_branch == kLatestRelease) {
                    queue_update("periodic check");
                }
            } else if (check.status == CheckStatus::NetworkFailure) {
                events_.add("warning", "Periodic check failed: " + check.message);
            }
        }
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    const auto& cfg = config_.data();
    auto& svr = http_->server;

    // 1. Bind
    int port = cfg.webhook_port;
    if (port == 0) {
        port = svr.bind_to_any_port(cfg.webhook_host);
        if (port <= 0) {
            spdlog::error("[Webhook] Cannot bind {}", cfg.webhook_host);
            return 1;
        }
    } else if (!svr.bind_to_port(cfg.webhook_host, port)) {
        spdlog::error("[Webhook] Cannot bind {}:{}", cfg.webhook_host, port);
        return 1;
    }

    if (signature_configured()) {
        spdlog::info("[Webhook] Signature verification enabled");
    } else if (cfg.webhook_require_signature) {
        spdlog::error("[Webhook] require_signature is set but no secret is configured: "
                      "every webhook call will be rejected");
    } else {
        spdlog::warn("[Webhook] ************************************************************");
        spdlog::warn("[Webhook] No webhook secret configured: push events are NOT verified.");
        spdlog::warn("[Webhook] Anyone who can reach {}:{} can force an update.", cfg.webhook_host, port);
        spdlog::warn("[Webhook] Set WEBHOOK_SECRET or webhook.secret to enable verification.");
        spdlog::warn("[Webhook] ************************************************************");
    }

    // 2. Supervised application
    process_mgr_.set_auto_restart(true);
    process_mgr_.on_crash = [this](int exit_code) {
        events_.add("error", "Supervised application exited with code " + std::to_string(exit_code),
                    {{"exit_code", exit_code}, {"command", ProcessRunner::describe(process_mgr_.command())}});
    };
    if (cfg.supervise_application && !cfg.app_command.empty()) {
        if (!process_mgr_.start(cfg.app_command, coordinator_.repo_path())) {
            events_.add("error", "Could not start supervised application");
        }
    }

    // 3. HTTP + maintenance threads
    std::thread http_thread([&svr] { svr.listen_after_bind(); });
    maintenance_thread_ = std::thread(&Daemon::maintenance_loop, this);

    port_.store(port);
    events_.add("info", "Listening on " + cfg.webhook_host + ":" + std::to_string(port),
                {{"path", cfg.webhook_path}, {"target_branch", cfg.webhook_target_branch}});

    // 4. Wait for a stop request; signal handlers only flip the flag
    while (!stop_flag_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // 5. Cleanup. stop() is a no-op until listen has started.
    for (int i = 0; i < 100 && !svr.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    svr.stop();
    if (http_thread.joinable()) http_thread.join();
    trigger_cv_.notify_all();
    if (maintenance_thread_.joinable()) maintenance_thread_.join();

    if (coordinator_.cancel()) {
        spdlog::info("[Daemon] Waiting for the running update to reach a stage boundary");
    }
    coordinator_.wait();
    process_mgr_.stop();
    port_.store(0);
    return 0;
}
