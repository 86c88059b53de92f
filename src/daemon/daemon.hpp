#pragma once

#include "core/config.hpp"
#include "core/update_coordinator.hpp"
#include "daemon/event_log.hpp"
#include "daemon/process_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/// `serve` mode: an HTTP endpoint for CI push events plus a maintenance
/// thread that runs triggered and periodic updates, and optionally keeps
/// the application running and restarts it after an update.
class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop, blocks until stop is requested
    int run();

    /// Request graceful stop (async-signal-safe, called from signal handler)
    void request_stop();

    /// Port actually bound, 0 before listening
    int port() const { return port_.load(); }
    bool wait_until_listening(int timeout_ms) const;

    const EventLog& events() const { return events_; }
    UpdateCoordinator& coordinator() { return coordinator_; }

    /// Queue an unattended update. Returns false when one was already
    /// pending or running, in which case this request is coalesced.
    bool queue_update(const std::string& source);

private:
    struct Http;

    Config& config_;
    UpdateCoordinator coordinator_;
    ProcessManager process_mgr_;
    EventLog events_;
    std::unique_ptr<Http> http_;

    std::atomic<bool> stop_flag_{false};
    std::atomic<int> port_{0};

    std::mutex trigger_mutex_;
    std::condition_variable trigger_cv_;
    bool trigger_pending_ = false;
    std::string trigger_source_;

    std::thread maintenance_thread_;

    void setup_routes();
    bool signature_configured() const;
    void maintenance_loop();
    void start_triggered_update(const std::string& source);
    std::optional<ReleaseRef> resolve_trigger_target(const std::string& source);
    void on_session_finished(const SessionOutcome& outcome);
    bool branch_matches_target(const std::string& branch) const;
};
