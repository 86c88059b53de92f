#pragma once

#include "core/config.hpp"
#include "core/git_repository.hpp"
#include "core/update_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class UpdateSession;

enum class CheckStatus {
    UpdateAvailable,
    UpToDate,
    Ahead,
    NoReleases,
    VersionUndetectable,
    NetworkFailure,
};

const char* to_string(CheckStatus status);

struct CheckResult {
    CheckStatus status = CheckStatus::VersionUndetectable;
    std::optional<Version> current;
    std::string current_source;
    std::optional<ReleaseRef> latest;
    std::string message;

    bool update_available() const { return status == CheckStatus::UpdateAvailable; }
};

enum class StartResult {
    Started,
    AlreadyRunning,     // a session is active in this process
    LockHeld,           // another process holds the tree lock
};

const char* to_string(StartResult result);

/// Owns the single update path of one working tree. At most one session
/// runs at a time: an in-process guard flag plus the tree's flock.
/// Restarting after an update is left to the caller.
class UpdateCoordinator {
public:
    explicit UpdateCoordinator(AppConfig config);
    ~UpdateCoordinator();

    UpdateCoordinator(const UpdateCoordinator&) = delete;
    UpdateCoordinator& operator=(const UpdateCoordinator&) = delete;

    /// Resolve the installed version, list releases, compare
    CheckResult check() const;

    /// Start a session on the worker thread. Callbacks run on that thread;
    /// on_finished runs before the single-flight guard is released.
    StartResult run_async(const ReleaseRef& target, SessionMode mode, ProgressCallbacks callbacks = {});

    /// Same, on the calling thread. A rejected start comes back as a Failed
    /// outcome with error AlreadyRunning.
    SessionOutcome run(const ReleaseRef& target, SessionMode mode, ProgressCallbacks callbacks = {});

    bool is_running() const;
    bool cancel();
    void wait();
    std::optional<UpdateState> active_state() const;

    /// Outcome of the most recent session, if any finished
    std::optional<SessionOutcome> last_outcome() const;

    std::optional<Version> current_version() const;
    SessionOptions session_options(SessionMode mode) const;
    const AppConfig& config() const { return config_; }
    const std::string& repo_path() const { return repo_path_; }

    /// Tracking target for a plain branch; version is the branch name
    ReleaseRef target_for_branch(const std::string& branch) const;

    // ── Post-update actions ──────────────────────────────

    /// execv the running binary with argv; only returns on failure
    static bool restart_in_place(const std::vector<std::string>& argv);

    std::string relauncher_path() const;

    /// Spawn "<relauncher> <version> <tree>" detached. The caller exits next.
    bool hand_off_to_relauncher(const std::string& target_version) const;

private:
    AppConfig config_;
    std::string repo_path_;
    GitRepository repo_;

    std::atomic<bool> active_{false};
    mutable std::mutex mutex_;
    std::shared_ptr<UpdateSession> session_;
    bool cancel_pending_ = false;               // cancel() before session_ was installed
    std::optional<SessionOutcome> last_outcome_;
    std::mutex worker_mutex_;
    std::thread worker_;

    bool claim();
    void install_session(const std::shared_ptr<UpdateSession>& session);
    void join_worker();
    void record_outcome(const SessionOutcome& outcome);
};
