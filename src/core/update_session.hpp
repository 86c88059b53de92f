#pragma once

#include "core/git_repository.hpp"
#include "core/update_types.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

/// One update attempt against one working tree:
///   CheckingWorkingTree -> [BackingUp] -> Fetching -> CheckingOut
///   -> SyncingDependencies -> Completed
/// with Failed and Cancelled as the other exits. Cancellation is only
/// looked at between stages; a running git or pip call is never interrupted.
class UpdateSession {
public:
    UpdateSession(GitRepository repo, ReleaseRef target, SessionOptions options,
                  ProgressCallbacks callbacks = {});

    /// Drive the session to a terminal state. Runs once; later calls
    /// return the stored outcome.
    SessionOutcome run();

    void cancel();
    bool cancel_requested() const { return cancel_requested_.load(); }

    UpdateState state() const { return state_.load(); }
    const ReleaseRef& target() const { return target_; }
    std::vector<std::string> log() const;

private:
    GitRepository repo_;
    ReleaseRef target_;
    SessionOptions options_;
    ProgressCallbacks callbacks_;

    std::atomic<UpdateState> state_{UpdateState::Created};
    std::atomic<bool> cancel_requested_{false};
    UpdateState cancelled_before_ = UpdateState::Created;
    std::string failure_reason_;

    mutable std::mutex mutex_;
    std::vector<std::string> log_;
    SessionOutcome outcome_;

    bool advance(UpdateState next);
    void fail(UpdateError error, const std::string& reason);
    void warn(UpdateError error, const std::string& message);
    void note(const std::string& line);

    bool check_working_tree();
    void back_up();
    bool fetch();
    bool check_out();
    void sync_dependencies();

    SessionOutcome finish();
    void append_progress_log(const SessionOutcome& outcome) const;
};
