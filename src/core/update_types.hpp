#pragma once

#include "core/version.hpp"

#include <functional>
#include <string>
#include <vector>

struct ReleaseRef {
    Version version;
    std::string branch;        // "release/1.0.1"
    std::string remote_ref;    // "origin/release/1.0.1"
};

enum class UpdateState {
    Created,
    CheckingWorkingTree,
    BackingUp,
    Fetching,
    CheckingOut,
    SyncingDependencies,
    Completed,
    Failed,
    Cancelled,
};

enum class UpdateError {
    None,
    VersionUndetectable,
    NetworkFailure,
    DirtyWorkingTree,
    BranchNotFound,
    CheckoutConflict,
    DependencySyncFailure,
    Timeout,
    Cancelled,
    BackupFailed,
    AlreadyRunning,
};

enum class SessionMode {
    Safe,               // refuse to touch a dirty tree
    DiscardAndForce,    // reset and clean local modifications first
};

const char* to_string(UpdateState state);
const char* to_string(UpdateError error);
bool is_terminal(UpdateState state);

/// Fatal errors end the session; the others are recorded as warnings
bool is_fatal(UpdateError error);

struct UpdateWarning {
    UpdateError error = UpdateError::None;
    std::string message;
};

struct SessionOptions {
    SessionMode mode = SessionMode::Safe;
    bool create_backup = true;

    int status_timeout_sec = 10;
    int fetch_timeout_sec = 30;
    int checkout_timeout_sec = 10;
    int fetch_depth = 0;

    bool sync_dependencies = true;
    std::string deps_manifest = "requirements.txt";
    std::string deps_venv_dir = "venv";
    std::string deps_python = "python3";
    int deps_timeout_sec = 300;

    std::string progress_log;   // appended on completion when set
};

struct SessionOutcome {
    UpdateState state = UpdateState::Created;   // Completed, Failed or Cancelled
    UpdateError error = UpdateError::None;
    ReleaseRef target;
    std::string summary;
    std::string backup_path;
    std::vector<UpdateWarning> warnings;
    std::vector<std::string> log;
    bool restart_recommended = false;

    bool succeeded() const { return state == UpdateState::Completed; }
};

/// Invoked on the session thread, in state order
struct ProgressCallbacks {
    std::function<void(UpdateState)> on_state;
    std::function<void(const std::string&)> on_log;
    std::function<void(const SessionOutcome&)> on_finished;
};
