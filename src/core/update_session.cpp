#include "core/update_session.hpp"
#include "core/backup_manager.hpp"
#include "core/dependency_sync.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

static std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static std::string tail_lines(const std::string& output, size_t max_lines) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < output.size()) {
        size_t nl = output.find('\n', start);
        std::string line = output.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    std::string out;
    size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    for (size_t i = first; i < lines.size(); ++i) {
        if (!out.empty()) out += " | ";
        out += lines[i];
    }
    return out;
}

static bool mentions_unknown_ref(const std::string& output) {
    return output.find("did not match any") != std::string::npos ||
           output.find("not a commit") != std::string::npos ||
           output.find("invalid reference") != std::string::npos ||
           output.find("unknown revision") != std::string::npos;
}

static const char* kAuthHint =
    "if the output mentions 'publickey' or 'Permission denied', the remote "
    "rejected our credentials: check the deploy key or SSH agent";

// ════════════════════════════════════════════════════════════
// UpdateSession
// ════════════════════════════════════════════════════════════

UpdateSession::UpdateSession(GitRepository repo, ReleaseRef target, SessionOptions options,
                             ProgressCallbacks callbacks)
    : repo_(std::move(repo)),
      target_(std::move(target)),
      options_(std::move(options)),
      callbacks_(std::move(callbacks)) {
    outcome_.target = target_;
}

void UpdateSession::cancel() {
    if (!cancel_requested_.exchange(true)) {
        spdlog::info("[UpdateSession] Cancellation requested, honoured at the next stage boundary");
    }
}

std::vector<std::string> UpdateSession::log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

void UpdateSession::note(const std::string& line) {
    spdlog::info("[UpdateSession] {}", line);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back("[" + timestamp() + "] " + line);
    }
    if (callbacks_.on_log) callbacks_.on_log(line);
}

bool UpdateSession::advance(UpdateState next) {
    if (cancel_requested_.load()) {
        note(std::string("Cancelled before ") + to_string(next));
        cancelled_before_ = next;
        state_.store(UpdateState::Cancelled);
        outcome_.error = UpdateError::Cancelled;
        if (callbacks_.on_state) callbacks_.on_state(UpdateState::Cancelled);
        return false;
    }
    state_.store(next);
    if (callbacks_.on_state) callbacks_.on_state(next);
    return true;
}

void UpdateSession::fail(UpdateError error, const std::string& reason) {
    spdlog::error("[UpdateSession] {} during {}: {}", to_string(error), to_string(state_.load()), reason);
    note(std::string("Failed [") + to_string(error) + "]: " + reason);
    outcome_.error = error;
    failure_reason_ = reason;
    state_.store(UpdateState::Failed);
    if (callbacks_.on_state) callbacks_.on_state(UpdateState::Failed);
}

void UpdateSession::warn(UpdateError error, const std::string& message) {
    spdlog::warn("[UpdateSession] {}: {}", to_string(error), message);
    note(std::string("Warning [") + to_string(error) + "]: " + message);
    outcome_.warnings.push_back({error, message});
}

// ── Stages ──────────────────────────────────────────────────

bool UpdateSession::check_working_tree() {
    std::string detail;
    bool dirty = repo_.is_dirty(options_.status_timeout_sec, &detail);
    if (!dirty) {
        note("Working tree is clean");
        return true;
    }

    if (options_.mode == SessionMode::Safe) {
        fail(UpdateError::DirtyWorkingTree,
             "local modifications present, commit or discard them first (" + tail_lines(detail, 5) + ")");
        return false;
    }

    note("Discarding local modifications: " + tail_lines(detail, 5));
    auto reset = repo_.reset_hard("", options_.checkout_timeout_sec);
    if (!reset.ok()) {
        fail(reset.timed_out ? UpdateError::Timeout : UpdateError::CheckoutConflict,
             "git reset --hard failed: " + tail_lines(reset.output, 3));
        return false;
    }
    note("git reset --hard: " + tail_lines(reset.output, 1));

    auto clean = repo_.clean_untracked(options_.checkout_timeout_sec);
    if (!clean.ok()) {
        fail(clean.timed_out ? UpdateError::Timeout : UpdateError::CheckoutConflict,
             "git clean -fd failed: " + tail_lines(clean.output, 3));
        return false;
    }
    std::string removed = tail_lines(clean.output, 5);
    note(removed.empty() ? "git clean -fd: nothing to remove" : "git clean -fd: " + removed);
    return true;
}

void UpdateSession::back_up() {
    BackupManager backups(repo_.path());
    auto result = backups.create_backup();
    if (!result.success) {
        warn(UpdateError::BackupFailed, result.error);
        return;
    }
    outcome_.backup_path = result.path;
    note("Backup created at " + result.path);
}

bool UpdateSession::fetch() {
    note("Fetching " + target_.branch + " from " + repo_.remote());
    auto r = repo_.fetch_branch(target_.branch, options_.fetch_depth, options_.fetch_timeout_sec);
    if (r.timed_out) {
        fail(UpdateError::NetworkFailure,
             "fetch timed out after " + std::to_string(options_.fetch_timeout_sec) + "s; " + kAuthHint);
        return false;
    }
    if (!r.ok()) {
        fail(UpdateError::NetworkFailure,
             "fetch failed: " + tail_lines(r.output, 3) + "; " + kAuthHint);
        return false;
    }
    note("Fetched " + target_.remote_ref);
    return true;
}

bool UpdateSession::check_out() {
    const int timeout = options_.checkout_timeout_sec;

    auto co = repo_.checkout(target_.branch, timeout);
    if (co.timed_out) {
        fail(UpdateError::Timeout, "git checkout timed out after " + std::to_string(timeout) + "s");
        return false;
    }
    if (co.ok()) {
        note("Checked out " + target_.branch);
    } else {
        note("No local " + target_.branch + ", creating it from " + target_.remote_ref);
        auto created = repo_.checkout_new(target_.branch, target_.remote_ref, timeout);
        if (created.timed_out) {
            fail(UpdateError::Timeout, "git checkout -b timed out after " + std::to_string(timeout) + "s");
            return false;
        }
        if (!created.ok()) {
            std::string output = co.output + "\n" + created.output;
            fail(mentions_unknown_ref(output) ? UpdateError::BranchNotFound : UpdateError::CheckoutConflict,
                 "cannot check out " + target_.branch + ": " + tail_lines(output, 3));
            return false;
        }
        note("Created " + target_.branch + " tracking " + target_.remote_ref);
    }

    auto reset = repo_.reset_hard(target_.remote_ref, timeout);
    if (reset.timed_out) {
        fail(UpdateError::Timeout, "git reset timed out after " + std::to_string(timeout) + "s");
        return false;
    }
    if (!reset.ok()) {
        fail(mentions_unknown_ref(reset.output) ? UpdateError::BranchNotFound : UpdateError::CheckoutConflict,
             "git reset --hard " + target_.remote_ref + " failed: " + tail_lines(reset.output, 3));
        return false;
    }
    note("Reset to " + target_.remote_ref + ": " + tail_lines(reset.output, 1));
    return true;
}

void UpdateSession::sync_dependencies() {
    if (!options_.sync_dependencies) {
        note("Dependency sync disabled");
        return;
    }

    DependencyOptions opts;
    opts.manifest = options_.deps_manifest;
    opts.venv_dir = options_.deps_venv_dir;
    opts.python = options_.deps_python;
    opts.timeout_sec = options_.deps_timeout_sec;

    DependencySync deps(repo_.path(), opts);
    auto result = deps.sync();
    if (!result.ran) {
        note(result.message);
        return;
    }
    if (!result.ok) {
        std::string detail = tail_lines(result.output, 3);
        warn(UpdateError::DependencySyncFailure,
             result.message + (detail.empty() ? "" : " (" + detail + ")"));
        return;
    }
    note(result.message);
}

// ── Driver ──────────────────────────────────────────────────

SessionOutcome UpdateSession::run() {
    if (state_.load() != UpdateState::Created) {
        spdlog::warn("[UpdateSession] run() called again for {}", target_.version.literal());
        std::lock_guard<std::mutex> lock(mutex_);
        return outcome_;
    }

    note("Starting update to " + target_.version.literal() + " (" + target_.remote_ref + ", " +
         (options_.mode == SessionMode::Safe ? "safe" : "discard-and-force") + " mode)");

    if (!advance(UpdateState::CheckingWorkingTree) || !check_working_tree()) return finish();

    if (options_.create_backup) {
        if (!advance(UpdateState::BackingUp)) return finish();
        back_up();
    }

    if (!advance(UpdateState::Fetching) || !fetch()) return finish();
    if (!advance(UpdateState::CheckingOut) || !check_out()) return finish();

    if (!advance(UpdateState::SyncingDependencies)) return finish();
    sync_dependencies();

    advance(UpdateState::Completed);
    return finish();
}

SessionOutcome UpdateSession::finish() {
    UpdateState final_state = state_.load();
    const std::string& v = target_.version.literal();
    std::string summary;

    if (final_state == UpdateState::Completed) {
        outcome_.restart_recommended = true;
        summary = "Update to " + v + " completed";
        if (!outcome_.warnings.empty()) {
            summary += " with " + std::to_string(outcome_.warnings.size()) + " warning(s)";
        }
        if (!outcome_.backup_path.empty()) summary += "; backup at " + outcome_.backup_path;
        for (const auto& w : outcome_.warnings) {
            summary += "; " + std::string(to_string(w.error)) + ": " + w.message;
        }
        summary += "; restart recommended";
    } else if (final_state == UpdateState::Cancelled) {
        summary = "Update to " + v + " cancelled before " + to_string(cancelled_before_);
    } else {
        summary = "Update to " + v + " failed [" + to_string(outcome_.error) + "]: " + failure_reason_;
        if (!outcome_.backup_path.empty()) summary += "; backup at " + outcome_.backup_path;
    }

    note(summary);

    SessionOutcome result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_.state = final_state;
        outcome_.summary = summary;
        outcome_.log = log_;
        result = outcome_;
    }

    append_progress_log(result);
    if (callbacks_.on_finished) callbacks_.on_finished(result);
    return result;
}

void UpdateSession::append_progress_log(const SessionOutcome& outcome) const {
    if (options_.progress_log.empty()) return;

    std::ofstream out(options_.progress_log, std::ios::app);
    if (!out) {
        spdlog::error("[UpdateSession] Cannot append to progress log {}", options_.progress_log);
        return;
    }
    for (const auto& line : outcome.log) out << line << "\n";
    out << "\n";
}
