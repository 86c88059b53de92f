#include "core/update_coordinator.hpp"
#include "core/process_runner.hpp"
#include "core/release_catalog.hpp"
#include "core/update_lock.hpp"
#include "core/update_session.hpp"
#include "core/version_resolver.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

const char* to_string(CheckStatus status) {
    switch (status) {
        case CheckStatus::UpdateAvailable:     return "UpdateAvailable";
        case CheckStatus::UpToDate:            return "UpToDate";
        case CheckStatus::Ahead:               return "Ahead";
        case CheckStatus::NoReleases:          return "NoReleases";
        case CheckStatus::VersionUndetectable: return "VersionUndetectable";
        case CheckStatus::NetworkFailure:      return "NetworkFailure";
    }
    return "Unknown";
}

const char* to_string(StartResult result) {
    switch (result) {
        case StartResult::Started:        return "Started";
        case StartResult::AlreadyRunning: return "AlreadyRunning";
        case StartResult::LockHeld:       return "LockHeld";
    }
    return "Unknown";
}

UpdateCoordinator::UpdateCoordinator(AppConfig config)
    : config_(std::move(config)),
      repo_path_(Config::resolve_repo_path(config_.repo_path)),
      repo_(repo_path_, config_.remote) {}

UpdateCoordinator::~UpdateCoordinator() {
    cancel();
    join_worker();
}

// ── Check ───────────────────────────────────────────────────

std::optional<Version> UpdateCoordinator::current_version() const {
    VersionResolver resolver(config_.release_prefixes, config_.probe_timeout_sec);
    auto resolved = resolver.resolve(repo_path_);
    if (!resolved) return std::nullopt;
    return resolved->version;
}

CheckResult UpdateCoordinator::check() const {
    CheckResult result;

    VersionResolver resolver(config_.release_prefixes, config_.probe_timeout_sec);
    auto resolved = resolver.resolve(repo_path_);
    if (!resolved) {
        result.status = CheckStatus::VersionUndetectable;
        result.message = "cannot determine the installed version of " + repo_path_;
        return result;
    }
    result.current = resolved->version;
    result.current_source = resolved->source;

    ReleaseCatalog catalog(config_.release_prefixes, config_.catalog_fetch_timeout_sec);
    auto listing = catalog.fetch_and_list(repo_);
    if (!listing.success) {
        result.status = CheckStatus::NetworkFailure;
        result.message = listing.message;
        return result;
    }

    result.latest = ReleaseCatalog::latest(listing.releases);
    if (!result.latest) {
        result.status = CheckStatus::NoReleases;
        result.message = "no release branches on " + config_.remote;
        return result;
    }

    int cmp = Version::compare(result.latest->version, resolved->version);
    const std::string& cur = resolved->version.literal();
    const std::string& latest = result.latest->version.literal();
    if (cmp > 0) {
        result.status = CheckStatus::UpdateAvailable;
        result.message = "update available: " + cur + " -> " + latest;
    } else if (cmp == 0) {
        result.status = CheckStatus::UpToDate;
        result.message = "up to date at " + cur;
    } else {
        result.status = CheckStatus::Ahead;
        result.message = "installed " + cur + " is newer than latest release " + latest;
    }
    spdlog::info("[UpdateCoordinator] {}", result.message);
    return result;
}

// ── Sessions ────────────────────────────────────────────────

SessionOptions UpdateCoordinator::session_options(SessionMode mode) const {
    SessionOptions o;
    o.mode = mode;
    o.create_backup = config_.backup;
    o.status_timeout_sec = config_.status_timeout_sec;
    o.fetch_timeout_sec = config_.fetch_timeout_sec;
    o.checkout_timeout_sec = config_.checkout_timeout_sec;
    o.fetch_depth = config_.fetch_depth;
    o.sync_dependencies = config_.deps_enabled;
    o.deps_manifest = config_.deps_manifest;
    o.deps_venv_dir = config_.deps_venv_dir;
    o.deps_python = config_.deps_python;
    o.deps_timeout_sec = config_.deps_timeout_sec;
    o.progress_log = Config::expand_home(config_.progress_log);
    return o;
}

ReleaseRef UpdateCoordinator::target_for_branch(const std::string& branch) const {
    ReleaseRef ref;
    auto v = VersionResolver::strip_release_prefix(branch, config_.release_prefixes);
    ref.version = Version(v ? *v : branch);
    ref.branch = branch;
    ref.remote_ref = config_.remote + "/" + branch;
    return ref;
}

void UpdateCoordinator::join_worker() {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void UpdateCoordinator::record_outcome(const SessionOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_outcome_ = outcome;
}

// Claiming the guard and dropping the previous session happen under one
// lock, so cancel() never reaches a finished session.
bool UpdateCoordinator::claim() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.load()) return false;
    active_.store(true);
    session_.reset();
    cancel_pending_ = false;
    return true;
}

void UpdateCoordinator::install_session(const std::shared_ptr<UpdateSession>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    if (cancel_pending_) {
        cancel_pending_ = false;
        session_->cancel();
    }
}

StartResult UpdateCoordinator::run_async(const ReleaseRef& target, SessionMode mode, ProgressCallbacks callbacks) {
    if (!claim()) {
        spdlog::warn("[UpdateCoordinator] Update to {} rejected: a session is already running",
                     target.version.literal());
        return StartResult::AlreadyRunning;
    }

    auto lock = UpdateLock::try_acquire(repo_path_);
    if (!lock) {
        active_.store(false);
        return StartResult::LockHeld;
    }

    // The previous worker cleared active_ as its last step
    join_worker();

    std::lock_guard<std::mutex> worker_lock(worker_mutex_);
    auto session = std::make_shared<UpdateSession>(repo_, target, session_options(mode), std::move(callbacks));
    install_session(session);

    std::shared_ptr<UpdateLock> held(std::move(lock));
    worker_ = std::thread([this, session, held]() mutable {
        auto outcome = session->run();
        record_outcome(outcome);
        held.reset();
        active_.store(false);
    });
    return StartResult::Started;
}

SessionOutcome UpdateCoordinator::run(const ReleaseRef& target, SessionMode mode, ProgressCallbacks callbacks) {
    SessionOutcome rejected;
    rejected.state = UpdateState::Failed;
    rejected.error = UpdateError::AlreadyRunning;
    rejected.target = target;

    if (!claim()) {
        rejected.summary = "Update to " + target.version.literal() + " rejected: a session is already running";
        spdlog::warn("[UpdateCoordinator] {}", rejected.summary);
        return rejected;
    }

    auto lock = UpdateLock::try_acquire(repo_path_);
    if (!lock) {
        active_.store(false);
        rejected.summary = "Update to " + target.version.literal() +
                           " rejected: another process is updating " + repo_path_;
        return rejected;
    }

    join_worker();
    auto session = std::make_shared<UpdateSession>(repo_, target, session_options(mode), std::move(callbacks));
    install_session(session);

    auto outcome = session->run();
    record_outcome(outcome);
    lock.reset();
    active_.store(false);
    return outcome;
}

bool UpdateCoordinator::is_running() const {
    return active_.load();
}

bool UpdateCoordinator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.load()) return false;
    if (session_) {
        session_->cancel();
    } else {
        cancel_pending_ = true;
    }
    return true;
}

void UpdateCoordinator::wait() {
    join_worker();
}

std::optional<UpdateState> UpdateCoordinator::active_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || !active_.load()) return std::nullopt;
    return session_->state();
}

std::optional<SessionOutcome> UpdateCoordinator::last_outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

// ── Restart ─────────────────────────────────────────────────

bool UpdateCoordinator::restart_in_place(const std::vector<std::string>& argv) {
    std::string self = ProcessRunner::self_path();
    if (self.empty()) {
        spdlog::error("[UpdateCoordinator] Cannot resolve /proc/self/exe");
        return false;
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    if (args.empty()) args.push_back(const_cast<char*>(self.c_str()));
    args.push_back(nullptr);

    spdlog::info("[UpdateCoordinator] Restarting in place: {}", self);
    spdlog::default_logger()->flush();
    execv(self.c_str(), args.data());

    spdlog::error("[UpdateCoordinator] execv {} failed: {}", self, std::strerror(errno));
    return false;
}

std::string UpdateCoordinator::relauncher_path() const {
    if (!config_.relauncher_path.empty()) return Config::expand_home(config_.relauncher_path);
    std::string self = ProcessRunner::self_path();
    if (self.empty()) return "pubsub-relauncher";
    return (fs::path(self).parent_path() / "pubsub-relauncher").string();
}

bool UpdateCoordinator::hand_off_to_relauncher(const std::string& target_version) const {
    std::string relauncher = relauncher_path();
    std::vector<std::string> argv = {relauncher, target_version, repo_path_};

    EnvOverrides env = {{"PUBSUB_UPDATER_PARENT_PID", std::to_string(getpid())}};
    std::string cfg = Config::config_path();
    if (!cfg.empty()) env.push_back({"PUBSUB_UPDATER_CONFIG", cfg});

    std::string log_path;
    if (!config_.log_file.empty()) log_path = Config::expand_home(config_.log_file) + ".relauncher";

    pid_t pid = ProcessRunner::spawn_detached(argv, repo_path_, log_path, env);
    if (pid <= 0) {
        spdlog::error("[UpdateCoordinator] Could not start {}", relauncher);
        return false;
    }
    spdlog::info("[UpdateCoordinator] Handed off to relauncher (pid {}): {}", pid, ProcessRunner::describe(argv));
    return true;
}
