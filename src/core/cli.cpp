#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/update_coordinator.hpp"
#include "core/update_lock.hpp"
#include "core/version_resolver.hpp"
#include "core/git_repository.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "check") == 0) {
        return cmd_check();
    }
    if (std::strcmp(cmd, "update") == 0) {
        return cmd_update(argc, argv);
    }
    if (std::strcmp(cmd, "serve") == 0 || std::strcmp(cmd, "--serve") == 0) {
        return -2;  // special: caller runs the webhook daemon
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'pubsub-updater help' for usage.\n";
    return 1;
}

bool CLI::load_config(Config& config) {
    config.load();
    // The terminal gets our own output; spdlog goes to logging.file only
    Logging::init(config.data(), /*console=*/false);
    if (!config.last_error().empty()) {
        std::cerr << "Config error: " << config.last_error() << " (using defaults)\n";
        return false;
    }
    return true;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "pubsub-updater: release updater for a git-deployed application\n"
        "\n"
        "Usage:\n"
        "  pubsub-updater                 Launch TUI (default)\n"
        "  pubsub-updater check           Compare installed version with the latest release\n"
        "  pubsub-updater update [flags]  Apply the latest release\n"
        "      --force                    Discard local modifications first\n"
        "      --no-backup                Skip the backup copy\n"
        "      --no-deps                  Skip the dependency install\n"
        "      --relaunch                 Hand off to pubsub-relauncher when done\n"
        "      --restart                  Restart using updater.restart_mode when done\n"
        "  pubsub-updater status          Show working tree and configuration\n"
        "  pubsub-updater serve           Run the webhook listener\n"
        "  pubsub-updater version         Show version\n"
        "\n"
        "Config: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "pubsub-updater " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    Config config;
    load_config(config);
    const auto& cfg = config.data();
    std::string tree = config.repo_path();

    std::cout << "Working tree: " << tree << "\n";

    GitRepository repo(tree, cfg.remote);
    if (!repo.is_repository()) {
        std::cout << "  (not a git working tree)\n";
        return 1;
    }

    VersionResolver resolver(cfg.release_prefixes, cfg.probe_timeout_sec);
    auto resolved = resolver.resolve(tree);
    if (resolved) {
        std::cout << "Version:      " << resolved->version.literal() << " (from " << resolved->source << ")\n";
    } else {
        std::cout << "Version:      (undetectable)\n";
    }

    auto branch = repo.current_branch(cfg.probe_timeout_sec);
    std::cout << "Branch:       " << (branch ? *branch : "(unknown)") << "\n";

    std::string detail;
    bool dirty = repo.is_dirty(cfg.status_timeout_sec, &detail);
    std::cout << "Local edits:  " << (dirty ? "yes" : "no") << "\n";

    {
        auto lock = UpdateLock::try_acquire(tree);
        std::cout << "Update lock:  " << (lock ? "free" : "held by another process") << "\n";
    }

    std::cout << "Remote:       " << cfg.remote << "\n";
    std::cout << "Restart mode: " << cfg.restart_mode << "\n";
    std::cout << "Webhook:      " << cfg.webhook_host << ":" << cfg.webhook_port << cfg.webhook_path
              << " (secret " << (cfg.webhook_secret.empty() ? "not set" : "set") << ", tracking "
              << cfg.webhook_target_branch << ")\n";
    return 0;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check() {
    Config config;
    load_config(config);

    UpdateCoordinator coordinator(config.data());
    auto result = coordinator.check();

    std::cout << "Installed: " << (result.current ? result.current->literal() : "(unknown)") << "\n";
    std::cout << "Latest:    " << (result.latest ? result.latest->version.literal() : "(none)") << "\n";
    std::cout << result.message << "\n";

    switch (result.status) {
        case CheckStatus::UpdateAvailable:
            return kUpdateAvailable;
        case CheckStatus::UpToDate:
        case CheckStatus::Ahead:
        case CheckStatus::NoReleases:
            return kUpToDate;
        case CheckStatus::VersionUndetectable:
        case CheckStatus::NetworkFailure:
            break;
    }
    return 1;
}

// ── update ──────────────────────────────────────────────────

int CLI::cmd_update(int argc, char* argv[]) {
    bool force = false;
    bool relaunch = false;
    bool restart = false;
    bool no_backup = false;
    bool no_deps = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--force") force = true;
        else if (arg == "--no-backup") no_backup = true;
        else if (arg == "--no-deps") no_deps = true;
        else if (arg == "--relaunch") relaunch = true;
        else if (arg == "--restart") restart = true;
        else {
            std::cerr << "Unknown update option: " << arg << "\n";
            std::cerr << "Usage: pubsub-updater update [--force] [--no-backup] [--no-deps] [--restart|--relaunch]\n";
            return 1;
        }
    }
    if (relaunch && restart) {
        std::cerr << "--restart and --relaunch are mutually exclusive\n";
        return 1;
    }

    Config config;
    load_config(config);
    if (no_backup) config.data().backup = false;
    if (no_deps) config.data().deps_enabled = false;

    UpdateCoordinator coordinator(config.data());
    auto check = coordinator.check();
    std::cout << check.message << "\n";
    if (check.status == CheckStatus::VersionUndetectable || check.status == CheckStatus::NetworkFailure) {
        return kUpdateFailed;
    }
    if (!check.update_available()) {
        // Second life of `update --restart` in place: the update it just
        // applied is why there is nothing to do
        if (const char* restarted = std::getenv(kRestartedEnv)) {
            std::cout << "Restarted after updating to " << restarted << "\n";
            unsetenv(kRestartedEnv);
            return 0;
        }
        return kNoUpdate;
    }

    ProgressCallbacks cb;
    cb.on_state = [](UpdateState state) {
        std::cout << "==> " << to_string(state) << "\n";
    };
    cb.on_log = [](const std::string& line) {
        std::cout << "    " << line << "\n";
    };

    auto mode = force ? SessionMode::DiscardAndForce : SessionMode::Safe;
    auto outcome = coordinator.run(*check.latest, mode, std::move(cb));

    if (outcome.error == UpdateError::AlreadyRunning) {
        std::cerr << outcome.summary << "\n";
        return kBusy;
    }
    if (outcome.state == UpdateState::Cancelled) return kCancelled;
    if (!outcome.succeeded()) {
        if (outcome.error == UpdateError::DirtyWorkingTree) {
            std::cerr << "Use --force to discard local modifications.\n";
        }
        return kUpdateFailed;
    }

    const std::string& version = outcome.target.version.literal();
    bool use_relauncher = relaunch || (restart && config.data().restart_mode != "in_place");
    if (use_relauncher) {
        if (!coordinator.hand_off_to_relauncher(version)) {
            std::cerr << "Could not start " << coordinator.relauncher_path() << "\n";
            return kUpdateFailed;
        }
        std::cout << "Relauncher started for " << version << "\n";
    } else if (restart) {
        std::cout << "Restarting...\n";
        std::cout.flush();
        setenv(kRestartedEnv, version.c_str(), 1);
        UpdateCoordinator::restart_in_place(std::vector<std::string>(argv, argv + argc));
        unsetenv(kRestartedEnv);
        std::cerr << "Restart failed, run pubsub-updater manually\n";
        return kUpdateFailed;
    } else {
        std::cout << "Restart the application to run " << version << ".\n";
    }
    return 0;
}
