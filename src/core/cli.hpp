#pragma once

#include <string>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, -1 if no subcommand (caller should launch TUI),
    /// or -2 for `serve` (caller runs the daemon).
    static int run(int argc, char* argv[]);

    // `check` exit codes
    static constexpr int kUpToDate = 0;
    static constexpr int kUpdateAvailable = 10;

    // `update` exit codes
    static constexpr int kUpdateFailed = 1;
    static constexpr int kNoUpdate = 2;
    static constexpr int kBusy = 3;
    static constexpr int kCancelled = 4;

    /// Set across an in-place restart of `update --restart`
    static constexpr const char* kRestartedEnv = "PUBSUB_UPDATER_RESTARTED";

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_check();
    static int cmd_update(int argc, char* argv[]);

    /// Config plus file-only logging; prints load errors
    static bool load_config(Config& config);
};
