#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Repository
    std::string repo_path = ".";
    std::string remote = "origin";
    std::vector<std::string> release_prefixes = {"release/", "Release/"};

    // Updater
    bool backup = true;
    std::string restart_mode = "relauncher";    // "relauncher" or "in_place"
    std::string relauncher_path;                // empty: next to our executable
    int probe_timeout_sec = 5;
    int status_timeout_sec = 10;
    int catalog_fetch_timeout_sec = 30;
    int fetch_timeout_sec = 30;
    int checkout_timeout_sec = 10;
    int fetch_depth = 0;                        // 0 = full history
    int check_interval_min = 0;                 // daemon polling, 0 = off
    std::string progress_log;

    // Dependencies
    bool deps_enabled = true;
    std::string deps_manifest = "requirements.txt";
    std::string deps_venv_dir = "venv";
    std::string deps_python = "python3";
    int deps_timeout_sec = 300;

    // Application / daemon / relauncher
    std::vector<std::string> app_command;
    std::string app_pid_file;                   // relative to the tree; empty: not tracked
    int app_stop_timeout_sec = 10;              // SIGTERM grace before SIGKILL
    bool supervise_application = false;
    int relauncher_wait_timeout_sec = 30;

    // Webhook
    std::string webhook_host = "0.0.0.0";
    int webhook_port = 9000;
    std::string webhook_path = "/webhook";
    std::string webhook_secret;
    bool webhook_require_signature = false;
    std::string webhook_target_branch = "main";
    int webhook_log_capacity = 100;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class Config {
public:
    Config();
    ~Config();

    /// Load from path (config_path() when empty), then apply environment
    /// overrides. Returns false when the file is missing or unreadable;
    /// defaults (plus environment) stay in effect either way.
    bool load(const std::string& path = "");
    bool save(const std::string& path = "");

    /// WEBHOOK_*, GIT_BRANCH, PUBSUB_UPDATER_* variables
    void apply_env();

    AppConfig& data();
    const AppConfig& data() const;

    /// Absolute working tree path with ~ expanded
    std::string repo_path() const;
    static std::string resolve_repo_path(const std::string& configured);

    /// Error from the last load(), empty when it succeeded or the file was absent
    const std::string& last_error() const { return last_error_; }

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
    std::string last_error_;
};
