#pragma once

#include <string>
#include <functional>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <sys/types.h>

/// Supervises the application the daemon keeps alive. The child runs in
/// the working tree and is restarted after a crash unless disabled.
class ProcessManager {
public:
    ProcessManager();
    ~ProcessManager();

    /// Start command (argv[0] looked up in PATH, or relative to cwd) in cwd
    bool start(const std::vector<std::string>& command, const std::string& cwd = "");

    /// Stop the child process (SIGTERM, wait, then SIGKILL if needed)
    bool stop();

    /// Restart with the same command, e.g. after the tree was updated
    bool restart();

    bool is_running() const;

    /// Get the PID of the child process (-1 if not running)
    pid_t child_pid() const;

    const std::vector<std::string>& command() const { return command_; }

    /// Enable or disable automatic restart on crash
    void set_auto_restart(bool enable);

    /// Callback invoked when the child process exits unexpectedly
    std::function<void(int exit_code)> on_crash;

private:
    std::vector<std::string> command_;
    std::string cwd_;
    std::mutex lifecycle_mutex_;
    std::atomic<pid_t> child_pid_{-1};
    std::atomic<bool> auto_restart_{true};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> monitor_running_{false};
    std::thread monitor_thread_;

    void monitor_loop();
    void stop_monitor();
    void start_monitor();
    bool do_start();
    void terminate_child();
};
