#pragma once

#include "core/config.hpp"

#include <string>
#include <vector>
#include <sys/types.h>

/// The deployed application as a detached process tracked through
/// application.pid_file. Used by the relauncher and by the daemon when it
/// does not supervise the application itself.
class ApplicationInstance {
public:
    ApplicationInstance(const AppConfig& config, std::string tree_path);

    /// Absolute pid file path, empty when application.pid_file is unset
    std::string pid_file() const;

    /// Pid recorded in the pid file, or -1
    pid_t recorded_pid() const;

    /// SIGTERM the recorded instance, SIGKILL it after stop_timeout_sec.
    /// Returns false only when it is still alive afterwards.
    bool stop_recorded();

    /// Spawn application.command detached in the tree and record its pid.
    /// Returns the pid, or -1.
    pid_t start(const std::string& log_path);

    bool record(pid_t pid) const;

    /// application.command with "./bin/x" style entries made absolute
    std::vector<std::string> command() const;

private:
    const AppConfig& config_;
    std::string tree_path_;
};
