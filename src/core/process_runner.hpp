#pragma once

#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

struct CommandResult {
    int exit_code = -1;
    std::string output;         // stdout and stderr, interleaved
    bool timed_out = false;
    bool launch_failed = false;

    bool ok() const { return !timed_out && !launch_failed && exit_code == 0; }
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

class ProcessRunner {
public:
    /// Run argv in cwd, capturing output. The child gets its own process
    /// group, which is killed with SIGKILL once timeout_sec elapses.
    static CommandResult run(const std::vector<std::string>& argv,
                             const std::string& cwd = "",
                             int timeout_sec = 30,
                             const EnvOverrides& env = {});

    /// Start argv detached in a new session (double fork, reparented to init).
    /// stdout/stderr are appended to log_path, or discarded when empty.
    /// Returns the pid of the detached process, or -1.
    static pid_t spawn_detached(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const std::string& log_path = "",
                                const EnvOverrides& env = {});

    /// True while pid exists and is not a zombie
    static bool is_alive(pid_t pid);

    /// Poll until pid is gone. Returns false on timeout.
    static bool wait_for_exit(pid_t pid, int timeout_sec);

    /// Absolute path of the running executable
    static std::string self_path();

    /// Space-joined argv for log lines
    static std::string describe(const std::vector<std::string>& argv);

    static constexpr size_t kMaxOutputBytes = 256 * 1024;
};
