#include "daemon/process_manager.hpp"
#include "core/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <chrono>
#include <cerrno>
#include <cstring>

ProcessManager::ProcessManager() = default;

ProcessManager::~ProcessManager() {
    stop();
}

bool ProcessManager::do_start() {
    if (command_.empty()) return false;

    // argv prepared before fork, the child only execs
    std::vector<char*> argv;
    for (const auto& arg : command_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* dir = cwd_.empty() ? nullptr : cwd_.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[ProcessManager] fork failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        // Own process group so stop() reaches grandchildren too
        setpgid(0, 0);
        if (dir && chdir(dir) != 0) _exit(127);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    child_pid_ = pid;
    spdlog::info("[ProcessManager] Started {} (pid {})", ProcessRunner::describe(command_), pid);
    return true;
}

void ProcessManager::start_monitor() {
    stop_monitor();
    monitor_running_.store(true);
    monitor_thread_ = std::thread(&ProcessManager::monitor_loop, this);
}

bool ProcessManager::start(const std::vector<std::string>& command, const std::string& cwd) {
    // Stop existing process if running
    if (is_running()) {
        stop();
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    command_ = command;
    cwd_ = cwd;
    stop_requested_.store(false);

    if (!do_start()) {
        return false;
    }
    start_monitor();
    return true;
}

void ProcessManager::terminate_child() {
    pid_t pid = child_pid_.load();
    if (pid <= 0) return;

    if (kill(-pid, SIGTERM) == 0 || kill(pid, SIGTERM) == 0) {
        // Wait up to 5 seconds for graceful exit
        for (int i = 0; i < 50; ++i) {
            int status;
            pid_t result = waitpid(pid, &status, WNOHANG);
            if (result == pid || (result < 0 && errno == ECHILD)) {
                child_pid_ = -1;
                spdlog::info("[ProcessManager] pid {} stopped", pid);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::warn("[ProcessManager] pid {} ignored SIGTERM, sending SIGKILL", pid);
        kill(-pid, SIGKILL);
        int status;
        waitpid(pid, &status, 0);
    }
    child_pid_ = -1;
}

bool ProcessManager::stop() {
    stop_requested_.store(true);
    // Monitor first, so it cannot reap or respawn underneath us
    stop_monitor();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    terminate_child();
    return true;
}

bool ProcessManager::restart() {
    stop();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_requested_.store(false);
    if (!do_start()) {
        return false;
    }
    start_monitor();
    return true;
}

bool ProcessManager::is_running() const {
    pid_t pid = child_pid_.load();
    if (pid <= 0) return false;

    // Check if process exists without sending a signal
    return kill(pid, 0) == 0;
}

pid_t ProcessManager::child_pid() const {
    return child_pid_;
}

void ProcessManager::set_auto_restart(bool enable) {
    auto_restart_.store(enable);
}

void ProcessManager::stop_monitor() {
    monitor_running_.store(false);
    if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id()) {
        monitor_thread_.join();
    }
}

void ProcessManager::monitor_loop() {
    while (monitor_running_.load() && !stop_requested_.load()) {
        pid_t pid = child_pid_.load();
        if (pid > 0) {
            int status;
            pid_t result = waitpid(pid, &status, WNOHANG);

            if (result == pid) {
                int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                child_pid_ = -1;

                if (!stop_requested_.load()) {
                    spdlog::warn("[ProcessManager] {} exited unexpectedly (code {})",
                                 ProcessRunner::describe(command_), exit_code);
                    if (on_crash) {
                        on_crash(exit_code);
                    }

                    if (auto_restart_.load()) {
                        // Wait before restarting
                        for (int i = 0; i < 30 && monitor_running_.load() && !stop_requested_.load(); ++i) {
                            std::this_thread::sleep_for(std::chrono::milliseconds(100));
                        }
                        if (monitor_running_.load() && !stop_requested_.load()) {
                            do_start();
                        }
                    }
                }
            }
        }

        // Check every 500ms
        for (int i = 0; i < 5 && monitor_running_.load() && !stop_requested_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}
