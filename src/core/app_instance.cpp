#include "core/app_instance.hpp"
#include "core/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

// The relauncher starts the application as a session leader, so the
// group signal reaches anything it forked. A pid the application wrote
// itself may not lead a group.
static void signal_instance(pid_t pid, int sig) {
    if (kill(-pid, sig) != 0) kill(pid, sig);
}

// ════════════════════════════════════════════════════════════
// ApplicationInstance
// ════════════════════════════════════════════════════════════

ApplicationInstance::ApplicationInstance(const AppConfig& config, std::string tree_path)
    : config_(config), tree_path_(std::move(tree_path)) {}

std::string ApplicationInstance::pid_file() const {
    if (config_.app_pid_file.empty()) return "";
    fs::path p(Config::expand_home(config_.app_pid_file));
    if (p.is_relative()) p = fs::path(tree_path_) / p;
    return p.lexically_normal().string();
}

pid_t ApplicationInstance::recorded_pid() const {
    std::string path = pid_file();
    if (path.empty()) return -1;

    std::ifstream in(path);
    if (!in) return -1;
    long value = -1;
    if (!(in >> value)) {
        spdlog::warn("[Application] {} does not hold a pid", path);
        return -1;
    }
    // Never signal init or ourselves on the strength of a stale file
    if (value <= 1 || value == static_cast<long>(getpid())) return -1;
    return static_cast<pid_t>(value);
}

bool ApplicationInstance::stop_recorded() {
    pid_t pid = recorded_pid();
    if (pid <= 0 || !ProcessRunner::is_alive(pid)) return true;

    spdlog::info("[Application] Stopping previous instance (pid {})", pid);
    signal_instance(pid, SIGTERM);
    if (ProcessRunner::wait_for_exit(pid, config_.app_stop_timeout_sec)) return true;

    spdlog::warn("[Application] pid {} ignored SIGTERM for {}s, sending SIGKILL",
                 pid, config_.app_stop_timeout_sec);
    signal_instance(pid, SIGKILL);
    if (ProcessRunner::wait_for_exit(pid, 5)) return true;

    spdlog::error("[Application] pid {} survived SIGKILL", pid);
    return false;
}

bool ApplicationInstance::record(pid_t pid) const {
    std::string path = pid_file();
    if (path.empty()) return true;

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream out(path, std::ios::trunc);
    if (!out || !(out << pid << "\n")) {
        spdlog::error("[Application] Cannot write {}: {}", path, std::strerror(errno));
        return false;
    }
    return true;
}

std::vector<std::string> ApplicationInstance::command() const {
    std::vector<std::string> argv = config_.app_command;
    if (!argv.empty() && argv[0].find('/') != std::string::npos && fs::path(argv[0]).is_relative()) {
        argv[0] = (fs::path(tree_path_) / argv[0]).lexically_normal().string();
    }
    return argv;
}

pid_t ApplicationInstance::start(const std::string& log_path) {
    auto argv = command();
    if (argv.empty()) return -1;

    spdlog::info("[Application] Starting {}", ProcessRunner::describe(argv));
    pid_t pid = ProcessRunner::spawn_detached(argv, tree_path_, log_path);
    if (pid <= 0) {
        spdlog::error("[Application] Could not spawn {}", argv[0]);
        return -1;
    }
    record(pid);
    return pid;
}
