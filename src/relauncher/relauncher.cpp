#include "relauncher/relauncher.hpp"
#include "core/app_instance.hpp"
#include "core/dependency_sync.hpp"
#include "core/logging.hpp"
#include "core/process_runner.hpp"
#include "core/version_resolver.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

Relauncher::Relauncher(AppConfig config, std::string target_version, std::string tree_path, pid_t parent_pid)
    : config_(std::move(config)),
      target_version_(std::move(target_version)),
      tree_path_(std::move(tree_path)),
      parent_pid_(parent_pid) {}

void Relauncher::wait_for_parent() {
    if (parent_pid_ <= 0) return;

    spdlog::info("[Relauncher] Waiting for pid {} to exit", parent_pid_);
    if (!ProcessRunner::wait_for_exit(parent_pid_, config_.relauncher_wait_timeout_sec)) {
        spdlog::warn("[Relauncher] pid {} still running after {}s, continuing anyway",
                     parent_pid_, config_.relauncher_wait_timeout_sec);
    }
}

void Relauncher::verify_version() {
    VersionResolver resolver(config_.release_prefixes, config_.probe_timeout_sec);
    auto resolved = resolver.resolve(tree_path_);
    if (!resolved) {
        spdlog::warn("[Relauncher] Cannot determine the version of {}", tree_path_);
        return;
    }
    if (Version::compare(resolved->version, Version(target_version_)) != 0) {
        spdlog::warn("[Relauncher] Tree is at {} ({}), expected {}",
                     resolved->version.literal(), resolved->source, target_version_);
    } else {
        spdlog::info("[Relauncher] Tree is at {}", target_version_);
    }
}

void Relauncher::repair_dependencies() {
    if (!config_.deps_enabled) return;

    DependencyOptions opts;
    opts.manifest = config_.deps_manifest;
    opts.venv_dir = config_.deps_venv_dir;
    opts.python = config_.deps_python;
    opts.timeout_sec = config_.deps_timeout_sec;
    DependencySync deps(tree_path_, opts);

    if (!deps.manifest_present()) return;

    std::string err;
    if (!deps.ensure_virtualenv(err)) {
        spdlog::error("[Relauncher] Virtual environment: {}", err);
    }
    auto result = deps.sync();
    if (!result.ok) {
        spdlog::error("[Relauncher] {}", result.message);
    }
}

bool Relauncher::stop_previous_instance() {
    ApplicationInstance app(config_, tree_path_);
    return app.stop_recorded();
}

int Relauncher::start_application() {
    if (config_.app_command.empty()) {
        spdlog::error("[Relauncher] application.command is not configured");
        return NoCommand;
    }

    std::string log_path;
    if (!config_.log_file.empty()) log_path = Config::expand_home(config_.log_file) + ".app";

    ApplicationInstance app(config_, tree_path_);
    started_pid_ = app.start(log_path);
    if (started_pid_ <= 0) return StartFailed;

    std::this_thread::sleep_for(std::chrono::milliseconds(startup_grace_ms_));
    if (!ProcessRunner::is_alive(started_pid_)) {
        spdlog::warn("[Relauncher] pid {} exited within {}ms of starting", started_pid_, startup_grace_ms_);
    } else {
        spdlog::info("[Relauncher] Application running as pid {}", started_pid_);
    }
    return Ok;
}

int Relauncher::run() {
    std::error_code ec;
    if (!fs::is_directory(tree_path_, ec)) {
        spdlog::error("[Relauncher] {} is not a directory", tree_path_);
        return Usage;
    }

    spdlog::info("[Relauncher] Relaunching {} at {}", tree_path_, target_version_);
    wait_for_parent();
    if (!stop_previous_instance()) {
        spdlog::error("[Relauncher] Previous instance is still running, not starting a second one");
        return StartFailed;
    }
    verify_version();
    repair_dependencies();
    return start_application();
}

int Relauncher::main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: pubsub-relauncher <target-version> <working-tree-path>\n";
        return Usage;
    }

    Config config;
    config.load();
    if (!config.last_error().empty()) {
        spdlog::error("[Relauncher] Config: {}", config.last_error());
    }
    Logging::init(config.data());

    pid_t parent = -1;
    if (const char* env = std::getenv("PUBSUB_UPDATER_PARENT_PID")) {
        try {
            parent = static_cast<pid_t>(std::stol(env));
        } catch (const std::exception&) {
            spdlog::warn("[Relauncher] Ignoring PUBSUB_UPDATER_PARENT_PID='{}'", env);
        }
    }

    std::string tree = Config::resolve_repo_path(argv[2]);
    Relauncher relauncher(config.data(), argv[1], tree, parent);
    return relauncher.run();
}
