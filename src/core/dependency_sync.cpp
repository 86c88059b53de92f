#include "core/dependency_sync.hpp"
#include "core/git_repository.hpp"
#include "core/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

DependencySync::DependencySync(std::string tree_path, DependencyOptions options)
    : tree_path_(std::move(tree_path)), options_(std::move(options)) {}

bool DependencySync::manifest_present() const {
    std::error_code ec;
    return fs::is_regular_file(fs::path(tree_path_) / options_.manifest, ec);
}

std::string DependencySync::venv_python() const {
    fs::path bin = fs::path(tree_path_) / options_.venv_dir / "bin";
    for (const char* name : {"python3", "python"}) {
        fs::path candidate = bin / name;
        if (access(candidate.c_str(), X_OK) == 0) return candidate.string();
    }
    return "";
}

std::string DependencySync::select_installer() const {
    std::string venv = venv_python();
    return venv.empty() ? options_.python : venv;
}

DependencyResult DependencySync::sync() const {
    DependencyResult result;
    if (!manifest_present()) {
        result.ok = true;
        result.message = options_.manifest + " not found, skipping dependency sync";
        spdlog::info("[Dependencies] {}", result.message);
        return result;
    }

    result.ran = true;
    result.installer = select_installer();
    std::vector<std::string> argv = {result.installer, "-m", "pip", "install",
                                     "-r", options_.manifest, "--upgrade"};
    spdlog::info("[Dependencies] {}", ProcessRunner::describe(argv));

    auto r = ProcessRunner::run(argv, tree_path_, options_.timeout_sec);
    result.exit_code = r.exit_code;
    result.timed_out = r.timed_out;
    result.output = r.output;
    result.ok = r.ok();

    if (r.timed_out) {
        result.message = "dependency install timed out after " + std::to_string(options_.timeout_sec) + "s";
    } else if (r.launch_failed) {
        result.message = GitRepository::first_line(r.output);
    } else if (!r.ok()) {
        result.message = "dependency install exited with code " + std::to_string(r.exit_code);
    } else {
        result.message = "dependencies installed with " + result.installer;
    }

    if (result.ok) {
        spdlog::info("[Dependencies] {}", result.message);
    } else {
        spdlog::warn("[Dependencies] {}", result.message);
    }
    return result;
}

bool DependencySync::ensure_virtualenv(std::string& error) const {
    if (!venv_python().empty()) return true;

    spdlog::info("[Dependencies] Creating virtual environment {}", options_.venv_dir);
    auto r = ProcessRunner::run({options_.python, "-m", "venv", options_.venv_dir},
                                tree_path_, options_.timeout_sec);
    if (!r.ok()) {
        error = r.timed_out ? "venv creation timed out" : GitRepository::first_line(r.output);
        if (error.empty()) error = "venv creation exited with code " + std::to_string(r.exit_code);
        return false;
    }
    return true;
}
