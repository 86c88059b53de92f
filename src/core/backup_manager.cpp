#include "core/backup_manager.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

BackupManager::BackupManager(std::string tree_path) : tree_path_(std::move(tree_path)) {}

std::string BackupManager::backup_name(const std::string& tree_name, std::time_t when) {
    std::tm tm{};
    localtime_r(&when, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);
    return tree_name + "-backup-" + stamp;
}

// Recursive copy that skips every ".git" entry and keeps symlinks as links
static void copy_tree(const fs::path& src, const fs::path& dst) {
    fs::create_directories(dst);
    for (const auto& entry : fs::directory_iterator(src)) {
        const auto name = entry.path().filename();
        if (name == ".git") continue;

        const fs::path target = dst / name;
        auto status = entry.symlink_status();
        if (fs::is_symlink(status)) {
            fs::copy_symlink(entry.path(), target);
        } else if (fs::is_directory(status)) {
            copy_tree(entry.path(), target);
        } else if (fs::is_regular_file(status)) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
        }
        // sockets, fifos and devices are not part of an install
    }
}

BackupResult BackupManager::create_backup() const {
    BackupResult result;

    fs::path tree = fs::path(tree_path_).lexically_normal();
    if (tree.filename().empty()) tree = tree.parent_path();

    std::error_code ec;
    if (!fs::is_directory(tree, ec)) {
        result.error = tree.string() + " is not a directory";
        return result;
    }

    std::string base = backup_name(tree.filename().string(), std::time(nullptr));
    fs::path dest = tree.parent_path() / base;
    for (int n = 1; fs::exists(dest, ec); ++n) {
        dest = tree.parent_path() / (base + "-" + std::to_string(n));
    }

    try {
        copy_tree(tree, dest);
    } catch (const fs::filesystem_error& e) {
        result.error = e.what();
        spdlog::error("[Backup] Copy to {} failed: {}", dest.string(), e.what());
        return result;
    }

    result.success = true;
    result.path = dest.string();
    spdlog::info("[Backup] Working tree copied to {}", result.path);
    return result;
}
