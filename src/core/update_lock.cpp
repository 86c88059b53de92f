#include "core/update_lock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <functional>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string UpdateLock::lock_path(const std::string& tree_path) {
    std::error_code ec;
    fs::path git_dir = fs::path(tree_path) / ".git";
    if (fs::is_directory(git_dir, ec)) {
        return (git_dir / "pubsub-updater.lock").string();
    }
    auto canonical = fs::weakly_canonical(tree_path, ec);
    std::string key = ec ? tree_path : canonical.string();
    return (fs::temp_directory_path() /
            ("pubsub-updater-" + std::to_string(std::hash<std::string>{}(key)) + ".lock")).string();
}

std::unique_ptr<UpdateLock> UpdateLock::try_acquire(const std::string& tree_path) {
    std::string path = lock_path(tree_path);
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("[UpdateLock] Cannot open {}: {}", path, std::strerror(errno));
        return nullptr;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            spdlog::warn("[UpdateLock] {} is held by another updater", path);
        } else {
            spdlog::error("[UpdateLock] flock {} failed: {}", path, std::strerror(err));
        }
        return nullptr;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 || write(fd, pid.data(), pid.size()) < 0) {
        spdlog::debug("[UpdateLock] Could not record pid in {}: {}", path, std::strerror(errno));
    }
    return std::unique_ptr<UpdateLock>(new UpdateLock(fd, std::move(path)));
}

UpdateLock::UpdateLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

UpdateLock::~UpdateLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}
