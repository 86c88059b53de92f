#pragma once

#include <memory>
#include <string>

/// Exclusive advisory lock on a working tree, held for the lifetime of
/// the object. Another process (or another open of the same file) that
/// tries to take it while held gets nullptr.
class UpdateLock {
public:
    static std::unique_ptr<UpdateLock> try_acquire(const std::string& tree_path);

    /// <tree>/.git/pubsub-updater.lock, or a temp file for non-git trees
    static std::string lock_path(const std::string& tree_path);

    ~UpdateLock();

    UpdateLock(const UpdateLock&) = delete;
    UpdateLock& operator=(const UpdateLock&) = delete;

    const std::string& path() const { return path_; }

private:
    UpdateLock(int fd, std::string path);

    int fd_;
    std::string path_;
};
