#pragma once

#include <ctime>
#include <string>

struct BackupResult {
    bool success = false;
    std::string path;
    std::string error;
};

/// Point-in-time copy of a working tree (without .git) into a sibling
/// directory. Backups are never removed or restored automatically.
class BackupManager {
public:
    explicit BackupManager(std::string tree_path);

    BackupResult create_backup() const;

    /// "<tree-name>-backup-YYYYMMDD-HHMMSS"
    static std::string backup_name(const std::string& tree_name, std::time_t when);

private:
    std::string tree_path_;
};
