#pragma once

#include "core/process_runner.hpp"

#include <optional>
#include <string>
#include <vector>

/// A working copy driven through the git CLI. Every call carries its own
/// timeout; terminal prompts are disabled so a missing credential fails
/// instead of hanging.
class GitRepository {
public:
    explicit GitRepository(std::string path, std::string remote = "origin");

    const std::string& path() const { return path_; }
    const std::string& remote() const { return remote_; }

    /// True when <path>/.git exists
    bool is_repository() const;
    std::string git_dir() const;

    CommandResult git(const std::vector<std::string>& args, int timeout_sec) const;

    /// Checked-out branch, "HEAD" when detached
    std::optional<std::string> current_branch(int timeout_sec) const;
    std::optional<std::string> describe_tags(int timeout_sec) const;
    std::optional<std::string> head_commit(int timeout_sec) const;

    /// Dirty when status reports anything, or when status itself fails
    bool is_dirty(int timeout_sec, std::string* detail = nullptr) const;

    CommandResult fetch_all_prune(int timeout_sec) const;
    CommandResult fetch_branch(const std::string& branch, int depth, int timeout_sec) const;

    /// Short names of refs/remotes/<remote>/*, in for-each-ref order
    CommandResult list_remote_branches(int timeout_sec, std::vector<std::string>& names) const;

    CommandResult checkout(const std::string& branch, int timeout_sec) const;
    CommandResult checkout_new(const std::string& branch, const std::string& start_point, int timeout_sec) const;
    CommandResult reset_hard(const std::string& ref, int timeout_sec) const;
    CommandResult clean_untracked(int timeout_sec) const;

    /// Trimmed first line of a command's output
    static std::string first_line(const std::string& output);

private:
    std::string path_;
    std::string remote_;
};
