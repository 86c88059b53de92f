#include "core/git_repository.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

GitRepository::GitRepository(std::string path, std::string remote)
    : path_(std::move(path)), remote_(std::move(remote)) {}

bool GitRepository::is_repository() const {
    std::error_code ec;
    return fs::exists(fs::path(path_) / ".git", ec);
}

std::string GitRepository::git_dir() const {
    return (fs::path(path_) / ".git").string();
}

CommandResult GitRepository::git(const std::vector<std::string>& args, int timeout_sec) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("git");
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("[Git] {} (cwd={}, timeout={}s)", ProcessRunner::describe(argv), path_, timeout_sec);
    auto result = ProcessRunner::run(argv, path_, timeout_sec,
                                     {{"GIT_TERMINAL_PROMPT", "0"},
                                      {"GIT_ASKPASS", "true"},
                                      {"LC_ALL", "C"}});
    if (result.timed_out) {
        spdlog::warn("[Git] {} timed out after {}s", ProcessRunner::describe(argv), timeout_sec);
    } else if (!result.ok()) {
        spdlog::debug("[Git] {} exited {}: {}", ProcessRunner::describe(argv), result.exit_code,
                      trim(result.output));
    }
    return result;
}

std::string GitRepository::first_line(const std::string& output) {
    std::string t = trim(output);
    auto nl = t.find('\n');
    return trim(nl == std::string::npos ? t : t.substr(0, nl));
}

std::optional<std::string> GitRepository::current_branch(int timeout_sec) const {
    auto r = git({"rev-parse", "--abbrev-ref", "HEAD"}, timeout_sec);
    if (!r.ok()) return std::nullopt;
    std::string name = first_line(r.output);
    if (name.empty()) return std::nullopt;
    return name;
}

std::optional<std::string> GitRepository::describe_tags(int timeout_sec) const {
    auto r = git({"describe", "--tags"}, timeout_sec);
    if (!r.ok()) return std::nullopt;
    std::string d = first_line(r.output);
    if (d.empty()) return std::nullopt;
    return d;
}

std::optional<std::string> GitRepository::head_commit(int timeout_sec) const {
    auto r = git({"rev-parse", "HEAD"}, timeout_sec);
    if (!r.ok()) return std::nullopt;
    return first_line(r.output);
}

bool GitRepository::is_dirty(int timeout_sec, std::string* detail) const {
    auto r = git({"status", "--porcelain"}, timeout_sec);
    if (!r.ok()) {
        if (detail) {
            *detail = r.timed_out ? "git status timed out" : "git status failed: " + first_line(r.output);
        }
        return true;
    }
    std::string changes = trim(r.output);
    if (detail) *detail = changes;
    return !changes.empty();
}

CommandResult GitRepository::fetch_all_prune(int timeout_sec) const {
    return git({"fetch", "--all", "--prune"}, timeout_sec);
}

CommandResult GitRepository::fetch_branch(const std::string& branch, int depth, int timeout_sec) const {
    std::vector<std::string> args = {"fetch"};
    if (depth > 0) args.push_back("--depth=" + std::to_string(depth));
    args.push_back(remote_);
    args.push_back("+refs/heads/" + branch + ":refs/remotes/" + remote_ + "/" + branch);
    return git(args, timeout_sec);
}

CommandResult GitRepository::list_remote_branches(int timeout_sec, std::vector<std::string>& names) const {
    names.clear();
    auto r = git({"for-each-ref", "--format=%(refname)", "refs/remotes/" + remote_ + "/"}, timeout_sec);
    if (!r.ok()) return r;

    const std::string full_prefix = "refs/remotes/";
    std::istringstream in(r.output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.compare(0, full_prefix.size(), full_prefix) != 0) continue;
        names.push_back(line.substr(full_prefix.size()));
    }
    return r;
}

CommandResult GitRepository::checkout(const std::string& branch, int timeout_sec) const {
    return git({"checkout", branch}, timeout_sec);
}

CommandResult GitRepository::checkout_new(const std::string& branch, const std::string& start_point,
                                          int timeout_sec) const {
    return git({"checkout", "-b", branch, start_point}, timeout_sec);
}

CommandResult GitRepository::reset_hard(const std::string& ref, int timeout_sec) const {
    if (ref.empty()) return git({"reset", "--hard"}, timeout_sec);
    return git({"reset", "--hard", ref}, timeout_sec);
}

CommandResult GitRepository::clean_untracked(int timeout_sec) const {
    return git({"clean", "-fd"}, timeout_sec);
}
