#include "core/version_resolver.hpp"
#include "core/git_repository.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

VersionResolver::VersionResolver(std::vector<std::string> release_prefixes, int probe_timeout_sec)
    : prefixes_(std::move(release_prefixes)), timeout_sec_(probe_timeout_sec) {}

std::optional<std::string> VersionResolver::strip_release_prefix(const std::string& branch,
                                                                 const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (prefix.empty() || branch.size() <= prefix.size()) continue;
        if (branch.compare(0, prefix.size(), prefix) == 0) {
            return branch.substr(prefix.size());
        }
    }
    return std::nullopt;
}

std::string VersionResolver::normalize_describe(const std::string& described) {
    std::string v = described;
    if (!v.empty() && (v[0] == 'v' || v[0] == 'V')) v.erase(0, 1);
    auto dash = v.find('-');
    if (dash != std::string::npos) v.erase(dash);
    return v;
}

std::optional<ResolvedVersion> VersionResolver::resolve(const std::string& repo_path) const {
    GitRepository repo(repo_path);

    // 1. release branch
    auto branch = repo.current_branch(timeout_sec_);
    if (branch) {
        if (auto v = strip_release_prefix(*branch, prefixes_)) {
            spdlog::debug("[VersionResolver] {} from branch {}", *v, *branch);
            return ResolvedVersion{Version(*v), "branch"};
        }
    } else {
        spdlog::debug("[VersionResolver] branch probe failed in {}", repo_path);
    }

    // 2. VERSION file
    fs::path version_file = fs::path(repo_path) / "VERSION";
    std::ifstream in(version_file);
    if (in) {
        std::string line;
        std::getline(in, line);
        line = GitRepository::first_line(line);
        if (!line.empty()) {
            spdlog::debug("[VersionResolver] {} from {}", line, version_file.string());
            return ResolvedVersion{Version(line), "VERSION file"};
        }
        spdlog::debug("[VersionResolver] {} is empty", version_file.string());
    }

    // 3. nearest tag
    if (auto described = repo.describe_tags(timeout_sec_)) {
        std::string v = normalize_describe(*described);
        if (!v.empty()) {
            spdlog::debug("[VersionResolver] {} from git describe ({})", v, *described);
            return ResolvedVersion{Version(v), "git describe"};
        }
    } else {
        spdlog::debug("[VersionResolver] no tags reachable in {}", repo_path);
    }

    // 4. whatever branch we are on
    if (branch && !branch->empty()) {
        return ResolvedVersion{Version(*branch), "branch name"};
    }

    spdlog::warn("[VersionResolver] Could not determine version of {}", repo_path);
    return std::nullopt;
}
