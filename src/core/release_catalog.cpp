#include "core/release_catalog.hpp"
#include "core/version_resolver.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

ReleaseCatalog::ReleaseCatalog(std::vector<std::string> release_prefixes, int fetch_timeout_sec)
    : prefixes_(std::move(release_prefixes)), fetch_timeout_sec_(fetch_timeout_sec) {}

std::vector<ReleaseRef> ReleaseCatalog::filter_release_branches(const std::vector<std::string>& remote_branches,
                                                                const std::string& remote,
                                                                const std::vector<std::string>& prefixes) {
    std::vector<ReleaseRef> out;
    std::unordered_map<std::string, size_t> slot;
    const std::string remote_prefix = remote + "/";

    for (const auto& name : remote_branches) {
        if (name.compare(0, remote_prefix.size(), remote_prefix) != 0) continue;
        std::string branch = name.substr(remote_prefix.size());

        auto version = VersionResolver::strip_release_prefix(branch, prefixes);
        if (!version || version->empty()) continue;

        ReleaseRef ref{Version(*version), branch, name};
        auto it = slot.find(*version);
        if (it == slot.end()) {
            slot.emplace(*version, out.size());
            out.push_back(std::move(ref));
        } else {
            spdlog::debug("[ReleaseCatalog] {} supersedes {} for version {}",
                          name, out[it->second].remote_ref, *version);
            out[it->second] = std::move(ref);
        }
    }
    return out;
}

std::optional<ReleaseRef> ReleaseCatalog::latest(const std::vector<ReleaseRef>& releases) {
    if (releases.empty()) return std::nullopt;
    const ReleaseRef* best = &releases.front();
    for (const auto& r : releases) {
        if (Version::compare(r.version, best->version) > 0) best = &r;
    }
    return *best;
}

CatalogResult ReleaseCatalog::fetch_and_list(const GitRepository& repo) const {
    CatalogResult result;
    result.error = UpdateError::NetworkFailure;

    if (!repo.is_repository()) {
        result.message = repo.path() + " is not a git working tree";
        spdlog::error("[ReleaseCatalog] {}", result.message);
        return result;
    }

    spdlog::info("[ReleaseCatalog] Fetching from all remotes");
    auto fetch = repo.fetch_all_prune(fetch_timeout_sec_);
    if (fetch.timed_out) {
        result.message = "fetch timed out after " + std::to_string(fetch_timeout_sec_) + "s";
        spdlog::error("[ReleaseCatalog] {}", result.message);
        return result;
    }
    if (!fetch.ok()) {
        result.message = "fetch failed: " + GitRepository::first_line(fetch.output);
        spdlog::error("[ReleaseCatalog] {}", result.message);
        return result;
    }

    std::vector<std::string> names;
    auto listing = repo.list_remote_branches(fetch_timeout_sec_, names);
    if (!listing.ok()) {
        result.message = "could not list remote branches: " + GitRepository::first_line(listing.output);
        spdlog::error("[ReleaseCatalog] {}", result.message);
        return result;
    }

    result.releases = filter_release_branches(names, repo.remote(), prefixes_);
    result.success = true;
    result.error = UpdateError::None;
    result.message = std::to_string(result.releases.size()) + " release branch(es) on " + repo.remote();
    spdlog::info("[ReleaseCatalog] {}", result.message);
    return result;
}
