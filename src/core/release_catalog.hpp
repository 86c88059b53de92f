#pragma once

#include "core/git_repository.hpp"
#include "core/update_types.hpp"

#include <optional>
#include <string>
#include <vector>

struct CatalogResult {
    bool success = false;
    UpdateError error = UpdateError::None;   // NetworkFailure when !success
    std::string message;
    std::vector<ReleaseRef> releases;
};

class ReleaseCatalog {
public:
    ReleaseCatalog(std::vector<std::string> release_prefixes, int fetch_timeout_sec = 30);

    /// Prune-aware fetch, then list release branches of the repository's
    /// remote. A failed fetch never falls through to a stale listing.
    CatalogResult fetch_and_list(const GitRepository& repo) const;

    /// Keep "<remote>/<prefix><version>" entries, one per version literal.
    /// A later duplicate replaces the earlier one in the earlier slot.
    static std::vector<ReleaseRef> filter_release_branches(const std::vector<std::string>& remote_branches,
                                                           const std::string& remote,
                                                           const std::vector<std::string>& prefixes);

    /// Highest version; the first of equal maxima wins
    static std::optional<ReleaseRef> latest(const std::vector<ReleaseRef>& releases);

private:
    std::vector<std::string> prefixes_;
    int fetch_timeout_sec_;
};
