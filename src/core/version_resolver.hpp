#pragma once

#include "core/version.hpp"

#include <optional>
#include <string>
#include <vector>

struct ResolvedVersion {
    Version version;
    std::string source;     // "branch", "VERSION file", "git describe", "branch name"
};

/// Works out the installed version of a working tree from, in order:
/// a release branch name, the VERSION file, the nearest tag, the raw
/// branch name. Each probe fails quietly and has its own timeout.
class VersionResolver {
public:
    explicit VersionResolver(std::vector<std::string> release_prefixes = {"release/", "Release/"},
                             int probe_timeout_sec = 5);

    std::optional<ResolvedVersion> resolve(const std::string& repo_path) const;

    /// "release/1.2.3" -> "1.2.3" for any matching prefix
    static std::optional<std::string> strip_release_prefix(const std::string& branch,
                                                           const std::vector<std::string>& prefixes);

    /// "v1.4.0-3-gabc123" -> "1.4.0"
    static std::string normalize_describe(const std::string& described);

private:
    std::vector<std::string> prefixes_;
    int timeout_sec_;
};
