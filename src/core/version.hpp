#pragma once

#include <string>
#include <vector>

/// A release version as found in a branch name, VERSION file or tag.
/// Keeps the original literal; the dotted-integer form is derived from it.
class Version {
public:
    Version() = default;
    explicit Version(std::string literal);

    const std::string& literal() const { return literal_; }
    bool empty() const { return literal_.empty(); }

    /// True when every dot-separated component is a non-empty run of digits
    bool is_structured() const { return structured_; }

    /// Digit components with leading zeros removed ("007" -> "7")
    const std::vector<std::string>& components() const { return components_; }

    /// -1, 0 or 1. Structured comparison when both sides parse,
    /// byte-wise comparison of the literals otherwise.
    static int compare(const Version& a, const Version& b);

    bool operator==(const Version& o) const { return compare(*this, o) == 0; }
    bool operator!=(const Version& o) const { return compare(*this, o) != 0; }
    bool operator<(const Version& o) const { return compare(*this, o) < 0; }
    bool operator>(const Version& o) const { return compare(*this, o) > 0; }

private:
    std::string literal_;
    std::vector<std::string> components_;
    bool structured_ = false;
};

/// Convenience wrapper over Version::compare for raw literals
int compare_versions(const std::string& a, const std::string& b);
