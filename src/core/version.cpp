#include "core/version.hpp"

#include <algorithm>
#include <cctype>

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static std::string strip_leading_zeros(const std::string& s) {
    size_t pos = s.find_first_not_of('0');
    if (pos == std::string::npos) return "0";
    return s.substr(pos);
}

// Compares two normalized digit strings by magnitude, no overflow limit
static int compare_digits(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    if (c == 0) return 0;
    return c < 0 ? -1 : 1;
}

// ════════════════════════════════════════════════════════════
// Version
// ════════════════════════════════════════════════════════════

Version::Version(std::string literal) : literal_(std::move(literal)) {
    std::vector<std::string> parts;
    size_t start = 0;
    bool ok = !literal_.empty();
    while (ok) {
        size_t dot = literal_.find('.', start);
        std::string part = literal_.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!all_digits(part)) {
            ok = false;
            break;
        }
        parts.push_back(strip_leading_zeros(part));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (ok) {
        components_ = std::move(parts);
        structured_ = true;
    }
}

int Version::compare(const Version& a, const Version& b) {
    if (!a.structured_ || !b.structured_) {
        int c = a.literal_.compare(b.literal_);
        if (c == 0) return 0;
        return c < 0 ? -1 : 1;
    }

    size_t n = std::max(a.components_.size(), b.components_.size());
    static const std::string zero = "0";
    for (size_t i = 0; i < n; ++i) {
        const std::string& x = i < a.components_.size() ? a.components_[i] : zero;
        const std::string& y = i < b.components_.size() ? b.components_[i] : zero;
        int c = compare_digits(x, y);
        if (c != 0) return c;
    }
    return 0;
}

int compare_versions(const std::string& a, const std::string& b) {
    return Version::compare(Version(a), Version(b));
}
