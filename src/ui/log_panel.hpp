#pragma once

#include <ftxui/component/component.hpp>
#include <memory>
#include <string>
#include <vector>

struct LogEntry {
    std::string type;       // "info", "warning", "error", "state"
    std::string payload;
};

/// Scrolling session progress. Keys: 1-4 filter, f freeze, e export.
class LogPanel {
public:
    LogPanel();
    ~LogPanel();

    // Push a log entry (thread-safe)
    void push_log(LogEntry entry);
    void clear();

    /// Entries passing the current filter, oldest first
    std::vector<LogEntry> visible() const;
    void set_filter(int level);

    /// Write the visible entries to path; false on I/O failure
    bool export_to(const std::string& path) const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
