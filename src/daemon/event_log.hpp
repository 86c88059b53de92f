#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct EventEntry {
    std::string timestamp;      // ISO-8601, local time
    std::string level;          // "info", "warning", "error"
    std::string message;
    nlohmann::json data;
};

/// Bounded in-memory history served by GET /logs. Oldest entries drop first.
class EventLog {
public:
    explicit EventLog(size_t capacity = 100);

    void add(const std::string& level, const std::string& message,
             nlohmann::json data = nlohmann::json::object());

    /// Newest `limit` entries, oldest first, optionally only one level
    std::vector<EventEntry> recent(size_t limit, const std::string& level = "") const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

    static nlohmann::json to_json(const EventEntry& entry);

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<EventEntry> entries_;
};
