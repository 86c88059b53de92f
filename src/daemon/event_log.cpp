#include "daemon/event_log.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

using json = nlohmann::json;

static std::string iso_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

EventLog::EventLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void EventLog::add(const std::string& level, const std::string& message, json data) {
    if (level == "error") {
        spdlog::error("[Webhook] {}", message);
    } else if (level == "warning") {
        spdlog::warn("[Webhook] {}", message);
    } else {
        spdlog::info("[Webhook] {}", message);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({iso_now(), level, message, std::move(data)});
    while (entries_.size() > capacity_) entries_.pop_front();
}

std::vector<EventEntry> EventLog::recent(size_t limit, const std::string& level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventEntry> out;
    for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
        if (!level.empty() && it->level != level) continue;
        out.push_back(*it);
    }
    return {out.rbegin(), out.rend()};
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

json EventLog::to_json(const EventEntry& entry) {
    return {
        {"timestamp", entry.timestamp},
        {"level", entry.level},
        {"message", entry.message},
        {"data", entry.data},
    };
}
