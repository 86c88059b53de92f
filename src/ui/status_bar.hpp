#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <mutex>
#include <atomic>

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_state(const std::string& state);
    void set_versions(const std::string& current, const std::string& latest);
    void set_busy(bool busy);
    void set_message(const std::string& message);

    /// Text of the left/center/right segments, for tests
    std::string summary();

private:
    std::mutex mutex_;
    std::string state_ = "Idle";
    std::string current_;
    std::string latest_;
    std::string message_;
    std::atomic<bool> busy_{false};
};
