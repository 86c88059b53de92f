#include "ui/status_bar.hpp"

#include <ftxui/dom/elements.hpp>

using namespace ftxui;

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_state(const std::string& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void StatusBar::set_versions(const std::string& current, const std::string& latest) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = current;
    latest_ = latest;
}

void StatusBar::set_busy(bool busy) {
    busy_.store(busy);
}

void StatusBar::set_message(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
}

std::string StatusBar::summary() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out = state_ + " | " + (current_.empty() ? "?" : current_);
    if (!latest_.empty() && latest_ != current_) out += " -> " + latest_;
    if (!message_.empty()) out += " | " + message_;
    return out;
}

Component StatusBar::component() {
    return Renderer([this] {
        std::string state, current, latest, message;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state = state_;
            current = current_;
            latest = latest_;
            message = message_;
        }

        bool busy = busy_.load();

        // Left: session state
        auto state_text = text(" " + state + " ") | bold;

        // Center: last message
        auto center_text = text(message);

        // Right: versions
        Elements right_elements;
        right_elements.push_back(text(" " + (current.empty() ? std::string("?") : current) + " "));
        if (!latest.empty() && latest != current) {
            right_elements.push_back(text("↑ " + latest + " ") | color(Color::Yellow));
        }
        right_elements.push_back(busy
            ? text(" ● working ") | color(Color::Yellow)
            : text(" ○ idle ") | color(Color::Green));

        return hbox({
            state_text,
            filler(),
            center_text,
            filler(),
            hbox(right_elements),
        }) | inverted;
    });
}
