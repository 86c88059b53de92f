#include "ui/log_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

static const int MAX_LOG_LINES = 1000;

struct LogPanel::Impl {
    std::deque<LogEntry> logs;
    mutable std::mutex log_mutex;

    int filter_level = 0; // 0=all, 1=info, 2=warning, 3=error
    bool frozen = false;
    std::string last_export;

    void push(LogEntry entry) {
        std::lock_guard<std::mutex> lock(log_mutex);
        logs.push_back(std::move(entry));
        while ((int)logs.size() > MAX_LOG_LINES) {
            logs.pop_front();
        }
    }

    bool matches_filter(const LogEntry& entry) const {
        if (filter_level == 0) return true;
        if (filter_level == 1 && (entry.type == "info" || entry.type == "state")) return true;
        if (filter_level == 2 && entry.type == "warning") return true;
        if (filter_level == 3 && entry.type == "error") return true;
        return false;
    }

    Color log_color(const std::string& type) const {
        if (type == "state") return Color::Cyan;
        if (type == "warning") return Color::Yellow;
        if (type == "error") return Color::Red;
        return Color::White;
    }

    bool export_logs(const std::string& path) const {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::ofstream out(path);
        if (!out.is_open()) return false;
        for (const auto& entry : logs) {
            if (matches_filter(entry)) {
                out << "[" << entry.type << "] " << entry.payload << "\n";
            }
        }
        return out.good();
    }

    std::string default_export_name() const {
        auto t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << "pubsub-updater-progress-" << std::put_time(&tm, "%Y%m%d-%H%M%S") << ".log";
        return oss.str();
    }
};

LogPanel::LogPanel() : impl_(std::make_unique<Impl>()) {}
LogPanel::~LogPanel() = default;

void LogPanel::push_log(LogEntry entry) { impl_->push(std::move(entry)); }

void LogPanel::clear() {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    impl_->logs.clear();
}

std::vector<LogEntry> LogPanel::visible() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    std::vector<LogEntry> out;
    for (const auto& e : impl_->logs) {
        if (impl_->matches_filter(e)) out.push_back(e);
    }
    return out;
}

void LogPanel::set_filter(int level) {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    impl_->filter_level = (level >= 0 && level <= 3) ? level : 0;
}

bool LogPanel::export_to(const std::string& path) const {
    return impl_->export_logs(path);
}

Component LogPanel::component() {
    auto self = impl_.get();

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->log_mutex);

        // Header with filter info
        std::string filter_labels[] = {"ALL", "INFO", "WARNING", "ERROR"};
        Elements header_items;
        for (int i = 0; i < 4; i++) {
            auto el = text(" " + std::to_string(i + 1) + ":" + filter_labels[i] + " ");
            if (i == self->filter_level) {
                el = el | bold | inverted;
            } else {
                el = el | dim;
            }
            header_items.push_back(el);
        }
        header_items.push_back(filler());
        if (!self->last_export.empty()) {
            header_items.push_back(text(" " + self->last_export + " ") | dim);
        }
        header_items.push_back(
            self->frozen
                ? text(" [F] frozen ") | color(Color::Yellow)
                : text(" [F] follow ") | dim
        );
        header_items.push_back(text(" [E] export ") | dim);

        auto header = hbox(std::move(header_items));

        Elements lines;
        for (const auto& entry : self->logs) {
            if (!self->matches_filter(entry)) continue;
            std::string prefix = entry.type == "state" ? "==> " : "[" + entry.type + "] ";
            lines.push_back(
                hbox({
                    text(prefix) | bold | color(self->log_color(entry.type)),
                    text(entry.payload),
                })
            );
        }

        if (lines.empty()) {
            lines.push_back(text("  (press c to check for updates)") | dim);
        }

        auto log_view = vbox(std::move(lines));
        if (!self->frozen) {
            log_view = log_view | focusPositionRelative(0, 1); // auto-scroll to bottom
        }

        return vbox({
            header,
            separator(),
            log_view | vscroll_indicator | frame | flex,
        }) | border;
    }) | CatchEvent([self](Event event) -> bool {
        if (event.is_character()) {
            const auto ch = event.character();
            if (ch == "1" || ch == "2" || ch == "3" || ch == "4") {
                std::lock_guard<std::mutex> lock(self->log_mutex);
                self->filter_level = ch[0] - '1';
                return true;
            }

            if (ch == "f" || ch == "F") {
                std::lock_guard<std::mutex> lock(self->log_mutex);
                self->frozen = !self->frozen;
                return true;
            }

            if (ch == "e" || ch == "E") {
                std::string path = self->default_export_name();
                bool ok = self->export_logs(path);
                std::lock_guard<std::mutex> lock(self->log_mutex);
                self->last_export = ok ? "saved " + path : "export failed";
                return true;
            }
        }

        return false;
    });
}
