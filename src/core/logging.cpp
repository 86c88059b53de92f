#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <mutex>
#include <vector>

static constexpr size_t kLogFileSize = 5 * 1024 * 1024;
static constexpr size_t kLogFileCount = 3;

static std::mutex g_mutex;
static std::shared_ptr<spdlog::sinks::sink> g_console_sink;
static std::shared_ptr<spdlog::sinks::sink> g_file_sink;

static void rebuild_logger(bool console) {
    std::vector<spdlog::sink_ptr> sinks;
    if (console && g_console_sink) sinks.push_back(g_console_sink);
    if (g_file_sink) sinks.push_back(g_file_sink);

    auto previous = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>("pubsub-updater", sinks.begin(), sinks.end());
    if (previous) logger->set_level(previous->level());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void Logging::init(const AppConfig& config, bool console) {
    std::lock_guard<std::mutex> lock(g_mutex);

    if (!g_console_sink) {
        g_console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }

    g_file_sink.reset();
    if (!config.log_file.empty()) {
        try {
            g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                Config::expand_home(config.log_file), kLogFileSize, kLogFileCount);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("[Logging] Cannot open log file {}: {}", config.log_file, e.what());
        }
    }

    rebuild_logger(console);
    set_level(config.log_level);
}

void Logging::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_console_sink) {
        g_console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    rebuild_logger(enabled);
}

void Logging::set_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    spdlog::set_level(lvl);
}
