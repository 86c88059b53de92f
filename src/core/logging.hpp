#pragma once

#include <string>

struct AppConfig;

class Logging {
public:
    /// Install the default spdlog logger: colour console sink plus a
    /// rotating file sink when logging.file is set. Safe to call again.
    static void init(const AppConfig& config, bool console = true);

    /// Drop the console sink (the TUI owns the terminal)
    static void set_console_enabled(bool enabled);

    /// "trace".."off"; unknown names fall back to info
    static void set_level(const std::string& level);
};
