#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    config.load();
    Logging::init(config.data());
    if (!config.last_error().empty()) {
        spdlog::error("[Daemon] Config: {} (using defaults)", config.last_error());
    }

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int ret = daemon.run();
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // serve subcommand
        return run_daemon();
    }
    if (cli_result != -1) {
        // handled by CLI (help, version, status, check, update, or error)
        return cli_result;
    }

    // No subcommand → launch TUI
    App app(std::vector<std::string>(argv, argv + argc));
    return app.run();
}
