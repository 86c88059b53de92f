#include "app.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/update_coordinator.hpp"
#include "ui/main_screen.hpp"
#include "ui/log_panel.hpp"
#include "ui/status_bar.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>

#include <thread>
#include <atomic>
#include <mutex>
#include <optional>

using namespace ftxui;

struct App::Impl {
    std::vector<std::string> args;
    Config config;
    std::unique_ptr<UpdateCoordinator> coordinator;

    MainScreen main_screen;
    StatusBar status_bar;
    LogPanel log_panel;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    std::mutex mutex;
    std::optional<ReleaseRef> available;     // latest release newer than installed
    std::optional<ReleaseRef> completed;     // set once a session completed
    std::string current_version;

    std::atomic<bool> checking{false};
    std::thread check_thread;
    bool restart_requested = false;

    void refresh() { screen.Post(Event::Custom); }

    void log(const std::string& type, const std::string& line) {
        log_panel.push_log({type, line});
        refresh();
    }

    void start_check() {
        if (coordinator->is_running()) {
            log("warning", "An update is running, check again when it finishes");
            return;
        }
        bool expected = false;
        if (!checking.compare_exchange_strong(expected, true)) return;

        if (check_thread.joinable()) check_thread.join();
        status_bar.set_state("Checking");
        status_bar.set_busy(true);
        log("info", "Checking " + coordinator->repo_path() + " against " + config.data().remote);

        check_thread = std::thread([this] {
            auto result = coordinator->check();
            std::string current = result.current ? result.current->literal() : "";
            std::string latest = result.latest ? result.latest->version.literal() : "";
            {
                std::lock_guard<std::mutex> lock(mutex);
                current_version = current;
                available.reset();
                if (result.update_available()) available = result.latest;
            }
            main_screen.set_versions(current, latest);
            status_bar.set_versions(current, latest);
            status_bar.set_state(to_string(result.status));
            status_bar.set_busy(false);
            status_bar.set_message(result.update_available() ? "press u to update" : "");

            bool problem = result.status == CheckStatus::NetworkFailure ||
                           result.status == CheckStatus::VersionUndetectable;
            log(problem ? "error" : "info", result.message);
            checking.store(false);
        });
    }

    void request_update() {
        if (coordinator->is_running() || checking.load()) {
            log("warning", "Busy, try again in a moment");
            return;
        }
        std::optional<ReleaseRef> target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            target = available;
        }
        if (!target) {
            log("info", "No update pending, press c to check first");
            return;
        }
        main_screen.set_prompt("Update to " + target->version.literal() +
                               "? The application must be restarted afterwards.");
        refresh();
    }

    void confirm(bool yes) {
        main_screen.set_prompt("");
        if (!yes) {
            log("info", "Update declined");
            return;
        }

        std::optional<ReleaseRef> target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            target = available;
        }
        if (!target) return;

        ProgressCallbacks cb;
        cb.on_state = [this](UpdateState state) {
            status_bar.set_state(to_string(state));
            log("state", to_string(state));
        };
        cb.on_log = [this](const std::string& line) {
            bool warning = line.rfind("Warning", 0) == 0;
            bool error = line.rfind("Failed", 0) == 0;
            log(error ? "error" : warning ? "warning" : "info", line);
        };
        cb.on_finished = [this](const SessionOutcome& outcome) {
            status_bar.set_busy(false);
            if (outcome.succeeded()) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    completed = outcome.target;
                    available.reset();
                }
                main_screen.set_restart_available(true);
                status_bar.set_message("press r to restart");
            } else {
                status_bar.set_message(to_string(outcome.error));
            }
            refresh();
        };

        auto started = coordinator->run_async(*target, SessionMode::Safe, std::move(cb));
        if (started != StartResult::Started) {
            log("error", std::string("Update not started: ") + to_string(started));
            return;
        }
        status_bar.set_busy(true);
        status_bar.set_message("");
    }

    void cancel() {
        if (coordinator->cancel()) {
            log("warning", "Cancel requested, waiting for the current stage to finish");
        } else {
            log("info", "Nothing to cancel");
        }
    }

    void setup_callbacks() {
        MainScreen::Callbacks cb;
        cb.on_check = [this] { start_check(); };
        cb.on_update = [this] { request_update(); };
        cb.on_confirm = [this](bool yes) { confirm(yes); };
        cb.on_cancel = [this] { cancel(); };
        cb.on_restart = [this] {
            restart_requested = true;
            screen.Exit();
        };
        cb.on_quit = [this] {
            if (coordinator->is_running()) {
                log("warning", "An update is running; press x to cancel it first");
                return;
            }
            screen.Exit();
        };
        main_screen.set_callbacks(std::move(cb));
    }

    void stop_threads() {
        if (check_thread.joinable()) {
            check_thread.join();
        }
        coordinator->wait();
    }

    int restart() {
        std::optional<ReleaseRef> target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            target = completed;
        }
        if (!target) return 0;

        if (config.data().restart_mode == "in_place") {
            UpdateCoordinator::restart_in_place(args);
            spdlog::error("[App] In-place restart failed");
            return 1;
        }
        return coordinator->hand_off_to_relauncher(target->version.literal()) ? 0 : 1;
    }
};

App::App(std::vector<std::string> args) : impl_(std::make_unique<Impl>()) {
    impl_->args = std::move(args);

    // Load config (use defaults if file doesn't exist)
    impl_->config.load();
    // The screen owns the terminal; log to file only
    Logging::init(impl_->config.data(), /*console=*/false);
    if (!impl_->config.last_error().empty()) {
        spdlog::error("[App] Config: {}", impl_->config.last_error());
    }

    impl_->coordinator = std::make_unique<UpdateCoordinator>(impl_->config.data());
    impl_->main_screen.set_tree(impl_->coordinator->repo_path());

    impl_->setup_callbacks();
    impl_->main_screen.set_content(impl_->log_panel.component());
    impl_->main_screen.set_status_bar(impl_->status_bar.component());

    if (!impl_->config.last_error().empty()) {
        impl_->log_panel.push_log({"error", "Config: " + impl_->config.last_error() + " (using defaults)"});
    }
}

App::~App() {
    impl_->stop_threads();
}

int App::run() {
    // Check for updates in background right away
    impl_->start_check();

    // Run the TUI
    impl_->screen.Loop(impl_->main_screen.component());

    // Cleanup
    impl_->coordinator->cancel();
    impl_->stop_threads();

    if (impl_->restart_requested) {
        return impl_->restart();
    }
    return 0;
}
