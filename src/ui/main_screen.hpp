#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <functional>
#include <memory>

class MainScreen {
public:
    struct Callbacks {
        std::function<void()> on_check;
        std::function<void()> on_update;            // asks for confirmation
        std::function<void(bool)> on_confirm;       // y / n while a prompt is shown
        std::function<void()> on_cancel;
        std::function<void()> on_restart;
        std::function<void()> on_quit;
    };

    MainScreen();
    ~MainScreen();

    void set_callbacks(Callbacks cb);
    void set_versions(const std::string& current, const std::string& latest);
    void set_tree(const std::string& path);

    /// Non-empty prompt puts the screen in y/n mode
    void set_prompt(const std::string& prompt);
    void set_restart_available(bool available);

    // Set the main content component (the progress log)
    void set_content(ftxui::Component content);

    // Set the status bar component
    void set_status_bar(ftxui::Component status_bar);

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
