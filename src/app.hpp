#pragma once

#include <memory>
#include <string>
#include <vector>

class App {
public:
    /// args are kept for an in-place restart
    explicit App(std::vector<std::string> args);
    ~App();

    /// Runs the TUI; returns the process exit code
    int run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
