#pragma once

#include "core/config.hpp"

#include <string>
#include <sys/types.h>

/// Second half of a relauncher restart: waits for the updater that spawned
/// it to exit, stops the application recorded in application.pid_file,
/// repairs the environment and starts the updated application.
class Relauncher {
public:
    enum ExitCode {
        Ok = 0,
        Usage = 1,
        NoCommand = 2,
        StartFailed = 3,
    };

    Relauncher(AppConfig config, std::string target_version, std::string tree_path, pid_t parent_pid = -1);

    int run();

    /// Entry point shared by the executable and the tests
    static int main(int argc, char* argv[]);

    /// How long a freshly started application must survive to count as started
    void set_startup_grace_ms(int ms) { startup_grace_ms_ = ms; }

    pid_t started_pid() const { return started_pid_; }

private:
    AppConfig config_;
    std::string target_version_;
    std::string tree_path_;
    pid_t parent_pid_;
    int startup_grace_ms_ = 1000;
    pid_t started_pid_ = -1;

    void wait_for_parent();
    bool stop_previous_instance();
    void verify_version();
    void repair_dependencies();
    int start_application();
};
