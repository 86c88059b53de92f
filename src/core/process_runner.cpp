#include "core/process_runner.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

extern char** environ;

// ════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════

namespace {

// Everything the child needs is prepared before fork(): only
// async-signal-safe calls happen between fork and exec.
struct ExecImage {
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;

    ExecImage(const std::vector<std::string>& args, const EnvOverrides& overrides) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            std::string key = entry.substr(0, entry.find('='));
            bool overridden = false;
            for (const auto& kv : overrides) {
                if (kv.first == key) { overridden = true; break; }
            }
            if (!overridden) env_storage.push_back(std::move(entry));
        }
        for (const auto& kv : overrides) {
            env_storage.push_back(kv.first + "=" + kv.second);
        }

        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        for (auto& e : env_storage) envp.push_back(const_cast<char*>(e.c_str()));
        envp.push_back(nullptr);
    }
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

constexpr std::chrono::milliseconds kDrainGrace{250};

void append_capped(std::string& out, const char* buf, size_t n) {
    out.append(buf, n);
    if (out.size() > ProcessRunner::kMaxOutputBytes) {
        // keep the tail, errors are usually printed last
        out.erase(0, out.size() - ProcessRunner::kMaxOutputBytes);
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// ════════════════════════════════════════════════════════════
// ProcessRunner
// ════════════════════════════════════════════════════════════

CommandResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 const std::string& cwd,
                                 int timeout_sec,
                                 const EnvOverrides& env) {
    CommandResult result;
    if (argv.empty()) {
        result.launch_failed = true;
        result.output = "empty command";
        return result;
    }

    ExecImage image(argv, env);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.launch_failed = true;
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    // Closed by exec on success; carries errno when exec fails
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.launch_failed = true;
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    const char* dir = cwd.empty() ? nullptr : cwd.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        result.launch_failed = true;
        result.output = std::string("fork failed: ") + std::strerror(err);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        if (dir && chdir(dir) != 0) {
            int err = errno;
            ssize_t w = write(err_pipe[1], &err, sizeof(err));
            (void)w;
            _exit(127);
        }
        execvpe(image.argv[0], image.argv.data(), image.envp.data());
        int err = errno;
        ssize_t w = write(err_pipe[1], &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    // Mirror setpgid in the parent so kill(-pid) is valid immediately
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    close(err_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(out_pipe[0]);
        result.launch_failed = true;
        result.exit_code = 127;
        result.output = "failed to execute " + argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    int fd = out_pipe[0];
    char buf[4096];
    int status = 0;
    bool reaped = false;

    while (!reaped) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            result.exit_code = -1;
            close_fd(fd);
            return result;
        }

        auto now = std::chrono::steady_clock::now();
        if (timeout_sec > 0 && now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = fd >= 0 ? 200 : 20;
        if (timeout_sec > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            if (left < wait_ms) wait_ms = static_cast<int>(left) + 1;
        }

        if (fd < 0) {
            // Output closed; the child may still be finishing
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
            continue;
        }

        struct pollfd pfd{fd, POLLIN, 0};
        int pr = poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno != EINTR) close_fd(fd);
            continue;
        }
        if (pr == 0) continue;

        ssize_t got = read(fd, buf, sizeof(buf));
        if (got > 0) {
            append_capped(result.output, buf, static_cast<size_t>(got));
        } else if (got == 0) {
            close_fd(fd);
        } else if (errno != EINTR && errno != EAGAIN) {
            close_fd(fd);
        }
    }

    if (result.timed_out) {
        close_fd(fd);
        kill(-pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exit_code = decode_status(status);
        return result;
    }

    // The child is gone. Whatever it left in the pipe is collected, but a
    // background process that inherited the pipe (an ssh control master,
    // say) must not hold the result hostage.
    auto drain_until = std::chrono::steady_clock::now() + kDrainGrace;
    while (fd >= 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            drain_until - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        struct pollfd pfd{fd, POLLIN, 0};
        int pr = poll(&pfd, 1, static_cast<int>(left));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) break;
        ssize_t got = read(fd, buf, sizeof(buf));
        if (got > 0) {
            append_capped(result.output, buf, static_cast<size_t>(got));
        } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
            break;
        }
    }
    close_fd(fd);

    result.exit_code = decode_status(status);
    return result;
}

pid_t ProcessRunner::spawn_detached(const std::vector<std::string>& argv,
                                    const std::string& cwd,
                                    const std::string& log_path,
                                    const EnvOverrides& env) {
    if (argv.empty()) return -1;

    ExecImage image(argv, env);
    const char* dir = cwd.empty() ? nullptr : cwd.c_str();
    const char* log = log_path.empty() ? "/dev/null" : log_path.c_str();

    int pid_pipe[2];
    if (pipe2(pid_pipe, O_CLOEXEC) != 0) return -1;

    pid_t first = fork();
    if (first < 0) {
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        return -1;
    }

    if (first == 0) {
        setsid();
        pid_t second = fork();
        if (second < 0) _exit(1);
        if (second > 0) {
            ssize_t w = write(pid_pipe[1], &second, sizeof(second));
            (void)w;
            _exit(0);
        }

        int in = open("/dev/null", O_RDONLY);
        if (in >= 0) dup2(in, STDIN_FILENO);
        int out = open(log, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out >= 0) {
            dup2(out, STDOUT_FILENO);
            dup2(out, STDERR_FILENO);
        }
        if (dir && chdir(dir) != 0) _exit(127);
        execvpe(image.argv[0], image.argv.data(), image.envp.data());
        _exit(127);
    }

    close(pid_pipe[1]);
    int status = 0;
    waitpid(first, &status, 0);

    pid_t detached = -1;
    ssize_t n = read(pid_pipe[0], &detached, sizeof(detached));
    close(pid_pipe[0]);
    if (n != static_cast<ssize_t>(sizeof(detached))) return -1;
    return detached;
}

bool ProcessRunner::is_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) != 0 && errno != EPERM) return false;

    // A zombie still answers kill(0); check its state
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return true;
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren != std::string::npos && close_paren + 2 < line.size()) {
        return line[close_paren + 2] != 'Z';
    }
    return true;
}

bool ProcessRunner::wait_for_exit(pid_t pid, int timeout_sec) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

std::string ProcessRunner::self_path() {
    std::error_code ec;
    auto p = fs::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return p.string();
}

std::string ProcessRunner::describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        if (a.find(' ') != std::string::npos) {
            out += "'" + a + "'";
        } else {
            out += a;
        }
    }
    return out;
}
