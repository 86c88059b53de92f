#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/pubsub-updater";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/pubsub-updater";
}

std::string Config::config_path() {
    const char* env = std::getenv("PUBSUB_UPDATER_CONFIG");
    if (env && *env) return expand_home(env);

    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::repo_path() const {
    return resolve_repo_path(config_.repo_path);
}

std::string Config::resolve_repo_path(const std::string& configured) {
    std::string p = expand_home(configured);
    if (p.empty()) p = ".";
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return p;
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool Config::load(const std::string& explicit_path) {
    last_error_.clear();
    std::string path = explicit_path.empty() ? config_path() : explicit_path;
    bool loaded = false;

    if (!path.empty() && fs::exists(path)) {
        try {
            YAML::Node root = YAML::LoadFile(path);

            if (auto repo = root["repository"]) {
                config_.repo_path = repo["path"].as<std::string>(config_.repo_path);
                config_.remote = repo["remote"].as<std::string>(config_.remote);
                if (auto prefixes = repo["release_prefixes"]) {
                    if (prefixes.IsSequence() && prefixes.size() > 0) {
                        config_.release_prefixes.clear();
                        for (const auto& p : prefixes) {
                            config_.release_prefixes.push_back(p.as<std::string>());
                        }
                    }
                }
            }

            if (auto up = root["updater"]) {
                config_.backup = up["backup"].as<bool>(config_.backup);
                config_.restart_mode = up["restart_mode"].as<std::string>(config_.restart_mode);
                config_.relauncher_path = up["relauncher_path"].as<std::string>(config_.relauncher_path);
                config_.probe_timeout_sec = up["probe_timeout_sec"].as<int>(config_.probe_timeout_sec);
                config_.status_timeout_sec = up["status_timeout_sec"].as<int>(config_.status_timeout_sec);
                config_.catalog_fetch_timeout_sec = up["catalog_fetch_timeout_sec"].as<int>(config_.catalog_fetch_timeout_sec);
                config_.fetch_timeout_sec = up["fetch_timeout_sec"].as<int>(config_.fetch_timeout_sec);
                config_.checkout_timeout_sec = up["checkout_timeout_sec"].as<int>(config_.checkout_timeout_sec);
                config_.fetch_depth = up["fetch_depth"].as<int>(config_.fetch_depth);
                config_.check_interval_min = up["check_interval_min"].as<int>(config_.check_interval_min);
                config_.progress_log = up["progress_log"].as<std::string>(config_.progress_log);
            }

            if (auto deps = root["dependencies"]) {
                config_.deps_enabled = deps["enabled"].as<bool>(config_.deps_enabled);
                config_.deps_manifest = deps["manifest"].as<std::string>(config_.deps_manifest);
                config_.deps_venv_dir = deps["venv_dir"].as<std::string>(config_.deps_venv_dir);
                config_.deps_python = deps["python"].as<std::string>(config_.deps_python);
                config_.deps_timeout_sec = deps["timeout_sec"].as<int>(config_.deps_timeout_sec);
            }

            if (auto app = root["application"]) {
                if (auto cmd = app["command"]) {
                    config_.app_command.clear();
                    if (cmd.IsSequence()) {
                        for (const auto& part : cmd) {
                            config_.app_command.push_back(part.as<std::string>());
                        }
                    } else if (cmd.IsScalar()) {
                        config_.app_command.push_back(cmd.as<std::string>());
                    }
                }
                config_.app_pid_file = app["pid_file"].as<std::string>(config_.app_pid_file);
                config_.app_stop_timeout_sec = app["stop_timeout_sec"].as<int>(config_.app_stop_timeout_sec);
            }

            if (auto daemon = root["daemon"]) {
                config_.supervise_application = daemon["supervise_application"].as<bool>(config_.supervise_application);
            }

            if (auto rl = root["relauncher"]) {
                config_.relauncher_wait_timeout_sec = rl["wait_timeout_sec"].as<int>(config_.relauncher_wait_timeout_sec);
            }

            if (auto wh = root["webhook"]) {
                config_.webhook_host = wh["host"].as<std::string>(config_.webhook_host);
                config_.webhook_port = wh["port"].as<int>(config_.webhook_port);
                config_.webhook_path = wh["path"].as<std::string>(config_.webhook_path);
                config_.webhook_secret = wh["secret"].as<std::string>(config_.webhook_secret);
                config_.webhook_require_signature = wh["require_signature"].as<bool>(config_.webhook_require_signature);
                config_.webhook_target_branch = wh["target_branch"].as<std::string>(config_.webhook_target_branch);
                config_.webhook_log_capacity = wh["log_capacity"].as<int>(config_.webhook_log_capacity);
            }

            if (auto log = root["logging"]) {
                config_.log_level = log["level"].as<std::string>(config_.log_level);
                config_.log_file = log["file"].as<std::string>(config_.log_file);
            }

            loaded = true;
        } catch (const YAML::Exception& e) {
            // Parse failed, defaults stay
            last_error_ = path + ": " + e.what();
        }
    }

    apply_env();
    return loaded;
}

void Config::apply_env() {
    auto env = [](const char* name) -> const char* {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    };

    if (const char* v = env("WEBHOOK_SECRET")) config_.webhook_secret = v;
    if (const char* v = env("WEBHOOK_HOST")) config_.webhook_host = v;
    if (const char* v = env("WEBHOOK_PORT")) {
        try {
            config_.webhook_port = std::stoi(v);
        } catch (const std::exception&) {
            last_error_ = std::string("WEBHOOK_PORT is not a number: ") + v;
        }
    }
    if (const char* v = env("GIT_BRANCH")) config_.webhook_target_branch = v;
    if (const char* v = env("PUBSUB_UPDATER_REPO")) config_.repo_path = v;
    if (const char* v = env("PUBSUB_UPDATER_LOG_LEVEL")) config_.log_level = v;
}

bool Config::save(const std::string& explicit_path) {
    std::string path = explicit_path.empty() ? config_path() : explicit_path;
    if (path.empty()) return false;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "repository" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config_.repo_path;
        out << YAML::Key << "remote" << YAML::Value << config_.remote;
        out << YAML::Key << "release_prefixes" << YAML::Value << YAML::BeginSeq;
        for (const auto& p : config_.release_prefixes) out << p;
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::Key << "updater" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "backup" << YAML::Value << config_.backup;
        out << YAML::Key << "restart_mode" << YAML::Value << config_.restart_mode;
        out << YAML::Key << "relauncher_path" << YAML::Value << config_.relauncher_path;
        out << YAML::Key << "probe_timeout_sec" << YAML::Value << config_.probe_timeout_sec;
        out << YAML::Key << "status_timeout_sec" << YAML::Value << config_.status_timeout_sec;
        out << YAML::Key << "catalog_fetch_timeout_sec" << YAML::Value << config_.catalog_fetch_timeout_sec;
        out << YAML::Key << "fetch_timeout_sec" << YAML::Value << config_.fetch_timeout_sec;
        out << YAML::Key << "checkout_timeout_sec" << YAML::Value << config_.checkout_timeout_sec;
        out << YAML::Key << "fetch_depth" << YAML::Value << config_.fetch_depth;
        out << YAML::Key << "check_interval_min" << YAML::Value << config_.check_interval_min;
        out << YAML::Key << "progress_log" << YAML::Value << config_.progress_log;
        out << YAML::EndMap;

        out << YAML::Key << "dependencies" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.deps_enabled;
        out << YAML::Key << "manifest" << YAML::Value << config_.deps_manifest;
        out << YAML::Key << "venv_dir" << YAML::Value << config_.deps_venv_dir;
        out << YAML::Key << "python" << YAML::Value << config_.deps_python;
        out << YAML::Key << "timeout_sec" << YAML::Value << config_.deps_timeout_sec;
        out << YAML::EndMap;

        out << YAML::Key << "application" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "command" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& part : config_.app_command) out << part;
        out << YAML::EndSeq;
        out << YAML::Key << "pid_file" << YAML::Value << config_.app_pid_file;
        out << YAML::Key << "stop_timeout_sec" << YAML::Value << config_.app_stop_timeout_sec;
        out << YAML::EndMap;

        out << YAML::Key << "daemon" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "supervise_application" << YAML::Value << config_.supervise_application;
        out << YAML::EndMap;

        out << YAML::Key << "relauncher" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "wait_timeout_sec" << YAML::Value << config_.relauncher_wait_timeout_sec;
        out << YAML::EndMap;

        out << YAML::Key << "webhook" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << config_.webhook_host;
        out << YAML::Key << "port" << YAML::Value << config_.webhook_port;
        out << YAML::Key << "path" << YAML::Value << config_.webhook_path;
        out << YAML::Key << "secret" << YAML::Value << config_.webhook_secret;
        out << YAML::Key << "require_signature" << YAML::Value << config_.webhook_require_signature;
        out << YAML::Key << "target_branch" << YAML::Value << config_.webhook_target_branch;
        out << YAML::Key << "log_capacity" << YAML::Value << config_.webhook_log_capacity;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str() << "\n";
        return fout.good();
    } catch (const std::exception& e) {
        last_error_ = path + ": " + e.what();
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
