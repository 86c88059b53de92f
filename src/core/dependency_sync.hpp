#pragma once

#include <string>

struct DependencyOptions {
    std::string manifest = "requirements.txt";
    std::string venv_dir = "venv";
    std::string python = "python3";
    int timeout_sec = 300;
};

struct DependencyResult {
    bool ran = false;           // false when the manifest is absent
    bool ok = false;
    bool timed_out = false;
    int exit_code = 0;
    std::string installer;
    std::string output;
    std::string message;
};

class DependencySync {
public:
    DependencySync(std::string tree_path, DependencyOptions options);

    bool manifest_present() const;

    /// venv interpreter when present, configured python otherwise
    std::string select_installer() const;

    /// <python> -m pip install -r <manifest> --upgrade
    DependencyResult sync() const;

    /// <python> -m venv <venv_dir> when the venv has no interpreter yet
    bool ensure_virtualenv(std::string& error) const;

private:
    std::string tree_path_;
    DependencyOptions options_;

    std::string venv_python() const;
};
