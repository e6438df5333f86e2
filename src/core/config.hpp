#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from an explicit YAML file
    static Result<Config> load(const fs::path& path);

    // Load ~/.sshkit/config.yaml
    static Result<Config> load_global();

    // Accessors
    const SessionTarget& session() const { return session_; }
    const std::optional<std::string>& log_path() const { return log_path_; }

public:
    Config() = default;

private:
    SessionTarget session_;
    std::optional<std::string> log_path_;
};

bool global_config_exists();

fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~/" to the home directory.
std::string expand_home(const std::string& path);
