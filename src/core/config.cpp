#include "config.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshkit";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

std::string expand_home(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

static std::optional<std::string> optional_path(const YAML::Node& node) {
    auto value = optional_string(node);
    if (value) value = expand_home(*value);
    return value;
}

static SessionTarget parse_session_config(const YAML::Node& node) {
    SessionTarget target;
    target.host = node["host"].as<std::string>("");
    target.port = node["port"].as<int>(22);
    target.user = node["user"].as<std::string>("");
    target.password = optional_string(node["password"]);
    target.public_key_path = optional_path(node["public_key"]);
    target.private_key_path = optional_path(node["private_key"]);
    target.public_key_data = optional_string(node["public_key_data"]);
    target.private_key_data = optional_string(node["private_key_data"]);
    target.passphrase = node["passphrase"].as<std::string>("");
    target.connect_timeout = node["connect_timeout"].as<int>(30);
    target.wait_timeout_ms = node["wait_timeout_ms"].as<int>(10000);
    return target;
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (!root["session"] || !root["session"].IsMap()) {
            return Result<Config>::Err("Config " + path.string() + " has no session block");
        }

        Config config;
        config.session_ = parse_session_config(root["session"]);

        if (config.session_.host.empty()) {
            return Result<Config>::Err("session.host is required");
        }
        if (config.session_.user.empty()) {
            return Result<Config>::Err("session.user is required");
        }
        if (config.session_.port < 1 || config.session_.port > 65535) {
            return Result<Config>::Err("session.port must be between 1 and 65535");
        }
        if (config.session_.connect_timeout <= 0) {
            return Result<Config>::Err("session.connect_timeout must be positive");
        }
        if (config.session_.wait_timeout_ms <= 0) {
            return Result<Config>::Err("session.wait_timeout_ms must be positive");
        }

        config.log_path_ = optional_path(root["log_path"]);
        if (config.log_path_) set_log_path(*config.log_path_);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load(get_global_config_path());
}
