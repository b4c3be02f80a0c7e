#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace teamfs {

struct HTTPConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
    std::string api_key;       // Optional Bearer token auth
};

// A process backend: argv template plus model tiers.
// Placeholders: {name} {team} {model} {prompt} {agent_id} {cwd} {color}
struct BackendConfig {
    std::vector<std::string> command;
    std::string default_model;
    std::map<std::string, std::string> models;   // "fast"/"balanced"/"powerful" -> model id
    std::map<std::string, std::string> env;
};

struct Config {
    std::string root = "~/.teamfs";

    // Lock acquisition bounds: short operations vs. the long-poll path
    int lock_timeout_ms = 5000;
    int poll_lock_timeout_ms = 30000;

    // Long-poll loop
    int poll_interval_ms = 50;
    int poll_max_wait_ms = 30000;

    HTTPConfig http;

    std::map<std::string, BackendConfig> backends;
    std::string default_backend;  // empty = first registered

    // TEAMFS_HOME overrides `root`
    std::string root_path() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace teamfs
