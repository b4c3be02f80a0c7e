#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace teamfs {

std::string Config::root_path() const {
    const char* env = std::getenv("TEAMFS_HOME");
    if (env && *env) return env;
    return expand_path(root);
}

Config Config::make_default() {
    Config c;
    c.root = default_root_path();

    // A plain `sh -c` agent: handy for local experiments and for tests.
    BackendConfig shell;
    shell.command = {"/bin/sh", "-c", "{prompt}"};
    shell.default_model = "default";
    c.backends["shell"] = shell;
    c.default_backend = "shell";
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["root"] = root;
    j["lock_timeout_ms"] = lock_timeout_ms;
    j["poll_lock_timeout_ms"] = poll_lock_timeout_ms;
    j["poll_interval_ms"] = poll_interval_ms;
    j["poll_max_wait_ms"] = poll_max_wait_ms;

    j["http"] = {{"host", http.host}, {"port", http.port}};
    if (!http.api_key.empty()) j["http"]["api_key"] = http.api_key;

    for (auto& [name, b] : backends) {
        nlohmann::json bj;
        bj["command"] = b.command;
        if (!b.default_model.empty()) bj["default_model"] = b.default_model;
        if (!b.models.empty()) bj["models"] = b.models;
        if (!b.env.empty()) bj["env"] = b.env;
        j["backends"][name] = bj;
    }
    if (!default_backend.empty()) j["default_backend"] = default_backend;
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

static std::map<std::string, std::string> parse_string_map(const nlohmann::json& obj) {
    std::map<std::string, std::string> result;
    if (obj.is_object()) {
        for (auto& [k, v] : obj.items()) {
            if (v.is_string()) result[k] = v.get<std::string>();
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.root = j.value("root", default_root_path());
    c.lock_timeout_ms = j.value("lock_timeout_ms", c.lock_timeout_ms);
    c.poll_lock_timeout_ms = j.value("poll_lock_timeout_ms", c.poll_lock_timeout_ms);
    c.poll_interval_ms = j.value("poll_interval_ms", c.poll_interval_ms);
    c.poll_max_wait_ms = j.value("poll_max_wait_ms", c.poll_max_wait_ms);

    if (j.contains("http") && j["http"].is_object()) {
        auto& hc = j["http"];
        c.http.host = hc.value("host", c.http.host);
        c.http.port = hc.value("port", c.http.port);
        c.http.api_key = hc.value("api_key", "");
    }

    if (j.contains("backends") && j["backends"].is_object()) {
        for (auto& [name, bj] : j["backends"].items()) {
            BackendConfig b;
            if (bj.contains("command")) b.command = parse_string_array(bj["command"]);
            b.default_model = bj.value("default_model", "");
            if (bj.contains("models")) b.models = parse_string_map(bj["models"]);
            if (bj.contains("env")) b.env = parse_string_map(bj["env"]);
            if (b.command.empty()) {
                std::cerr << "[config] Warning: backend '" << name << "' has no command, skipped\n";
                continue;
            }
            c.backends[name] = std::move(b);
        }
    }
    c.default_backend = j.value("default_backend", "");

    if (c.poll_interval_ms <= 0) c.poll_interval_ms = 50;
    if (c.poll_max_wait_ms < 0) c.poll_max_wait_ms = 0;
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) throw io_error("create " + fs::path(path).parent_path().string(), ec);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
    if (!f) throw StoreError(ErrorCode::IOError, "write " + path);
}

} // namespace teamfs
