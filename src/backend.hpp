#pragma once
#include "config.hpp"
#include "team_registry.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace teamfs {

struct SpawnRequest {
    std::string agent_id;
    std::string name;
    std::string team_name;
    std::string prompt;
    std::string model;
    std::string agent_type;
    std::string color;
    std::string cwd;
    std::string lead_session_id;
    bool plan_mode_required = false;
};

struct SpawnResult {
    std::string process_handle;
    std::string backend_type;
};

struct HealthStatus {
    bool alive = false;
    std::string detail;
};

// ── Backend ─────────────────────────────────────────────────────────
//
// Lifecycle of one kind of agent process. Handles are opaque strings owned
// by the backend that issued them.
class Backend {
public:
    virtual ~Backend() = default;

    virtual std::string name() const = 0;
    virtual std::string binary_name() const = 0;
    virtual bool is_available() const = 0;
    virtual std::vector<std::string> supported_models() const = 0;
    virtual std::string default_model() const = 0;

    // "fast" / "balanced" / "powerful" map through the backend's table;
    // anything else passes through, empty gives the default model.
    virtual std::string resolve_model(const std::string& generic) const = 0;

    virtual SpawnResult spawn(const SpawnRequest& req) = 0;
    virtual HealthStatus health_check(const std::string& handle) = 0;
    virtual void kill(const std::string& handle) = 0;
    // True if the process exited within `timeout`.
    virtual bool graceful_shutdown(const std::string& handle, std::chrono::milliseconds timeout) = 0;
};

// Runs a configured argv template as a child process. The handle is the pid.
class ProcessBackend : public Backend {
public:
    ProcessBackend(std::string name, BackendConfig cfg)
        : name_(std::move(name)), cfg_(std::move(cfg)) {}

    std::string name() const override { return name_; }
    std::string binary_name() const override;
    bool is_available() const override;
    std::vector<std::string> supported_models() const override;
    std::string default_model() const override { return cfg_.default_model; }
    std::string resolve_model(const std::string& generic) const override;

    SpawnResult spawn(const SpawnRequest& req) override;
    HealthStatus health_check(const std::string& handle) override;
    void kill(const std::string& handle) override;
    bool graceful_shutdown(const std::string& handle, std::chrono::milliseconds timeout) override;

    // Substitutes {name} {team} {model} {prompt} {agent_id} {cwd} {color}.
    static std::vector<std::string> expand_command(const std::vector<std::string>& tmpl,
                                                   const SpawnRequest& req);

private:
    std::string name_;
    BackendConfig cfg_;
};

// ── BackendRegistry ─────────────────────────────────────────────────

class BackendRegistry {
public:
    void register_backend(const std::string& name, std::unique_ptr<Backend> backend);

    // Throws StoreError(NotFound) naming the registered backends.
    Backend& get(const std::string& name) const;
    bool has(const std::string& name) const { return backends_.count(name) > 0; }

    std::vector<std::string> names() const;
    std::vector<std::string> list_available() const;
    std::string default_backend() const;

    // alive / dead from the member's backend; the member's recorded status
    // when it has no handle or its backend is not registered here.
    MemberStatus health_of(const TeamMember& member) const;
    HealthCheck health_check() const;

    static BackendRegistry from_config(const Config& cfg);

private:
    std::map<std::string, std::unique_ptr<Backend>> backends_;
    std::string default_;
};

} // namespace teamfs
