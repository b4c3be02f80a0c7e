#pragma once
#include "config.hpp"
#include "document_store.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace teamfs {

// The coordination root: where the shared tree lives, which store reaches it
// and how long operations may wait. Passed to every component call.
struct Context {
    std::string root;
    std::shared_ptr<DocumentStore> store;

    std::chrono::milliseconds lock_timeout{5000};
    std::chrono::milliseconds poll_lock_timeout{30000};
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds poll_max_wait{30000};

    static Context from_config(const Config& cfg) {
        Context ctx;
        ctx.root = cfg.root_path();
        ctx.store = std::make_shared<FileDocumentStore>();
        ctx.lock_timeout = std::chrono::milliseconds(cfg.lock_timeout_ms);
        ctx.poll_lock_timeout = std::chrono::milliseconds(cfg.poll_lock_timeout_ms);
        ctx.poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms);
        ctx.poll_max_wait = std::chrono::milliseconds(cfg.poll_max_wait_ms);
        return ctx;
    }

    // ── Layout ──────────────────────────────────────────────────────

    std::string teams_dir() const { return root + "/teams"; }
    std::string team_dir(const std::string& team) const { return teams_dir() + "/" + team; }
    std::string team_config_path(const std::string& team) const { return team_dir(team) + "/config.json"; }
    std::string team_lock_path(const std::string& team) const { return team_dir(team) + "/.lock"; }

    std::string inboxes_dir(const std::string& team) const { return team_dir(team) + "/inboxes"; }
    std::string inbox_path(const std::string& team, const std::string& agent) const {
        return inboxes_dir(team) + "/" + agent + ".json";
    }
    std::string inbox_lock_path(const std::string& team) const { return inboxes_dir(team) + "/.lock"; }

    std::string tasks_dir(const std::string& team) const { return root + "/tasks/" + team; }
    std::string task_path(const std::string& team, int64_t id) const {
        return tasks_dir(team) + "/" + std::to_string(id) + ".json";
    }
    std::string task_lock_path(const std::string& team) const { return tasks_dir(team) + "/.lock"; }
    std::string counter_path(const std::string& team) const { return tasks_dir(team) + "/.counter.json"; }
    std::string counter_lock_path(const std::string& team) const { return tasks_dir(team) + "/.counter.lock"; }
};

} // namespace teamfs
