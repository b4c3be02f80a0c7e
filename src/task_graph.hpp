#pragma once
#include "context.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace teamfs {

enum class TaskStatus { pending, in_progress, completed, deleted };

const char* task_status_name(TaskStatus s);
// Throws StoreError(InvalidArgument) for anything else.
TaskStatus parse_task_status(const std::string& s);

// ── Data structures ─────────────────────────────────────────────────

struct Task {
    int64_t id = 0;
    std::string subject;
    std::string description;
    std::string active_form;
    TaskStatus status = TaskStatus::pending;
    std::optional<std::string> owner;
    std::set<int64_t> blocks;       // tasks waiting on this one
    std::set<int64_t> blocked_by;   // tasks this one waits on
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
    static Task from_json(const nlohmann::json& j);
};

struct TaskSpec {
    std::string subject;
    std::string description;
    std::string active_form;
    std::optional<std::string> owner;
    std::vector<int64_t> blocked_by;
    std::vector<int64_t> blocks;
    nlohmann::json metadata = nlohmann::json::object();
};

// Every field is optional; absent fields are left alone.
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<std::string> owner;   // "" clears the owner
    std::optional<std::string> subject;
    std::optional<std::string> description;
    std::optional<std::string> active_form;
    std::vector<int64_t> add_blocks;
    std::vector<int64_t> add_blocked_by;
    std::vector<int64_t> remove_blocks;
    std::vector<int64_t> remove_blocked_by;
    nlohmann::json metadata;            // null: unchanged; keys set to null are deleted
};

using TaskMap = std::map<int64_t, Task>;

// Documents touched by one mutation: tasks to write and ids to remove.
struct GraphChange {
    TaskMap writes;
    std::vector<int64_t> removals;
    Task result;
};

// ── Pure graph logic ────────────────────────────────────────────────
//
// No I/O. Each validates against the loaded graph and either throws
// StoreError or returns the full set of document changes.

// pending->in_progress, in_progress->completed, any->deleted, or no change.
void check_transition(TaskStatus from, TaskStatus to);

// True if adding the edge `blocker` -> `blocked` (blocker.blocks gains
// blocked) would close a cycle, self-edges included.
bool would_create_cycle(const TaskMap& graph, int64_t blocker, int64_t blocked);

// `task.id` must not be in `graph`; it may be 0 to validate before an id exists.
GraphChange plan_create(const TaskMap& graph, Task task);
GraphChange plan_update(const TaskMap& graph, int64_t id, const TaskUpdate& update);

// ── TaskGraph ───────────────────────────────────────────────────────
//
// Mutations hold the team's task-graph lock for their whole duration, so
// the edge set seen during validation is the one that gets committed.
// Reads are lock-free and see whole documents with no cross-file snapshot.
class TaskGraph {
public:
    explicit TaskGraph(Context ctx) : ctx_(std::move(ctx)) {}

    int64_t allocate_id(const std::string& team);

    Task create(const std::string& team, const TaskSpec& spec);
    Task update(const std::string& team, int64_t id, const TaskUpdate& update);
    Task get(const std::string& team, int64_t id) const;
    std::vector<Task> list(const std::string& team) const;

    // Clears `agent` as owner; its in_progress tasks go back to pending.
    // Returns the ids that changed.
    std::vector<int64_t> reset_owner_tasks(const std::string& team, const std::string& agent);

private:
    Context ctx_;

    void require_team(const std::string& team) const;
    // NotFound unless `owner` is a member of the team.
    void require_owner(const std::string& team, const std::string& owner) const;
    TaskMap load_graph(const std::string& team) const;
    void commit(const std::string& team, const GraphChange& change);
};

} // namespace teamfs
