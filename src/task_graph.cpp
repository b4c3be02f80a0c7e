#include "task_graph.hpp"
#include "errors.hpp"
#include "team_registry.hpp"
#include <algorithm>
#include <cctype>

namespace teamfs {

const char* task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::pending:     return "pending";
        case TaskStatus::in_progress: return "in_progress";
        case TaskStatus::completed:   return "completed";
        case TaskStatus::deleted:     return "deleted";
    }
    return "pending";
}

TaskStatus parse_task_status(const std::string& s) {
    if (s == "pending") return TaskStatus::pending;
    if (s == "in_progress") return TaskStatus::in_progress;
    if (s == "completed") return TaskStatus::completed;
    if (s == "deleted") return TaskStatus::deleted;
    throw StoreError(ErrorCode::InvalidArgument, "invalid task status '" + s + "'");
}

// ── Task JSON ───────────────────────────────────────────────────────

nlohmann::json Task::to_json() const {
    nlohmann::json j = {
        {"id", id}, {"subject", subject}, {"description", description},
        {"activeForm", active_form}, {"status", task_status_name(status)},
        {"blocks", blocks}, {"blockedBy", blocked_by},
    };
    if (owner) j["owner"] = *owner;
    if (!metadata.empty()) j["metadata"] = metadata;
    return j;
}

Task Task::from_json(const nlohmann::json& j) {
    Task t;
    t.id = j.value("id", int64_t{0});
    t.subject = j.value("subject", "");
    t.description = j.value("description", "");
    t.active_form = j.value("activeForm", "");
    t.status = parse_task_status(j.value("status", "pending"));
    if (j.contains("owner") && j["owner"].is_string()) t.owner = j["owner"].get<std::string>();
    if (j.contains("blocks")) t.blocks = j["blocks"].get<std::set<int64_t>>();
    if (j.contains("blockedBy")) t.blocked_by = j["blockedBy"].get<std::set<int64_t>>();
    if (j.contains("metadata") && j["metadata"].is_object()) t.metadata = j["metadata"];
    return t;
}

// ── Pure graph logic ────────────────────────────────────────────────

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

void require_subject(const std::string& subject) {
    if (is_blank(subject)) throw StoreError(ErrorCode::InvalidArgument, "task subject must not be empty");
}

void require_known(const TaskMap& graph, int64_t id) {
    if (!graph.count(id)) {
        throw StoreError(ErrorCode::UnknownTask, "referenced task " + std::to_string(id) + " does not exist");
    }
}

void add_edge(TaskMap& g, int64_t blocker, int64_t blocked, std::set<int64_t>& touched) {
    if (would_create_cycle(g, blocker, blocked)) {
        throw StoreError(ErrorCode::CycleDetected,
                         "task " + std::to_string(blocker) + " blocking task " +
                         std::to_string(blocked) + " would create a cycle");
    }
    g[blocker].blocks.insert(blocked);
    g[blocked].blocked_by.insert(blocker);
    touched.insert(blocker);
    touched.insert(blocked);
}

// Either end may be missing when a neighbour's document is already gone.
void remove_edge(TaskMap& g, int64_t blocker, int64_t blocked, std::set<int64_t>& touched) {
    auto from = g.find(blocker);
    if (from != g.end()) {
        from->second.blocks.erase(blocked);
        touched.insert(blocker);
    }
    auto to = g.find(blocked);
    if (to != g.end()) {
        to->second.blocked_by.erase(blocker);
        touched.insert(blocked);
    }
}

// Keeps only the touched tasks whose document actually differs.
GraphChange collect(const TaskMap& before, const TaskMap& after,
                    const std::set<int64_t>& touched, int64_t skip) {
    GraphChange change;
    for (int64_t id : touched) {
        if (id == skip) continue;
        auto a = after.find(id);
        if (a == after.end()) continue;
        auto b = before.find(id);
        if (b == before.end() || b->second.to_json() != a->second.to_json())
            change.writes[id] = a->second;
    }
    return change;
}

} // namespace

void check_transition(TaskStatus from, TaskStatus to) {
    if (from == to || to == TaskStatus::deleted) return;
    if (from == TaskStatus::pending && to == TaskStatus::in_progress) return;
    if (from == TaskStatus::in_progress && to == TaskStatus::completed) return;
    throw StoreError(ErrorCode::InvalidTransition,
                     std::string("cannot transition from '") + task_status_name(from) +
                     "' to '" + task_status_name(to) + "'");
}

bool would_create_cycle(const TaskMap& graph, int64_t blocker, int64_t blocked) {
    if (blocker == blocked) return true;
    // A cycle closes if `blocker` is already reachable from `blocked`.
    std::vector<int64_t> stack{blocked};
    std::set<int64_t> seen;
    while (!stack.empty()) {
        int64_t cur = stack.back();
        stack.pop_back();
        if (cur == blocker) return true;
        if (!seen.insert(cur).second) continue;
        auto it = graph.find(cur);
        if (it == graph.end()) continue;
        for (int64_t next : it->second.blocks) stack.push_back(next);
    }
    return false;
}

GraphChange plan_create(const TaskMap& graph, Task task) {
    require_subject(task.subject);
    for (int64_t id : task.blocked_by) require_known(graph, id);
    for (int64_t id : task.blocks) require_known(graph, id);

    TaskMap working = graph;
    std::set<int64_t> deps = task.blocked_by;
    std::set<int64_t> dependents = task.blocks;
    task.blocked_by.clear();
    task.blocks.clear();
    working[task.id] = task;

    std::set<int64_t> touched;
    for (int64_t d : deps) add_edge(working, d, task.id, touched);
    for (int64_t b : dependents) add_edge(working, task.id, b, touched);

    GraphChange change = collect(graph, working, touched, task.id);
    change.result = working[task.id];
    change.writes[task.id] = change.result;
    return change;
}

GraphChange plan_update(const TaskMap& graph, int64_t id, const TaskUpdate& u) {
    if (!graph.count(id)) throw StoreError(ErrorCode::NotFound, "task " + std::to_string(id) + " not found");

    TaskMap working = graph;
    std::set<int64_t> touched{id};
    Task& t = working[id];

    if (u.subject) {
        require_subject(*u.subject);
        t.subject = *u.subject;
    }
    if (u.description) t.description = *u.description;
    if (u.active_form) t.active_form = *u.active_form;
    if (u.owner) {
        if (u.owner->empty()) t.owner.reset();
        else t.owner = *u.owner;
    }

    for (auto* ids : {&u.add_blocks, &u.add_blocked_by})
        for (int64_t other : *ids) require_known(graph, other);
    // A stale edge to a task whose document is gone may still be removed.
    for (int64_t other : u.remove_blocks)
        if (!t.blocks.count(other)) require_known(graph, other);
    for (int64_t other : u.remove_blocked_by)
        if (!t.blocked_by.count(other)) require_known(graph, other);

    for (int64_t b : u.remove_blocks) remove_edge(working, id, b, touched);
    for (int64_t b : u.remove_blocked_by) remove_edge(working, b, id, touched);
    for (int64_t b : u.add_blocks) add_edge(working, id, b, touched);
    for (int64_t b : u.add_blocked_by) add_edge(working, b, id, touched);

    if (!u.metadata.is_null()) {
        if (!u.metadata.is_object()) throw StoreError(ErrorCode::InvalidArgument, "metadata must be an object");
        for (auto& [key, value] : u.metadata.items()) {
            if (value.is_null()) t.metadata.erase(key);
            else t.metadata[key] = value;
        }
    }

    if (u.status) {
        TaskStatus to = *u.status;
        check_transition(t.status, to);
        if (to != t.status && (to == TaskStatus::in_progress || to == TaskStatus::completed)) {
            for (int64_t b : t.blocked_by) {
                auto blocker = working.find(b);
                if (blocker == working.end()) continue;  // deleted blockers no longer block
                if (blocker->second.status != TaskStatus::completed) {
                    throw StoreError(ErrorCode::InvalidTransition,
                                     std::string("cannot set status to '") + task_status_name(to) +
                                     "': blocked by task " + std::to_string(b) +
                                     " (status '" + task_status_name(blocker->second.status) + "')");
                }
            }
        }
        t.status = to;
    }

    if (t.status == TaskStatus::deleted) {
        for (int64_t b : std::set<int64_t>(t.blocks)) remove_edge(working, id, b, touched);
        for (int64_t b : std::set<int64_t>(t.blocked_by)) remove_edge(working, b, id, touched);
        GraphChange change = collect(graph, working, touched, id);
        change.removals.push_back(id);
        change.result = working[id];
        return change;
    }

    GraphChange change = collect(graph, working, touched, -1);
    change.result = working[id];
    return change;
}

// ── TaskGraph ───────────────────────────────────────────────────────

namespace {

std::optional<int64_t> parse_task_id(const std::string& stem) {
    if (stem.empty() || stem.size() > 18) return std::nullopt;
    for (char c : stem)
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    int64_t id = std::stoll(stem);
    if (id <= 0) return std::nullopt;
    return id;
}

} // namespace

void TaskGraph::require_owner(const std::string& team, const std::string& owner) const {
    auto doc = ctx_.store->read(ctx_.team_config_path(team));
    if (!doc) throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
    if (!TeamConfig::from_json(*doc).find_member(owner)) {
        throw StoreError(ErrorCode::NotFound,
                         "owner '" + owner + "' is not a member of team '" + team + "'");
    }
}

void TaskGraph::require_team(const std::string& team) const {
    validate_name(team, "team");
    if (!ctx_.store->exists(ctx_.team_config_path(team)))
        throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
}

TaskMap TaskGraph::load_graph(const std::string& team) const {
    TaskMap graph;
    for (auto& stem : ctx_.store->list(ctx_.tasks_dir(team))) {
        auto id = parse_task_id(stem);
        if (!id) continue;
        auto doc = ctx_.store->read(ctx_.task_path(team, *id));
        if (doc) graph[*id] = Task::from_json(*doc);
    }
    return graph;
}

void TaskGraph::commit(const std::string& team, const GraphChange& change) {
    auto write = [&](const Task& task) {
        nlohmann::json doc = task.to_json();
        ctx_.store->modify_held(ctx_.task_path(team, task.id),
            [&](const std::optional<Document>&) -> std::optional<Document> { return doc; });
    };
    // The task itself first, then the inverse sets of its neighbours.
    auto own = change.writes.find(change.result.id);
    if (own != change.writes.end()) write(own->second);
    for (int64_t id : change.removals) {
        ctx_.store->modify_held(ctx_.task_path(team, id),
            [](const std::optional<Document>&) -> std::optional<Document> { return std::nullopt; });
    }
    for (auto& [id, task] : change.writes) {
        if (id != change.result.id) write(task);
    }
}

int64_t TaskGraph::allocate_id(const std::string& team) {
    validate_name(team, "team");
    int64_t allocated = 0;
    ctx_.store->modify(ctx_.counter_path(team), ctx_.counter_lock_path(team),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            int64_t next = 1;
            if (cur) {
                if (!cur->contains("nextId") || !(*cur)["nextId"].is_number_integer())
                    throw StoreError(ErrorCode::IOError, "malformed counter " + ctx_.counter_path(team));
                next = (*cur)["nextId"].get<int64_t>();
            } else {
                // No counter yet: continue after any task already on disk.
                for (auto& stem : ctx_.store->list(ctx_.tasks_dir(team))) {
                    auto id = parse_task_id(stem);
                    if (id && *id >= next) next = *id + 1;
                }
            }
            allocated = next;
            return Document{{"nextId", next + 1}};
        }, ctx_.lock_timeout);
    return allocated;
}

Task TaskGraph::create(const std::string& team, const TaskSpec& spec) {
    require_subject(spec.subject);
    require_team(team);

    Task task;
    task.subject = spec.subject;
    task.description = spec.description;
    task.active_form = spec.active_form;
    if (spec.owner && !spec.owner->empty()) task.owner = spec.owner;
    task.blocked_by.insert(spec.blocked_by.begin(), spec.blocked_by.end());
    task.blocks.insert(spec.blocks.begin(), spec.blocks.end());
    if (!spec.metadata.is_null()) {
        if (!spec.metadata.is_object()) throw StoreError(ErrorCode::InvalidArgument, "metadata must be an object");
        task.metadata = spec.metadata;
    }

    auto held = ctx_.store->lock(ctx_.task_lock_path(team), ctx_.lock_timeout);
    // Again under the lock: a team delete may have run while this call waited.
    require_team(team);
    if (task.owner) require_owner(team, *task.owner);
    TaskMap graph = load_graph(team);
    // Validate with a placeholder id so a rejected task consumes no id.
    plan_create(graph, task);
    task.id = allocate_id(team);
    GraphChange change = plan_create(graph, task);
    commit(team, change);
    return change.result;
}

Task TaskGraph::update(const std::string& team, int64_t id, const TaskUpdate& update) {
    require_team(team);
    auto held = ctx_.store->lock(ctx_.task_lock_path(team), ctx_.lock_timeout);
    require_team(team);
    if (update.owner && !update.owner->empty()) require_owner(team, *update.owner);
    GraphChange change = plan_update(load_graph(team), id, update);
    commit(team, change);
    return change.result;
}

Task TaskGraph::get(const std::string& team, int64_t id) const {
    validate_name(team, "team");
    auto doc = ctx_.store->read(ctx_.task_path(team, id));
    if (!doc) throw StoreError(ErrorCode::NotFound, "task " + std::to_string(id) + " not found");
    return Task::from_json(*doc);
}

std::vector<Task> TaskGraph::list(const std::string& team) const {
    validate_name(team, "team");
    std::vector<Task> tasks;
    for (auto& [id, task] : load_graph(team)) tasks.push_back(task);
    return tasks;
}

std::vector<int64_t> TaskGraph::reset_owner_tasks(const std::string& team, const std::string& agent) {
    require_team(team);
    auto held = ctx_.store->lock(ctx_.task_lock_path(team), ctx_.lock_timeout);
    require_team(team);
    std::vector<int64_t> changed;
    for (auto& [id, task] : load_graph(team)) {
        if (task.owner != agent || task.status == TaskStatus::completed) continue;
        Task next = task;
        next.owner.reset();
        if (next.status == TaskStatus::in_progress) next.status = TaskStatus::pending;
        nlohmann::json doc = next.to_json();
        ctx_.store->modify_held(ctx_.task_path(team, id),
            [&](const std::optional<Document>&) -> std::optional<Document> { return doc; });
        changed.push_back(id);
    }
    return changed;
}

} // namespace teamfs
