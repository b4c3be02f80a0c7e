#include "team_tools.hpp"
#include "../errors.hpp"

namespace teamfs {

using json = nlohmann::json;

namespace {

std::string require_str(const json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty())
        throw StoreError(ErrorCode::InvalidArgument, std::string("missing required argument '") + key + "'");
    return args[key].get<std::string>();
}

// Task ids arrive as numbers or numeric strings.
int64_t to_task_id(const json& v) {
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos && s.size() <= 18)
            return std::stoll(s);
    }
    throw StoreError(ErrorCode::InvalidArgument, "invalid task id " + v.dump());
}

int64_t require_task_id(const json& args, const char* key) {
    if (!args.contains(key))
        throw StoreError(ErrorCode::InvalidArgument, std::string("missing required argument '") + key + "'");
    return to_task_id(args[key]);
}

std::vector<int64_t> id_list(const json& args, const char* key) {
    std::vector<int64_t> ids;
    if (!args.contains(key) || args[key].is_null()) return ids;
    if (!args[key].is_array())
        throw StoreError(ErrorCode::InvalidArgument, std::string("'") + key + "' must be an array");
    for (auto& v : args[key]) ids.push_back(to_task_id(v));
    return ids;
}

std::optional<std::string> opt_str(const json& args, const char* key) {
    if (!args.contains(key) || args[key].is_null()) return std::nullopt;
    return args[key].get<std::string>();
}

json messages_json(const std::vector<Message>& msgs) {
    json arr = json::array();
    for (auto& m : msgs) arr.push_back(m.to_json());
    return arr;
}

const TeamMember& require_teammate(const TeamConfig& cfg, const std::string& name) {
    const TeamMember* m = cfg.find_member(name);
    if (!m || m->is_lead())
        throw StoreError(ErrorCode::NotFound, "teammate '" + name + "' not found in team '" + cfg.name + "'");
    return *m;
}

// Removal after a confirmed shutdown or a forced kill: the member goes and
// its unfinished tasks return to the pool.
void retire_member(Services& svc, const std::string& team, const std::string& name) {
    svc.teams.remove_member(team, name);
    svc.tasks.reset_owner_tasks(team, name);
}

} // namespace

void register_team_tools(ToolRegistry& tools, std::shared_ptr<Services> svc) {

    // ── team_create ─────────────────────────────────────────────────
    tools.register_tool({
        "team_create",
        "Create a new agent team. The caller becomes team-lead.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":   {"type": "string", "description": "Letters, digits, '-' and '_', at most 64 chars"},
                "description": {"type": "string", "description": "What the team is for"},
                "session_id":  {"type": "string", "description": "Session id of the lead (optional)"}
            },
            "required": ["team_name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            TeamConfig cfg = svc->teams.create(team, args.value("description", ""),
                                               args.value("session_id", ""));
            return {{"team_name", cfg.name},
                    {"team_file_path", svc->ctx.team_config_path(cfg.name)},
                    {"lead_agent_id", cfg.lead_agent_id}};
        }
    });

    // ── team_delete ─────────────────────────────────────────────────
    tools.register_tool({
        "team_delete",
        "Delete a team with its inboxes and tasks. Fails while any teammate is still alive.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name": {"type": "string"}
            },
            "required": ["team_name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            svc->teams.remove(team, svc->backends->health_check());
            return {{"success", true}, {"team_name", team},
                    {"message", "Team '" + team + "' deleted"}};
        }
    });

    // ── read_config ─────────────────────────────────────────────────
    tools.register_tool({
        "read_config",
        "Read the team configuration including all members.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name": {"type": "string"}
            },
            "required": ["team_name"]
        })JSON"),
        [svc](const json& args) -> json {
            return svc->teams.read_config(require_str(args, "team_name")).to_json();
        }
    });

    // ── add_member ──────────────────────────────────────────────────
    tools.register_tool({
        "add_member",
        "Add a teammate. With a backend, also spawns its process and records the handle.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":          {"type": "string"},
                "name":               {"type": "string", "description": "Unique teammate name"},
                "prompt":             {"type": "string", "description": "Initial instructions"},
                "model":              {"type": "string", "description": "Model id or tier: fast, balanced, powerful"},
                "agent_type":         {"type": "string", "description": "Role (default: general-purpose)"},
                "backend":            {"type": "string", "description": "Backend to spawn with (omit to only register)"},
                "cwd":                {"type": "string"},
                "plan_mode_required": {"type": "boolean"}
            },
            "required": ["team_name", "name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            TeamMember m;
            m.name = require_str(args, "name");
            m.prompt = args.value("prompt", "");
            m.model = args.value("model", "");
            m.agent_type = args.value("agent_type", "general-purpose");
            m.cwd = args.value("cwd", "");
            m.plan_mode_required = args.value("plan_mode_required", false);

            std::string backend_name = args.value("backend", "");
            Backend* backend = nullptr;
            if (!backend_name.empty()) {
                backend = &svc->backends->get(backend_name);
                m.backend_type = backend_name;
                m.model = backend->resolve_model(m.model);
            }

            TeamMember added = svc->teams.add_member(team, m);
            json result = {{"agent_id", added.agent_id}, {"name", added.name},
                           {"team_name", team}, {"color", added.color}};
            if (!backend) {
                result["message"] = "Teammate registered.";
                return result;
            }

            SpawnRequest req;
            req.agent_id = added.agent_id;
            req.name = added.name;
            req.team_name = team;
            req.prompt = added.prompt;
            req.model = added.model;
            req.agent_type = added.agent_type;
            req.color = added.color;
            req.cwd = added.cwd;
            req.lead_session_id = svc->teams.read_config(team).lead_session_id;
            req.plan_mode_required = added.plan_mode_required;

            SpawnResult spawned;
            try {
                spawned = backend->spawn(req);
            } catch (const StoreError&) {
                svc->teams.remove_member(team, added.name);
                throw;
            }
            svc->teams.update_member(team, added.name, [&](TeamMember& mm) {
                mm.process_handle = spawned.process_handle;
                mm.backend_type = spawned.backend_type;
                mm.status = MemberStatus::alive;
            });
            result["process_handle"] = spawned.process_handle;
            result["message"] = "The agent is now running and will receive instructions via mailbox.";
            return result;
        }
    });

    // ── remove_member ───────────────────────────────────────────────
    tools.register_tool({
        "remove_member",
        "Remove a teammate and release its tasks. With kill=true its process is killed first.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name": {"type": "string"},
                "name":      {"type": "string"},
                "kill":      {"type": "boolean"}
            },
            "required": ["team_name", "name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            std::string name = require_str(args, "name");
            if (args.value("kill", false)) {
                const TeamMember& m = require_teammate(svc->teams.read_config(team), name);
                if (!m.process_handle.empty() && svc->backends->has(m.backend_type))
                    svc->backends->get(m.backend_type).kill(m.process_handle);
            }
            retire_member(*svc, team, name);
            return {{"success", true}, {"message", name + " removed from team."}};
        }
    });

    // ── task_create ─────────────────────────────────────────────────
    tools.register_tool({
        "task_create",
        "Create a task. Dependencies must already exist and may not form a cycle.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":   {"type": "string"},
                "subject":     {"type": "string", "description": "Brief task title"},
                "description": {"type": "string"},
                "active_form": {"type": "string", "description": "Present-tense label shown while in progress"},
                "owner":       {"type": "string", "description": "Teammate to assign (gets a task_assignment message)"},
                "blocked_by":  {"type": "array", "items": {"type": "integer"}},
                "blocks":      {"type": "array", "items": {"type": "integer"}},
                "metadata":    {"type": "object"}
            },
            "required": ["team_name", "subject"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            TaskSpec spec;
            spec.subject = args.value("subject", "");
            spec.description = args.value("description", "");
            spec.active_form = args.value("active_form", "");
            spec.owner = opt_str(args, "owner");
            spec.blocked_by = id_list(args, "blocked_by");
            spec.blocks = id_list(args, "blocks");
            if (args.contains("metadata")) spec.metadata = args["metadata"];

            Task task = svc->tasks.create(team, spec);
            if (task.owner) svc->mailbox.send_task_assignment(team, task, kLeadName);
            return task.to_json();
        }
    });

    // ── task_update ─────────────────────────────────────────────────
    tools.register_tool({
        "task_update",
        "Update a task. Status moves pending -> in_progress -> completed; 'deleted' removes it. "
        "An empty owner clears the assignment; metadata keys set to null are removed.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":         {"type": "string"},
                "task_id":           {"type": "integer"},
                "status":            {"type": "string", "enum": ["pending", "in_progress", "completed", "deleted"]},
                "owner":             {"type": "string"},
                "subject":           {"type": "string"},
                "description":       {"type": "string"},
                "active_form":       {"type": "string"},
                "add_blocks":        {"type": "array", "items": {"type": "integer"}},
                "add_blocked_by":    {"type": "array", "items": {"type": "integer"}},
                "remove_blocks":     {"type": "array", "items": {"type": "integer"}},
                "remove_blocked_by": {"type": "array", "items": {"type": "integer"}},
                "metadata":          {"type": "object"}
            },
            "required": ["team_name", "task_id"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            int64_t id = require_task_id(args, "task_id");

            TaskUpdate u;
            if (auto s = opt_str(args, "status")) u.status = parse_task_status(*s);
            u.owner = opt_str(args, "owner");
            u.subject = opt_str(args, "subject");
            u.description = opt_str(args, "description");
            u.active_form = opt_str(args, "active_form");
            u.add_blocks = id_list(args, "add_blocks");
            u.add_blocked_by = id_list(args, "add_blocked_by");
            u.remove_blocks = id_list(args, "remove_blocks");
            u.remove_blocked_by = id_list(args, "remove_blocked_by");
            if (args.contains("metadata")) u.metadata = args["metadata"];

            std::optional<std::string> previous_owner;
            if (u.owner && !u.owner->empty()) previous_owner = svc->tasks.get(team, id).owner;

            Task task = svc->tasks.update(team, id, u);
            if (task.status != TaskStatus::deleted && task.owner && task.owner != previous_owner)
                svc->mailbox.send_task_assignment(team, task, kLeadName);
            return task.to_json();
        }
    });

    // ── task_list ───────────────────────────────────────────────────
    tools.register_tool({
        "task_list",
        "List all tasks of a team, ordered by id.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name": {"type": "string"}
            },
            "required": ["team_name"]
        })JSON"),
        [svc](const json& args) -> json {
            json arr = json::array();
            for (auto& t : svc->tasks.list(require_str(args, "team_name"))) arr.push_back(t.to_json());
            return arr;
        }
    });

    // ── task_get ────────────────────────────────────────────────────
    tools.register_tool({
        "task_get",
        "Get one task by id.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name": {"type": "string"},
                "task_id":   {"type": "integer"}
            },
            "required": ["team_name", "task_id"]
        })JSON"),
        [svc](const json& args) -> json {
            return svc->tasks.get(require_str(args, "team_name"), require_task_id(args, "task_id")).to_json();
        }
    });

    // ── send_message ────────────────────────────────────────────────
    tools.register_tool({
        "send_message",
        "Send a message or a protocol response. Types: message (needs recipient, content), "
        "broadcast (content), shutdown_request (recipient; content is the reason), "
        "shutdown_response (sender, request_id, approve), "
        "plan_approval_response (recipient, request_id, approve).",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":  {"type": "string"},
                "type":       {"type": "string", "enum": ["message", "broadcast", "shutdown_request", "shutdown_response", "plan_approval_response"]},
                "recipient":  {"type": "string"},
                "content":    {"type": "string"},
                "summary":    {"type": "string"},
                "request_id": {"type": "string"},
                "approve":    {"type": "boolean"},
                "sender":     {"type": "string", "description": "Defaults to team-lead"}
            },
            "required": ["team_name", "type"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            MessageType type = parse_message_type(require_str(args, "type"));
            std::string sender = args.value("sender", kLeadName);
            std::string content = args.value("content", "");
            std::string summary = args.value("summary", "");
            bool approve = args.value("approve", false);

            switch (type) {
                case MessageType::direct: {
                    std::string recipient = require_str(args, "recipient");
                    TeamConfig cfg = svc->teams.read_config(team);
                    Message msg;
                    msg.from = sender;
                    msg.text = content;
                    msg.summary = summary;
                    if (const TeamMember* target = cfg.find_member(recipient)) msg.color = target->color;
                    Message sent = svc->mailbox.send(team, recipient, msg);
                    return {{"success", true}, {"message", "Message sent to " + recipient},
                            {"id", sent.id}};
                }
                case MessageType::broadcast: {
                    Message msg;
                    msg.from = sender;
                    msg.text = content;
                    msg.summary = summary;
                    auto sent = svc->mailbox.broadcast(team, msg);
                    return {{"success", true},
                            {"message", "Broadcast sent to " + std::to_string(sent.size()) + " member(s)"}};
                }
                case MessageType::shutdown_request: {
                    std::string recipient = require_str(args, "recipient");
                    std::string request_id = svc->mailbox.send_shutdown_request(team, recipient, content);
                    return {{"success", true}, {"message", "Shutdown request sent to " + recipient},
                            {"request_id", request_id}, {"target", recipient}};
                }
                case MessageType::shutdown_response: {
                    std::string request_id = require_str(args, "request_id");
                    svc->mailbox.send_shutdown_response(team, sender, request_id, approve, content);
                    return {{"success", true},
                            {"message", std::string("Shutdown ") + (approve ? "approved" : "rejected") +
                                        " for request " + request_id}};
                }
                case MessageType::plan_approval_response: {
                    std::string recipient = require_str(args, "recipient");
                    svc->mailbox.send_plan_approval_response(team, sender, recipient,
                                                             args.value("request_id", ""), approve, content);
                    return {{"success", true},
                            {"message", std::string("Plan ") + (approve ? "approved" : "rejected") +
                                        " for " + recipient}};
                }
            }
            throw StoreError(ErrorCode::InvalidArgument, "unsupported message type");
        }
    });

    // ── read_inbox ──────────────────────────────────────────────────
    tools.register_tool({
        "read_inbox",
        "Read an agent's inbox. Returns all messages unless unread_only is set.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":    {"type": "string"},
                "agent_name":   {"type": "string"},
                "unread_only":  {"type": "boolean"},
                "mark_as_read": {"type": "boolean", "description": "Default true"}
            },
            "required": ["team_name", "agent_name"]
        })JSON"),
        [svc](const json& args) -> json {
            return messages_json(svc->mailbox.read(require_str(args, "team_name"),
                                                   require_str(args, "agent_name"),
                                                   args.value("unread_only", false),
                                                   args.value("mark_as_read", true)));
        }
    });

    // ── poll_inbox ──────────────────────────────────────────────────
    tools.register_tool({
        "poll_inbox",
        "Wait up to timeout_ms for unread messages newer than since_id; returns them marked read, "
        "or an empty list on timeout.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":  {"type": "string"},
                "agent_name": {"type": "string"},
                "since_id":   {"type": "integer", "description": "Default 0"},
                "timeout_ms": {"type": "integer", "description": "Default 30000"}
            },
            "required": ["team_name", "agent_name"]
        })JSON"),
        [svc](const json& args) -> json {
            PollRequest req;
            req.since_id = args.value("since_id", int64_t{0});
            req.max_wait = std::chrono::milliseconds(args.value("timeout_ms", int64_t{30000}));
            req.unread_only = true;
            req.mark_as_read = true;
            auto pending = svc->mailbox.poll_async(require_str(args, "team_name"),
                                                   require_str(args, "agent_name"),
                                                   req, svc->stopping);
            return messages_json(pending.get());
        }
    });

    // ── health_check ────────────────────────────────────────────────
    tools.register_tool({
        "health_check",
        "Check whether a teammate's process is still running and record the result.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":  {"type": "string"},
                "agent_name": {"type": "string"}
            },
            "required": ["team_name", "agent_name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            std::string name = require_str(args, "agent_name");
            TeamMember m = require_teammate(svc->teams.read_config(team), name);
            if (m.process_handle.empty())
                throw StoreError(ErrorCode::InvalidArgument, "no process handle for teammate '" + name + "'");

            HealthStatus h = svc->backends->get(m.backend_type).health_check(m.process_handle);
            svc->teams.update_member(team, name, [&](TeamMember& mm) {
                mm.status = h.alive ? MemberStatus::alive : MemberStatus::dead;
            });
            return {{"agent_name", name}, {"alive", h.alive},
                    {"backend", m.backend_type}, {"detail", h.detail}};
        }
    });

    // ── list_backends ───────────────────────────────────────────────
    tools.register_tool({
        "list_backends",
        "List the configured spawn backends with their models.",
        json::parse(R"JSON({"type": "object", "properties": {}})JSON"),
        [svc](const json&) -> json {
            json arr = json::array();
            for (auto& name : svc->backends->names()) {
                Backend& b = svc->backends->get(name);
                arr.push_back({{"name", name}, {"binary", b.binary_name()},
                               {"available", b.is_available()},
                               {"defaultModel", b.default_model()},
                               {"supportedModels", b.supported_models()},
                               {"default", name == svc->backends->default_backend()}});
            }
            return arr;
        }
    });

    // ── process_shutdown_approved ───────────────────────────────────
    tools.register_tool({
        "process_shutdown_approved",
        "Remove a teammate after its shutdown was approved and release its tasks.",
        json::parse(R"JSON({
            "type": "object",
            "properties": {
                "team_name":  {"type": "string"},
                "agent_name": {"type": "string"}
            },
            "required": ["team_name", "agent_name"]
        })JSON"),
        [svc](const json& args) -> json {
            std::string team = require_str(args, "team_name");
            std::string name = require_str(args, "agent_name");
            if (name == kLeadName)
                throw StoreError(ErrorCode::InvalidName, "cannot process shutdown for " + kLeadName);
            retire_member(*svc, team, name);
            return {{"success", true}, {"message", name + " removed from team."}};
        }
    });
}

} // namespace teamfs
