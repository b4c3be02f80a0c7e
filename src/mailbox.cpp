#include "mailbox.hpp"
#include "errors.hpp"
#include "team_registry.hpp"
#include "utils.hpp"
#include <algorithm>
#include <set>
#include <thread>

namespace teamfs {

const char* message_type_name(MessageType t) {
    switch (t) {
        case MessageType::direct:                 return "direct";
        case MessageType::broadcast:              return "broadcast";
        case MessageType::shutdown_request:       return "shutdown_request";
        case MessageType::shutdown_response:      return "shutdown_response";
        case MessageType::plan_approval_response: return "plan_approval_response";
    }
    return "direct";
}

MessageType parse_message_type(const std::string& s) {
    if (s == "direct" || s == "message") return MessageType::direct;
    if (s == "broadcast") return MessageType::broadcast;
    if (s == "shutdown_request") return MessageType::shutdown_request;
    if (s == "shutdown_response") return MessageType::shutdown_response;
    if (s == "plan_approval_response") return MessageType::plan_approval_response;
    throw StoreError(ErrorCode::InvalidArgument, "unknown message type '" + s + "'");
}

nlohmann::json Message::to_json() const {
    nlohmann::json j = {
        {"id", id}, {"type", message_type_name(type)}, {"from", from},
        {"text", text}, {"read", read}, {"timestamp", timestamp},
    };
    if (to) j["to"] = *to;
    if (!summary.empty()) j["summary"] = summary;
    if (request_id) j["requestId"] = *request_id;
    if (approve) j["approve"] = *approve;
    if (!color.empty()) j["color"] = color;
    return j;
}

Message Message::from_json(const nlohmann::json& j) {
    Message m;
    m.id = j.value("id", int64_t{0});
    m.type = parse_message_type(j.value("type", "direct"));
    m.from = j.value("from", "");
    if (j.contains("to") && j["to"].is_string()) m.to = j["to"].get<std::string>();
    m.text = j.value("text", "");
    m.summary = j.value("summary", "");
    if (j.contains("requestId") && j["requestId"].is_string()) m.request_id = j["requestId"].get<std::string>();
    if (j.contains("approve") && j["approve"].is_boolean()) m.approve = j["approve"].get<bool>();
    m.color = j.value("color", "");
    m.read = j.value("read", false);
    m.timestamp = j.value("timestamp", "");
    return m;
}

// ── Inbox documents ─────────────────────────────────────────────────

namespace {

const nlohmann::json& require_array(const std::optional<Document>& doc, const std::string& path) {
    if (!doc->is_array()) throw StoreError(ErrorCode::IOError, "malformed inbox " + path);
    return *doc;
}

int64_t last_id(const nlohmann::json& inbox) {
    int64_t last = 0;
    for (auto& m : inbox) last = std::max(last, m.value("id", int64_t{0}));
    return last;
}

TeamConfig require_member(const Context& ctx, const std::string& team, const std::string& name) {
    validate_name(team, "team");
    validate_name(name, "agent");
    auto doc = ctx.store->read(ctx.team_config_path(team));
    if (!doc) throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
    TeamConfig cfg = TeamConfig::from_json(*doc);
    if (!cfg.find_member(name)) {
        throw StoreError(ErrorCode::NotFound,
                         "recipient '" + name + "' is not a member of team '" + team + "'");
    }
    return cfg;
}

} // namespace

Message Mailbox::append(const std::string& team, const std::string& recipient, Message msg) {
    std::string path = ctx_.inbox_path(team, recipient);
    msg.read = false;
    if (msg.type != MessageType::broadcast) msg.to = recipient;
    if (msg.timestamp.empty()) msg.timestamp = now_iso8601();

    ctx_.store->modify(path, ctx_.inbox_lock_path(team),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            // The team may have been deleted while this call waited for the lock.
            if (!ctx_.store->exists(ctx_.team_config_path(team)))
                throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
            nlohmann::json inbox = cur ? require_array(cur, path) : nlohmann::json::array();
            msg.id = last_id(inbox) + 1;
            inbox.push_back(msg.to_json());
            return inbox;
        }, ctx_.lock_timeout);
    return msg;
}

std::vector<Message> Mailbox::load(const std::string& team, const std::string& agent) const {
    std::string path = ctx_.inbox_path(team, agent);
    auto doc = ctx_.store->read(path);
    std::vector<Message> out;
    if (!doc) return out;
    for (auto& m : require_array(doc, path)) out.push_back(Message::from_json(m));
    return out;
}

void Mailbox::mark_read(const std::string& team, const std::string& agent,
                        const std::vector<int64_t>& ids, std::chrono::milliseconds timeout) {
    std::string path = ctx_.inbox_path(team, agent);
    std::set<int64_t> wanted(ids.begin(), ids.end());
    ctx_.store->modify(path, ctx_.inbox_lock_path(team),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            if (!cur) return std::nullopt;
            nlohmann::json inbox = require_array(cur, path);
            for (auto& m : inbox) {
                if (wanted.count(m.value("id", int64_t{0}))) m["read"] = true;
            }
            return inbox;
        }, timeout);
}

// ── Operations ──────────────────────────────────────────────────────

Message Mailbox::send(const std::string& team, const std::string& recipient, Message msg) {
    if (msg.text.empty()) throw StoreError(ErrorCode::InvalidArgument, "message content must not be empty");
    require_member(ctx_, team, recipient);
    return append(team, recipient, std::move(msg));
}

std::vector<Message> Mailbox::broadcast(const std::string& team, Message msg) {
    if (msg.text.empty()) throw StoreError(ErrorCode::InvalidArgument, "message content must not be empty");
    validate_name(team, "team");
    auto doc = ctx_.store->read(ctx_.team_config_path(team));
    if (!doc) throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
    TeamConfig cfg = TeamConfig::from_json(*doc);

    msg.type = MessageType::broadcast;
    msg.to.reset();
    if (msg.timestamp.empty()) msg.timestamp = now_iso8601();
    std::vector<Message> sent;
    for (auto& m : cfg.members) {
        if (m.name == msg.from) continue;
        sent.push_back(append(team, m.name, msg));
    }
    return sent;
}

std::vector<Message> Mailbox::read(const std::string& team, const std::string& agent,
                                   bool unread_only, bool mark_as_read) {
    validate_name(team, "team");
    validate_name(agent, "agent");
    std::vector<Message> all = load(team, agent);
    std::vector<Message> out;
    for (auto& m : all) {
        if (!unread_only || !m.read) out.push_back(m);
    }
    if (!mark_as_read || out.empty()) return out;

    // Marked under the lock; a concurrent reader may mark some of these first.
    std::vector<int64_t> ids;
    for (auto& m : out) {
        ids.push_back(m.id);
        m.read = true;
    }
    mark_read(team, agent, ids, ctx_.lock_timeout);
    return out;
}

std::vector<Message> Mailbox::poll(const std::string& team, const std::string& agent,
                                   const PollRequest& req, const std::atomic<bool>* cancel) {
    validate_name(team, "team");
    validate_name(agent, "agent");
    auto wait = std::min(req.max_wait, ctx_.poll_max_wait);
    if (wait.count() < 0) wait = std::chrono::milliseconds(0);
    auto deadline = std::chrono::steady_clock::now() + wait;

    for (;;) {
        std::vector<Message> found;
        for (auto& m : load(team, agent)) {
            if (m.id > req.since_id && (!req.unread_only || !m.read)) found.push_back(m);
        }
        if (!found.empty()) {
            if (req.mark_as_read) {
                std::vector<int64_t> ids;
                for (auto& m : found) {
                    ids.push_back(m.id);
                    m.read = true;
                }
                mark_read(team, agent, ids, ctx_.poll_lock_timeout);
            }
            return found;
        }
        if (cancel && cancel->load()) return {};
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return {};
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(ctx_.poll_interval, left));
    }
}

std::future<std::vector<Message>> Mailbox::poll_async(const std::string& team, const std::string& agent,
                                                      PollRequest req,
                                                      std::shared_ptr<std::atomic<bool>> cancel) {
    Context ctx = ctx_;
    return std::async(std::launch::async, [ctx, team, agent, req, cancel]() {
        Mailbox box(ctx);
        return box.poll(team, agent, req, cancel.get());
    });
}

// ── Protocol messages ───────────────────────────────────────────────

std::string Mailbox::send_shutdown_request(const std::string& team, const std::string& recipient,
                                           const std::string& reason) {
    if (recipient == kLeadName) {
        throw StoreError(ErrorCode::InvalidArgument, "cannot send shutdown request to " + kLeadName);
    }
    require_member(ctx_, team, recipient);

    std::string request_id = "shutdown-" + std::to_string(epoch_ms()) + "@" + recipient;
    Message msg;
    msg.type = MessageType::shutdown_request;
    msg.from = kLeadName;
    msg.request_id = request_id;
    msg.timestamp = now_iso8601();
    msg.text = nlohmann::json{
        {"type", "shutdown_request"}, {"requestId", request_id}, {"from", kLeadName},
        {"reason", reason}, {"timestamp", msg.timestamp},
    }.dump();
    append(team, recipient, msg);
    return request_id;
}

Message Mailbox::send_shutdown_response(const std::string& team, const std::string& sender,
                                        const std::string& request_id, bool approve,
                                        const std::string& reason) {
    TeamConfig cfg = require_member(ctx_, team, kLeadName);

    Message msg;
    msg.type = MessageType::shutdown_response;
    msg.from = sender;
    msg.request_id = request_id;
    msg.approve = approve;
    msg.timestamp = now_iso8601();
    if (approve) {
        const TeamMember* member = cfg.find_member(sender);
        msg.text = nlohmann::json{
            {"type", "shutdown_approved"}, {"requestId", request_id}, {"from", sender},
            {"timestamp", msg.timestamp},
            {"backendType", member ? member->backend_type : ""},
            {"processHandle", member ? member->process_handle : ""},
        }.dump();
        msg.summary = "shutdown_approved";
    } else {
        msg.text = reason.empty() ? "Shutdown rejected" : reason;
        msg.summary = "shutdown_rejected";
    }
    return append(team, kLeadName, msg);
}

Message Mailbox::send_plan_approval_response(const std::string& team, const std::string& sender,
                                             const std::string& recipient, const std::string& request_id,
                                             bool approve, const std::string& feedback) {
    require_member(ctx_, team, recipient);

    Message msg;
    msg.type = MessageType::plan_approval_response;
    msg.from = sender;
    msg.request_id = request_id;
    msg.approve = approve;
    if (approve) {
        msg.text = R"({"type":"plan_approval","approved":true})";
        msg.summary = "plan_approved";
    } else {
        msg.text = feedback.empty() ? "Plan rejected" : feedback;
        msg.summary = "plan_rejected";
    }
    return append(team, recipient, msg);
}

Message Mailbox::send_task_assignment(const std::string& team, const Task& task,
                                      const std::string& assigned_by) {
    if (!task.owner) {
        throw StoreError(ErrorCode::InvalidArgument,
                         "cannot send task assignment: task " + std::to_string(task.id) + " has no owner");
    }
    require_member(ctx_, team, *task.owner);

    Message msg;
    msg.type = MessageType::direct;
    msg.from = assigned_by;
    msg.timestamp = now_iso8601();
    msg.summary = "task_assignment";
    msg.text = nlohmann::json{
        {"type", "task_assignment"}, {"taskId", task.id}, {"subject", task.subject},
        {"description", task.description}, {"assignedBy", assigned_by},
        {"timestamp", msg.timestamp},
    }.dump();
    return append(team, *task.owner, msg);
}

} // namespace teamfs
