#pragma once
#include "context.hpp"
#include "task_graph.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace teamfs {

enum class MessageType { direct, broadcast, shutdown_request, shutdown_response, plan_approval_response };

const char* message_type_name(MessageType t);
// Accepts "message" as an alias of "direct". Throws StoreError(InvalidArgument).
MessageType parse_message_type(const std::string& s);

struct Message {
    int64_t id = 0;
    MessageType type = MessageType::direct;
    std::string from;
    std::optional<std::string> to;
    std::string text;
    std::string summary;
    std::optional<std::string> request_id;
    std::optional<bool> approve;
    std::string color;
    bool read = false;
    std::string timestamp;

    nlohmann::json to_json() const;
    static Message from_json(const nlohmann::json& j);
};

struct PollRequest {
    int64_t since_id = 0;
    std::chrono::milliseconds max_wait{30000};
    bool unread_only = false;
    bool mark_as_read = false;
};

// ── Mailbox ─────────────────────────────────────────────────────────
//
// One inbox document per agent: a JSON array of messages, appended only.
// Every mutation in a team holds that team's inbox lock. Message ids are
// per inbox, start at 1 and only grow.
class Mailbox {
public:
    explicit Mailbox(Context ctx) : ctx_(std::move(ctx)) {}

    // The recipient must be a member of the team. `id`, `to`, `read` and an
    // empty `timestamp` are filled in. Returns the stored message.
    Message send(const std::string& team, const std::string& recipient, Message msg);

    // Appends to every member's inbox except the sender's, one inbox at a
    // time. A failure part way leaves earlier recipients delivered.
    std::vector<Message> broadcast(const std::string& team, Message msg);

    std::vector<Message> read(const std::string& team, const std::string& agent,
                              bool unread_only = false, bool mark_as_read = false);

    // Waits until a message with id > since_id exists, `cancel` becomes true
    // or max_wait (capped by the context) elapses. Empty on timeout.
    std::vector<Message> poll(const std::string& team, const std::string& agent,
                              const PollRequest& req,
                              const std::atomic<bool>* cancel = nullptr);

    std::future<std::vector<Message>> poll_async(const std::string& team, const std::string& agent,
                                                 PollRequest req,
                                                 std::shared_ptr<std::atomic<bool>> cancel = nullptr);

    // ── Protocol messages ───────────────────────────────────────────

    // From team-lead. Returns the request id "shutdown-<epoch ms>@<recipient>".
    std::string send_shutdown_request(const std::string& team, const std::string& recipient,
                                      const std::string& reason);
    Message send_shutdown_response(const std::string& team, const std::string& sender,
                                   const std::string& request_id, bool approve,
                                   const std::string& reason);
    Message send_plan_approval_response(const std::string& team, const std::string& sender,
                                        const std::string& recipient, const std::string& request_id,
                                        bool approve, const std::string& feedback);
    // Tells the task's owner it was assigned. Throws InvalidArgument without an owner.
    Message send_task_assignment(const std::string& team, const Task& task,
                                 const std::string& assigned_by);

private:
    Context ctx_;

    Message append(const std::string& team, const std::string& recipient, Message msg);
    std::vector<Message> load(const std::string& team, const std::string& agent) const;
    void mark_read(const std::string& team, const std::string& agent,
                   const std::vector<int64_t>& ids, std::chrono::milliseconds timeout);
};

} // namespace teamfs
