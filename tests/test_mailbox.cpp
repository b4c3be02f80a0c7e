// Mailbox tests: delivery, reads, long-poll and protocol messages.
#include "test_helpers.hpp"
#include "mailbox.hpp"
#include "team_registry.hpp"
#include <thread>

using namespace teamfs;
using namespace teamfs_test;

static Message text_from(const std::string& from, const std::string& text) {
    Message m;
    m.from = from;
    m.text = text;
    return m;
}

static void make_team(const Context& ctx, const std::string& team,
                      const std::vector<std::string>& members) {
    TeamRegistry teams(ctx);
    teams.create(team, "");
    for (auto& name : members) {
        TeamMember m;
        m.name = name;
        teams.add_member(team, m);
    }
}

void test_send(const Context& ctx) {
    test_header("send");
    make_team(ctx, "direct", {"alice"});
    Mailbox box(ctx);

    Message first = box.send("direct", "alice", text_from("team-lead", "hello"));
    Message second = box.send("direct", "alice", text_from("team-lead", "again"));
    check(first.id == 1 && second.id == 2, "per-inbox ids 1, 2");
    check(first.to == std::optional<std::string>("alice") && !first.read, "recipient set, unread");
    check(!first.timestamp.empty() && first.timestamp.back() == 'Z', "UTC timestamp");

    auto doc = ctx.store->read(ctx.inbox_path("direct", "alice"));
    check(doc && doc->is_array() && doc->size() == 2, "inbox document is an array of 2");

    expect_error(ErrorCode::NotFound, [&] { box.send("direct", "mallory", text_from("team-lead", "x")); },
                 "recipient outside the team");
    expect_error(ErrorCode::InvalidArgument, [&] { box.send("direct", "alice", text_from("team-lead", "")); },
                 "empty content");
    expect_error(ErrorCode::NotFound, [&] { box.send("nowhere", "alice", text_from("team-lead", "x")); },
                 "unknown team");
    expect_error(ErrorCode::InvalidName, [&] { box.send("direct", "../x", text_from("team-lead", "x")); },
                 "path-like recipient");
    check(parse_message_type("message") == MessageType::direct, "'message' is an alias of direct");
}

void test_broadcast(const Context& ctx) {
    test_header("broadcast");
    make_team(ctx, "bcast", {"a", "b", "c"});
    Mailbox box(ctx);

    // Give each inbox a different history first.
    box.send("bcast", "b", text_from("team-lead", "pre"));
    box.send("bcast", "c", text_from("team-lead", "pre"));
    box.send("bcast", "c", text_from("team-lead", "pre"));

    auto sent = box.broadcast("bcast", text_from("team-lead", "all hands"));
    check(sent.size() == 3, "three recipients, sender excluded");

    int64_t expected[] = {1, 2, 3};
    const char* names[] = {"a", "b", "c"};
    for (int i = 0; i < 3; i++) {
        auto inbox = box.read("bcast", names[i]);
        int copies = 0;
        for (auto& m : inbox) {
            if (m.type == MessageType::broadcast) {
                copies++;
                if (m.id != expected[i]) test_fail(std::string("wrong id in ") + names[i]);
                if (m.to) test_fail("broadcast carries a recipient");
            }
        }
        if (copies != 1) test_fail(std::string("expected one copy in ") + names[i]);
        if (inbox.back().id <= inbox.front().id && inbox.size() > 1) test_fail("ids not increasing");
    }
    test_pass("one copy per inbox, next id in each");
    check(box.read("bcast", "team-lead").empty(), "sender's inbox untouched");

    auto from_member = box.broadcast("bcast", text_from("a", "from a"));
    check(from_member.size() == 3, "member broadcast reaches lead and the other two");
}

void test_read(const Context& ctx) {
    test_header("read");
    make_team(ctx, "reads", {"r"});
    Mailbox box(ctx);
    box.send("reads", "r", text_from("team-lead", "one"));
    box.send("reads", "r", text_from("team-lead", "two"));

    auto peek = box.read("reads", "r", false, false);
    check(peek.size() == 2 && !peek[0].read, "plain read leaves messages unread");

    auto marked = box.read("reads", "r", true, true);
    check(marked.size() == 2 && marked[0].read, "returned as read");
    check(box.read("reads", "r", true, false).empty(), "nothing unread afterwards");
    check(box.read("reads", "r").size() == 2, "messages are never removed");
    check(box.read("reads", "nobody").empty(), "missing inbox reads empty");
}

void test_poll_timeout(const Context& ctx) {
    test_header("poll times out");
    make_team(ctx, "polling", {"p"});
    Mailbox box(ctx);
    for (int i = 0; i < 5; i++) box.send("polling", "p", text_from("team-lead", "m"));

    PollRequest req;
    req.since_id = 5;
    req.max_wait = std::chrono::milliseconds(2000);
    auto start = std::chrono::steady_clock::now();
    auto got = box.poll("polling", "p", req);
    long took = elapsed_ms(start);
    check(got.empty(), "empty result");
    check(took >= 1950 && took < 3000, "returned after ~2s (" + std::to_string(took) + "ms)");

    req.since_id = 3;
    start = std::chrono::steady_clock::now();
    got = box.poll("polling", "p", req);
    check(got.size() == 2 && got[0].id == 4, "existing newer messages returned at once");
    check(elapsed_ms(start) < 500, "no wait when messages exist");
}

void test_poll_wakeup(const Context& ctx) {
    test_header("poll wakes on an append from another process");
    Mailbox box(ctx);

    pid_t pid = fork();
    if (pid == 0) {
        int rc = 0;
        try {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            Mailbox writer(ctx);
            writer.send("polling", "p", text_from("team-lead", "sixth"));
        } catch (const std::exception&) {
            rc = 1;
        }
        _exit(rc);
    }

    PollRequest req;
    req.since_id = 5;
    req.max_wait = std::chrono::milliseconds(10000);
    auto start = std::chrono::steady_clock::now();
    auto got = box.poll("polling", "p", req);
    long took = elapsed_ms(start);
    check(got.size() == 1 && got[0].id == 6 && got[0].text == "sixth", "message 6 returned");
    check(took < 2000, "returned promptly (" + std::to_string(took) + "ms)");

    int status = 0;
    waitpid(pid, &status, 0);
    check(WIFEXITED(status) && WEXITSTATUS(status) == 0, "writer exited cleanly");
}

void test_poll_async_cancel(const Context& ctx) {
    test_header("poll_async and cancellation");
    Mailbox box(ctx);
    PollRequest req;
    req.since_id = 100;
    req.max_wait = std::chrono::milliseconds(20000);

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto start = std::chrono::steady_clock::now();
    auto pending = box.poll_async("polling", "p", req, cancel);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancel->store(true);
    auto got = pending.get();
    check(got.empty(), "cancelled poll returns empty");
    check(elapsed_ms(start) < 2000, "cancellation is prompt");

    req.since_id = 6;
    req.unread_only = true;
    req.mark_as_read = true;
    auto waiter = box.poll_async("polling", "p", req);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    box.send("polling", "p", text_from("team-lead", "seventh"));
    got = waiter.get();
    check(got.size() == 1 && got[0].id == 7 && got[0].read, "async poll delivers and marks read");
    auto stored = box.read("polling", "p");
    check(stored.back().read, "read flag persisted");
}

void test_protocol(const Context& ctx) {
    test_header("Protocol messages");
    make_team(ctx, "proto", {"worker"});
    Mailbox box(ctx);

    std::string request_id = box.send_shutdown_request("proto", "worker", "done for today");
    check(request_id.rfind("shutdown-", 0) == 0, "request id prefix");
    check(request_id.size() > 16 && request_id.substr(request_id.size() - 7) == "@worker", "request id suffix");
    auto inbox = box.read("proto", "worker");
    check(inbox.size() == 1 && inbox[0].type == MessageType::shutdown_request, "request delivered");
    auto body = nlohmann::json::parse(inbox[0].text);
    check(body["requestId"] == request_id && body["reason"] == "done for today", "request payload");
    expect_error(ErrorCode::InvalidArgument, [&] { box.send_shutdown_request("proto", "team-lead", ""); },
                 "lead cannot be asked to shut down");

    Message approved = box.send_shutdown_response("proto", "worker", request_id, true, "");
    check(approved.to == std::optional<std::string>("team-lead"), "response goes to the lead");
    check(approved.approve == std::optional<bool>(true) && approved.request_id == request_id,
          "approval carries the request id");
    check(nlohmann::json::parse(approved.text)["type"] == "shutdown_approved", "approval payload");

    Message rejected = box.send_shutdown_response("proto", "worker", request_id, false, "");
    check(rejected.text == "Shutdown rejected", "default rejection reason");

    Message plan = box.send_plan_approval_response("proto", "team-lead", "worker", "plan-1", false, "more tests");
    check(plan.type == MessageType::plan_approval_response && plan.text == "more tests", "plan rejection");

    Task task;
    task.id = 12;
    task.subject = "write docs";
    expect_error(ErrorCode::InvalidArgument, [&] { box.send_task_assignment("proto", task, "team-lead"); },
                 "assignment without owner");
    task.owner = "worker";
    Message assigned = box.send_task_assignment("proto", task, "team-lead");
    auto payload = nlohmann::json::parse(assigned.text);
    check(payload["type"] == "task_assignment" && payload["taskId"] == 12, "assignment payload");
}

void test_team_deleted_while_waiting(const Context& ctx) {
    test_header("send waiting on the lock of a deleted team");
    make_team(ctx, "fading", {"x"});
    Mailbox box(ctx);
    auto held = ctx.store->lock(ctx.inbox_lock_path("fading"), ctx.lock_timeout);

    bool rejected = false;
    std::thread sender([&] {
        try {
            box.send("fading", "x", text_from("team-lead", "too late"));
        } catch (const StoreError& e) {
            rejected = e.code() == ErrorCode::NotFound;
        }
    });
    // The sender has passed its membership check and is waiting for the lock.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ctx.store->remove(ctx.team_config_path("fading"));
    held.reset();
    sender.join();

    check(rejected, "NotFound once the lock is granted");
    check(!ctx.store->exists(ctx.inbox_path("fading", "x")), "no inbox written");
}

int main() {
    std::cout << "Mailbox Tests" << std::endl;
    TempRoot root("mail");
    Context ctx = make_context(root.path());

    test_send(ctx);
    test_broadcast(ctx);
    test_read(ctx);
    test_poll_timeout(ctx);
    test_poll_wakeup(ctx);
    test_poll_async_cancel(ctx);
    test_protocol(ctx);
    test_team_deleted_while_waiting(ctx);

    std::cout << "\nAll Mailbox tests passed." << std::endl;
    return 0;
}
