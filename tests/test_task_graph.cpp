// Task graph tests: ids, edges, transitions and cross-process creation.
#include "test_helpers.hpp"
#include "task_graph.hpp"
#include "team_registry.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <thread>

using namespace teamfs;
using namespace teamfs_test;

static TaskSpec spec(const std::string& subject, std::vector<int64_t> blocked_by = {}) {
    TaskSpec s;
    s.subject = subject;
    s.blocked_by = std::move(blocked_by);
    return s;
}

static TaskUpdate status_to(TaskStatus s) {
    TaskUpdate u;
    u.status = s;
    return u;
}

static size_t task_files(const Context& ctx, const std::string& team) {
    return ctx.store->list(ctx.tasks_dir(team)).size();
}

void test_transitions() {
    test_header("Status transitions");
    check_transition(TaskStatus::pending, TaskStatus::in_progress);
    check_transition(TaskStatus::in_progress, TaskStatus::completed);
    check_transition(TaskStatus::completed, TaskStatus::deleted);
    check_transition(TaskStatus::pending, TaskStatus::pending);
    test_pass("forward moves, deletion and no-ops allowed");

    expect_error(ErrorCode::InvalidTransition,
                 [] { check_transition(TaskStatus::pending, TaskStatus::completed); }, "skip in_progress");
    expect_error(ErrorCode::InvalidTransition,
                 [] { check_transition(TaskStatus::completed, TaskStatus::pending); }, "backward move");
    expect_error(ErrorCode::InvalidTransition,
                 [] { check_transition(TaskStatus::in_progress, TaskStatus::pending); }, "in_progress back");
    expect_error(ErrorCode::InvalidArgument, [] { parse_task_status("done"); }, "unknown status name");
}

void test_cycle_detection() {
    test_header("would_create_cycle");
    TaskMap g;
    for (int64_t id : {1, 2, 3}) g[id].id = id;
    g[1].blocks = {2};
    g[2].blocked_by = {1};
    g[2].blocks = {3};
    g[3].blocked_by = {2};

    check(would_create_cycle(g, 3, 1), "closing 1->2->3->1");
    check(would_create_cycle(g, 2, 2), "self edge");
    check(!would_create_cycle(g, 1, 3), "shortcut edge is fine");
}

void test_create(const Context& ctx) {
    test_header("create");
    TaskGraph tasks(ctx);
    Task a = tasks.create("graph", spec("first"));
    Task b = tasks.create("graph", spec("second", {a.id}));
    check(a.id == 1 && b.id == 2, "ids 1 and 2");
    check(a.status == TaskStatus::pending, "new task is pending");

    Task a2 = tasks.get("graph", a.id);
    check(a2.blocks == std::set<int64_t>({b.id}), "blocker gained the inverse edge");
    check(tasks.get("graph", b.id).blocked_by == std::set<int64_t>({a.id}), "blockedBy stored");

    auto doc = ctx.store->read(ctx.task_path("graph", b.id));
    check(doc->contains("blockedBy") && doc->contains("activeForm"), "camelCase keys on disk");

    size_t before = task_files(ctx, "graph");
    expect_error(ErrorCode::UnknownTask, [&] { tasks.create("graph", spec("orphan", {99})); },
                 "unknown dependency");
    check(task_files(ctx, "graph") == before, "no file created");
    check(tasks.create("graph", spec("third")).id == 3, "rejected create consumed no id");

    expect_error(ErrorCode::InvalidArgument, [&] { tasks.create("graph", spec("   ")); }, "blank subject");
    expect_error(ErrorCode::NotFound, [&] { tasks.create("nosuchteam", spec("x")); }, "unknown team");
    expect_error(ErrorCode::NotFound, [&] { tasks.get("graph", 42); }, "get missing task");
}

void test_cycles(const Context& ctx) {
    test_header("Cycle rejected with no write");
    TaskGraph tasks(ctx);
    Task a = tasks.create("cycles", spec("A"));
    Task b = tasks.create("cycles", spec("B", {a.id}));

    auto a_before = ctx.store->read(ctx.task_path("cycles", a.id));
    auto b_before = ctx.store->read(ctx.task_path("cycles", b.id));

    TaskUpdate u;
    u.add_blocked_by = {b.id};
    expect_error(ErrorCode::CycleDetected, [&] { tasks.update("cycles", a.id, u); }, "A blocked by B");
    check(ctx.store->read(ctx.task_path("cycles", a.id)) == a_before, "A unchanged");
    check(ctx.store->read(ctx.task_path("cycles", b.id)) == b_before, "B unchanged");

    TaskUpdate self;
    self.add_blocks = {a.id};
    expect_error(ErrorCode::CycleDetected, [&] { tasks.update("cycles", a.id, self); }, "self edge");

    TaskUpdate unknown;
    unknown.add_blocks = {77};
    expect_error(ErrorCode::UnknownTask, [&] { tasks.update("cycles", a.id, unknown); }, "edge to unknown id");

    // Removing the edge and re-adding it reversed is legal in one update.
    TaskUpdate flip;
    flip.remove_blocked_by = {a.id};
    flip.add_blocks = {a.id};
    Task flipped = tasks.update("cycles", b.id, flip);
    check(flipped.blocks == std::set<int64_t>({a.id}) && flipped.blocked_by.empty(), "edge reversed");
    check(tasks.get("cycles", a.id).blocked_by == std::set<int64_t>({b.id}), "inverse updated");
}

void test_status_updates(const Context& ctx) {
    test_header("Status updates");
    TaskGraph tasks(ctx);
    Task dep = tasks.create("status", spec("dependency"));
    Task t = tasks.create("status", spec("work", {dep.id}));

    expect_error(ErrorCode::InvalidTransition,
                 [&] { tasks.update("status", t.id, status_to(TaskStatus::in_progress)); },
                 "cannot start while blocked");
    check(tasks.get("status", t.id).status == TaskStatus::pending, "still pending");

    tasks.update("status", dep.id, status_to(TaskStatus::in_progress));
    tasks.update("status", dep.id, status_to(TaskStatus::completed));
    check(tasks.update("status", t.id, status_to(TaskStatus::in_progress)).status == TaskStatus::in_progress,
          "starts once the blocker is completed");
    tasks.update("status", t.id, status_to(TaskStatus::completed));

    expect_error(ErrorCode::InvalidTransition,
                 [&] { tasks.update("status", t.id, status_to(TaskStatus::pending)); },
                 "completed -> pending");
    check(tasks.get("status", t.id).status == TaskStatus::completed, "document unchanged");
    check(tasks.update("status", t.id, status_to(TaskStatus::completed)).status == TaskStatus::completed,
          "same status is a no-op");
}

void test_fields_and_metadata(const Context& ctx) {
    test_header("Owner, fields and metadata");
    TaskGraph tasks(ctx);
    TaskSpec s = spec("meta");
    s.metadata = {{"keep", 1}, {"drop", "x"}};
    Task t = tasks.create("fields", s);

    TaskUpdate u;
    u.owner = "alice";
    u.description = "details";
    u.metadata = {{"drop", nullptr}, {"added", true}};
    Task out = tasks.update("fields", t.id, u);
    check(out.owner == std::optional<std::string>("alice"), "owner set");
    check(out.description == "details", "description set");
    check(out.metadata == nlohmann::json({{"keep", 1}, {"added", true}}), "metadata merged, null deletes");

    TaskUpdate clear;
    clear.owner = "";
    check(!tasks.update("fields", t.id, clear).owner, "empty owner clears");
}

void test_delete(const Context& ctx) {
    test_header("Delete");
    TaskGraph tasks(ctx);
    Task a = tasks.create("del", spec("A"));
    Task b = tasks.create("del", spec("B", {a.id}));
    Task c = tasks.create("del", spec("C", {b.id}));

    tasks.update("del", b.id, status_to(TaskStatus::deleted));
    check(!ctx.store->exists(ctx.task_path("del", b.id)), "document removed");
    check(tasks.get("del", a.id).blocks.empty(), "stripped from blocker");
    check(tasks.get("del", c.id).blocked_by.empty(), "stripped from dependent");
    check(tasks.list("del").size() == 2, "two tasks left");
    check(tasks.create("del", spec("D")).id == c.id + 1, "deleted id not reissued");

    expect_error(ErrorCode::NotFound, [&] { tasks.update("del", b.id, status_to(TaskStatus::pending)); },
                 "update deleted task");
}

void test_reset_owner(const Context& ctx) {
    test_header("reset_owner_tasks");
    TaskGraph tasks(ctx);
    TaskSpec s = spec("one");
    s.owner = "bob";
    Task one = tasks.create("owners", s);
    s.subject = "two";
    Task two = tasks.create("owners", s);
    s.subject = "three";
    Task three = tasks.create("owners", s);
    s.owner = "carol";
    s.subject = "four";
    Task four = tasks.create("owners", s);

    tasks.update("owners", one.id, status_to(TaskStatus::in_progress));
    tasks.update("owners", three.id, status_to(TaskStatus::in_progress));
    tasks.update("owners", three.id, status_to(TaskStatus::completed));

    auto changed = tasks.reset_owner_tasks("owners", "bob");
    check(changed == std::vector<int64_t>({one.id, two.id}), "open tasks of bob reset");
    Task r1 = tasks.get("owners", one.id);
    check(!r1.owner && r1.status == TaskStatus::pending, "in_progress back to pending, owner cleared");
    check(tasks.get("owners", three.id).owner == std::optional<std::string>("bob"), "completed task kept");
    check(tasks.get("owners", four.id).owner == std::optional<std::string>("carol"), "other owner untouched");
}

void test_id_allocation_processes(const Context& ctx) {
    test_header("100 ids from 10 processes");
    std::string out_dir = ctx.root + "/ids";
    fs::create_directories(out_dir);

    bool ok = run_children(10, [&](int i) {
        TaskGraph tasks(ctx);
        std::ofstream out(out_dir + "/" + std::to_string(i) + ".txt");
        for (int n = 0; n < 10; n++) out << tasks.allocate_id("alloc") << "\n";
    });
    check(ok, "children finished");

    std::set<int64_t> ids;
    size_t total = 0;
    for (int i = 0; i < 10; i++) {
        std::ifstream in(out_dir + "/" + std::to_string(i) + ".txt");
        int64_t id;
        while (in >> id) {
            ids.insert(id);
            total++;
        }
    }
    check(total == 100, "100 ids handed out");
    check(ids.size() == 100, "all unique");
    check(*ids.begin() == 1 && *ids.rbegin() == 100, "dense from 1 to 100");
}

void test_create_processes(const Context& ctx) {
    test_header("Concurrent creates with a shared dependency");
    TaskGraph tasks(ctx);
    Task root_task = tasks.create("race", spec("root"));

    bool ok = run_children(4, [&](int) {
        TaskGraph local(ctx);
        for (int n = 0; n < 5; n++) local.create("race", spec("child", {root_task.id}));
    });
    check(ok, "children finished");

    auto all = tasks.list("race");
    check(all.size() == 21, "21 tasks");
    Task root_after = tasks.get("race", root_task.id);
    check(root_after.blocks.size() == 20, "root lists every dependent");
    for (auto& t : all) {
        if (t.id == root_task.id) continue;
        if (t.blocked_by != std::set<int64_t>({root_task.id})) test_fail("dependent missing its edge");
    }
    test_pass("inverse edges consistent");
}

void test_owner_membership(const Context& ctx) {
    test_header("Owner must be a team member");
    TaskGraph tasks(ctx);
    size_t before = task_files(ctx, "fields");

    TaskSpec s = spec("unassignable");
    s.owner = "stranger";
    expect_error(ErrorCode::NotFound, [&] { tasks.create("fields", s); }, "create with non-member owner");
    check(task_files(ctx, "fields") == before, "no task written");

    Task t = tasks.create("fields", spec("assignable"));
    TaskUpdate u;
    u.owner = "stranger";
    u.subject = "renamed";
    expect_error(ErrorCode::NotFound, [&] { tasks.update("fields", t.id, u); }, "update to non-member owner");
    Task after = tasks.get("fields", t.id);
    check(!after.owner && after.subject == "assignable", "nothing applied");
}

void test_dangling_edges(const Context& ctx) {
    test_header("Edges to tasks whose document is gone");
    TaskGraph tasks(ctx);
    Task a = tasks.create("dangling", spec("A"));
    Task b = tasks.create("dangling", spec("B", {a.id}));
    Task c = tasks.create("dangling", spec("C", {b.id}));
    // Leaves B and C pointing at a missing task, as an interrupted commit would.
    ctx.store->remove(ctx.task_path("dangling", a.id));

    Task started = tasks.update("dangling", b.id, status_to(TaskStatus::in_progress));
    check(started.status == TaskStatus::in_progress, "missing blocker does not block");

    TaskUpdate cleanup;
    cleanup.remove_blocked_by = {a.id};
    check(tasks.update("dangling", b.id, cleanup).blocked_by.empty(), "stale edge can be removed");

    TaskUpdate relink;
    relink.add_blocked_by = {a.id};
    expect_error(ErrorCode::UnknownTask, [&] { tasks.update("dangling", c.id, relink); },
                 "new edge to a missing task");

    ctx.store->remove(ctx.task_path("dangling", b.id));
    tasks.update("dangling", c.id, status_to(TaskStatus::deleted));
    check(!ctx.store->exists(ctx.task_path("dangling", c.id)), "task with a stale edge deleted");
    check(!ctx.store->exists(ctx.task_path("dangling", 0)), "no placeholder document written");
    check(tasks.list("dangling").empty(), "graph empty");
}

void test_team_deleted_while_waiting(const Context& ctx) {
    test_header("Create waiting on the lock of a deleted team");
    TaskGraph tasks(ctx);
    auto held = ctx.store->lock(ctx.task_lock_path("vanishing"), ctx.lock_timeout);

    bool rejected = false;
    std::thread waiter([&] {
        try {
            tasks.create("vanishing", spec("late"));
        } catch (const StoreError& e) {
            rejected = e.code() == ErrorCode::NotFound;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ctx.store->remove(ctx.team_config_path("vanishing"));
    held.reset();
    waiter.join();

    check(rejected, "NotFound once the lock is granted");
    check(task_files(ctx, "vanishing") == 0, "no task written");
}

int main() {
    std::cout << "TaskGraph Tests" << std::endl;
    TempRoot root("tasks");
    Context ctx = make_context(root.path());

    TeamRegistry teams(ctx);
    for (auto name : {"graph", "cycles", "status", "fields", "del", "owners", "race", "dangling", "vanishing"})
        teams.create(name, "");
    std::vector<std::pair<std::string, std::string>> owners = {
        {"fields", "alice"}, {"owners", "bob"}, {"owners", "carol"},
    };
    for (auto& [team, name] : owners) {
        TeamMember m;
        m.name = name;
        teams.add_member(team, m);
    }

    test_transitions();
    test_cycle_detection();
    test_create(ctx);
    test_cycles(ctx);
    test_status_updates(ctx);
    test_fields_and_metadata(ctx);
    test_delete(ctx);
    test_reset_owner(ctx);
    test_owner_membership(ctx);
    test_dangling_edges(ctx);
    // Forking tests run before any thread is started.
    test_id_allocation_processes(ctx);
    test_create_processes(ctx);
    test_team_deleted_while_waiting(ctx);

    std::cout << "\nAll TaskGraph tests passed." << std::endl;
    return 0;
}
