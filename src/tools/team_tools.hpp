#pragma once
#include "../tool_registry.hpp"
#include "../backend.hpp"
#include "../context.hpp"
#include "../mailbox.hpp"
#include "../task_graph.hpp"
#include "../team_registry.hpp"
#include <atomic>
#include <memory>

namespace teamfs {

// Everything a boundary operation needs, built once per process.
struct Services {
    Context ctx;
    TeamRegistry teams;
    TaskGraph tasks;
    Mailbox mailbox;
    std::shared_ptr<BackendRegistry> backends;
    // Set on shutdown; wakes pending long-polls.
    std::shared_ptr<std::atomic<bool>> stopping = std::make_shared<std::atomic<bool>>(false);

    Services(const Context& c, std::shared_ptr<BackendRegistry> b)
        : ctx(c), teams(c), tasks(c), mailbox(c), backends(std::move(b)) {}
};

void register_team_tools(ToolRegistry& tools, std::shared_ptr<Services> svc);

} // namespace teamfs
