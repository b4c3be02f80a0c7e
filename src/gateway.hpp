#pragma once
#include "config.hpp"
#include "tool_registry.hpp"
#include "tools/team_tools.hpp"
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

namespace teamfs {

// HTTP front end for the tool registry:
//   GET  /health          liveness
//   GET  /tools           tool specs
//   POST /tools/<name>    JSON arguments in, {"result": ...} or {"error": ...} out
class Gateway {
public:
    Gateway(const HTTPConfig& cfg, const ToolRegistry& tools, std::shared_ptr<Services> svc)
        : cfg_(cfg), tools_(tools), svc_(std::move(svc)) {}
    ~Gateway() { stop(); }

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Binds and serves on a background thread. Returns false if the bind failed.
    bool start(const std::string& host, int port);
    void stop();

private:
    HTTPConfig cfg_;
    const ToolRegistry& tools_;
    std::shared_ptr<Services> svc_;
    httplib::Server server_;
    std::thread thread_;

    bool check_auth(const httplib::Request& req, httplib::Response& res) const;
};

// `teamfs serve`: runs the gateway until SIGINT/SIGTERM.
int cmd_serve(const Config& cfg, const std::string& host, int port);

} // namespace teamfs
