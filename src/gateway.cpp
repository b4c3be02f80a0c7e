#include "gateway.hpp"
#include "tool_dispatch.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>

namespace teamfs {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

bool Gateway::check_auth(const httplib::Request& req, httplib::Response& res) const {
    if (cfg_.api_key.empty()) return true;

    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + cfg_.api_key) {
        res.status = 401;
        res.set_content(R"({"error":{"code":"Unauthorized","message":"unauthorized"}})", "application/json");
        return false;
    }
    return true;
}

bool Gateway::start(const std::string& host, int port) {
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server_.Get("/tools", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        res.set_content(tools_.catalog().dump(), "application/json");
    });

    server_.Post(R"(/tools/([A-Za-z0-9_]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;

        nlohmann::json args = nlohmann::json::object();
        if (!req.body.empty()) {
            try {
                args = nlohmann::json::parse(req.body);
            } catch (const nlohmann::json::parse_error& e) {
                res.status = 400;
                res.set_content(error_body(ErrorCode::InvalidArgument,
                                           std::string("invalid JSON in request body: ") + e.what()).dump(),
                                "application/json");
                return;
            }
        }

        ToolResponse out = dispatch_tool(tools_, req.matches[1].str(), args);
        res.status = out.status;
        res.set_content(out.body.dump(), "application/json");
    });

    // Anything that escaped dispatch_tool.
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[gateway] Unhandled exception in " << req.path << ": " << msg << "\n";
        res.status = 500;
        res.set_content(error_body(ErrorCode::IOError, msg).dump(), "application/json");
    });

    if (!server_.bind_to_port(host, port)) {
        std::cerr << "[gateway] Failed to bind " << host << ":" << port << "\n";
        return false;
    }
    thread_ = std::thread([this, host, port]() {
        std::cerr << "[gateway] Listening on " << host << ":" << port << "\n";
        server_.listen_after_bind();
    });
    return true;
}

void Gateway::stop() {
    // Wake long-polls so worker threads can finish.
    if (svc_) svc_->stopping->store(true);
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

int cmd_serve(const Config& cfg, const std::string& host, int port) {
    Context ctx = Context::from_config(cfg);
    auto backends = std::make_shared<BackendRegistry>(BackendRegistry::from_config(cfg));
    auto svc = std::make_shared<Services>(ctx, backends);

    ToolRegistry tools;
    register_team_tools(tools, svc);

    Gateway gateway(cfg.http, tools, svc);
    if (!gateway.start(host, port)) return 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cerr << "[gateway] Ready. Root: " << ctx.root << ". Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    gateway.stop();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace teamfs
