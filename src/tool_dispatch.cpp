#include "tool_dispatch.hpp"
#include <iostream>

namespace teamfs {

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::AlreadyExists:
        case ErrorCode::TeammatesActive:
        case ErrorCode::InvalidTransition:
        case ErrorCode::CycleDetected:
            return 409;
        case ErrorCode::InvalidName:
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnknownTask:
            return 400;
        case ErrorCode::LockTimeout:
            return 423;
        case ErrorCode::IOError:
            return 500;
    }
    return 500;
}

nlohmann::json error_body(ErrorCode code, const std::string& message) {
    return {{"error", {
        {"code", error_code_name(code)},
        {"message", message},
        {"retryable", code == ErrorCode::LockTimeout},
    }}};
}

ToolResponse dispatch_tool(const ToolRegistry& tools, const std::string& name,
                           const nlohmann::json& args) {
    ToolResponse res;
    try {
        res.body = {{"result", tools.execute(name, args)}};
    } catch (const StoreError& e) {
        std::cerr << "[gateway] " << name << " failed: " << e.code_name() << ": " << e.what() << "\n";
        res.status = http_status_for(e.code());
        res.body = error_body(e.code(), e.what());
    } catch (const nlohmann::json::exception& e) {
        // Arguments of the wrong JSON type.
        std::cerr << "[gateway] " << name << " bad arguments: " << e.what() << "\n";
        res.status = 400;
        res.body = error_body(ErrorCode::InvalidArgument, e.what());
    }
    return res;
}

} // namespace teamfs
