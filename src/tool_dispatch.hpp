#pragma once
#include "errors.hpp"
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace teamfs {

// HTTP status for a store error: 404, 409, 400, 423 (lock timeout) or 500.
int http_status_for(ErrorCode code);

// {"error": {"code": ..., "message": ..., "retryable": ...}}
nlohmann::json error_body(ErrorCode code, const std::string& message);

struct ToolResponse {
    int status = 200;
    nlohmann::json body;
};

// Runs one tool and renders the outcome, success or failure, as a response.
ToolResponse dispatch_tool(const ToolRegistry& tools, const std::string& name,
                           const nlohmann::json& args);

} // namespace teamfs
