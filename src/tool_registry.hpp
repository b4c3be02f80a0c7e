#pragma once
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace teamfs {

// Takes the call arguments, returns the result. Failures throw StoreError.
using ToolFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;  // JSON schema of the argument object
    ToolFunction func;
};

// Named operations callable with a JSON argument object. Tools are registered
// once at startup; afterwards every member is const and may be called from
// any number of threads.
class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        if (def.name.empty() || !def.func) {
            throw StoreError(ErrorCode::InvalidArgument, "tool needs a name and a function");
        }
        std::string name = def.name;
        if (!tools_.emplace(name, std::move(def)).second) {
            throw StoreError(ErrorCode::AlreadyExists, "tool '" + name + "' registered twice");
        }
    }

    nlohmann::json execute(const std::string& name, const nlohmann::json& args) const {
        const ToolDef& def = find(name);
        if (!args.is_object()) {
            throw StoreError(ErrorCode::InvalidArgument, "arguments for " + name + " must be an object");
        }
        return def.func(args);
    }

    // [{name, description, parameters}] ordered by name, for GET /tools.
    nlohmann::json catalog() const {
        nlohmann::json out = nlohmann::json::array();
        for (auto& [name, def] : tools_) {
            out.push_back({{"name", name}, {"description", def.description}, {"parameters", def.parameters}});
        }
        return out;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(tools_.size());
        for (auto& entry : tools_) out.push_back(entry.first);
        return out;
    }

    size_t size() const { return tools_.size(); }

private:
    const ToolDef& find(const std::string& name) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) throw StoreError(ErrorCode::NotFound, "unknown tool: " + name);
        return it->second;
    }

    std::map<std::string, ToolDef> tools_;
};

} // namespace teamfs
