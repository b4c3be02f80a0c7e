#include "cli.hpp"
#include "errors.hpp"
#include "tool_registry.hpp"
#include "tools/team_tools.hpp"
#include <iostream>
#include <map>
#include <set>

namespace teamfs {

using json = nlohmann::json;

namespace {

// Positional words plus "--key value" options; keys in `flags` take no value.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    bool has(const std::string& key) const { return options.count(key) || flags.count(key); }
    std::string get(const std::string& key, const std::string& def = "") const {
        auto it = options.find(key);
        return it == options.end() ? def : it->second;
    }
};

ParsedArgs parse_args(const std::vector<std::string>& args, size_t start,
                      const std::set<std::string>& flag_names) {
    ParsedArgs p;
    for (size_t i = start; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            std::string key = a.substr(2);
            if (flag_names.count(key)) {
                p.flags.insert(key);
            } else if (i + 1 < args.size()) {
                p.options[key] = args[++i];
            } else {
                throw StoreError(ErrorCode::InvalidArgument, "option " + a + " needs a value");
            }
        } else {
            p.positional.push_back(a);
        }
    }
    return p;
}

const std::string& positional(const ParsedArgs& p, size_t i, const char* usage) {
    if (i >= p.positional.size()) throw StoreError(ErrorCode::InvalidArgument, std::string("usage: ") + usage);
    return p.positional[i];
}

int64_t parse_int(const std::string& s, const std::string& what) {
    if (s.empty() || s.size() > 18 || s.find_first_not_of("0123456789") != std::string::npos)
        throw StoreError(ErrorCode::InvalidArgument, "invalid " + what + " '" + s + "'");
    return std::stoll(s);
}

// "1,2,3" -> [1,2,3]
json parse_id_list(const std::string& s) {
    json ids = json::array();
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string part = s.substr(start, comma - start);
        if (!part.empty()) ids.push_back(parse_int(part, "task id"));
        start = comma + 1;
    }
    return ids;
}

void copy_option(const ParsedArgs& p, json& args, const std::string& opt, const std::string& key) {
    if (p.options.count(opt)) args[key] = p.get(opt);
}

void copy_id_list(const ParsedArgs& p, json& args, const std::string& opt, const std::string& key) {
    if (p.options.count(opt)) args[key] = parse_id_list(p.get(opt));
}

void print_usage() {
    std::cout << "Usage: teamfs <command> [options]\n\n"
              << "Commands:\n"
              << "  team create <team> [--description D] [--session S]\n"
              << "  team delete <team>\n"
              << "  team show <team>\n"
              << "  team list\n"
              << "  member add <team> <name> [--prompt P] [--model M] [--type T]\n"
              << "                           [--backend B] [--cwd DIR]\n"
              << "  member remove <team> <name> [--kill]\n"
              << "  task create <team> <subject> [--description D] [--active-form A]\n"
              << "                               [--owner O] [--blocked-by 1,2] [--blocks 3]\n"
              << "  task update <team> <id> [--status S] [--owner O] [--subject S]\n"
              << "                          [--description D] [--active-form A]\n"
              << "                          [--add-blocks IDS] [--add-blocked-by IDS]\n"
              << "                          [--remove-blocks IDS] [--remove-blocked-by IDS]\n"
              << "                          [--meta key=value ...]\n"
              << "  task list <team>\n"
              << "  task get <team> <id>\n"
              << "  send <team> <recipient|*> <text> [--summary S] [--from NAME]\n"
              << "  inbox read <team> <agent> [--unread] [--keep-unread]\n"
              << "  inbox poll <team> <agent> [--since ID] [--timeout MS]\n"
              << "  backends\n"
              << "  serve [--host H] [--port P]\n"
              << "  config [--init]\n";
}

json run_team(Services& svc, const ToolRegistry& tools, const std::vector<std::string>& args) {
    ParsedArgs p = parse_args(args, 1, {});
    const std::string& sub = positional(p, 0, "team create|delete|show|list");
    if (sub == "list") {
        json arr = json::array();
        for (auto& name : svc.teams.list()) arr.push_back(name);
        return arr;
    }
    json a = {{"team_name", positional(p, 1, "team <create|delete|show> <team>")}};
    if (sub == "create") {
        copy_option(p, a, "description", "description");
        copy_option(p, a, "session", "session_id");
        return tools.execute("team_create", a);
    }
    if (sub == "delete") return tools.execute("team_delete", a);
    if (sub == "show") return tools.execute("read_config", a);
    throw StoreError(ErrorCode::InvalidArgument, "unknown team subcommand: " + sub);
}

json run_member(const ToolRegistry& tools, const std::vector<std::string>& args) {
    ParsedArgs p = parse_args(args, 1, {"kill", "plan-mode"});
    const std::string& sub = positional(p, 0, "member add|remove <team> <name>");
    json a = {{"team_name", positional(p, 1, "member <add|remove> <team> <name>")},
              {"name", positional(p, 2, "member <add|remove> <team> <name>")}};
    if (sub == "add") {
        copy_option(p, a, "prompt", "prompt");
        copy_option(p, a, "model", "model");
        copy_option(p, a, "type", "agent_type");
        copy_option(p, a, "backend", "backend");
        copy_option(p, a, "cwd", "cwd");
        if (p.flags.count("plan-mode")) a["plan_mode_required"] = true;
        return tools.execute("add_member", a);
    }
    if (sub == "remove") {
        if (p.flags.count("kill")) a["kill"] = true;
        return tools.execute("remove_member", a);
    }
    throw StoreError(ErrorCode::InvalidArgument, "unknown member subcommand: " + sub);
}

json run_task(const ToolRegistry& tools, const std::vector<std::string>& args) {
    ParsedArgs p = parse_args(args, 1, {});
    const std::string& sub = positional(p, 0, "task create|update|list|get");
    json a = {{"team_name", positional(p, 1, "task <create|update|list|get> <team> ...")}};

    if (sub == "list") return tools.execute("task_list", a);
    if (sub == "get") {
        a["task_id"] = parse_int(positional(p, 2, "task get <team> <id>"), "task id");
        return tools.execute("task_get", a);
    }
    if (sub == "create") {
        a["subject"] = positional(p, 2, "task create <team> <subject>");
        copy_option(p, a, "description", "description");
        copy_option(p, a, "active-form", "active_form");
        copy_option(p, a, "owner", "owner");
        copy_id_list(p, a, "blocked-by", "blocked_by");
        copy_id_list(p, a, "blocks", "blocks");
        return tools.execute("task_create", a);
    }
    if (sub == "update") {
        a["task_id"] = parse_int(positional(p, 2, "task update <team> <id>"), "task id");
        copy_option(p, a, "status", "status");
        copy_option(p, a, "owner", "owner");
        copy_option(p, a, "subject", "subject");
        copy_option(p, a, "description", "description");
        copy_option(p, a, "active-form", "active_form");
        copy_id_list(p, a, "add-blocks", "add_blocks");
        copy_id_list(p, a, "add-blocked-by", "add_blocked_by");
        copy_id_list(p, a, "remove-blocks", "remove_blocks");
        copy_id_list(p, a, "remove-blocked-by", "remove_blocked_by");
        if (p.options.count("meta")) {
            // key=value sets a string, bare key deletes it.
            std::string kv = p.get("meta");
            auto eq = kv.find('=');
            json meta = json::object();
            if (eq == std::string::npos) meta[kv] = nullptr;
            else meta[kv.substr(0, eq)] = kv.substr(eq + 1);
            a["metadata"] = meta;
        }
        return tools.execute("task_update", a);
    }
    throw StoreError(ErrorCode::InvalidArgument, "unknown task subcommand: " + sub);
}

json run_send(const ToolRegistry& tools, const std::vector<std::string>& args) {
    ParsedArgs p = parse_args(args, 0, {});
    const char* usage = "send <team> <recipient|*> <text>";
    std::string recipient = positional(p, 1, usage);
    json a = {{"team_name", positional(p, 0, usage)},
              {"content", positional(p, 2, usage)},
              {"summary", p.get("summary")},
              {"sender", p.get("from", "team-lead")}};
    if (recipient == "*") {
        a["type"] = "broadcast";
    } else {
        a["type"] = "message";
        a["recipient"] = recipient;
    }
    return tools.execute("send_message", a);
}

json run_inbox(const ToolRegistry& tools, const std::vector<std::string>& args) {
    ParsedArgs p = parse_args(args, 1, {"unread", "keep-unread"});
    const std::string& sub = positional(p, 0, "inbox read|poll <team> <agent>");
    json a = {{"team_name", positional(p, 1, "inbox <read|poll> <team> <agent>")},
              {"agent_name", positional(p, 2, "inbox <read|poll> <team> <agent>")}};
    if (sub == "read") {
        a["unread_only"] = p.flags.count("unread") > 0;
        a["mark_as_read"] = p.flags.count("keep-unread") == 0;
        return tools.execute("read_inbox", a);
    }
    if (sub == "poll") {
        if (p.options.count("since")) a["since_id"] = parse_int(p.get("since"), "message id");
        if (p.options.count("timeout")) a["timeout_ms"] = parse_int(p.get("timeout"), "timeout");
        return tools.execute("poll_inbox", a);
    }
    throw StoreError(ErrorCode::InvalidArgument, "unknown inbox subcommand: " + sub);
}

} // namespace

int run_cli(const Config& cfg, const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    try {
        Context ctx = Context::from_config(cfg);
        auto backends = std::make_shared<BackendRegistry>(BackendRegistry::from_config(cfg));
        auto svc = std::make_shared<Services>(ctx, backends);
        ToolRegistry tools;
        register_team_tools(tools, svc);

        json out;
        if (cmd == "team") out = run_team(*svc, tools, args);
        else if (cmd == "member") out = run_member(tools, args);
        else if (cmd == "task") out = run_task(tools, args);
        else if (cmd == "send") out = run_send(tools, args);
        else if (cmd == "inbox") out = run_inbox(tools, args);
        else if (cmd == "backends") out = tools.execute("list_backends", json::object());
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    } catch (const StoreError& e) {
        std::cerr << "[error] " << e.code_name() << ": " << e.what() << "\n";
        return e.retryable() ? 2 : 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[error] " << error_code_name(ErrorCode::InvalidArgument) << ": " << e.what() << "\n";
        return 1;
    }
}

} // namespace teamfs
