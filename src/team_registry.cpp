#include "team_registry.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

namespace teamfs {

// ── Helpers ─────────────────────────────────────────────────────────

bool is_valid_name(const std::string& name) {
    if (name.empty() || name.size() > kMaxNameLength) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

void validate_name(const std::string& name, const std::string& what) {
    if (name.size() > kMaxNameLength) {
        throw StoreError(ErrorCode::InvalidName,
                         what + " name too long (" + std::to_string(name.size()) +
                         " chars, max " + std::to_string(kMaxNameLength) + ")");
    }
    if (!is_valid_name(name)) {
        throw StoreError(ErrorCode::InvalidName,
                         "invalid " + what + " name '" + name +
                         "': use only letters, numbers, hyphens, underscores");
    }
}

std::string color_for_index(size_t n) {
    static const char* palette[] = {
        "blue", "green", "yellow", "purple", "orange", "pink", "cyan", "red",
    };
    return palette[n % (sizeof(palette) / sizeof(palette[0]))];
}

const char* member_status_name(MemberStatus s) {
    switch (s) {
        case MemberStatus::alive: return "alive";
        case MemberStatus::dead:  return "dead";
        default:                  return "unknown";
    }
}

MemberStatus parse_member_status(const std::string& s) {
    if (s == "alive") return MemberStatus::alive;
    if (s == "dead") return MemberStatus::dead;
    return MemberStatus::unknown;
}

// ── JSON ────────────────────────────────────────────────────────────

nlohmann::json TeamMember::to_json() const {
    nlohmann::json j = {
        {"agentId", agent_id}, {"name", name}, {"agentType", agent_type},
        {"model", model}, {"joinedAt", joined_at}, {"cwd", cwd},
        {"processHandle", process_handle}, {"status", member_status_name(status)},
    };
    if (!backend_type.empty()) j["backendType"] = backend_type;
    if (!color.empty()) j["color"] = color;
    if (!prompt.empty()) j["prompt"] = prompt;
    if (plan_mode_required) j["planModeRequired"] = true;
    return j;
}

TeamMember TeamMember::from_json(const nlohmann::json& j) {
    TeamMember m;
    m.agent_id = j.value("agentId", "");
    m.name = j.value("name", "");
    m.agent_type = j.value("agentType", "general-purpose");
    m.model = j.value("model", "");
    m.backend_type = j.value("backendType", "");
    m.color = j.value("color", "");
    m.prompt = j.value("prompt", "");
    m.cwd = j.value("cwd", "");
    m.process_handle = j.value("processHandle", "");
    m.joined_at = j.value("joinedAt", int64_t{0});
    m.plan_mode_required = j.value("planModeRequired", false);
    m.status = parse_member_status(j.value("status", "unknown"));
    return m;
}

const TeamMember* TeamConfig::find_member(const std::string& member_name) const {
    for (auto& m : members)
        if (m.name == member_name) return &m;
    return nullptr;
}

nlohmann::json TeamConfig::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["description"] = description;
    j["createdAt"] = created_at;
    j["leadAgentId"] = lead_agent_id;
    j["leadSessionId"] = lead_session_id;
    j["members"] = nlohmann::json::array();
    for (auto& m : members) j["members"].push_back(m.to_json());
    return j;
}

TeamConfig TeamConfig::from_json(const nlohmann::json& j) {
    TeamConfig c;
    c.name = j.value("name", "");
    c.description = j.value("description", "");
    c.created_at = j.value("createdAt", int64_t{0});
    c.lead_agent_id = j.value("leadAgentId", "");
    c.lead_session_id = j.value("leadSessionId", "");
    if (j.contains("members") && j["members"].is_array()) {
        for (auto& m : j["members"])
            c.members.push_back(TeamMember::from_json(m));
    }
    return c;
}

// ── Pure transitions ────────────────────────────────────────────────

TeamConfig make_team_config(const std::string& name, const std::string& description,
                            const std::string& session_id, int64_t now_ms) {
    TeamConfig c;
    c.name = name;
    c.description = description;
    c.created_at = now_ms;
    c.lead_agent_id = kLeadName + "@" + name;
    c.lead_session_id = session_id;

    TeamMember lead;
    lead.agent_id = c.lead_agent_id;
    lead.name = kLeadName;
    lead.agent_type = kLeadName;
    lead.joined_at = now_ms;
    lead.status = MemberStatus::alive;
    c.members.push_back(lead);
    return c;
}

TeamConfig with_member_added(TeamConfig cfg, TeamMember member, int64_t now_ms) {
    validate_name(member.name, "member");
    if (member.is_lead()) {
        throw StoreError(ErrorCode::InvalidName, "member name '" + kLeadName + "' is reserved");
    }
    if (cfg.find_member(member.name)) {
        throw StoreError(ErrorCode::AlreadyExists,
                         "member '" + member.name + "' already exists in team '" + cfg.name + "'");
    }

    size_t teammates = std::count_if(cfg.members.begin(), cfg.members.end(),
                                     [](const TeamMember& m) { return !m.is_lead(); });
    member.agent_id = member.name + "@" + cfg.name;
    if (member.color.empty()) member.color = color_for_index(teammates);
    if (member.joined_at == 0) member.joined_at = now_ms;
    cfg.members.push_back(std::move(member));
    return cfg;
}

TeamConfig with_member_removed(TeamConfig cfg, const std::string& member_name) {
    if (member_name == kLeadName) {
        throw StoreError(ErrorCode::InvalidName, "cannot remove " + kLeadName);
    }
    auto it = std::remove_if(cfg.members.begin(), cfg.members.end(),
        [&](const TeamMember& m) { return m.name == member_name; });
    if (it == cfg.members.end()) {
        throw StoreError(ErrorCode::NotFound,
                         "member '" + member_name + "' not found in team '" + cfg.name + "'");
    }
    cfg.members.erase(it, cfg.members.end());
    return cfg;
}

std::vector<std::string> alive_teammates(const TeamConfig& cfg, const HealthCheck& health) {
    std::vector<std::string> alive;
    for (auto& m : cfg.members) {
        if (m.is_lead()) continue;
        MemberStatus s = health ? health(m) : m.status;
        if (s == MemberStatus::alive) alive.push_back(m.name);
    }
    return alive;
}

// ── TeamRegistry ────────────────────────────────────────────────────

TeamConfig TeamRegistry::create(const std::string& name, const std::string& description,
                                const std::string& session_id) {
    validate_name(name, "team");
    TeamConfig cfg = make_team_config(name, description, session_id, epoch_ms());

    ctx_.store->modify(ctx_.team_config_path(name), ctx_.team_lock_path(name),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            if (cur) throw StoreError(ErrorCode::AlreadyExists, "team '" + name + "' already exists");
            return cfg.to_json();
        }, ctx_.lock_timeout);

    ctx_.store->ensure_dir(ctx_.tasks_dir(name));
    std::cerr << "[team] Created team '" << name << "'\n";
    return cfg;
}

void TeamRegistry::remove(const std::string& name, const HealthCheck& health) {
    validate_name(name, "team");
    // Checked before locking so a missing team does not get its directory recreated.
    if (!exists(name)) throw StoreError(ErrorCode::NotFound, "team '" + name + "' not found");

    // All three locks before the first removal, so a timeout leaves the team whole.
    // Lock order is team, inboxes, tasks.
    auto team_lock = ctx_.store->lock(ctx_.team_lock_path(name), ctx_.lock_timeout);
    auto inbox_lock = ctx_.store->lock(ctx_.inbox_lock_path(name), ctx_.lock_timeout);
    auto task_lock = ctx_.store->lock(ctx_.task_lock_path(name), ctx_.lock_timeout);

    ctx_.store->modify_held(ctx_.team_config_path(name),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            if (!cur) throw StoreError(ErrorCode::NotFound, "team '" + name + "' not found");
            auto alive = alive_teammates(TeamConfig::from_json(*cur), health);
            if (!alive.empty()) {
                std::string names;
                for (auto& n : alive) names += (names.empty() ? "" : ", ") + n;
                throw StoreError(ErrorCode::TeammatesActive,
                                 "team '" + name + "' still has active teammates: " + names);
            }
            return std::nullopt;
        });

    // Waiters on the unlinked markers re-check the config once they get the
    // lock and find the team gone.
    ctx_.store->remove_tree(ctx_.inboxes_dir(name));
    ctx_.store->remove_tree(ctx_.tasks_dir(name));
    task_lock.reset();
    inbox_lock.reset();
    team_lock.reset();
    ctx_.store->remove_tree(ctx_.team_dir(name));
    std::cerr << "[team] Deleted team '" << name << "'\n";
}

TeamConfig TeamRegistry::read_config(const std::string& name) const {
    validate_name(name, "team");
    auto doc = ctx_.store->read(ctx_.team_config_path(name));
    if (!doc) throw StoreError(ErrorCode::NotFound, "team '" + name + "' not found");
    return TeamConfig::from_json(*doc);
}

bool TeamRegistry::exists(const std::string& name) const {
    return is_valid_name(name) && ctx_.store->exists(ctx_.team_config_path(name));
}

std::vector<std::string> TeamRegistry::list() const {
    std::vector<std::string> teams;
    for (auto& dir : ctx_.store->list_dirs(ctx_.teams_dir())) {
        if (exists(dir)) teams.push_back(dir);
    }
    return teams;
}

TeamConfig TeamRegistry::modify_config(const std::string& team,
                                       const std::function<TeamConfig(TeamConfig)>& fn) {
    validate_name(team, "team");
    if (!exists(team)) throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");

    auto doc = ctx_.store->modify(ctx_.team_config_path(team), ctx_.team_lock_path(team),
        [&](const std::optional<Document>& cur) -> std::optional<Document> {
            if (!cur) throw StoreError(ErrorCode::NotFound, "team '" + team + "' not found");
            return fn(TeamConfig::from_json(*cur)).to_json();
        }, ctx_.lock_timeout);
    return TeamConfig::from_json(*doc);
}

TeamMember TeamRegistry::add_member(const std::string& team, TeamMember member) {
    std::string member_name = member.name;
    int64_t now = epoch_ms();
    TeamConfig cfg = modify_config(team, [&](TeamConfig c) {
        return with_member_added(std::move(c), member, now);
    });
    return *cfg.find_member(member_name);
}

void TeamRegistry::remove_member(const std::string& team, const std::string& member_name) {
    modify_config(team, [&](TeamConfig c) {
        return with_member_removed(std::move(c), member_name);
    });
}

TeamMember TeamRegistry::update_member(const std::string& team, const std::string& member_name,
                                       const std::function<void(TeamMember&)>& fn) {
    TeamConfig cfg = modify_config(team, [&](TeamConfig c) {
        for (auto& m : c.members) {
            if (m.name != member_name) continue;
            fn(m);
            m.name = member_name;  // identity is not editable
            return c;
        }
        throw StoreError(ErrorCode::NotFound,
                         "member '" + member_name + "' not found in team '" + team + "'");
    });
    return *cfg.find_member(member_name);
}

TeamConfig TeamRegistry::refresh_health(const std::string& team, const HealthCheck& health) {
    // Probe outside the lock; backends may be slow.
    TeamConfig snapshot = read_config(team);
    std::map<std::string, MemberStatus> observed;
    for (auto& m : snapshot.members) {
        if (!m.is_lead()) observed[m.name] = health(m);
    }
    return modify_config(team, [&](TeamConfig c) {
        for (auto& m : c.members) {
            auto it = observed.find(m.name);
            if (it != observed.end()) m.status = it->second;
        }
        return c;
    });
}

} // namespace teamfs
