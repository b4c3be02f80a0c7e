#pragma once
#include "context.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace teamfs {

// Reserved name of the member that created the team.
inline const std::string kLeadName = "team-lead";
constexpr size_t kMaxNameLength = 64;

// Letters, digits, '_' and '-', 1..64 chars.
bool is_valid_name(const std::string& name);

// Throws StoreError(InvalidName). `what` names the thing for the message.
void validate_name(const std::string& name, const std::string& what);

// Palette slot for the n-th teammate (wraps around).
std::string color_for_index(size_t n);

// ── Data structures ─────────────────────────────────────────────────

enum class MemberStatus { unknown, alive, dead };

const char* member_status_name(MemberStatus s);
MemberStatus parse_member_status(const std::string& s);

struct TeamMember {
    std::string agent_id;
    std::string name;
    std::string agent_type = "general-purpose";
    std::string model;
    std::string backend_type;
    std::string color;
    std::string prompt;
    std::string cwd;
    std::string process_handle;
    int64_t joined_at = 0;
    bool plan_mode_required = false;
    MemberStatus status = MemberStatus::unknown;

    bool is_lead() const { return name == kLeadName; }

    nlohmann::json to_json() const;
    static TeamMember from_json(const nlohmann::json& j);
};

struct TeamConfig {
    std::string name;
    std::string description;
    int64_t created_at = 0;
    std::string lead_agent_id;
    std::string lead_session_id;
    std::vector<TeamMember> members;

    const TeamMember* find_member(const std::string& member_name) const;

    nlohmann::json to_json() const;
    static TeamConfig from_json(const nlohmann::json& j);
};

// Liveness of one member as reported by its backend.
using HealthCheck = std::function<MemberStatus(const TeamMember&)>;

// ── Pure config transitions ─────────────────────────────────────────
//
// Each takes the current config and returns the next one or throws
// StoreError. No I/O; TeamRegistry wraps them in a locked modify.

TeamConfig make_team_config(const std::string& name, const std::string& description,
                            const std::string& session_id, int64_t now_ms);
TeamConfig with_member_added(TeamConfig cfg, TeamMember member, int64_t now_ms);
TeamConfig with_member_removed(TeamConfig cfg, const std::string& member_name);

// Names of non-lead members that are currently alive.
std::vector<std::string> alive_teammates(const TeamConfig& cfg, const HealthCheck& health);

// ── TeamRegistry ────────────────────────────────────────────────────

class TeamRegistry {
public:
    explicit TeamRegistry(Context ctx) : ctx_(std::move(ctx)) {}

    TeamConfig create(const std::string& name, const std::string& description,
                      const std::string& session_id = "");

    // Fails with TeammatesActive while any teammate is alive. `health` is
    // consulted when given; otherwise each member's recorded status is used.
    void remove(const std::string& name, const HealthCheck& health = nullptr);

    TeamConfig read_config(const std::string& name) const;
    bool exists(const std::string& name) const;
    std::vector<std::string> list() const;

    TeamMember add_member(const std::string& team, TeamMember member);
    void remove_member(const std::string& team, const std::string& member_name);
    TeamMember update_member(const std::string& team, const std::string& member_name,
                             const std::function<void(TeamMember&)>& fn);

    // Stores the current health of every member in its `status` field.
    TeamConfig refresh_health(const std::string& team, const HealthCheck& health);

private:
    Context ctx_;

    TeamConfig modify_config(const std::string& team,
                             const std::function<TeamConfig(TeamConfig)>& fn);
};

} // namespace teamfs
