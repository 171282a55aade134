#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace forge::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "Unknown command";
inline constexpr std::string_view unsupported_button = "Unsupported button";
inline constexpr std::string_view unsupported_select = "Unsupported selection";
inline constexpr std::string_view panel_expired = "This panel has expired";
inline constexpr std::string_view panel_owner_only = "Only the panel owner can use this panel";
inline constexpr std::string_view no_rosters = "No rosters yet";
inline constexpr std::string_view no_rosters_hint = "Create one with `/newroster <name>`.";
inline constexpr std::string_view no_active_roster = "No active roster, pick one with `/useroster`";
inline constexpr std::string_view no_members = "The roster has no members yet";
inline constexpr std::string_view no_rules = "No rules in this roster";
inline constexpr std::string_view no_teams_yet = "No teams generated yet";
inline constexpr std::string_view no_teams_yet_hint = "Press Generate first.";
inline constexpr std::string_view roster_changed = "The active roster changed since this panel was opened";
inline constexpr std::string_view roster_changed_hint = "Run `/generate` again for the current roster.";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
inline constexpr std::string_view hint_prefix = "💡 ";
} // namespace text

// Engine failure messages, paired with the suggestion shown to the user
namespace failure {
inline constexpr std::string_view duplicate_identity = "Duplicate member names found";
inline constexpr std::string_view duplicate_identity_hint = "Remove the duplicates from the roster and try again.";
inline constexpr std::string_view invalid_level = "Member levels must be between 1 and 3";
inline constexpr std::string_view invalid_level_hint = "Fix the level of the listed members and try again.";
inline constexpr std::string_view empty_roster = "No members are marked present";
inline constexpr std::string_view empty_roster_hint = "Add members or mark some of them present before generating teams.";
inline constexpr std::string_view team_count_out_of_range = "Team count must be between 2 and 10";
inline constexpr std::string_view team_count_out_of_range_hint = "Pick a valid number of teams and try again.";
inline constexpr std::string_view team_count_exceeds_members = "Team count cannot exceed the number of present members";
inline constexpr std::string_view team_count_exceeds_members_hint = "Reduce the team count or mark more members present.";
inline constexpr std::string_view self_referential_rule = "A rule names the same member on both sides";
inline constexpr std::string_view self_referential_rule_hint = "Remove the invalid rule and try again.";
inline constexpr std::string_view unknown_identity_rule = "A rule references a member that is no longer in the roster";
inline constexpr std::string_view unknown_identity_rule_hint = "Clean up rules that mention removed members and try again.";
inline constexpr std::string_view contradictory_rules = "A keep-apart rule contradicts a keep-together rule";
inline constexpr std::string_view contradictory_rules_hint = "Remove either the keep-apart or the keep-together rule for this pair.";
inline constexpr std::string_view oversized_group = "A keep-together group is larger than any team";
inline constexpr std::string_view oversized_group_hint = "Reduce the team count or relax keep-together rules.";
inline constexpr std::string_view no_feasible_allocation = "Could not find a valid split with the current rules";
inline constexpr std::string_view no_feasible_allocation_hint = "Increase the team count or remove some keep-apart rules and try again.";
inline constexpr std::string_view cancelled = "Team generation was cancelled";
inline constexpr std::string_view cancelled_hint = "Try again, or lower the attempt budget.";
} // namespace failure

// File paths
namespace files {
inline constexpr std::string_view rosters_file = "rosters.json";
inline constexpr std::string_view bot_config_file = "teamforge.json";
inline constexpr std::string_view token_file = ".bot_token";
} // namespace files

// Limits
namespace limits {
inline constexpr int min_teams = 2;
inline constexpr int max_teams = 10;
inline constexpr int min_level = 1;
inline constexpr int max_level = 3;
inline constexpr int default_level = 2;
inline constexpr int default_max_attempts = 2000;
inline constexpr int default_refine_iterations = 120;
inline constexpr int data_version = 1;
inline constexpr std::size_t max_discord_select_options = 25;
inline constexpr std::size_t max_live_sessions = 8;
// Discord drops interaction replies after 3 s
inline constexpr std::chrono::milliseconds generate_deadline{2500};
} // namespace limits

// Greedy placement weights
namespace weights {
inline constexpr double skill = 1.3;
inline constexpr double category_overfill = 8.0;
inline constexpr double category_underfill = 0.4;
inline constexpr double tie_tolerance = 1e-4;
} // namespace weights

} // namespace forge::constants
