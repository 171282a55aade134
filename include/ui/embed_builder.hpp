#pragma once

#include "engine/generation.hpp"
#include "models/roster.hpp"
#include "models/team.hpp"
#include <dpp/dpp.h>

#include <optional>
#include <span>
#include <string>

namespace forge::ui {

class embed_builder {
public:
	// Build help embed
	[[nodiscard]] static auto build_help() -> dpp::embed;

	[[nodiscard]] static auto build_roster_list(std::span<const roster> rosters, const std::optional<std::string> &active_id) -> dpp::embed;

	[[nodiscard]] static auto build_member_list(const roster &r) -> dpp::embed;

	[[nodiscard]] static auto build_rule_list(const roster &r) -> dpp::embed;

	// Build team formation result embed
	[[nodiscard]] static auto build_teams(std::span<const team> teams, int attempts_used) -> dpp::embed;

	[[nodiscard]] static auto build_failure(const generation_failure &failure) -> dpp::embed;

private:
	// Format helpers
	[[nodiscard]] static auto format_member(const member &m) -> std::string;
	[[nodiscard]] static auto format_rules(std::span<const pair_rule> rules) -> std::string;
};

} // namespace forge::ui
