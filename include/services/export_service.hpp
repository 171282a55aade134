#pragma once

#include "models/team.hpp"
#include <nlohmann/json.hpp>

#include <span>
#include <string>
#include <string_view>

namespace forge {

// Renders generated teams for people and files.
class export_service {
public:
	// "Team 1\n- Name (level 2, A)\n..." with a blank line between teams.
	[[nodiscard]] static auto format_teams_as_text(std::span<const team> teams) -> std::string;

	// "Skill sum: 7 | A: 2 | B: 1"
	[[nodiscard]] static auto summarize_team(const team &t) -> std::string;

	// "teams-<slug>.txt"
	[[nodiscard]] static auto export_file_name(std::string_view roster_name) -> std::string;

	[[nodiscard]] static auto teams_to_json(std::span<const team> teams) -> nlohmann::json;
};

} // namespace forge
