#pragma once

#include "core/utils.hpp"
#include "engine/generation.hpp"
#include "models/team.hpp"
#include <dpp/dpp.h>

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace forge {

// State behind one /generate panel message.
struct panel_session {
	std::string panel_id{};
	dpp::snowflake guild_id{};
	dpp::snowflake channel_id{};
	dpp::snowflake owner_id{};
	bool active{true};

	// Session data
	std::string roster_id{};
	int team_count{2};
	std::uint64_t seed{0};
	std::vector<team> teams{};
	std::optional<generation_failure> failure{};
	int attempts_used{};

	// Timestamps
	std::chrono::steady_clock::time_point created_at{std::chrono::steady_clock::now()};
	std::chrono::steady_clock::time_point last_accessed_at{created_at};
};

class session_manager {
public:
	[[nodiscard]] auto create_session(panel_session session) -> std::string;
	[[nodiscard]] auto get_session(std::string_view id) -> std::optional<std::reference_wrapper<panel_session>>;
	[[nodiscard]] auto validate_owner(std::string_view id, dpp::snowflake owner) -> std::expected<std::reference_wrapper<panel_session>, type::error>;

	auto remove_session(std::string_view id) -> void;
	auto cleanup_old_sessions(std::size_t max_sessions = constants::limits::max_live_sessions) -> void;

private:
	std::unordered_map<std::string, panel_session> sessions_;
};

} // namespace forge
