#pragma once

#include "core/constants.hpp"
#include "core/log.hpp"
#include "models/team.hpp"

#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace forge {

enum class error_kind : std::uint8_t {
	duplicate_identity,
	invalid_level,
	empty_roster,
	team_count_out_of_range,
	team_count_exceeds_members,
	self_referential_rule,
	unknown_identity_rule,
	contradictory_rules,
	oversized_group,
	no_feasible_allocation,
	cancelled,
};

[[nodiscard]] auto to_string(error_kind kind) noexcept -> std::string_view;

struct generation_failure {
	error_kind kind{error_kind::no_feasible_allocation};
	std::string message;
	std::string suggestion;
	int attempts_used{};

	// Fixed message for the kind, optionally followed by ": <detail>".
	[[nodiscard]] static auto make(error_kind kind, std::string_view detail = {}, int attempts_used = 0) -> generation_failure;
};

struct generation_success {
	std::vector<team> teams;
	int attempts_used{}; // attempt index that produced the returned allocation
};

using generation_result = std::expected<generation_success, generation_failure>;

struct generation_config {
	int team_count{2};
	int max_attempts{constants::limits::default_max_attempts};
	int refine_iterations{constants::limits::default_refine_iterations};
	std::uint64_t seed{0}; // 0 = derive from roster keys and the clock
	std::stop_token stop{};
	log_sink log{};
};

} // namespace forge
