#pragma once

#include "engine/allocation.hpp"
#include "engine/target_distribution.hpp"

#include <compare>
#include <span>
#include <string>

namespace forge {

// Distance from ideal balance; compared lexicographically in member order, all-zero is perfect.
struct quality_vector {
	int level_count_gap{};			 // per level: max-min spread across teams beyond the unavoidable remainder
	int level_count_deviation{}; // per team and level: distance outside the target band
	int skill_sum_range{};			 // max team skill sum - min team skill sum
	int skill_sum_deviation{};	 // per team: distance outside [floor(ideal), ceil(ideal)]
	int category_deviation{};		 // per team, categories A and B: distance outside the target band

	[[nodiscard]] auto operator<=>(const quality_vector &) const = default;

	[[nodiscard]] auto perfect() const noexcept -> bool { return *this == quality_vector{}; }

	[[nodiscard]] auto to_string() const -> std::string;
};

[[nodiscard]] auto evaluate(std::span<const team_stats> teams, const target_distribution &targets) -> quality_vector;

} // namespace forge
