#pragma once

#include "engine/atomic_groups.hpp"

#include <array>
#include <vector>

namespace forge {

// Running totals of one team within an attempt.
struct team_stats {
	int size{};
	int skill_sum{};
	std::array<int, category_count> categories{};
	std::array<int, level_count> levels{};

	auto add(const atomic_group &g) -> void;
	auto remove(const atomic_group &g) -> void;
};

// One attempt's assignment of groups to teams. Fresh per attempt, never shared.
struct allocation {
	static constexpr std::size_t unassigned = static_cast<std::size_t>(-1);

	std::vector<std::size_t> team_of; // per group id
	std::vector<team_stats> stats;		// per team

	allocation(std::size_t group_count, std::size_t team_count) : team_of(group_count, unassigned), stats(team_count) {}

	auto place(const atomic_group &g, std::size_t team) -> void;
	auto relocate(const atomic_group &g, std::size_t to) -> void;

	// True when some neighbour of g (other than `ignore`) already sits in `team`.
	[[nodiscard]] auto blocked(const group_graph &conflicts, std::size_t g, std::size_t team, std::size_t ignore = unassigned) const -> bool;
};

} // namespace forge
