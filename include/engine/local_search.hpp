#pragma once

#include "core/constants.hpp"
#include "engine/allocation.hpp"
#include "engine/quality.hpp"

#include <optional>
#include <span>

namespace forge {

// Best-improvement hill climbing over single-group relocations and two-team swaps.
// Three-way rotations are not explored, so some local optima stay unreachable.
class local_search {
public:
	local_search(std::span<const atomic_group> groups, const group_graph &conflicts, const target_distribution &targets,
							 int max_iterations = constants::limits::default_refine_iterations);

	// Applies improving moves in place; returns how many were applied.
	auto refine(allocation &alloc) const -> int;

private:
	std::span<const atomic_group> groups_;
	const group_graph &conflicts_;
	const target_distribution &targets_;
	int max_iterations_;

	struct candidate_move {
		std::size_t group{allocation::unassigned};
		std::size_t to{allocation::unassigned};
		std::size_t partner{allocation::unassigned}; // set for swaps
		quality_vector quality{};
	};

	[[nodiscard]] auto fits(int size) const noexcept -> bool;
	[[nodiscard]] auto best_move(const allocation &alloc, const quality_vector &current) const -> std::optional<candidate_move>;
};

} // namespace forge
