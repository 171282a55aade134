#pragma once

#include "engine/allocation.hpp"
#include "engine/target_distribution.hpp"

#include <optional>
#include <random>
#include <span>
#include <vector>

namespace forge {

// One randomized construction: hard-to-place groups first, each into its cheapest eligible team.
class greedy_assigner {
public:
	greedy_assigner(std::span<const atomic_group> groups, const group_graph &conflicts, const target_distribution &targets);

	// nullopt when some group has no eligible team; the caller retries with a new shuffle.
	[[nodiscard]] auto assign(std::mt19937_64 &rng) const -> std::optional<allocation>;

	// Lower is better. Exposed for tests.
	[[nodiscard]] auto penalty(const team_stats &team, const atomic_group &g, std::size_t team_index) const -> double;

private:
	std::span<const atomic_group> groups_;
	const group_graph &conflicts_;
	const target_distribution &targets_;

	[[nodiscard]] auto placement_order(std::mt19937_64 &rng) const -> std::vector<std::size_t>;
	[[nodiscard]] auto pick_team(const allocation &alloc, const atomic_group &g, std::mt19937_64 &rng) const -> std::optional<std::size_t>;
};

} // namespace forge
