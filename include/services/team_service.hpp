#pragma once

#include "engine/allocation.hpp"
#include "engine/atomic_groups.hpp"
#include "engine/generation.hpp"
#include "engine/roster_normalizer.hpp"
#include "engine/target_distribution.hpp"
#include "models/pair_rule.hpp"

#include <expected>
#include <span>
#include <vector>

namespace forge {

class team_service {
public:
	// Validates the snapshot, then runs up to max_attempts randomized constructions and keeps the best.
	[[nodiscard]] static auto generate(std::span<const member> members, std::span<const pair_rule> exclusions, std::span<const pair_rule> cohesions,
																		 generation_config config) -> generation_result;

private:
	// Everything derived from the snapshot before the first attempt.
	struct prepared {
		std::vector<keyed_member> present;
		std::vector<atomic_group> groups;
		group_graph conflicts;
		target_distribution targets;
	};

	[[nodiscard]] static auto prepare(std::span<const member> members, std::span<const pair_rule> exclusions, std::span<const pair_rule> cohesions,
																		int team_count) -> std::expected<prepared, generation_failure>;

	[[nodiscard]] static auto make_seed(std::span<const keyed_member> present) -> std::uint64_t;

	[[nodiscard]] static auto build_teams(const prepared &ctx, const allocation &alloc) -> std::vector<team>;
};

} // namespace forge
