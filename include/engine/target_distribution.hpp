#pragma once

#include "engine/roster_normalizer.hpp"
#include "models/member.hpp"

#include <array>
#include <span>
#include <vector>

namespace forge {

// total / buckets each, the first (total % buckets) buckets get one extra.
[[nodiscard]] auto split_evenly(int total, int buckets) -> std::vector<int>;

struct target_distribution {
	std::vector<int> sizes;
	std::array<std::vector<int>, category_count> categories;
	std::array<std::vector<int>, level_count> levels;
	int total_skill{};
	double ideal_skill{}; // total skill / team count

	[[nodiscard]] auto team_count() const noexcept -> std::size_t { return sizes.size(); }
	[[nodiscard]] auto min_size() const -> int;
	[[nodiscard]] auto max_size() const -> int;
};

[[nodiscard]] auto compute_targets(std::span<const keyed_member> present, int team_count) -> target_distribution;

} // namespace forge
