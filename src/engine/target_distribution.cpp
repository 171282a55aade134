#include "engine/target_distribution.hpp"

#include <algorithm>

namespace forge {

auto split_evenly(int total, int buckets) -> std::vector<int>
{
	if (buckets <= 0) {
		return {};
	}

	const int base = total / buckets;
	const int remainder = total % buckets;

	std::vector<int> out(static_cast<std::size_t>(buckets), base);
	for (int i = 0; i < remainder; ++i) {
		++out[static_cast<std::size_t>(i)];
	}
	return out;
}

auto target_distribution::min_size() const -> int { return sizes.empty() ? 0 : std::ranges::min(sizes); }

auto target_distribution::max_size() const -> int { return sizes.empty() ? 0 : std::ranges::max(sizes); }

auto compute_targets(std::span<const keyed_member> present, int team_count) -> target_distribution
{
	std::array<int, category_count> category_totals{};
	std::array<int, level_count> level_totals{};
	int skill = 0;

	for (const auto &m : present) {
		++category_totals[index_of(m.data.cat)];
		++level_totals[static_cast<std::size_t>(m.data.level - constants::limits::min_level)];
		skill += m.data.level;
	}

	target_distribution out;
	out.sizes = split_evenly(static_cast<int>(present.size()), team_count);
	for (std::size_t c = 0; c < category_count; ++c) {
		out.categories[c] = split_evenly(category_totals[c], team_count);
	}
	for (std::size_t l = 0; l < level_count; ++l) {
		out.levels[l] = split_evenly(level_totals[l], team_count);
	}
	out.total_skill = skill;
	out.ideal_skill = team_count > 0 ? static_cast<double>(skill) / static_cast<double>(team_count) : 0.0;

	return out;
}

} // namespace forge
