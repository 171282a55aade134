#include "engine/quality.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <ranges>

namespace forge {

namespace {
// How far v lies outside [lo, hi].
[[nodiscard]] constexpr auto outside(int v, int lo, int hi) noexcept -> int { return v < lo ? lo - v : (v > hi ? v - hi : 0); }

template <typename Proj>
[[nodiscard]] auto spread(std::span<const team_stats> teams, Proj proj) -> int
{
	auto [lo, hi] = std::ranges::minmax(teams | std::views::transform(proj));
	return hi - lo;
}
} // namespace

auto quality_vector::to_string() const -> std::string
{
	return std::format("({}, {}, {}, {}, {})", level_count_gap, level_count_deviation, skill_sum_range, skill_sum_deviation, category_deviation);
}

auto evaluate(std::span<const team_stats> teams, const target_distribution &targets) -> quality_vector
{
	quality_vector q;
	if (teams.empty()) {
		return q;
	}

	for (std::size_t l = 0; l < level_count; ++l) {
		const auto [lo, hi] = std::ranges::minmax(targets.levels[l]);
		q.level_count_gap += std::max(0, spread(teams, [l](const team_stats &t) { return t.levels[l]; }) - (hi - lo));
		for (const auto &t : teams) {
			q.level_count_deviation += outside(t.levels[l], lo, hi);
		}
	}

	q.skill_sum_range = spread(teams, &team_stats::skill_sum);

	const auto ideal_lo = static_cast<int>(std::floor(targets.ideal_skill));
	const auto ideal_hi = static_cast<int>(std::ceil(targets.ideal_skill));
	for (const auto &t : teams) {
		q.skill_sum_deviation += outside(t.skill_sum, ideal_lo, ideal_hi);
	}

	for (auto c : {category::a, category::b}) {
		const auto [lo, hi] = std::ranges::minmax(targets.categories[index_of(c)]);
		for (const auto &t : teams) {
			q.category_deviation += outside(t.categories[index_of(c)], lo, hi);
		}
	}

	return q;
}

} // namespace forge
