#include "core/constants.hpp"
#include "engine/greedy_assigner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace forge {

greedy_assigner::greedy_assigner(std::span<const atomic_group> groups, const group_graph &conflicts, const target_distribution &targets)
		: groups_(groups), conflicts_(conflicts), targets_(targets)
{
}

auto greedy_assigner::placement_order(std::mt19937_64 &rng) const -> std::vector<std::size_t>
{
	std::vector<std::size_t> order(groups_.size());
	std::iota(order.begin(), order.end(), std::size_t{0});

	// Fisher-Yates, drawing from the caller's generator
	for (std::size_t i = order.size(); i > 1; --i) {
		std::uniform_int_distribution<std::size_t> pick(0, i - 1);
		std::swap(order[i - 1], order[pick(rng)]);
	}

	// The shuffle only decides ties: most constrained, then largest, then strongest goes first.
	std::ranges::stable_sort(order, [this](std::size_t a, std::size_t b) {
		const auto &ga = groups_[a];
		const auto &gb = groups_[b];
		if (conflicts_.degree(a) != conflicts_.degree(b))
			return conflicts_.degree(a) > conflicts_.degree(b);
		if (ga.size != gb.size)
			return ga.size > gb.size;
		return ga.skill_sum > gb.skill_sum;
	});

	return order;
}

auto greedy_assigner::penalty(const team_stats &team, const atomic_group &g, std::size_t team_index) const -> double
{
	using namespace constants::weights;

	const double next_skill = team.skill_sum + g.skill_sum;
	const double skill_penalty = std::abs(next_skill - targets_.ideal_skill);
	const double size_penalty = static_cast<double>(team.size + g.size) / static_cast<double>(targets_.sizes[team_index]);

	double category_penalty = 0.0;
	for (auto c : {category::a, category::b}) {
		const auto ci = index_of(c);
		if (g.per_category[ci] == 0) {
			continue;
		}

		const int projected = team.categories[ci] + g.per_category[ci];
		const int target = targets_.categories[ci][team_index];
		category_penalty += projected > target ? (projected - target) * category_overfill : std::abs(projected - target) * category_underfill;
	}

	return skill_penalty * skill + size_penalty + category_penalty;
}

auto greedy_assigner::pick_team(const allocation &alloc, const atomic_group &g, std::mt19937_64 &rng) const -> std::optional<std::size_t>
{
	double best_score = std::numeric_limits<double>::infinity();
	std::vector<std::size_t> best;

	for (std::size_t t = 0; t < alloc.stats.size(); ++t) {
		const auto &team = alloc.stats[t];
		if (targets_.sizes[t] - team.size < g.size) {
			continue;
		}

		if (alloc.blocked(conflicts_, g.id, t)) {
			continue;
		}

		const double score = penalty(team, g, t);
		if (score < best_score) {
			best_score = score;
			best.assign(1, t);
			continue;
		}

		if (std::abs(score - best_score) < constants::weights::tie_tolerance) {
			best.push_back(t);
		}
	}

	if (best.empty()) {
		return std::nullopt;
	}

	std::uniform_int_distribution<std::size_t> pick(0, best.size() - 1);
	return best[pick(rng)];
}

auto greedy_assigner::assign(std::mt19937_64 &rng) const -> std::optional<allocation>
{
	allocation alloc{groups_.size(), targets_.team_count()};

	for (auto gi : placement_order(rng)) {
		const auto &g = groups_[gi];
		auto team = pick_team(alloc, g, rng);
		if (!team) {
			return std::nullopt;
		}
		alloc.place(g, *team);
	}

	return alloc;
}

} // namespace forge
