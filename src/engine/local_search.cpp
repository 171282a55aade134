#include "engine/local_search.hpp"

#include <optional>
#include <vector>

namespace forge {

local_search::local_search(std::span<const atomic_group> groups, const group_graph &conflicts, const target_distribution &targets, int max_iterations)
		: groups_(groups), conflicts_(conflicts), targets_(targets), max_iterations_(max_iterations)
{
}

// Sizes stay within the target band so teams never differ by more than the split allows.
auto local_search::fits(int size) const noexcept -> bool { return size >= targets_.min_size() && size <= targets_.max_size(); }

auto local_search::best_move(const allocation &alloc, const quality_vector &current) const -> std::optional<candidate_move>
{
	std::optional<candidate_move> best;
	auto bound = current;
	std::vector<team_stats> scratch;

	auto consider = [&](candidate_move candidate) {
		auto q = evaluate(scratch, targets_);
		if (q < bound) {
			bound = q;
			candidate.quality = q;
			best = candidate;
		}
	};

	for (const auto &g : groups_) {
		const auto from = alloc.team_of[g.id];

		// relocation
		for (std::size_t to = 0; to < alloc.stats.size(); ++to) {
			if (to == from || !fits(alloc.stats[from].size - g.size) || !fits(alloc.stats[to].size + g.size)) {
				continue;
			}
			if (alloc.blocked(conflicts_, g.id, to)) {
				continue;
			}

			scratch = alloc.stats;
			scratch[from].remove(g);
			scratch[to].add(g);
			consider({.group = g.id, .to = to});
		}

		// swap with every later group in another team
		for (std::size_t hi = g.id + 1; hi < groups_.size(); ++hi) {
			const auto &h = groups_[hi];
			const auto to = alloc.team_of[h.id];
			if (to == from) {
				continue;
			}

			const int delta = h.size - g.size;
			if (!fits(alloc.stats[from].size + delta) || !fits(alloc.stats[to].size - delta)) {
				continue;
			}
			if (alloc.blocked(conflicts_, g.id, to, h.id) || alloc.blocked(conflicts_, h.id, from, g.id)) {
				continue;
			}

			scratch = alloc.stats;
			scratch[from].remove(g);
			scratch[from].add(h);
			scratch[to].remove(h);
			scratch[to].add(g);
			consider({.group = g.id, .to = to, .partner = h.id});
		}
	}

	return best;
}

auto local_search::refine(allocation &alloc) const -> int
{
	auto current = evaluate(alloc.stats, targets_);
	int applied = 0;

	while (applied < max_iterations_ && !current.perfect()) {
		auto m = best_move(alloc, current);
		if (!m) {
			break;
		}

		const auto from = alloc.team_of[m->group];
		alloc.relocate(groups_[m->group], m->to);
		if (m->partner != allocation::unassigned) {
			alloc.relocate(groups_[m->partner], from);
		}

		current = m->quality;
		++applied;
	}

	return applied;
}

} // namespace forge
