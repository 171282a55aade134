#include "engine/allocation.hpp"

namespace forge {

auto team_stats::add(const atomic_group &g) -> void
{
	size += g.size;
	skill_sum += g.skill_sum;
	for (std::size_t c = 0; c < category_count; ++c)
		categories[c] += g.per_category[c];
	for (std::size_t l = 0; l < level_count; ++l)
		levels[l] += g.per_level[l];
}

auto team_stats::remove(const atomic_group &g) -> void
{
	size -= g.size;
	skill_sum -= g.skill_sum;
	for (std::size_t c = 0; c < category_count; ++c)
		categories[c] -= g.per_category[c];
	for (std::size_t l = 0; l < level_count; ++l)
		levels[l] -= g.per_level[l];
}

auto allocation::place(const atomic_group &g, std::size_t team) -> void
{
	team_of[g.id] = team;
	stats[team].add(g);
}

auto allocation::relocate(const atomic_group &g, std::size_t to) -> void
{
	stats[team_of[g.id]].remove(g);
	place(g, to);
}

auto allocation::blocked(const group_graph &conflicts, std::size_t g, std::size_t team, std::size_t ignore) const -> bool
{
	for (auto n : conflicts.neighbours(g)) {
		if (n != ignore && team_of[n] == team) {
			return true;
		}
	}
	return false;
}

} // namespace forge
