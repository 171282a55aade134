#include "engine/atomic_groups.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <unordered_map>

namespace forge {

disjoint_set::disjoint_set(std::size_t n) : parent_(n), rank_(n, 0) { std::iota(parent_.begin(), parent_.end(), std::size_t{0}); }

auto disjoint_set::find(std::size_t x) -> std::size_t
{
	auto root = x;
	while (parent_[root] != root) {
		root = parent_[root];
	}

	// compress the walked path
	while (parent_[x] != root) {
		auto next = parent_[x];
		parent_[x] = root;
		x = next;
	}

	return root;
}

auto disjoint_set::unite(std::size_t a, std::size_t b) -> bool
{
	auto ra = find(a);
	auto rb = find(b);
	if (ra == rb) {
		return false;
	}

	if (rank_[ra] < rank_[rb]) {
		std::swap(ra, rb);
	}
	parent_[rb] = ra;
	if (rank_[ra] == rank_[rb]) {
		++rank_[ra];
	}
	return true;
}

auto form_atomic_groups(std::span<const keyed_member> present, const adjacency &cohesion) -> std::vector<atomic_group>
{
	std::unordered_map<std::string, std::size_t> index_of_key;
	for (std::size_t i = 0; i < present.size(); ++i) {
		index_of_key.emplace(present[i].key, i);
	}

	disjoint_set sets{present.size()};
	for (std::size_t i = 0; i < present.size(); ++i) {
		auto it = cohesion.find(present[i].key);
		if (it == cohesion.end()) {
			continue;
		}
		for (const auto &other : it->second) {
			if (auto j = index_of_key.find(other); j != index_of_key.end()) {
				sets.unite(i, j->second);
			}
		}
	}

	// Groups are numbered by their first member so the layout does not depend on hashing.
	std::vector<atomic_group> groups;
	std::unordered_map<std::size_t, std::size_t> group_of_root;

	for (std::size_t i = 0; i < present.size(); ++i) {
		auto root = sets.find(i);
		auto [it, inserted] = group_of_root.try_emplace(root, groups.size());
		if (inserted) {
			groups.push_back({.id = groups.size()});
		}

		auto &g = groups[it->second];
		const auto &m = present[i].data;
		g.members.push_back(i);
		g.size += 1;
		g.skill_sum += m.level;
		g.per_category[index_of(m.cat)] += 1;
		g.per_level[static_cast<std::size_t>(m.level - constants::limits::min_level)] += 1;
	}

	return groups;
}

group_graph::group_graph(std::size_t group_count) : count_{group_count}, matrix_(group_count * group_count, 0), adjacent_(group_count) {}

auto group_graph::link(std::size_t a, std::size_t b) -> void
{
	if (a == b || conflicts(a, b)) {
		return;
	}

	matrix_[a * count_ + b] = 1;
	matrix_[b * count_ + a] = 1;
	adjacent_[a].push_back(b);
	adjacent_[b].push_back(a);
}

auto project_conflicts(std::span<const atomic_group> groups, std::span<const keyed_member> present, const adjacency &exclusion, int max_team_size)
		-> std::expected<group_graph, projection_failure>
{
	std::unordered_map<std::string, std::size_t> group_of_key;
	for (const auto &g : groups) {
		for (auto idx : g.members) {
			group_of_key.emplace(present[idx].key, g.id);
		}
	}

	// Internal contradictions first: a keep-apart pair that keep-together rules joined.
	for (const auto &g : groups) {
		for (auto idx : g.members) {
			auto it = exclusion.find(present[idx].key);
			if (it == exclusion.end()) {
				continue;
			}
			for (const auto &other : it->second) {
				if (auto gi = group_of_key.find(other); gi != group_of_key.end() && gi->second == g.id) {
					auto other_idx = std::ranges::find(present, other, &keyed_member::key) - present.begin();
					return std::unexpected(projection_failure{
							.kind = error_kind::contradictory_rules,
							.detail = std::format("{} and {}", present[idx].data.display_name, present[static_cast<std::size_t>(other_idx)].data.display_name)});
				}
			}
		}
	}

	for (const auto &g : groups) {
		if (g.size <= max_team_size) {
			continue;
		}

		std::string names;
		for (auto idx : g.members) {
			if (!names.empty())
				names += ", ";
			names += present[idx].data.display_name;
		}
		return std::unexpected(projection_failure{.kind = error_kind::oversized_group, .detail = std::format("{} ({} > {})", names, g.size, max_team_size)});
	}

	group_graph graph{groups.size()};
	for (const auto &g : groups) {
		for (auto idx : g.members) {
			auto it = exclusion.find(present[idx].key);
			if (it == exclusion.end()) {
				continue;
			}
			for (const auto &other : it->second) {
				if (auto gi = group_of_key.find(other); gi != group_of_key.end()) {
					graph.link(g.id, gi->second);
				}
			}
		}
	}

	return graph;
}

} // namespace forge
