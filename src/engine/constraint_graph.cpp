#include "engine/constraint_graph.hpp"

namespace forge {

namespace {
auto link_all(adjacency &graph, const rule_check &rules) -> void
{
	for (const auto &[a, b] : rules.active) {
		auto ita = graph.find(a);
		auto itb = graph.find(b);
		if (ita == graph.end() || itb == graph.end()) {
			continue;
		}
		ita->second.insert(b);
		itb->second.insert(a);
	}
}
} // namespace

auto build_constraint_graphs(std::span<const keyed_member> present, const rule_check &exclusions, const rule_check &cohesions) -> constraint_graphs
{
	constraint_graphs out;

	for (const auto &m : present) {
		out.exclusion.try_emplace(m.key);
		out.cohesion.try_emplace(m.key);
	}

	link_all(out.exclusion, exclusions);
	link_all(out.cohesion, cohesions);

	return out;
}

} // namespace forge
