#pragma once

#include "engine/atomic_groups.hpp"
#include "engine/constraint_graph.hpp"
#include "engine/roster_normalizer.hpp"
#include "engine/rule_validator.hpp"
#include "engine/target_distribution.hpp"
#include "models/pair_rule.hpp"
#include "models/member.hpp"
#include "models/team.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace test_helpers {

[[nodiscard]] inline auto make_member(std::string name, int level = 2, forge::category cat = forge::category::unknown, bool present = true) -> forge::member
{
	return {.display_name = std::move(name), .level = level, .cat = cat, .present = present};
}

// Present members with identity keys, as the engine sees them. Input must not contain duplicates.
[[nodiscard]] inline auto present_keyed(const std::vector<forge::member> &members) -> std::vector<forge::keyed_member>
{
	auto all = forge::normalize_roster(members).value();
	return std::ranges::to<std::vector<forge::keyed_member>>(all | std::views::filter([](const forge::keyed_member &m) { return m.data.present; }));
}

// The engine's inputs for one roster snapshot. Rules must already be valid.
struct engine_input {
	std::vector<forge::keyed_member> present;
	std::vector<forge::atomic_group> groups;
	forge::group_graph conflicts;
	forge::target_distribution targets;
};

[[nodiscard]] inline auto prepare_engine(const std::vector<forge::member> &members, const std::vector<forge::pair_rule> &exclusions,
																				 const std::vector<forge::pair_rule> &cohesions, int team_count) -> engine_input
{
	engine_input in;
	in.present = present_keyed(members);
	forge::rule_validator validator{in.present};
	auto graphs = forge::build_constraint_graphs(in.present, validator.check(exclusions), validator.check(cohesions));
	in.groups = forge::form_atomic_groups(in.present, graphs.cohesion);
	in.targets = forge::compute_targets(in.present, team_count);
	in.conflicts = forge::project_conflicts(in.groups, in.present, graphs.exclusion, in.targets.max_size()).value();
	return in;
}

[[nodiscard]] inline auto names_of(const forge::team &t) -> std::vector<std::string>
{
	return std::ranges::to<std::vector<std::string>>(t.members | std::views::transform(&forge::member::display_name));
}

[[nodiscard]] inline auto team_index_of(const std::vector<forge::team> &teams, const std::string &name) -> int
{
	for (std::size_t i = 0; i < teams.size(); ++i) {
		if (std::ranges::contains(teams[i].members, name, &forge::member::display_name)) {
			return static_cast<int>(i);
		}
	}
	return -1;
}

} // namespace test_helpers
