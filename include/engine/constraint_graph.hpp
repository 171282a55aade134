#pragma once

#include "engine/roster_normalizer.hpp"
#include "engine/rule_validator.hpp"

#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace forge {

// key -> keys it is linked to
using adjacency = std::unordered_map<std::string, std::unordered_set<std::string>>;

struct constraint_graphs {
	adjacency exclusion;
	adjacency cohesion;
};

// Every present key gets an entry, linked or not.
[[nodiscard]] auto build_constraint_graphs(std::span<const keyed_member> present, const rule_check &exclusions, const rule_check &cohesions)
		-> constraint_graphs;

} // namespace forge
