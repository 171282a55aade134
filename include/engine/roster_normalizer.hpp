#pragma once

#include "core/utils.hpp"
#include "models/member.hpp"

#include <expected>
#include <span>
#include <string>
#include <vector>

namespace forge {

struct keyed_member {
	std::string key; // normalized identity
	member data;
};

struct duplicate_names {
	std::vector<std::string> names; // every cleaned display name involved in a collision, first-seen order
};

// Trims display names, derives identity keys and rejects collisions. Blank names are skipped.
[[nodiscard]] auto normalize_roster(std::span<const member> raw) -> std::expected<std::vector<keyed_member>, duplicate_names>;

} // namespace forge
