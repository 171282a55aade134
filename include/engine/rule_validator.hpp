#pragma once

#include "engine/roster_normalizer.hpp"
#include "models/pair_rule.hpp"

#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace forge {

// One rule set checked against the roster snapshot.
struct rule_check {
	std::vector<std::pair<std::string, std::string>> active; // key pairs, deduplicated, both present
	std::vector<pair_rule> self_referential;
	std::vector<pair_rule> dangling; // names someone outside the roster
	std::size_t inactive{};					 // both known but someone is absent; ignored

	[[nodiscard]] auto ok() const noexcept -> bool { return self_referential.empty() && dangling.empty(); }
};

class rule_validator {
public:
	explicit rule_validator(std::span<const keyed_member> roster);

	[[nodiscard]] auto check(std::span<const pair_rule> rules) const -> rule_check;

	[[nodiscard]] auto present_keys() const noexcept -> const std::unordered_set<std::string> & { return present_; }

private:
	std::unordered_set<std::string> known_;
	std::unordered_set<std::string> present_;
};

} // namespace forge
