#include "engine/rule_validator.hpp"

namespace forge {

rule_validator::rule_validator(std::span<const keyed_member> roster)
{
	for (const auto &m : roster) {
		known_.insert(m.key);
		if (m.data.present) {
			present_.insert(m.key);
		}
	}
}

auto rule_validator::check(std::span<const pair_rule> rules) const -> rule_check
{
	rule_check out;
	std::unordered_set<std::string> pairs_seen;

	for (const auto &rule : rules) {
		auto a = util::normalize_name(rule.a);
		auto b = util::normalize_name(rule.b);

		if (a.empty() || b.empty()) {
			continue;
		}

		if (a == b) {
			out.self_referential.push_back(rule);
			continue;
		}

		if (!known_.contains(a) || !known_.contains(b)) {
			out.dangling.push_back(rule);
			continue;
		}

		if (!present_.contains(a) || !present_.contains(b)) {
			++out.inactive;
			continue;
		}

		if (!pairs_seen.insert(util::pair_key(a, b)).second) {
			continue;
		}

		out.active.emplace_back(std::move(a), std::move(b));
	}

	return out;
}

} // namespace forge
