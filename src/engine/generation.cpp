#include "engine/generation.hpp"

#include <format>
#include <utility>

namespace forge {

namespace {
[[nodiscard]] auto texts(error_kind kind) noexcept -> std::pair<std::string_view, std::string_view>
{
	using namespace constants::failure;

	switch (kind) {
	case error_kind::duplicate_identity:
		return {duplicate_identity, duplicate_identity_hint};
	case error_kind::invalid_level:
		return {invalid_level, invalid_level_hint};
	case error_kind::empty_roster:
		return {empty_roster, empty_roster_hint};
	case error_kind::team_count_out_of_range:
		return {team_count_out_of_range, team_count_out_of_range_hint};
	case error_kind::team_count_exceeds_members:
		return {team_count_exceeds_members, team_count_exceeds_members_hint};
	case error_kind::self_referential_rule:
		return {self_referential_rule, self_referential_rule_hint};
	case error_kind::unknown_identity_rule:
		return {unknown_identity_rule, unknown_identity_rule_hint};
	case error_kind::contradictory_rules:
		return {contradictory_rules, contradictory_rules_hint};
	case error_kind::oversized_group:
		return {oversized_group, oversized_group_hint};
	case error_kind::no_feasible_allocation:
		return {no_feasible_allocation, no_feasible_allocation_hint};
	case error_kind::cancelled:
		return {cancelled, cancelled_hint};
	}
	return {no_feasible_allocation, no_feasible_allocation_hint};
}
} // namespace

auto to_string(error_kind kind) noexcept -> std::string_view
{
	switch (kind) {
	case error_kind::duplicate_identity:
		return "duplicate_identity";
	case error_kind::invalid_level:
		return "invalid_level";
	case error_kind::empty_roster:
		return "empty_roster";
	case error_kind::team_count_out_of_range:
		return "team_count_out_of_range";
	case error_kind::team_count_exceeds_members:
		return "team_count_exceeds_members";
	case error_kind::self_referential_rule:
		return "self_referential_rule";
	case error_kind::unknown_identity_rule:
		return "unknown_identity_rule";
	case error_kind::contradictory_rules:
		return "contradictory_rules";
	case error_kind::oversized_group:
		return "oversized_group";
	case error_kind::no_feasible_allocation:
		return "no_feasible_allocation";
	case error_kind::cancelled:
		return "cancelled";
	}
	return "unknown";
}

auto generation_failure::make(error_kind kind, std::string_view detail, int attempts_used) -> generation_failure
{
	auto [message, suggestion] = texts(kind);
	return {.kind = kind,
					.message = detail.empty() ? std::string(message) : std::format("{}: {}", message, detail),
					.suggestion = std::string(suggestion),
					.attempts_used = attempts_used};
}

} // namespace forge
