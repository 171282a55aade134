#include "core/constants.hpp"
#include "engine/constraint_graph.hpp"
#include "engine/greedy_assigner.hpp"
#include "engine/local_search.hpp"
#include "engine/quality.hpp"
#include "engine/rule_validator.hpp"
#include "services/team_service.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <optional>
#include <random>
#include <ranges>

namespace forge {

namespace {
[[nodiscard]] auto join_names(std::span<const std::string> names) -> std::string
{
	std::string out;
	for (const auto &n : names) {
		if (!out.empty())
			out += ", ";
		out += n;
	}
	return out;
}

[[nodiscard]] auto join_rules(std::span<const pair_rule> rules) -> std::string
{
	std::string out;
	for (const auto &r : rules) {
		if (!out.empty())
			out += ", ";
		out += std::format("{} / {}", util::clean_name(r.a), util::clean_name(r.b));
	}
	return out;
}
} // namespace

auto team_service::prepare(std::span<const member> members, std::span<const pair_rule> exclusions, std::span<const pair_rule> cohesions, int team_count)
		-> std::expected<prepared, generation_failure>
{
	auto roster = normalize_roster(members);
	if (!roster) {
		return std::unexpected(generation_failure::make(error_kind::duplicate_identity, join_names(roster.error().names)));
	}

	auto bad_levels = std::ranges::to<std::vector<std::string>>(*roster | std::views::filter([](const keyed_member &m) { return !valid_level(m.data.level); }) |
																															 std::views::transform([](const keyed_member &m) { return m.data.display_name; }));
	if (!bad_levels.empty()) {
		return std::unexpected(generation_failure::make(error_kind::invalid_level, join_names(bad_levels)));
	}

	auto present = std::ranges::to<std::vector<keyed_member>>(*roster | std::views::filter([](const keyed_member &m) { return m.data.present; }));

	if (present.empty()) {
		return std::unexpected(generation_failure::make(error_kind::empty_roster));
	}

	if (team_count < constants::limits::min_teams || team_count > constants::limits::max_teams) {
		return std::unexpected(generation_failure::make(error_kind::team_count_out_of_range, std::format("got {}", team_count)));
	}

	if (static_cast<std::size_t>(team_count) > present.size()) {
		return std::unexpected(generation_failure::make(error_kind::team_count_exceeds_members, std::format("{} teams, {} present", team_count, present.size())));
	}

	rule_validator validator{*roster};
	auto excl = validator.check(exclusions);
	auto cohe = validator.check(cohesions);

	if (!excl.self_referential.empty() || !cohe.self_referential.empty()) {
		auto bad = excl.self_referential;
		bad.insert(bad.end(), cohe.self_referential.begin(), cohe.self_referential.end());
		return std::unexpected(generation_failure::make(error_kind::self_referential_rule, join_rules(bad)));
	}

	if (!excl.dangling.empty() || !cohe.dangling.empty()) {
		auto bad = excl.dangling;
		bad.insert(bad.end(), cohe.dangling.begin(), cohe.dangling.end());
		return std::unexpected(generation_failure::make(error_kind::unknown_identity_rule, join_rules(bad)));
	}

	auto graphs = build_constraint_graphs(present, excl, cohe);
	auto groups = form_atomic_groups(present, graphs.cohesion);
	auto targets = compute_targets(present, team_count);

	auto conflicts = project_conflicts(groups, present, graphs.exclusion, targets.max_size());
	if (!conflicts) {
		return std::unexpected(generation_failure::make(conflicts.error().kind, conflicts.error().detail));
	}

	return prepared{.present = std::move(present), .groups = std::move(groups), .conflicts = std::move(*conflicts), .targets = std::move(targets)};
}

auto team_service::make_seed(std::span<const keyed_member> present) -> std::uint64_t
{
	// FNV-1a over the sorted keys, mixed with the wall clock
	auto keys = std::ranges::to<std::vector<std::string>>(present | std::views::transform(&keyed_member::key));
	std::ranges::sort(keys);

	std::uint64_t h = 1469598103934665603ull;
	for (const auto &k : keys) {
		for (unsigned char c : k) {
			h ^= c;
			h *= 1099511628211ull;
		}
	}

	auto t = static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
	t ^= t >> 33;
	t *= 0xff51afd7ed558ccdULL;
	t ^= t >> 33;
	t *= 0xc4ceb9fe1a85ec53ULL;
	t ^= t >> 33;
	return h ^ t;
}

auto team_service::build_teams(const prepared &ctx, const allocation &alloc) -> std::vector<team>
{
	std::vector<std::vector<std::size_t>> indices(alloc.stats.size());
	for (const auto &g : ctx.groups) {
		auto &slot = indices[alloc.team_of[g.id]];
		slot.insert(slot.end(), g.members.begin(), g.members.end());
	}

	// roster order inside each team
	std::vector<team> out(alloc.stats.size());
	for (std::size_t t = 0; t < indices.size(); ++t) {
		std::ranges::sort(indices[t]);
		for (auto idx : indices[t]) {
			out[t].add_member(ctx.present[idx].data);
		}
	}
	return out;
}

auto team_service::generate(std::span<const member> members, std::span<const pair_rule> exclusions, std::span<const pair_rule> cohesions,
														generation_config config) -> generation_result
{
	auto ctx = prepare(members, exclusions, cohesions, config.team_count);
	if (!ctx) {
		util::log(config.log, dpp::ll_warning, "team generation rejected: {} ({})", ctx.error().message, to_string(ctx.error().kind));
		return std::unexpected(std::move(ctx.error()));
	}

	const int attempt_limit = std::max(1, config.max_attempts);
	const auto seed = config.seed ? config.seed : make_seed(ctx->present);
	std::mt19937_64 rng{seed};

	util::log(config.log, dpp::ll_debug, "generating {} teams from {} members in {} groups, seed {:#x}", config.team_count, ctx->present.size(),
						ctx->groups.size(), seed);

	greedy_assigner assigner{ctx->groups, ctx->conflicts, ctx->targets};
	local_search refiner{ctx->groups, ctx->conflicts, ctx->targets, config.refine_iterations};

	std::optional<allocation> best;
	quality_vector best_quality;
	int best_attempt = 0;
	int used = 0;
	bool stopped = false;

	for (int attempt = 1; attempt <= attempt_limit; ++attempt) {
		if (config.stop.stop_requested()) {
			stopped = true;
			break;
		}
		used = attempt;

		auto alloc = assigner.assign(rng);
		if (!alloc) {
			continue;
		}

		refiner.refine(*alloc);
		auto quality = evaluate(alloc->stats, ctx->targets);

		if (!best || quality < best_quality) {
			best = std::move(alloc);
			best_quality = quality;
			best_attempt = attempt;
			util::log(config.log, dpp::ll_debug, "attempt {}: new best {}", attempt, quality.to_string());
		}

		if (quality.perfect()) {
			break;
		}
	}

	if (!best) {
		auto failure = stopped ? generation_failure::make(error_kind::cancelled, {}, used) : generation_failure::make(error_kind::no_feasible_allocation, {}, attempt_limit);
		util::log(config.log, dpp::ll_warning, "team generation failed after {} attempts: {}", failure.attempts_used, failure.message);
		return std::unexpected(std::move(failure));
	}

	util::log(config.log, dpp::ll_info, "teams generated: best {} at attempt {} of {}{}", best_quality.to_string(), best_attempt, used,
						stopped ? " (stopped early)" : "");

	return generation_success{.teams = build_teams(*ctx, *best), .attempts_used = best_attempt};
}

} // namespace forge
