#include "core/constants.hpp"
#include "services/export_service.hpp"
#include "ui/embed_builder.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace forge::ui {

auto embed_builder::build_help() -> dpp::embed
{
	dpp::embed e;
	e.set_title("Commands / Help");

	e.add_field("Rosters",
							"• `/newroster <name>` create a roster (the first one becomes active)\n"
							"• `/useroster <name>` switch the active roster\n"
							"• `/rosters` list rosters\n"
							"• `/deleteroster <name>` delete a roster",
							false);

	e.add_field("Members",
							"• `/addmember <name> <level> [category]` add or update a member (level 1-3, category A/B)\n"
							"• `/addmembers <names>` add many at once, separated by commas\n"
							"• `/removemember <name>` remove a member and their rules\n"
							"• `/present [name] <present>` mark one member, or everyone, present/absent\n"
							"• `/members` list members",
							false);

	e.add_field("Rules",
							"• `/block <a> <b>` keep two members apart\n"
							"• `/together <a> <b>` keep two members on the same team\n"
							"• `/unrule <kind> <a> <b>` remove a rule\n"
							"• `/rules` list rules",
							false);

	e.add_field("Teams",
							"• `/generate [teams] [seed]` open the team panel, 2 teams by default\n"
							"• Pick who is present in the menu (Discord limit: 25 entries)\n"
							"• Press **Generate** to build or re-roll teams\n"
							"• Press **Export** to get the teams as a text file\n"
							"• Press **End** to close the panel",
							false);

	return e;
}

auto embed_builder::build_roster_list(std::span<const roster> rosters, const std::optional<std::string> &active_id) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Rosters");

	std::string desc;
	for (const auto &r : rosters) {
		const bool is_active = active_id && *active_id == r.id;
		desc += std::format("{}**{}**: {} members, {} present\n", is_active ? "▶ " : "", r.name, r.members.size(), r.present_count());
	}

	e.set_description(desc);
	return e;
}

auto embed_builder::format_member(const member &m) -> std::string
{
	return std::format("{}{} (level {}, {})", m.present ? "" : "~~", m.display_name, m.level, to_string(m.cat)) + (m.present ? "" : "~~");
}

auto embed_builder::build_member_list(const roster &r) -> dpp::embed
{
	dpp::embed e;
	e.set_title(std::format("Members of {}", r.name));

	std::string desc;
	for (const auto &m : r.members) {
		desc += "• " + format_member(m) + "\n";
	}
	desc += std::format("\n{} of {} present", r.present_count(), r.members.size());

	e.set_description(desc);
	return e;
}

auto embed_builder::format_rules(std::span<const pair_rule> rules) -> std::string
{
	if (rules.empty()) {
		return "-";
	}

	std::string out;
	for (const auto &rule : rules) {
		out += std::format("• {} / {}\n", rule.a, rule.b);
	}
	return out;
}

auto embed_builder::build_rule_list(const roster &r) -> dpp::embed
{
	dpp::embed e;
	e.set_title(std::format("Rules of {}", r.name));
	e.add_field("Keep apart", format_rules(r.exclusions), true);
	e.add_field("Keep together", format_rules(r.cohesions), true);
	return e;
}

auto embed_builder::build_teams(std::span<const team> teams, int attempts_used) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Generated teams");

	for (std::size_t i = 0; i < teams.size(); ++i) {
		std::string body;
		for (const auto &m : teams[i].members) {
			body += std::format("• {} ({})\n", m.display_name, m.level);
		}
		body += export_service::summarize_team(teams[i]);
		e.add_field(std::format("Team {} ({} members)", i + 1, teams[i].size()), body, true);
	}

	auto sums = teams | std::views::transform([](const team &t) { return t.skill_sum(); });
	if (!teams.empty()) {
		auto [lo, hi] = std::ranges::minmax(sums);
		e.set_footer(dpp::embed_footer().set_text(std::format("Skill spread {} • found on attempt {}", hi - lo, attempts_used)));
	}

	return e;
}

auto embed_builder::build_failure(const generation_failure &failure) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Could not generate teams");
	e.set_color(dpp::colors::red);
	e.set_description(std::format("{}{}\n{}{}", constants::text::err_prefix, failure.message, constants::text::hint_prefix, failure.suggestion));
	if (failure.attempts_used > 0) {
		e.set_footer(dpp::embed_footer().set_text(std::format("{} attempts", failure.attempts_used)));
	}
	return e;
}

} // namespace forge::ui
