#include "core/constants.hpp"
#include "ui/embed_builder.hpp"
#include "ui/panel_builder.hpp"

#include <algorithm>
#include <format>

namespace forge {

auto panel_builder::build_generate_panel(const panel_session &sess, const roster &r) const -> dpp::message
{
	dpp::message msg;
	dpp::embed e;
	e.set_title(std::format("Team panel: {}", r.name));

	const auto present = r.present_count();
	const bool can_generate = present >= static_cast<std::size_t>(sess.team_count);

	std::string body;
	body += std::format("Teams: **{}**\n", sess.team_count);
	body += std::format("Present: **{}** of {}\n", present, r.members.size());
	if (sess.seed != 0) {
		body += std::format("Seed: `{}`\n", sess.seed);
	}

	if (!can_generate) {
		body += std::format("\n⚠️ Mark at least {} members present (one per team) to generate.\n", sess.team_count);
	}
	else if (sess.teams.empty() && !sess.failure) {
		body += "\n*Pick who is present below, then press Generate*\n";
	}

	if (r.members.size() > constants::limits::max_discord_select_options) {
		body += std::format("\nOnly the first {} members fit in the menu; use `/present` for the rest.\n", constants::limits::max_discord_select_options);
	}

	e.set_description(body);
	msg.add_embed(e);

	if (sess.failure) {
		msg.add_embed(ui::embed_builder::build_failure(*sess.failure));
	}
	else if (!sess.teams.empty()) {
		msg.add_embed(ui::embed_builder::build_teams(sess.teams, sess.attempts_used));
	}

	if (!r.members.empty()) {
		dpp::component row1;
		row1.add_component(create_presence_select_menu(sess.panel_id, r));
		msg.add_component(row1);
	}

	msg.add_component(create_buttons(sess, can_generate));
	return msg;
}

auto panel_builder::create_presence_select_menu(const std::string &panel_id, const roster &r) const -> dpp::component
{
	const auto shown = std::min(r.members.size(), constants::limits::max_discord_select_options);

	dpp::component menu;
	menu.set_type(dpp::cot_selectmenu)
			.set_placeholder("Who is present?")
			.set_id(std::format("panel:{}:present", panel_id))
			.set_min_values(0)
			.set_max_values(static_cast<uint32_t>(shown));

	for (std::size_t i = 0; i < shown; ++i) {
		const auto &m = r.members[i];
		menu.add_select_option(
				dpp::select_option(m.display_name, m.display_name, std::format("level {}, {}", m.level, to_string(m.cat))).set_default(m.present));
	}

	return menu;
}

auto panel_builder::create_buttons(const panel_session &sess, bool can_generate) const -> dpp::component
{
	dpp::component row;
	row.add_component(dpp::component()
												.set_type(dpp::cot_button)
												.set_style(dpp::cos_primary)
												.set_label(sess.teams.empty() ? "Generate" : "Re-roll")
												.set_id(std::format("panel:{}:generate", sess.panel_id))
												.set_disabled(!can_generate));

	row.add_component(dpp::component()
												.set_type(dpp::cot_button)
												.set_style(dpp::cos_success)
												.set_label("Export")
												.set_id(std::format("panel:{}:export", sess.panel_id))
												.set_disabled(sess.teams.empty()));

	row.add_component(
			dpp::component().set_type(dpp::cot_button).set_style(dpp::cos_danger).set_label("End").set_id(std::format("panel:{}:end", sess.panel_id)));

	return row;
}

} // namespace forge
