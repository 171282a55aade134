#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "ui/embed_builder.hpp"
#include "ui/message_builder.hpp"

#include <format>

namespace forge {

namespace {
[[nodiscard]] auto string_param(const dpp::slashcommand_t &ev, const std::string &name) -> std::string
{
	auto p = ev.get_parameter(name);
	return std::holds_alternative<std::string>(p) ? std::get<std::string>(p) : std::string{};
}

[[nodiscard]] auto join(std::span<const std::string> names) -> std::string
{
	std::string out;
	for (const auto &n : names) {
		if (!out.empty())
			out += ", ";
		out += n;
	}
	return out;
}
} // namespace

command_handler::command_handler(std::shared_ptr<roster_service> roster_svc, std::shared_ptr<session_manager> session_mgr,
																 std::shared_ptr<panel_builder> panel_bld)
		: roster_svc_(std::move(roster_svc)), session_mgr_(std::move(session_mgr)), panel_bld_(std::move(panel_bld))
{
}

auto command_handler::on_slash(const dpp::slashcommand_t &ev) -> void
{
	auto name = ev.command.get_command_name();

	if (name == "help")
		return cmd_help(ev);
	if (name == "rosters")
		return cmd_rosters(ev);
	if (name == "newroster")
		return cmd_newroster(ev);
	if (name == "useroster")
		return cmd_useroster(ev);
	if (name == "deleteroster")
		return cmd_deleteroster(ev);
	if (name == "addmember")
		return cmd_addmember(ev);
	if (name == "addmembers")
		return cmd_addmembers(ev);
	if (name == "removemember")
		return cmd_removemember(ev);
	if (name == "members")
		return cmd_members(ev);
	if (name == "present")
		return cmd_present(ev);
	if (name == "block")
		return cmd_rule(ev, rule_kind::exclusion);
	if (name == "together")
		return cmd_rule(ev, rule_kind::cohesion);
	if (name == "unrule")
		return cmd_unrule(ev);
	if (name == "rules")
		return cmd_rules(ev);
	if (name == "generate")
		return cmd_generate(ev);

	return ui::message_builder::reply_error(ev, constants::text::unknown_command);
}

auto command_handler::commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>
{
	std::vector<dpp::slashcommand> cmds;

	auto name_opt = [](const std::string &name, const std::string &desc) { return dpp::command_option(dpp::co_string, name, desc, true); };

	cmds.emplace_back("help", "Show the command list", bot_id);

	cmds.emplace_back("rosters", "List rosters", bot_id);
	cmds.emplace_back("newroster", "Create a roster", bot_id).add_option(name_opt("name", "Roster name"));
	cmds.emplace_back("useroster", "Switch the active roster", bot_id).add_option(name_opt("name", "Roster name"));
	cmds.emplace_back("deleteroster", "Delete a roster", bot_id).add_option(name_opt("name", "Roster name"));

	cmds.emplace_back("addmember", "Add or update a member of the active roster", bot_id)
			.add_option(name_opt("name", "Member name"))
			.add_option(dpp::command_option(dpp::co_integer, "level", "Skill level (1-3)", true)
											.set_min_value(int64_t{constants::limits::min_level})
											.set_max_value(int64_t{constants::limits::max_level}))
			.add_option(dpp::command_option(dpp::co_string, "category", "Category", false)
											.add_choice(dpp::command_option_choice("A", std::string("A")))
											.add_choice(dpp::command_option_choice("B", std::string("B")))
											.add_choice(dpp::command_option_choice("unknown", std::string("unknown"))));

	cmds.emplace_back("addmembers", "Add several members at once", bot_id).add_option(name_opt("names", "Names separated by commas"));
	cmds.emplace_back("removemember", "Remove a member and their rules", bot_id).add_option(name_opt("name", "Member name"));
	cmds.emplace_back("members", "List members of the active roster", bot_id);

	cmds.emplace_back("present", "Mark a member (or everyone) present or absent", bot_id)
			.add_option(dpp::command_option(dpp::co_boolean, "present", "Present?", true))
			.add_option(dpp::command_option(dpp::co_string, "name", "Member name (everyone if omitted)", false));

	cmds.emplace_back("block", "Keep two members on different teams", bot_id).add_option(name_opt("a", "First member")).add_option(name_opt("b", "Second member"));
	cmds.emplace_back("together", "Keep two members on the same team", bot_id)
			.add_option(name_opt("a", "First member"))
			.add_option(name_opt("b", "Second member"));

	cmds.emplace_back("unrule", "Remove a rule", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "kind", "Rule kind", true)
											.add_choice(dpp::command_option_choice("apart", std::string("apart")))
											.add_choice(dpp::command_option_choice("together", std::string("together"))))
			.add_option(name_opt("a", "First member"))
			.add_option(name_opt("b", "Second member"));

	cmds.emplace_back("rules", "List rules of the active roster", bot_id);

	cmds.emplace_back("generate", "Open the team panel", bot_id)
			.add_option(dpp::command_option(dpp::co_integer, "teams", "Number of teams (default 2)", false)
											.set_min_value(int64_t{constants::limits::min_teams})
											.set_max_value(int64_t{constants::limits::max_teams}))
			.add_option(dpp::command_option(dpp::co_integer, "seed", "Fixed seed for repeatable results", false).set_min_value(int64_t{1}));

	return cmds;
}

template <typename Build>
auto command_handler::save_and_reply(const dpp::slashcommand_t &ev, std::string_view ok, Build build) -> void
{
	if (auto res = roster_svc_->save(); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	dpp::message msg = ui::message_builder::success(ok);
	if (auto active = roster_svc_->active_roster()) {
		msg.add_embed(build(active->get()));
	}
	return ev.reply(msg);
}

auto command_handler::cmd_help(const dpp::slashcommand_t &ev) -> void
{
	auto embed = ui::embed_builder::build_help();
	ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_rosters(const dpp::slashcommand_t &ev) -> void
{
	auto rosters = roster_svc_->list_rosters();
	if (rosters.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_rosters, constants::text::no_rosters_hint);
	}

	auto active = roster_svc_->active_roster();
	auto active_id = active ? std::optional{active->get().id} : std::nullopt;
	return ev.reply(dpp::message().add_embed(ui::embed_builder::build_roster_list(rosters, active_id)));
}

auto command_handler::cmd_newroster(const dpp::slashcommand_t &ev) -> void
{
	auto res = roster_svc_->create_roster(string_param(ev, "name"));
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("Created roster {}", res->get().name), &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_useroster(const dpp::slashcommand_t &ev) -> void
{
	auto res = roster_svc_->select_roster(string_param(ev, "name"));
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("Now using roster {}", res->get().name), &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_deleteroster(const dpp::slashcommand_t &ev) -> void
{
	auto name = string_param(ev, "name");
	if (auto res = roster_svc_->remove_roster(name); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	if (auto res = roster_svc_->save(); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return ev.reply(ui::message_builder::success(std::format("🗑️ Deleted roster {}", util::clean_name(name))));
}

auto command_handler::cmd_addmember(const dpp::slashcommand_t &ev) -> void
{
	auto name = string_param(ev, "name");
	auto level = static_cast<int>(std::get<int64_t>(ev.get_parameter("level")));
	auto cat = category_from_string(string_param(ev, "category")).value_or(category::unknown);

	if (auto res = roster_svc_->upsert_member(name, level, cat); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("Saved {} (level {}, {})", util::clean_name(name), level, to_string(cat)), &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_addmembers(const dpp::slashcommand_t &ev) -> void
{
	auto res = roster_svc_->add_members(string_param(ev, "names"));
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	auto ok = std::format("Added {} member(s)", res->added.size());
	if (!res->skipped.empty()) {
		ok += std::format("; skipped duplicates: {}", join(res->skipped));
	}
	return save_and_reply(ev, ok, &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_removemember(const dpp::slashcommand_t &ev) -> void
{
	auto name = string_param(ev, "name");
	if (auto res = roster_svc_->remove_member(name); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("🗑️ Removed {}", util::clean_name(name)), &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_members(const dpp::slashcommand_t &ev) -> void
{
	auto active = roster_svc_->active_roster();
	if (!active) {
		return ui::message_builder::reply_error(ev, constants::text::no_active_roster);
	}

	if (active->get().members.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_members);
	}

	return ev.reply(dpp::message().add_embed(ui::embed_builder::build_member_list(active->get())));
}

auto command_handler::cmd_present(const dpp::slashcommand_t &ev) -> void
{
	const bool present = std::get<bool>(ev.get_parameter("present"));
	auto name = string_param(ev, "name");

	auto res = name.empty() ? roster_svc_->set_all_present(present) : roster_svc_->set_present(name, present);
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	auto who = name.empty() ? std::string("Everyone") : util::clean_name(name);
	return save_and_reply(ev, std::format("{} marked {}", who, present ? "present" : "absent"), &ui::embed_builder::build_member_list);
}

auto command_handler::cmd_rule(const dpp::slashcommand_t &ev, rule_kind kind) -> void
{
	auto a = string_param(ev, "a");
	auto b = string_param(ev, "b");

	if (auto res = roster_svc_->add_rule(kind, a, b); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("Added {} rule for {} and {}", to_string(kind), util::clean_name(a), util::clean_name(b)),
												&ui::embed_builder::build_rule_list);
}

auto command_handler::cmd_unrule(const dpp::slashcommand_t &ev) -> void
{
	const auto kind = string_param(ev, "kind") == "together" ? rule_kind::cohesion : rule_kind::exclusion;
	auto a = string_param(ev, "a");
	auto b = string_param(ev, "b");

	if (auto res = roster_svc_->remove_rule(kind, a, b); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	return save_and_reply(ev, std::format("Removed {} rule for {} and {}", to_string(kind), util::clean_name(a), util::clean_name(b)),
												&ui::embed_builder::build_rule_list);
}

auto command_handler::cmd_rules(const dpp::slashcommand_t &ev) -> void
{
	auto active = roster_svc_->active_roster();
	if (!active) {
		return ui::message_builder::reply_error(ev, constants::text::no_active_roster);
	}

	const auto &r = active->get();
	if (r.exclusions.empty() && r.cohesions.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_rules);
	}

	return ev.reply(dpp::message().add_embed(ui::embed_builder::build_rule_list(r)));
}

auto command_handler::cmd_generate(const dpp::slashcommand_t &ev) -> void
{
	int team_count = 2;
	if (auto p = ev.get_parameter("teams"); std::holds_alternative<int64_t>(p)) {
		team_count = static_cast<int>(std::get<int64_t>(p));
	}

	std::uint64_t seed = 0;
	if (auto p = ev.get_parameter("seed"); std::holds_alternative<int64_t>(p)) {
		seed = static_cast<std::uint64_t>(std::get<int64_t>(p));
	}

	auto active = roster_svc_->active_roster();
	if (!active) {
		return ui::message_builder::reply_error(ev, constants::text::no_active_roster);
	}

	if (active->get().members.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_members);
	}

	panel_session sess{.guild_id = ev.command.guild_id,
										 .channel_id = ev.command.channel_id,
										 .owner_id = ev.command.usr.id,
										 .roster_id = active->get().id,
										 .team_count = team_count,
										 .seed = seed};

	auto panel_id = session_mgr_->create_session(std::move(sess));
	auto session = session_mgr_->get_session(panel_id);
	if (!session) {
		return ui::message_builder::reply_error(ev, "Could not open a panel");
	}

	auto msg = panel_bld_->build_generate_panel(session->get(), active->get());
	msg.set_content(std::format("👑 Panel owner: <@{}>; only the owner can use it", static_cast<std::uint64_t>(session->get().owner_id)));
	return ev.reply(msg);
}

} // namespace forge
