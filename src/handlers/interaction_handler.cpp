#include "core/constants.hpp"
#include "handlers/interaction_handler.hpp"
#include "services/export_service.hpp"
#include "ui/message_builder.hpp"

#include <condition_variable>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>

namespace forge {

interaction_handler::interaction_handler(std::shared_ptr<roster_service> roster_svc, std::shared_ptr<session_manager> session_mgr,
																				 std::shared_ptr<panel_builder> panel_bld, log_sink log)
		: roster_svc_(std::move(roster_svc)), session_mgr_(std::move(session_mgr)), panel_bld_(std::move(panel_bld)), log_(std::move(log))
{
}

auto interaction_handler::parse_custom_id(std::string_view custom_id) const -> std::optional<parsed_custom_id>
{
	if (!custom_id.starts_with("panel:")) {
		return std::nullopt;
	}

	auto rest = custom_id.substr(6);
	auto colon = rest.find(':');
	if (colon == std::string_view::npos || colon == 0 || colon + 1 == rest.size()) {
		return std::nullopt;
	}

	return parsed_custom_id{.panel_id = std::string(rest.substr(0, colon)), .action = std::string(rest.substr(colon + 1))};
}

auto interaction_handler::panel_roster(const panel_session &sess) const -> std::expected<std::reference_wrapper<const roster>, type::error>
{
	auto active = roster_svc_->active_roster();
	if (!active || active->get().id != sess.roster_id) {
		return std::unexpected(type::error{constants::text::roster_changed});
	}
	return *active;
}

auto interaction_handler::on_button(const dpp::button_click_t &ev) -> void
{
	auto parsed = parse_custom_id(ev.custom_id);
	if (!parsed) {
		return ui::message_builder::reply_error(ev, constants::text::unsupported_button);
	}

	auto session = session_mgr_->validate_owner(parsed->panel_id, ev.command.usr.id);
	if (!session) {
		return ui::message_builder::reply_error(ev, session.error().what());
	}

	auto &sess = session->get();
	if (parsed->action == "generate") {
		handle_generate(ev, sess);
	}
	else if (parsed->action == "export") {
		handle_export(ev, sess);
	}
	else if (parsed->action == "end") {
		handle_end(ev, sess);
	}
	else {
		ui::message_builder::reply_error(ev, constants::text::unsupported_button);
	}
}

auto interaction_handler::on_select(const dpp::select_click_t &ev) -> void
{
	auto parsed = parse_custom_id(ev.custom_id);
	if (!parsed) {
		return ui::message_builder::reply_error(ev, constants::text::unsupported_select);
	}

	auto session = session_mgr_->validate_owner(parsed->panel_id, ev.command.usr.id);
	if (!session) {
		return ui::message_builder::reply_error(ev, session.error().what());
	}

	if (parsed->action == "present") {
		handle_presence_select(ev, session->get());
	}
	else {
		ui::message_builder::reply_error(ev, constants::text::unsupported_select);
	}
}

auto interaction_handler::generate_with_deadline(const panel_session &sess) const -> generation_result
{
	std::stop_source stop;

	// Requests stop once the deadline passes; leaving scope wakes and joins it.
	std::jthread watchdog([&stop](std::stop_token st) {
		std::mutex m;
		std::condition_variable_any cv;
		std::unique_lock lock(m);
		cv.wait_for(lock, st, constants::limits::generate_deadline, [] { return false; });
		if (!st.stop_requested()) {
			stop.request_stop();
		}
	});

	return roster_svc_->generate({.team_count = sess.team_count, .seed = sess.seed, .stop = stop.get_token(), .log = log_});
}

auto interaction_handler::handle_generate(const dpp::button_click_t &ev, panel_session &sess) -> void
{
	auto r = panel_roster(sess);
	if (!r) {
		return ui::message_builder::reply_error(ev, r.error().what(), constants::text::roster_changed_hint);
	}

	if (auto res = generate_with_deadline(sess)) {
		sess.teams = std::move(res->teams);
		sess.attempts_used = res->attempts_used;
		sess.failure.reset();
	}
	else {
		sess.teams.clear();
		sess.attempts_used = res.error().attempts_used;
		sess.failure = std::move(res.error());
	}

	auto msg = panel_bld_->build_generate_panel(sess, r->get());
	ev.reply(dpp::ir_update_message, msg);
}

auto interaction_handler::handle_export(const dpp::button_click_t &ev, panel_session &sess) -> void
{
	if (sess.teams.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_teams_yet, constants::text::no_teams_yet_hint);
	}

	auto r = panel_roster(sess);
	if (!r) {
		return ui::message_builder::reply_error(ev, r.error().what(), constants::text::roster_changed_hint);
	}

	dpp::message msg;
	msg.set_content(std::format("📄 Teams for {}", r->get().name));
	msg.add_file(export_service::export_file_name(r->get().name), export_service::format_teams_as_text(sess.teams));
	return ev.reply(msg);
}

auto interaction_handler::handle_end(const dpp::button_click_t &ev, panel_session &sess) -> void
{
	sess.active = false;
	const auto owner = sess.owner_id;
	session_mgr_->remove_session(sess.panel_id);

	dpp::message msg;
	msg.set_content(std::format("🔒 Panel closed by <@{}>", static_cast<std::uint64_t>(owner)));
	return ev.reply(dpp::ir_update_message, msg);
}

auto interaction_handler::handle_presence_select(const dpp::select_click_t &ev, panel_session &sess) -> void
{
	auto r = panel_roster(sess);
	if (!r) {
		return ui::message_builder::reply_error(ev, r.error().what(), constants::text::roster_changed_hint);
	}

	// members past the menu limit keep their current flag
	std::vector<std::string> present(ev.values.begin(), ev.values.end());
	const auto &members = r->get().members;
	for (std::size_t i = constants::limits::max_discord_select_options; i < members.size(); ++i) {
		if (members[i].present) {
			present.push_back(members[i].display_name);
		}
	}

	if (auto res = roster_svc_->set_present_only(present); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	if (auto res = roster_svc_->save(); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	sess.teams.clear();
	sess.failure.reset();

	auto msg = panel_bld_->build_generate_panel(sess, r->get());
	return ev.reply(dpp::ir_update_message, msg);
}

} // namespace forge
