#pragma once

#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "services/roster_service.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <memory>

namespace forge {

class command_handler {
public:
	explicit command_handler(std::shared_ptr<roster_service> roster_svc, std::shared_ptr<session_manager> session_mgr, std::shared_ptr<panel_builder> panel_bld);

	// Command dispatch
	auto on_slash(const dpp::slashcommand_t &ev) -> void;

	// Get command definitions for registration
	[[nodiscard]] static auto commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>;

private:
	std::shared_ptr<roster_service> roster_svc_;
	std::shared_ptr<session_manager> session_mgr_;
	std::shared_ptr<panel_builder> panel_bld_;

	// Save, then answer with `ok` plus the embed built from the active roster.
	template <typename Build>
	auto save_and_reply(const dpp::slashcommand_t &ev, std::string_view ok, Build build) -> void;

	// Command implementations
	auto cmd_help(const dpp::slashcommand_t &ev) -> void;
	auto cmd_rosters(const dpp::slashcommand_t &ev) -> void;
	auto cmd_newroster(const dpp::slashcommand_t &ev) -> void;
	auto cmd_useroster(const dpp::slashcommand_t &ev) -> void;
	auto cmd_deleteroster(const dpp::slashcommand_t &ev) -> void;
	auto cmd_addmember(const dpp::slashcommand_t &ev) -> void;
	auto cmd_addmembers(const dpp::slashcommand_t &ev) -> void;
	auto cmd_removemember(const dpp::slashcommand_t &ev) -> void;
	auto cmd_members(const dpp::slashcommand_t &ev) -> void;
	auto cmd_present(const dpp::slashcommand_t &ev) -> void;
	auto cmd_rule(const dpp::slashcommand_t &ev, rule_kind kind) -> void;
	auto cmd_unrule(const dpp::slashcommand_t &ev) -> void;
	auto cmd_rules(const dpp::slashcommand_t &ev) -> void;
	auto cmd_generate(const dpp::slashcommand_t &ev) -> void;
};

} // namespace forge
