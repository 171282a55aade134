#pragma once

#include "core/log.hpp"
#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "services/roster_service.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <memory>

namespace forge {

class interaction_handler {
public:
	explicit interaction_handler(std::shared_ptr<roster_service> roster_svc, std::shared_ptr<session_manager> session_mgr,
															 std::shared_ptr<panel_builder> panel_bld, log_sink log = {});

	// Interaction handlers
	auto on_button(const dpp::button_click_t &ev) -> void;
	auto on_select(const dpp::select_click_t &ev) -> void;

private:
	std::shared_ptr<roster_service> roster_svc_;
	std::shared_ptr<session_manager> session_mgr_;
	std::shared_ptr<panel_builder> panel_bld_;
	log_sink log_;

	// Helper to parse custom_id format: "panel:<panel_id>:<action>"
	struct parsed_custom_id {
		std::string panel_id;
		std::string action;
	};

	[[nodiscard]] auto parse_custom_id(std::string_view custom_id) const -> std::optional<parsed_custom_id>;

	// Active roster, provided it is still the one the panel was opened for.
	[[nodiscard]] auto panel_roster(const panel_session &sess) const -> std::expected<std::reference_wrapper<const roster>, type::error>;

	// Runs the engine, stopping it when the interaction deadline is near.
	[[nodiscard]] auto generate_with_deadline(const panel_session &sess) const -> generation_result;

	// Button action handlers
	auto handle_generate(const dpp::button_click_t &ev, panel_session &sess) -> void;
	auto handle_export(const dpp::button_click_t &ev, panel_session &sess) -> void;
	auto handle_end(const dpp::button_click_t &ev, panel_session &sess) -> void;

	// Select action handlers
	auto handle_presence_select(const dpp::select_click_t &ev, panel_session &sess) -> void;
};

} // namespace forge
