#pragma once

#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "models/roster.hpp"
#include <dpp/dpp.h>

#include <string>

namespace forge {

class panel_builder {
public:
	// Build team generation panel
	[[nodiscard]] auto build_generate_panel(const panel_session &sess, const roster &r) const -> dpp::message;

private:
	// Helper methods
	[[nodiscard]] auto create_presence_select_menu(const std::string &panel_id, const roster &r) const -> dpp::component;
	[[nodiscard]] auto create_buttons(const panel_session &sess, bool can_generate) const -> dpp::component;
};

} // namespace forge
