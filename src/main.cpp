#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "handlers/interaction_handler.hpp"
#include "handlers/session_manager.hpp"
#include "models/bot_config.hpp"
#include "services/persistence_service.hpp"
#include "services/roster_service.hpp"
#include "ui/message_builder.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>
#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

using namespace forge;

namespace {
// teamforge.json first, then a bare .bot_token with defaults
auto load_config() -> std::expected<bot_config, type::error>
{
	const std::filesystem::path config_path{constants::files::bot_config_file};
	if (std::filesystem::exists(config_path)) {
		try {
			std::ifstream file(config_path);
			nlohmann::json j;
			file >> j;
			return bot_config::from_json(j);
		} catch (const std::exception &e) {
			return std::unexpected(type::error{std::format("Could not read {}: {}", config_path.string(), e.what())});
		}
	}

	bot_config config;
	if (!(std::ifstream(std::string(constants::files::token_file)) >> config.token)) {
		return std::unexpected(type::error{std::format("Missing {} and {}", constants::files::bot_config_file, constants::files::token_file)});
	}
	return config;
}
} // namespace

int main()
{
	auto config = load_config();
	if (!config) {
		std::cerr << config.error().what() << "\n";
		return 1;
	}

	// Initialize services
	auto persistence = std::make_shared<persistence_service>(config->data_dir);
	auto roster_svc = std::make_shared<roster_service>(persistence);
	auto session_mgr = std::make_shared<session_manager>();
	auto panel_bld = std::make_shared<panel_builder>();

	// Load data
	if (auto res = roster_svc->load(); !res) {
		std::cerr << "Load data warning: " << res.error().what() << "\n";
	}

	// Create bot
	dpp::cluster bot(config->token);
	bot.on_log(dpp::utility::cout_logger());

	log_sink engine_log = [&bot](dpp::loglevel level, std::string_view msg) { bot.log(level, std::string(msg)); };

	// Create handlers
	auto cmd_handler = std::make_shared<command_handler>(roster_svc, session_mgr, panel_bld);
	auto int_handler = std::make_shared<interaction_handler>(roster_svc, session_mgr, panel_bld, engine_log);

	// Wire events
	bot.on_slashcommand([cmd_handler](const dpp::slashcommand_t &ev) {
		try {
			cmd_handler->on_slash(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_button_click([int_handler](const dpp::button_click_t &ev) {
		try {
			int_handler->on_button(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_select_click([int_handler](const dpp::select_click_t &ev) {
		try {
			int_handler->on_select(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_ready([&bot, guild = config->guild_id](const dpp::ready_t &) {
		auto cmds = command_handler::commands(bot.me.id);
		if (guild) {
			// Clear global commands, register on the one guild
			bot.global_bulk_command_create({});
			bot.guild_bulk_command_create(cmds, dpp::snowflake{*guild});
		}
		else {
			bot.global_bulk_command_create(cmds);
		}
	});

	// Start bot
	bot.start(dpp::st_wait);

	// Save on exit
	if (auto res = roster_svc->save(); !res) {
		std::cerr << "Save error: " << res.error().what() << "\n";
	}

	return 0;
}
