#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace forge {

// Contents of teamforge.json.
struct bot_config {
	std::string token;
	std::optional<std::uint64_t> guild_id; // register commands on this guild only
	std::string data_dir{"."};

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> bot_config
	{
		bot_config c;
		c.token = j.at("token").get<std::string>();
		if (j.contains("guild_id") && !j["guild_id"].is_null()) {
			c.guild_id = j["guild_id"].is_string() ? std::stoull(j["guild_id"].get<std::string>()) : j["guild_id"].get<std::uint64_t>();
		}
		c.data_dir = j.value("data_dir", std::string{"."});
		return c;
	}
};

} // namespace forge
