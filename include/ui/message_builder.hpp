#pragma once

#include "core/constants.hpp"
#include <dpp/dpp.h>

#include <format>
#include <string_view>

namespace forge::ui {

template <typename T>
concept Replyable = requires(const T &t, dpp::message m) { t.reply(m); };

// Chat replies. Errors are ephemeral so only the caller sees them.
class message_builder {
public:
	[[nodiscard]] static auto error(std::string_view msg, std::string_view hint = {}) -> dpp::message
	{
		auto text = std::format("{}{}", constants::text::err_prefix, msg);
		if (!hint.empty()) {
			text += std::format("\n{}{}", constants::text::hint_prefix, hint);
		}
		return dpp::message{text}.set_flags(dpp::m_ephemeral);
	}

	[[nodiscard]] static auto success(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::ok_prefix, msg)}; }

	static auto reply_error(const Replyable auto &event, std::string_view msg, std::string_view hint = {}) -> void { event.reply(error(msg, hint)); }
};

} // namespace forge::ui
