#pragma once

#include <dpp/misc-enum.h>

#include <format>
#include <functional>
#include <string_view>

namespace forge {

// Same shape as dpp::cluster::log, so the bot can forward engine messages as-is.
using log_sink = std::function<void(dpp::loglevel, std::string_view)>;

namespace util {
template <typename... Args>
auto log(const log_sink &sink, dpp::loglevel level, std::format_string<Args...> fmt, Args &&...args) -> void
{
	if (sink) {
		sink(level, std::format(fmt, std::forward<Args>(args)...));
	}
}
} // namespace util

} // namespace forge
