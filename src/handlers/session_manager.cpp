#include "core/constants.hpp"
#include "handlers/session_manager.hpp"

#include <algorithm>

namespace forge {

auto session_manager::create_session(panel_session session) -> std::string
{
	session.panel_id = util::make_token();
	auto id = session.panel_id;

	// make room first so the new panel is never the one evicted
	cleanup_old_sessions(constants::limits::max_live_sessions - 1);
	sessions_.insert_or_assign(id, std::move(session));
	return id;
}

auto session_manager::get_session(std::string_view id) -> std::optional<std::reference_wrapper<panel_session>>
{
	auto it = sessions_.find(std::string{id});
	if (it == sessions_.end() || !it->second.active) {
		return std::nullopt;
	}

	it->second.last_accessed_at = std::chrono::steady_clock::now();
	return std::ref(it->second);
}

auto session_manager::validate_owner(std::string_view id, dpp::snowflake owner) -> std::expected<std::reference_wrapper<panel_session>, type::error>
{
	auto sess = get_session(id);
	if (!sess) {
		return std::unexpected(type::error{constants::text::panel_expired});
	}

	if (sess->get().owner_id != owner) {
		return std::unexpected(type::error{constants::text::panel_owner_only});
	}

	return *sess;
}

auto session_manager::remove_session(std::string_view id) -> void { sessions_.erase(std::string{id}); }

auto session_manager::cleanup_old_sessions(std::size_t max_sessions) -> void
{
	std::erase_if(sessions_, [](const auto &entry) { return !entry.second.active; });

	// evict the least recently used panel until under the cap
	while (sessions_.size() > max_sessions) {
		auto oldest = std::ranges::min_element(sessions_, {}, [](const auto &entry) { return entry.second.last_accessed_at; });
		sessions_.erase(oldest);
	}
}

} // namespace forge
