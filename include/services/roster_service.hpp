#pragma once

#include "core/utils.hpp"
#include "engine/generation.hpp"
#include "models/roster.hpp"
#include "services/persistence_service.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace forge {

class roster_service {
public:
	explicit roster_service(std::shared_ptr<persistence_service> persistence);

	// Roster management
	[[nodiscard]] auto create_roster(std::string_view name) -> std::expected<std::reference_wrapper<const roster>, type::error>;
	[[nodiscard]] auto remove_roster(std::string_view name) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto select_roster(std::string_view name) -> std::expected<std::reference_wrapper<const roster>, type::error>;
	[[nodiscard]] auto list_rosters() const -> std::span<const roster> { return data_.rosters; }
	[[nodiscard]] auto active_roster() const -> std::optional<std::reference_wrapper<const roster>>;

	// Member management, all on the active roster
	struct bulk_result {
		std::vector<std::string> added;
		std::vector<std::string> skipped; // already in the roster or repeated in the batch
	};

	[[nodiscard]] auto upsert_member(std::string_view name, int level, category cat) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto add_members(std::string_view text) -> std::expected<bulk_result, type::error>;
	[[nodiscard]] auto remove_member(std::string_view name) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto set_present(std::string_view name, bool present) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto set_all_present(bool present) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto set_present_only(std::span<const std::string> names) -> std::expected<std::monostate, type::error>;

	// Rule management
	[[nodiscard]] auto add_rule(rule_kind kind, std::string_view a, std::string_view b) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto remove_rule(rule_kind kind, std::string_view a, std::string_view b) -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto rules(rule_kind kind) const -> std::vector<pair_rule>;

	// Runs the engine on the active roster
	[[nodiscard]] auto generate(generation_config config) const -> generation_result;

	// Persistence
	[[nodiscard]] auto load() -> std::expected<std::monostate, type::error>;
	[[nodiscard]] auto save() const -> std::expected<std::monostate, type::error>;

private:
	std::shared_ptr<persistence_service> persistence_;
	app_data data_;

	[[nodiscard]] auto find_roster(std::string_view name) -> std::vector<roster>::iterator;
	[[nodiscard]] auto require_active() -> std::expected<std::reference_wrapper<roster>, type::error>;
};

} // namespace forge
