#pragma once

#include "core/utils.hpp"
#include "models/roster.hpp"

#include <expected>
#include <filesystem>
#include <variant>

namespace forge {

class persistence_service {
public:
	explicit persistence_service(std::filesystem::path data_dir = ".") : data_dir_{std::move(data_dir)} {}

	// Missing file -> empty data. Malformed entries are repaired rather than rejected.
	[[nodiscard]] auto load() const -> std::expected<app_data, type::error>;
	[[nodiscard]] auto save(const app_data &data) const -> std::expected<std::monostate, type::error>;

	// Exposed for tests: the repair pass applied by load().
	[[nodiscard]] static auto parse(const nlohmann::json &j) -> app_data;
	[[nodiscard]] static auto serialize(const app_data &data) -> nlohmann::json;

	[[nodiscard]] auto rosters_path() const -> std::filesystem::path;

private:
	std::filesystem::path data_dir_;

	[[nodiscard]] static auto sanitize(roster r, std::size_t index) -> roster;
};

} // namespace forge
