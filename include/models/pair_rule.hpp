#pragma once

#include "models/json_field.hpp"
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace forge {

enum class rule_kind : std::uint8_t { exclusion, cohesion };

[[nodiscard]] constexpr auto to_string(rule_kind k) noexcept -> std::string_view { return k == rule_kind::exclusion ? "keep apart" : "keep together"; }

// Unordered pair of member names.
struct pair_rule {
	std::string a;
	std::string b;

	[[nodiscard]] auto operator==(const pair_rule &) const -> bool = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json { return {{"a", a}, {"b", b}}; }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> pair_rule
	{
		return {.a = json_field::get<std::string>(j, "a").value_or(""), .b = json_field::get<std::string>(j, "b").value_or("")};
	}
};

} // namespace forge
