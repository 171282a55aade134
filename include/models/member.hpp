#pragma once

#include "core/constants.hpp"
#include "models/json_field.hpp"
#include <nlohmann/json.hpp>

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace forge {

enum class category : std::uint8_t { a, b, unknown };

inline constexpr std::array all_categories{category::a, category::b, category::unknown};
inline constexpr std::size_t category_count = all_categories.size();
inline constexpr std::size_t level_count = constants::limits::max_level;

[[nodiscard]] constexpr auto to_string(category c) noexcept -> std::string_view
{
	switch (c) {
	case category::a:
		return "A";
	case category::b:
		return "B";
	case category::unknown:
		break;
	}
	return "unknown";
}

[[nodiscard]] inline auto category_from_string(std::string_view s) -> std::optional<category>
{
	if (s == "A" || s == "a")
		return category::a;
	if (s == "B" || s == "b")
		return category::b;
	if (s == "unknown" || s == "?" || s.empty())
		return category::unknown;
	return std::nullopt;
}

[[nodiscard]] constexpr auto index_of(category c) noexcept -> std::size_t { return static_cast<std::size_t>(c); }

[[nodiscard]] constexpr auto valid_level(int level) noexcept -> bool
{
	return level >= constants::limits::min_level && level <= constants::limits::max_level;
}

class member {
public:
	std::string display_name;
	int level{constants::limits::default_level};
	category cat{category::unknown};
	bool present{true};

	[[nodiscard]] auto operator<=>(const member &) const = default;

	// explicit object parameter for const correctness
	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"name", self.display_name}, {"level", self.level}, {"category", to_string(self.cat)}, {"present", self.present}};
	}

	// Lenient: missing or mistyped fields, unknown categories and out-of-range levels fall back to defaults.
	// Anything but a string or an object yields a blank name, which the loader drops.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> member
	{
		if (j.is_string()) {
			return {.display_name = j.get<std::string>()};
		}

		auto level = json_field::get<int>(j, "level").value_or(constants::limits::default_level);
		return {.display_name = json_field::get<std::string>(j, "name").value_or(""),
						.level = valid_level(level) ? level : constants::limits::default_level,
						.cat = category_from_string(json_field::get<std::string>(j, "category").value_or("")).value_or(category::unknown),
						.present = json_field::get<bool>(j, "present").value_or(true)};
	}

	// Copy with one field changed.
	[[nodiscard]] auto with_present(this const auto &self, bool present) -> member
	{
		auto copy = self;
		copy.present = present;
		return copy;
	}
};

} // namespace forge
