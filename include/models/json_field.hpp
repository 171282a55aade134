#pragma once

#include <nlohmann/json.hpp>

#include <concepts>
#include <optional>
#include <string>

namespace forge::json_field {

// Value of j[key] when j is an object holding that key with the expected JSON type, nullopt otherwise.
template <typename T>
[[nodiscard]] auto get(const nlohmann::json &j, const char *key) -> std::optional<T>
{
	if (!j.is_object()) {
		return std::nullopt;
	}

	auto it = j.find(key);
	if (it == j.end()) {
		return std::nullopt;
	}

	if constexpr (std::same_as<T, std::string>) {
		if (!it->is_string())
			return std::nullopt;
	}
	else if constexpr (std::same_as<T, bool>) {
		if (!it->is_boolean())
			return std::nullopt;
	}
	else if constexpr (std::integral<T>) {
		if (!it->is_number_integer())
			return std::nullopt;
	}

	return it->template get<T>();
}

} // namespace forge::json_field
