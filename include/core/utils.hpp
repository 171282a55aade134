#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forge {

namespace type {
// Error handling
struct error {
	std::string message;

	constexpr error(std::string_view sv) : message(sv) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};
} // namespace type

namespace util {
// Strip leading/trailing whitespace and collapse inner runs to one space.
[[nodiscard]] auto clean_name(std::string_view value) -> std::string;

// clean_name + case fold (ASCII and the Latin-1 block of UTF-8).
[[nodiscard]] auto normalize_name(std::string_view value) -> std::string;

[[nodiscard]] inline auto same_name(std::string_view a, std::string_view b) -> bool { return normalize_name(a) == normalize_name(b); }

// Order-independent key for an unordered pair of names.
[[nodiscard]] auto pair_key(std::string_view a, std::string_view b) -> std::string;

// Split on newlines, commas and semicolons; entries are cleaned and blanks dropped.
[[nodiscard]] auto parse_name_list(std::string_view text) -> std::vector<std::string>;

// Random lowercase hex token, 16 digits.
[[nodiscard]] auto make_token() -> std::string;

} // namespace util

} // namespace forge
