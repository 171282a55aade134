#include "core/utils.hpp"

#include <format>
#include <random>

namespace forge::util {

namespace {
[[nodiscard]] constexpr auto is_space(char c) noexcept -> bool { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; }

[[nodiscard]] constexpr auto is_separator(char c) noexcept -> bool { return c == '\n' || c == ',' || c == ';'; }
} // namespace

auto clean_name(std::string_view value) -> std::string
{
	std::string out;
	out.reserve(value.size());

	bool pending_space = false;
	for (char c : value) {
		if (is_space(c)) {
			pending_space = !out.empty();
			continue;
		}
		if (pending_space) {
			out.push_back(' ');
			pending_space = false;
		}
		out.push_back(c);
	}

	return out;
}

auto normalize_name(std::string_view value) -> std::string
{
	auto out = clean_name(value);

	for (std::size_t i = 0; i < out.size(); ++i) {
		auto c = static_cast<unsigned char>(out[i]);
		if (c >= 'A' && c <= 'Z') {
			out[i] = static_cast<char>(c + ('a' - 'A'));
			continue;
		}

		// U+00C0..U+00DE (minus U+00D7) encode as C3 80..C3 9E; lowercase is +0x20 on the trail byte.
		if (c == 0xC3 && i + 1 < out.size()) {
			auto trail = static_cast<unsigned char>(out[i + 1]);
			if (trail >= 0x80 && trail <= 0x9E && trail != 0x97) {
				out[i + 1] = static_cast<char>(trail + 0x20);
			}
			++i;
		}
	}

	return out;
}

auto pair_key(std::string_view a, std::string_view b) -> std::string
{
	auto first = normalize_name(a);
	auto second = normalize_name(b);
	return first < second ? std::format("{}||{}", first, second) : std::format("{}||{}", second, first);
}

auto parse_name_list(std::string_view text) -> std::vector<std::string>
{
	std::vector<std::string> out;

	std::size_t start = 0;
	for (std::size_t i = 0; i <= text.size(); ++i) {
		if (i < text.size() && !is_separator(text[i])) {
			continue;
		}

		if (auto name = clean_name(text.substr(start, i - start)); !name.empty()) {
			out.push_back(std::move(name));
		}
		start = i + 1;
	}

	return out;
}

auto make_token() -> std::string
{
	static std::mt19937_64 rng{std::random_device{}()};
	std::uniform_int_distribution<std::uint64_t> dist;
	return std::format("{:016x}", dist(rng));
}

} // namespace forge::util
