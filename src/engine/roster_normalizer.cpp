#include "engine/roster_normalizer.hpp"

#include <algorithm>
#include <unordered_map>

namespace forge {

auto normalize_roster(std::span<const member> raw) -> std::expected<std::vector<keyed_member>, duplicate_names>
{
	std::vector<keyed_member> out;
	out.reserve(raw.size());

	std::unordered_map<std::string, std::string> first_seen; // key -> display name that claimed it
	duplicate_names dupes;

	auto report = [&dupes](const std::string &name) {
		if (std::ranges::find(dupes.names, name) == dupes.names.end()) {
			dupes.names.push_back(name);
		}
	};

	for (const auto &m : raw) {
		auto cleaned = util::clean_name(m.display_name);
		if (cleaned.empty()) {
			continue;
		}

		auto key = util::normalize_name(cleaned);
		if (auto [it, inserted] = first_seen.try_emplace(key, cleaned); !inserted) {
			report(it->second);
			report(cleaned);
			continue;
		}

		auto copy = m;
		copy.display_name = std::move(cleaned);
		out.push_back({.key = std::move(key), .data = std::move(copy)});
	}

	if (!dupes.names.empty()) {
		return std::unexpected(std::move(dupes));
	}

	return out;
}

} // namespace forge
