#include "core/utils.hpp"
#include "services/export_service.hpp"

#include <format>

namespace forge {

auto export_service::format_teams_as_text(std::span<const team> teams) -> std::string
{
	std::string out;

	for (std::size_t i = 0; i < teams.size(); ++i) {
		if (i > 0)
			out += "\n\n";

		out += std::format("Team {}", i + 1);
		for (const auto &m : teams[i].members) {
			out += std::format("\n- {} (level {}, {})", m.display_name, m.level, to_string(m.cat));
		}
	}

	return out;
}

auto export_service::summarize_team(const team &t) -> std::string
{
	return std::format("Skill sum: {} | A: {} | B: {}", t.skill_sum(), t.count(category::a), t.count(category::b));
}

auto export_service::export_file_name(std::string_view roster_name) -> std::string
{
	std::string slug;
	bool pending_dash = false;

	for (char c : util::normalize_name(roster_name)) {
		auto uc = static_cast<unsigned char>(c);
		const bool keep = (uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9') || uc >= 0x80;
		if (!keep) {
			pending_dash = !slug.empty();
			continue;
		}
		if (pending_dash) {
			slug.push_back('-');
			pending_dash = false;
		}
		slug.push_back(c);
	}

	return std::format("teams-{}.txt", slug.empty() ? "roster" : slug);
}

auto export_service::teams_to_json(std::span<const team> teams) -> nlohmann::json
{
	auto out = nlohmann::json::array();
	for (const auto &t : teams) {
		auto members = nlohmann::json::array();
		for (const auto &m : t.members) {
			members.push_back(m.to_json());
		}
		out.push_back({{"members", std::move(members)}, {"skill_sum", t.skill_sum()}});
	}
	return out;
}

} // namespace forge
