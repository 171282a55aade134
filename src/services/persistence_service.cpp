#include "core/constants.hpp"
#include "models/json_field.hpp"
#include "services/persistence_service.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <unordered_set>

namespace forge {

auto persistence_service::rosters_path() const -> std::filesystem::path { return data_dir_ / constants::files::rosters_file; }

auto persistence_service::sanitize(roster r, std::size_t index) -> roster
{
	r.id = util::clean_name(r.id);
	if (r.id.empty()) {
		r.id = util::make_token();
	}

	r.name = util::clean_name(r.name);
	if (r.name.empty()) {
		r.name = std::format("Roster {}", index + 1);
	}

	// drop blank and repeated names, first one wins
	std::unordered_set<std::string> seen;
	std::vector<member> members;
	for (auto &m : r.members) {
		m.display_name = util::clean_name(m.display_name);
		if (m.display_name.empty() || !seen.insert(util::normalize_name(m.display_name)).second) {
			continue;
		}
		members.push_back(std::move(m));
	}
	r.members = std::move(members);

	for (auto kind : {rule_kind::exclusion, rule_kind::cohesion}) {
		std::erase_if(r.rules(kind), [](pair_rule &rule) {
			rule.a = util::clean_name(rule.a);
			rule.b = util::clean_name(rule.b);
			return rule.a.empty() || rule.b.empty();
		});
	}

	return r;
}

auto persistence_service::parse(const nlohmann::json &j) -> app_data
{
	app_data data;
	if (!j.is_object()) {
		return data;
	}

	// Version-less documents predate member attributes; member::from_json accepts bare names.
	if (auto it = j.find("rosters"); it != j.end() && it->is_array()) {
		for (const auto &rj : *it) {
			if (!rj.is_object()) {
				continue;
			}
			data.rosters.push_back(sanitize(roster::from_json(rj), data.rosters.size()));
		}
	}

	auto requested = json_field::get<std::string>(j, "active_roster_id").value_or("");
	if (std::ranges::any_of(data.rosters, [&](const roster &r) { return r.id == requested; })) {
		data.active_roster_id = requested;
	}
	else if (!data.rosters.empty()) {
		data.active_roster_id = data.rosters.front().id;
	}

	return data;
}

auto persistence_service::serialize(const app_data &data) -> nlohmann::json
{
	nlohmann::json j;
	j["version"] = constants::limits::data_version;
	j["active_roster_id"] = data.active_roster_id ? nlohmann::json(*data.active_roster_id) : nlohmann::json(nullptr);
	j["rosters"] = nlohmann::json::array();
	for (const auto &r : data.rosters) {
		j["rosters"].push_back(r.to_json());
	}
	return j;
}

auto persistence_service::load() const -> std::expected<app_data, type::error>
{
	if (!std::filesystem::exists(rosters_path())) {
		return app_data{}; // Return empty data if file doesn't exist
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(rosters_path());
		nlohmann::json j;
		file >> j;
		return parse(j);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Could not load rosters: {}", e.what())});
	}
}

auto persistence_service::save(const app_data &data) const -> std::expected<std::monostate, type::error>
{
	try { // The try block is for nlohmann::json
		std::ofstream file(rosters_path());
		if (!file) {
			return std::unexpected(type::error{std::format("Could not open {} for writing", rosters_path().string())});
		}
		file << serialize(data).dump(2);
		return std::monostate{};
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Could not save rosters: {}", e.what())});
	}
}

} // namespace forge
