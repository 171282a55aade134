#pragma once

#include "core/utils.hpp"
#include "models/member.hpp"
#include "models/pair_rule.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <ranges>
#include <vector>

namespace forge {

// A named group of people plus the pairwise rules that apply to them.
class roster {
public:
	std::string id;
	std::string name;
	std::vector<member> members;
	std::vector<pair_rule> exclusions;
	std::vector<pair_rule> cohesions;

	[[nodiscard]] auto rules(this auto &self, rule_kind kind) -> auto &
	{
		return kind == rule_kind::exclusion ? self.exclusions : self.cohesions;
	}

	[[nodiscard]] auto find_member(this auto &self, std::string_view member_name) -> decltype(&self.members.front())
	{
		auto key = util::normalize_name(member_name);
		auto it = std::ranges::find_if(self.members, [&](const member &m) { return util::normalize_name(m.display_name) == key; });
		return it == self.members.end() ? nullptr : &*it;
	}

	[[nodiscard]] auto present_count(this const auto &self) -> std::size_t
	{
		return static_cast<std::size_t>(std::ranges::count(self.members, true, &member::present));
	}

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		auto as_json = [](const auto &x) { return x.to_json(); };

		nlohmann::json out;
		out["id"] = self.id;
		out["name"] = self.name;
		out["members"] = std::ranges::to<std::vector<nlohmann::json>>(self.members | std::views::transform(as_json));
		out["exclusions"] = std::ranges::to<std::vector<nlohmann::json>>(self.exclusions | std::views::transform(as_json));
		out["cohesions"] = std::ranges::to<std::vector<nlohmann::json>>(self.cohesions | std::views::transform(as_json));
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> roster
	{
		roster r;
		r.id = json_field::get<std::string>(j, "id").value_or("");
		r.name = json_field::get<std::string>(j, "name").value_or("");

		if (auto it = j.find("members"); it != j.end() && it->is_array()) {
			for (const auto &mj : *it) {
				if (mj.is_string() || mj.is_object()) {
					r.members.push_back(member::from_json(mj));
				}
			}
		}

		for (auto kind : {rule_kind::exclusion, rule_kind::cohesion}) {
			auto it = j.find(kind == rule_kind::exclusion ? "exclusions" : "cohesions");
			if (it == j.end() || !it->is_array()) {
				continue;
			}
			for (const auto &rj : *it) {
				if (!rj.is_object())
					continue;
				r.rules(kind).push_back(pair_rule::from_json(rj));
			}
		}

		return r;
	}
};

// Everything the bot persists.
struct app_data {
	int version{constants::limits::data_version};
	std::optional<std::string> active_roster_id;
	std::vector<roster> rosters;
};

} // namespace forge
