#include "core/constants.hpp"
#include "services/roster_service.hpp"
#include "services/team_service.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace forge {

roster_service::roster_service(std::shared_ptr<persistence_service> persistence) : persistence_(std::move(persistence)) {}

auto roster_service::load() -> std::expected<std::monostate, type::error>
{
	if (auto res = persistence_->load()) {
		data_ = std::move(*res);
	}
	else {
		return std::unexpected(res.error());
	}

	return std::monostate{};
}

auto roster_service::save() const -> std::expected<std::monostate, type::error> { return persistence_->save(data_); }

auto roster_service::find_roster(std::string_view name) -> std::vector<roster>::iterator
{
	auto key = util::normalize_name(name);
	return std::ranges::find_if(data_.rosters, [&](const roster &r) { return util::normalize_name(r.name) == key; });
}

auto roster_service::active_roster() const -> std::optional<std::reference_wrapper<const roster>>
{
	if (!data_.active_roster_id) {
		return std::nullopt;
	}

	auto it = std::ranges::find(data_.rosters, *data_.active_roster_id, &roster::id);
	return it == data_.rosters.end() ? std::nullopt : std::optional{std::cref(*it)};
}

auto roster_service::require_active() -> std::expected<std::reference_wrapper<roster>, type::error>
{
	if (data_.active_roster_id) {
		if (auto it = std::ranges::find(data_.rosters, *data_.active_roster_id, &roster::id); it != data_.rosters.end()) {
			return std::ref(*it);
		}
	}
	return std::unexpected(type::error{constants::text::no_active_roster});
}

auto roster_service::create_roster(std::string_view name) -> std::expected<std::reference_wrapper<const roster>, type::error>
{
	auto cleaned = util::clean_name(name);
	if (cleaned.empty()) {
		return std::unexpected(type::error{"Roster name cannot be empty"});
	}

	if (find_roster(cleaned) != data_.rosters.end()) {
		return std::unexpected(type::error{std::format("A roster named {} already exists", cleaned)});
	}

	data_.rosters.push_back({.id = util::make_token(), .name = std::move(cleaned)});
	if (!data_.active_roster_id) {
		data_.active_roster_id = data_.rosters.back().id;
	}

	return std::cref(data_.rosters.back());
}

auto roster_service::remove_roster(std::string_view name) -> std::expected<std::monostate, type::error>
{
	auto it = find_roster(name);
	if (it == data_.rosters.end()) {
		return std::unexpected(type::error{std::format("No roster named {}", util::clean_name(name))});
	}

	const bool was_active = data_.active_roster_id == it->id;
	data_.rosters.erase(it);

	if (was_active) {
		data_.active_roster_id = data_.rosters.empty() ? std::nullopt : std::optional{data_.rosters.front().id};
	}

	return std::monostate{};
}

auto roster_service::select_roster(std::string_view name) -> std::expected<std::reference_wrapper<const roster>, type::error>
{
	auto it = find_roster(name);
	if (it == data_.rosters.end()) {
		return std::unexpected(type::error{std::format("No roster named {}", util::clean_name(name))});
	}

	data_.active_roster_id = it->id;
	return std::cref(*it);
}

auto roster_service::upsert_member(std::string_view name, int level, category cat) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}
	auto &r = active->get();

	auto cleaned = util::clean_name(name);
	if (cleaned.empty()) {
		return std::unexpected(type::error{"Member name cannot be empty"});
	}

	if (!valid_level(level)) {
		return std::unexpected(type::error{std::format("Level must be between {} and {}", constants::limits::min_level, constants::limits::max_level)});
	}

	if (auto *m = r.find_member(cleaned)) {
		m->display_name = std::move(cleaned);
		m->level = level;
		m->cat = cat;
		return std::monostate{};
	}

	r.members.push_back({.display_name = std::move(cleaned), .level = level, .cat = cat, .present = true});
	return std::monostate{};
}

auto roster_service::add_members(std::string_view text) -> std::expected<bulk_result, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}
	auto &r = active->get();

	bulk_result out;
	std::unordered_set<std::string> seen;
	for (const auto &m : r.members) {
		seen.insert(util::normalize_name(m.display_name));
	}

	for (auto &name : util::parse_name_list(text)) {
		if (!seen.insert(util::normalize_name(name)).second) {
			out.skipped.push_back(std::move(name));
			continue;
		}
		r.members.push_back({.display_name = name});
		out.added.push_back(std::move(name));
	}

	return out;
}

auto roster_service::remove_member(std::string_view name) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}
	auto &r = active->get();

	auto key = util::normalize_name(name);
	if (std::erase_if(r.members, [&](const member &m) { return util::normalize_name(m.display_name) == key; }) == 0) {
		return std::unexpected(type::error{std::format("No member named {}", util::clean_name(name))});
	}

	// rules mentioning the member would dangle
	for (auto kind : {rule_kind::exclusion, rule_kind::cohesion}) {
		std::erase_if(r.rules(kind), [&](const pair_rule &rule) { return util::normalize_name(rule.a) == key || util::normalize_name(rule.b) == key; });
	}

	return std::monostate{};
}

auto roster_service::set_present(std::string_view name, bool present) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}

	auto *m = active->get().find_member(name);
	if (!m) {
		return std::unexpected(type::error{std::format("No member named {}", util::clean_name(name))});
	}

	*m = m->with_present(present);
	return std::monostate{};
}

auto roster_service::set_all_present(bool present) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}

	for (auto &m : active->get().members) {
		m.present = present;
	}
	return std::monostate{};
}

auto roster_service::set_present_only(std::span<const std::string> names) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}
	auto &r = active->get();

	std::unordered_set<std::string> wanted;
	for (const auto &n : names) {
		if (!r.find_member(n)) {
			return std::unexpected(type::error{std::format("No member named {}", util::clean_name(n))});
		}
		wanted.insert(util::normalize_name(n));
	}

	for (auto &m : r.members) {
		m.present = wanted.contains(util::normalize_name(m.display_name));
	}
	return std::monostate{};
}

auto roster_service::add_rule(rule_kind kind, std::string_view a, std::string_view b) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}
	auto &r = active->get();

	if (util::same_name(a, b)) {
		return std::unexpected(type::error{constants::failure::self_referential_rule});
	}

	const auto *ma = r.find_member(a);
	const auto *mb = r.find_member(b);
	if (!ma || !mb) {
		return std::unexpected(type::error{std::format("No member named {}", util::clean_name(ma ? b : a))});
	}

	auto key = util::pair_key(a, b);
	auto same_pair = [&](const pair_rule &rule) { return util::pair_key(rule.a, rule.b) == key; };

	if (std::ranges::any_of(r.rules(kind), same_pair)) {
		return std::unexpected(type::error{std::format("{} and {} already have a {} rule", ma->display_name, mb->display_name, to_string(kind))});
	}

	const auto other = kind == rule_kind::exclusion ? rule_kind::cohesion : rule_kind::exclusion;
	if (std::ranges::any_of(r.rules(other), same_pair)) {
		return std::unexpected(
				type::error{std::format("{}: {} and {} already have a {} rule", constants::failure::contradictory_rules, ma->display_name, mb->display_name, to_string(other))});
	}

	r.rules(kind).push_back({.a = ma->display_name, .b = mb->display_name});
	return std::monostate{};
}

auto roster_service::remove_rule(rule_kind kind, std::string_view a, std::string_view b) -> std::expected<std::monostate, type::error>
{
	auto active = require_active();
	if (!active) {
		return std::unexpected(active.error());
	}

	auto key = util::pair_key(a, b);
	if (std::erase_if(active->get().rules(kind), [&](const pair_rule &rule) { return util::pair_key(rule.a, rule.b) == key; }) == 0) {
		return std::unexpected(type::error{std::format("No {} rule for {} and {}", to_string(kind), util::clean_name(a), util::clean_name(b))});
	}
	return std::monostate{};
}

auto roster_service::rules(rule_kind kind) const -> std::vector<pair_rule>
{
	auto active = active_roster();
	return active ? active->get().rules(kind) : std::vector<pair_rule>{};
}

auto roster_service::generate(generation_config config) const -> generation_result
{
	auto active = active_roster();
	if (!active) {
		return std::unexpected(generation_failure::make(error_kind::empty_roster, constants::text::no_active_roster));
	}

	const auto &r = active->get();
	return team_service::generate(r.members, r.exclusions, r.cohesions, std::move(config));
}

} // namespace forge
