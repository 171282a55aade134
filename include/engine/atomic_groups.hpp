#pragma once

#include "core/utils.hpp"
#include "engine/constraint_graph.hpp"
#include "engine/generation.hpp"
#include "models/member.hpp"

#include <array>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace forge {

// Union-find over member indices; find() is iterative with path compression.
class disjoint_set {
public:
	explicit disjoint_set(std::size_t n);

	[[nodiscard]] auto find(std::size_t x) -> std::size_t;
	auto unite(std::size_t a, std::size_t b) -> bool;

private:
	std::vector<std::size_t> parent_;
	std::vector<std::size_t> rank_;
};

// Members forced together by keep-together rules; the unit the allocator moves.
struct atomic_group {
	std::size_t id{};
	std::vector<std::size_t> members; // indices into the present list, ascending
	int size{};
	int skill_sum{};
	std::array<int, category_count> per_category{};
	std::array<int, level_count> per_level{};
};

[[nodiscard]] auto form_atomic_groups(std::span<const keyed_member> present, const adjacency &cohesion) -> std::vector<atomic_group>;

// Keep-apart rules lifted from members to groups.
class group_graph {
public:
	explicit group_graph(std::size_t group_count = 0);

	auto link(std::size_t a, std::size_t b) -> void;

	[[nodiscard]] auto conflicts(std::size_t a, std::size_t b) const -> bool { return matrix_[a * count_ + b] != 0; }
	[[nodiscard]] auto neighbours(std::size_t g) const -> std::span<const std::size_t> { return adjacent_[g]; }
	[[nodiscard]] auto degree(std::size_t g) const -> std::size_t { return adjacent_[g].size(); }
	[[nodiscard]] auto size() const noexcept -> std::size_t { return count_; }

private:
	std::size_t count_{};
	std::vector<char> matrix_;
	std::vector<std::vector<std::size_t>> adjacent_;
};

struct projection_failure {
	error_kind kind{error_kind::contradictory_rules};
	std::string detail;
};

// Fails on a group that contains a keep-apart pair, then on a group bigger than max_team_size.
[[nodiscard]] auto project_conflicts(std::span<const atomic_group> groups, std::span<const keyed_member> present, const adjacency &exclusion,
																		 int max_team_size) -> std::expected<group_graph, projection_failure>;

} // namespace forge
