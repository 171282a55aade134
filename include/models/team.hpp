#pragma once

#include "models/member.hpp"

#include <algorithm>
#include <numeric>
#include <ranges>
#include <vector>

namespace forge {

class team {
public:
	std::vector<member> members;

	// computed property using explicit object parameter
	[[nodiscard]] auto skill_sum(this const auto &self) -> int
	{
		return std::ranges::fold_left(self.members | std::views::transform(&member::level), 0, std::plus{});
	}

	[[nodiscard]] auto count(this const auto &self, category c) -> std::size_t
	{
		return static_cast<std::size_t>(std::ranges::count(self.members, c, &member::cat));
	}

	auto add_member(this auto &self, member m) -> void { self.members.push_back(std::move(m)); }

	[[nodiscard]] auto size(this const auto &self) -> std::size_t { return self.members.size(); }

	[[nodiscard]] auto empty(this const auto &self) -> bool { return self.members.empty(); }
};

} // namespace forge
