#include "services/team_service.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <ranges>
#include <set>

using namespace forge;
using test_helpers::make_member;
using test_helpers::team_index_of;

namespace {
auto seeded(int team_count, std::uint64_t seed = 42, int max_attempts = 200) -> generation_config
{
	return {.team_count = team_count, .max_attempts = max_attempts, .seed = seed};
}

auto class_roster() -> std::vector<member>
{
	return {
			make_member("Alva", 3, category::a),	make_member("Bruno", 1, category::b), make_member("Cleo", 2, category::a),
			make_member("Dante", 2, category::b), make_member("Elin", 3, category::a),	make_member("Frans", 1),
			make_member("Greta", 2, category::b), make_member("Hugo", 3, category::b),	make_member("Ines", 1, category::a),
			make_member("Jon", 2),								make_member("Kaja", 1, category::b),	make_member("Liam", 3),
	};
}
} // namespace

TEST(TeamServiceTest, EveryPresentMemberLandsInExactlyOneTeam)
{
	auto members = class_roster();
	members.push_back(make_member("Mira", 2, category::a, false));

	std::vector<pair_rule> exclusions{{.a = "Alva", .b = "Elin"}, {.a = "Hugo", .b = "Liam"}};
	std::vector<pair_rule> cohesions{{.a = "Bruno", .b = "Cleo"}};

	for (std::uint64_t seed = 1; seed <= 10; ++seed) {
		auto result = team_service::generate(members, exclusions, cohesions, seeded(3, seed));
		ASSERT_TRUE(result.has_value()) << result.error().message;
		ASSERT_EQ(result->teams.size(), 3u);

		std::multiset<std::string> seen;
		for (const auto &t : result->teams) {
			for (const auto &m : t.members) {
				seen.insert(m.display_name);
			}
		}
		EXPECT_EQ(seen.size(), 12u);
		EXPECT_EQ(seen.count("Mira"), 0u);
		for (const auto &m : class_roster()) {
			EXPECT_EQ(seen.count(m.display_name), 1u) << m.display_name;
		}

		EXPECT_NE(team_index_of(result->teams, "Alva"), team_index_of(result->teams, "Elin"));
		EXPECT_NE(team_index_of(result->teams, "Hugo"), team_index_of(result->teams, "Liam"));
		EXPECT_EQ(team_index_of(result->teams, "Bruno"), team_index_of(result->teams, "Cleo"));

		auto [lo, hi] = std::ranges::minmax(result->teams | std::views::transform([](const team &t) { return t.size(); }));
		EXPECT_LE(hi - lo, 1u);
	}
}

TEST(TeamServiceTest, FourMembersOneExclusionAlwaysSeparated)
{
	std::vector<member> members{make_member("m1", 3), make_member("m2", 3), make_member("m3", 1), make_member("m4", 1)};
	std::vector<pair_rule> exclusions{{.a = "m1", .b = "m2"}};

	for (std::uint64_t seed = 1; seed <= 30; ++seed) {
		auto result = team_service::generate(members, exclusions, {}, seeded(2, seed));
		ASSERT_TRUE(result.has_value());
		EXPECT_NE(team_index_of(result->teams, "m1"), team_index_of(result->teams, "m2"));
		EXPECT_EQ(result->teams[0].size(), 2u);
		EXPECT_EQ(result->teams[1].size(), 2u);
	}
}

TEST(TeamServiceTest, MembersKeepRosterOrderInsideTeams)
{
	auto members = class_roster();
	auto result = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_TRUE(result.has_value());

	auto position = [&](const std::string &name) { return std::ranges::find(members, name, &member::display_name) - members.begin(); };
	for (const auto &t : result->teams) {
		for (std::size_t i = 1; i < t.members.size(); ++i) {
			EXPECT_LT(position(t.members[i - 1].display_name), position(t.members[i].display_name));
		}
	}
}

TEST(TeamServiceTest, SameSeedSameTeams)
{
	auto members = class_roster();
	std::vector<pair_rule> exclusions{{.a = "Alva", .b = "Hugo"}};

	auto first = team_service::generate(members, exclusions, {}, seeded(3, 1234));
	auto second = team_service::generate(members, exclusions, {}, seeded(3, 1234));
	ASSERT_TRUE(first && second);
	ASSERT_EQ(first->teams.size(), second->teams.size());

	for (std::size_t t = 0; t < first->teams.size(); ++t) {
		EXPECT_EQ(test_helpers::names_of(first->teams[t]), test_helpers::names_of(second->teams[t]));
	}
	EXPECT_EQ(first->attempts_used, second->attempts_used);
}

TEST(TeamServiceTest, SpreadsLevelsEvenly)
{
	std::vector<member> members{make_member("a", 3), make_member("b", 3), make_member("c", 3), make_member("d", 1), make_member("e", 1), make_member("f", 1)};

	auto result = team_service::generate(members, {}, {}, seeded(2, 7, 50));
	ASSERT_TRUE(result.has_value());

	for (const auto &t : result->teams) {
		const auto strong = std::ranges::count(t.members, 3, &member::level);
		EXPECT_GE(strong, 1);
		EXPECT_LE(strong, 2);
		EXPECT_EQ(t.size(), 3u);
	}
}

TEST(TeamServiceTest, StopsAtFirstPerfectAllocation)
{
	std::vector<member> members{make_member("a", 1), make_member("b", 1), make_member("c", 1), make_member("d", 1)};

	auto result = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->attempts_used, 1);
}

TEST(TeamServiceTest, InactiveRulesAreIgnored)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c"), make_member("d"), make_member("e", 2, category::unknown, false)};
	// a keep-together with an absent member must not glue anyone
	std::vector<pair_rule> cohesions{{.a = "a", .b = "e"}};
	std::vector<pair_rule> exclusions{{.a = "b", .b = "e"}};

	auto result = team_service::generate(members, exclusions, cohesions, seeded(2));
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(team_index_of(result->teams, "e"), -1);
}

TEST(TeamServiceTest, SelfReferentialRuleRejectedBeforeAnyAttempt)
{
	std::vector<member> members{make_member("Eva"), make_member("Max")};
	std::vector<pair_rule> exclusions{{.a = "Eva", .b = " eva "}};

	auto result = team_service::generate(members, exclusions, {}, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::self_referential_rule);
	EXPECT_EQ(result.error().attempts_used, 0);
	EXPECT_FALSE(result.error().suggestion.empty());
}

TEST(TeamServiceTest, RuleNamingAStrangerIsRejected)
{
	std::vector<member> members{make_member("Eva"), make_member("Max")};
	std::vector<pair_rule> cohesions{{.a = "Eva", .b = "Zed"}};

	auto result = team_service::generate(members, {}, cohesions, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::unknown_identity_rule);
	EXPECT_NE(result.error().message.find("Zed"), std::string::npos);
}

TEST(TeamServiceTest, DuplicateNamesAreRejected)
{
	std::vector<member> members{make_member("Anna"), make_member(" ANNA"), make_member("Bo")};

	auto result = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::duplicate_identity);
	EXPECT_NE(result.error().message.find("Anna"), std::string::npos);
}

TEST(TeamServiceTest, LevelsOutsideRangeAreRejected)
{
	std::vector<member> members{make_member("Anna", 0), make_member("Bo"), make_member("Cy", 4), make_member("Dag", 1)};

	auto result = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::invalid_level);
	EXPECT_EQ(result.error().attempts_used, 0);
	EXPECT_NE(result.error().message.find("Anna"), std::string::npos);
	EXPECT_NE(result.error().message.find("Cy"), std::string::npos);
	EXPECT_EQ(result.error().message.find("Bo"), std::string::npos);
	EXPECT_FALSE(result.error().suggestion.empty());

	// absent members are checked too
	members = {make_member("Anna"), make_member("Bo"), make_member("Cy", -3, category::unknown, false)};
	auto absent = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_FALSE(absent.has_value());
	EXPECT_EQ(absent.error().kind, error_kind::invalid_level);
}

TEST(TeamServiceTest, TeamCountValidation)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c")};

	auto too_few = team_service::generate(members, {}, {}, seeded(1));
	ASSERT_FALSE(too_few.has_value());
	EXPECT_EQ(too_few.error().kind, error_kind::team_count_out_of_range);
	EXPECT_EQ(too_few.error().attempts_used, 0);

	auto too_many = team_service::generate(members, {}, {}, seeded(11));
	ASSERT_FALSE(too_many.has_value());
	EXPECT_EQ(too_many.error().kind, error_kind::team_count_out_of_range);

	auto more_than_people = team_service::generate(members, {}, {}, seeded(4));
	ASSERT_FALSE(more_than_people.has_value());
	EXPECT_EQ(more_than_people.error().kind, error_kind::team_count_exceeds_members);
}

TEST(TeamServiceTest, NobodyPresentIsAnEmptyRoster)
{
	std::vector<member> members{make_member("a", 2, category::unknown, false), make_member("b", 2, category::unknown, false)};

	auto result = team_service::generate(members, {}, {}, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::empty_roster);

	auto nobody = team_service::generate({}, {}, {}, seeded(2));
	ASSERT_FALSE(nobody.has_value());
	EXPECT_EQ(nobody.error().kind, error_kind::empty_roster);
}

TEST(TeamServiceTest, ApartAndTogetherOnSamePairContradict)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c"), make_member("d")};
	std::vector<pair_rule> rules{{.a = "a", .b = "b"}};

	auto result = team_service::generate(members, rules, rules, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::contradictory_rules);
}

TEST(TeamServiceTest, GroupTooBigForAnyTeam)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c"), make_member("d")};
	std::vector<pair_rule> cohesions{{.a = "a", .b = "b"}, {.a = "b", .b = "c"}};

	auto result = team_service::generate(members, {}, cohesions, seeded(2));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::oversized_group);
	EXPECT_EQ(result.error().attempts_used, 0);
}

TEST(TeamServiceTest, ExhaustsAttemptsWhenNothingFits)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c")};
	std::vector<pair_rule> exclusions{{.a = "a", .b = "b"}, {.a = "b", .b = "c"}, {.a = "a", .b = "c"}};

	auto result = team_service::generate(members, exclusions, {}, seeded(2, 42, 15));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::no_feasible_allocation);
	EXPECT_EQ(result.error().attempts_used, 15);
}

TEST(TeamServiceTest, ZeroAttemptsStillTriesOnce)
{
	std::vector<member> members{make_member("a"), make_member("b"), make_member("c")};
	std::vector<pair_rule> exclusions{{.a = "a", .b = "b"}, {.a = "b", .b = "c"}, {.a = "a", .b = "c"}};

	auto result = team_service::generate(members, exclusions, {}, seeded(2, 42, 0));
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().attempts_used, 1);

	auto fine = team_service::generate(class_roster(), {}, {}, seeded(2, 42, 0));
	ASSERT_TRUE(fine.has_value());
	EXPECT_EQ(fine->attempts_used, 1);
}

TEST(TeamServiceTest, StopRequestedUpFrontCancels)
{
	std::stop_source source;
	source.request_stop();

	auto config = seeded(2);
	config.stop = source.get_token();

	auto result = team_service::generate(class_roster(), {}, {}, config);
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(result.error().kind, error_kind::cancelled);
	EXPECT_EQ(result.error().attempts_used, 0);
}

TEST(TeamServiceTest, StopAfterFeasibleAttemptKeepsBestSoFar)
{
	// uneven skill totals never reach a perfect vector, so only the stop ends the loop
	std::vector<member> members{make_member("a", 3), make_member("b", 3), make_member("c", 3), make_member("d", 1), make_member("e", 1), make_member("f", 1)};

	std::stop_source source;
	auto config = seeded(2, 11, 500);
	config.stop = source.get_token();
	config.log = [&](dpp::loglevel, std::string_view text) {
		if (text.find("new best") != std::string_view::npos) {
			source.request_stop();
		}
	};

	auto result = team_service::generate(members, {}, {}, config);
	ASSERT_TRUE(result.has_value()) << result.error().message;
	EXPECT_EQ(result->attempts_used, 1);
	ASSERT_EQ(result->teams.size(), 2u);
	EXPECT_EQ(result->teams[0].size() + result->teams[1].size(), 6u);
}

TEST(TeamServiceTest, ReportsProgressThroughLogSink)
{
	std::vector<std::pair<dpp::loglevel, std::string>> lines;
	auto config = seeded(2);
	config.log = [&](dpp::loglevel level, std::string_view text) { lines.emplace_back(level, std::string(text)); };

	auto ok = team_service::generate(class_roster(), {}, {}, config);
	ASSERT_TRUE(ok.has_value());
	EXPECT_TRUE(std::ranges::contains(lines, dpp::ll_info, &std::pair<dpp::loglevel, std::string>::first));

	lines.clear();
	auto bad = team_service::generate(class_roster(), {}, {}, seeded(1));
	ASSERT_FALSE(bad.has_value());
	EXPECT_TRUE(lines.empty());

	config.team_count = 1;
	bad = team_service::generate(class_roster(), {}, {}, config);
	ASSERT_FALSE(bad.has_value());
	EXPECT_TRUE(std::ranges::contains(lines, dpp::ll_warning, &std::pair<dpp::loglevel, std::string>::first));
}

TEST(TeamServiceTest, UnseededRunsStillSucceed)
{
	auto config = seeded(4, 0);
	auto result = team_service::generate(class_roster(), {}, {}, config);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->teams.size(), 4u);
}
