#include "engine/roster_normalizer.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace forge;
using test_helpers::make_member;

TEST(RosterNormalizerTest, DerivesKeysAndCleansNames)
{
	std::vector<member> raw{make_member("  Anna  Berg "), make_member("BO", 3, category::b, false)};

	auto res = normalize_roster(raw);
	ASSERT_TRUE(res.has_value());
	ASSERT_EQ(res->size(), 2u);

	EXPECT_EQ((*res)[0].key, "anna berg");
	EXPECT_EQ((*res)[0].data.display_name, "Anna Berg");
	EXPECT_EQ((*res)[1].key, "bo");
	EXPECT_EQ((*res)[1].data.level, 3);
	EXPECT_EQ((*res)[1].data.cat, category::b);
	EXPECT_FALSE((*res)[1].data.present);
}

TEST(RosterNormalizerTest, SkipsBlankNames)
{
	std::vector<member> raw{make_member("   "), make_member("Cy")};

	auto res = normalize_roster(raw);
	ASSERT_TRUE(res.has_value());
	ASSERT_EQ(res->size(), 1u);
	EXPECT_EQ((*res)[0].key, "cy");
}

TEST(RosterNormalizerTest, CollisionsAreReportedNotMerged)
{
	std::vector<member> raw{make_member("Anna"), make_member("Bo"), make_member(" anna "), make_member("ANNA"), make_member("bo")};

	auto res = normalize_roster(raw);
	ASSERT_FALSE(res.has_value());
	EXPECT_EQ(res.error().names, (std::vector<std::string>{"Anna", "anna", "ANNA", "Bo", "bo"}));
}
