#include "handlers/session_manager.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace forge;

TEST(SessionManagerTest, OnlyTheOwnerMayUseAPanel)
{
	session_manager sessions;
	auto id = sessions.create_session({.owner_id = dpp::snowflake{42}, .team_count = 3});

	auto mine = sessions.validate_owner(id, dpp::snowflake{42});
	ASSERT_TRUE(mine.has_value());
	EXPECT_EQ(mine->get().team_count, 3);
	EXPECT_EQ(mine->get().panel_id, id);

	auto theirs = sessions.validate_owner(id, dpp::snowflake{7});
	ASSERT_FALSE(theirs.has_value());
	EXPECT_EQ(theirs.error().what(), constants::text::panel_owner_only);

	sessions.remove_session(id);
	auto gone = sessions.validate_owner(id, dpp::snowflake{42});
	ASSERT_FALSE(gone.has_value());
	EXPECT_EQ(gone.error().what(), constants::text::panel_expired);
}

TEST(SessionManagerTest, EndedPanelsAreNotReturned)
{
	session_manager sessions;
	auto id = sessions.create_session({});
	sessions.get_session(id)->get().active = false;

	EXPECT_FALSE(sessions.get_session(id).has_value());
}

TEST(SessionManagerTest, LeastRecentlyUsedPanelIsEvicted)
{
	session_manager sessions;
	std::vector<std::string> ids;
	for (std::size_t i = 0; i < constants::limits::max_live_sessions; ++i) {
		ids.push_back(sessions.create_session({}));
		std::this_thread::sleep_for(std::chrono::milliseconds{1});
	}

	// touching the first panel makes the second one the oldest
	ASSERT_TRUE(sessions.get_session(ids[0]).has_value());
	std::this_thread::sleep_for(std::chrono::milliseconds{1});

	auto newest = sessions.create_session({});

	EXPECT_TRUE(sessions.get_session(newest).has_value());
	EXPECT_TRUE(sessions.get_session(ids[0]).has_value());
	EXPECT_FALSE(sessions.get_session(ids[1]).has_value());
	for (std::size_t i = 2; i < ids.size(); ++i) {
		EXPECT_TRUE(sessions.get_session(ids[i]).has_value()) << i;
	}
}
