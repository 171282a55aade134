#include "services/persistence_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace forge;
using json = nlohmann::json;

class PersistenceServiceTest : public ::testing::Test {
protected:
	std::filesystem::path dir;

	void SetUp() override
	{
		dir = std::filesystem::temp_directory_path() / ("teamforge-data-" + util::make_token());
		std::filesystem::create_directories(dir);
	}

	void TearDown() override { std::filesystem::remove_all(dir); }

	void write(std::string_view text) const { std::ofstream{dir / constants::files::rosters_file} << text; }
};

TEST_F(PersistenceServiceTest, MissingFileIsEmpty)
{
	persistence_service store{dir};
	auto data = store.load();
	ASSERT_TRUE(data.has_value());
	EXPECT_TRUE(data->rosters.empty());
	EXPECT_FALSE(data->active_roster_id.has_value());
}

TEST_F(PersistenceServiceTest, MalformedFileIsAnError)
{
	write("{ not json");
	persistence_service store{dir};
	auto data = store.load();
	ASSERT_FALSE(data.has_value());
	EXPECT_FALSE(data.error().what().empty());
}

TEST_F(PersistenceServiceTest, SavedDataLoadsBack)
{
	app_data data;
	data.rosters.push_back({.id = "r1",
													.name = "Class 7B",
													.members = {{.display_name = "Anna", .level = 3, .cat = category::a, .present = true},
																			{.display_name = "Bo", .level = 1, .cat = category::b, .present = false}},
													.exclusions = {{.a = "Anna", .b = "Bo"}}});
	data.active_roster_id = "r1";

	persistence_service store{dir};
	ASSERT_TRUE(store.save(data).has_value());
	ASSERT_TRUE(std::filesystem::exists(store.rosters_path()));

	auto loaded = store.load();
	ASSERT_TRUE(loaded.has_value());
	ASSERT_EQ(loaded->rosters.size(), 1u);
	EXPECT_EQ(loaded->active_roster_id, "r1");
	EXPECT_EQ(loaded->rosters[0].members, data.rosters[0].members);
	EXPECT_EQ(loaded->rosters[0].exclusions, data.rosters[0].exclusions);
	EXPECT_TRUE(loaded->rosters[0].cohesions.empty());
}

TEST_F(PersistenceServiceTest, SerializedDocumentCarriesVersion)
{
	auto j = persistence_service::serialize(app_data{});
	EXPECT_EQ(j["version"], constants::limits::data_version);
	EXPECT_TRUE(j["active_roster_id"].is_null());
	EXPECT_TRUE(j["rosters"].is_array());
}

TEST_F(PersistenceServiceTest, LegacyBareNamesAreAccepted)
{
	auto data = persistence_service::parse(json::parse(R"({"rosters": [{"id": "old", "name": "Old", "members": ["Anna", "Bo"]}]})"));

	ASSERT_EQ(data.rosters.size(), 1u);
	const auto &members = data.rosters[0].members;
	ASSERT_EQ(members.size(), 2u);
	EXPECT_EQ(members[0].display_name, "Anna");
	EXPECT_EQ(members[0].level, constants::limits::default_level);
	EXPECT_EQ(members[0].cat, category::unknown);
	EXPECT_TRUE(members[1].present);
	EXPECT_EQ(data.active_roster_id, "old");
}

TEST_F(PersistenceServiceTest, RepairsDamagedEntries)
{
	auto data = persistence_service::parse(json::parse(R"({
		"active_roster_id": "gone",
		"rosters": [
			{"name": "  ", "members": [
				{"name": " Anna ", "level": 9, "category": "Z"},
				{"name": "anna", "level": 1},
				{"name": ""},
				"Bo",
				42,
				null,
				["x"],
				{"name": 5},
				{"name": "Cy", "level": "3", "present": "yes", "category": 7}
			],
			"exclusions": [{"a": "Anna", "b": " "}, {"a": "Anna", "b": "Bo"}, "Anna", null, {"a": "Cy", "b": 4}],
			"cohesions": [{"a": "Bo"}, ["Bo", "Cy"]]},
			42
		]
	})"));

	ASSERT_EQ(data.rosters.size(), 1u);
	const auto &r = data.rosters[0];
	EXPECT_FALSE(r.id.empty());
	EXPECT_EQ(r.name, "Roster 1");

	ASSERT_EQ(r.members.size(), 3u);
	EXPECT_EQ(r.members[0].display_name, "Anna");
	EXPECT_EQ(r.members[0].level, constants::limits::default_level);
	EXPECT_EQ(r.members[0].cat, category::unknown);
	EXPECT_EQ(r.members[1].display_name, "Bo");

	// mistyped fields fall back to defaults
	EXPECT_EQ(r.members[2].display_name, "Cy");
	EXPECT_EQ(r.members[2].level, constants::limits::default_level);
	EXPECT_EQ(r.members[2].cat, category::unknown);
	EXPECT_TRUE(r.members[2].present);

	EXPECT_EQ(r.exclusions, (std::vector<pair_rule>{{.a = "Anna", .b = "Bo"}}));
	EXPECT_TRUE(r.cohesions.empty());

	EXPECT_EQ(data.active_roster_id, r.id);
}

TEST_F(PersistenceServiceTest, MistypedEntriesDoNotBlockLoading)
{
	write(R"({"version": 1, "active_roster_id": 3, "rosters": [
		{"id": 7, "name": "Class 7B", "members": [null, {"name": "Anna", "level": 3, "present": false}, {"level": "high"}],
		 "exclusions": [1, 2], "cohesions": "none"}
	]})");

	persistence_service store{dir};
	auto data = store.load();
	ASSERT_TRUE(data.has_value()) << data.error().what();
	ASSERT_EQ(data->rosters.size(), 1u);

	const auto &r = data->rosters[0];
	EXPECT_FALSE(r.id.empty());
	EXPECT_EQ(r.name, "Class 7B");
	ASSERT_EQ(r.members.size(), 1u);
	EXPECT_EQ(r.members[0].level, 3);
	EXPECT_FALSE(r.members[0].present);
	EXPECT_TRUE(r.exclusions.empty());
	EXPECT_TRUE(r.cohesions.empty());
	EXPECT_EQ(data->active_roster_id, r.id);
}

TEST_F(PersistenceServiceTest, NonObjectDocumentIsEmpty)
{
	auto data = persistence_service::parse(json::array());
	EXPECT_TRUE(data.rosters.empty());
}
