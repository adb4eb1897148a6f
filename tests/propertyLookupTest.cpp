#include "DataManager.h"
#include "roomExtractor.h"

#include <gtest/gtest.h>

TEST(PropertyLookupTest, CommonPsetFlag)
{
	nlohmann::json objectProperties = nlohmann::json::parse(R"({ "Pset_DoorCommon": { "IsExternal": true, "FireRating": "EI30" } })");
	std::optional<bool> isExternal = DataManager::findBoolProperty(objectProperties, IfcPropertyID::psetDoorCommon, IfcPropertyID::isExternal);
	ASSERT_TRUE(isExternal.has_value());
	EXPECT_TRUE(*isExternal);
}

TEST(PropertyLookupTest, FlagInOtherPset)
{
	nlohmann::json objectProperties = nlohmann::json::parse(R"({
		"PSet_Revit_Dimensions": { "Height": 2.1 },
		"PSet_Revit_Other": { "IsExternal": true }
	})");
	std::optional<bool> isExternal = DataManager::findBoolProperty(objectProperties, IfcPropertyID::psetDoorCommon, IfcPropertyID::isExternal);
	ASSERT_TRUE(isExternal.has_value());
	EXPECT_TRUE(*isExternal);
}

TEST(PropertyLookupTest, PreferredPsetIsSearchedFirst)
{
	// "A_Custom" is iterated before the common pset
	nlohmann::json objectProperties = nlohmann::json::parse(R"({
		"A_Custom": { "IsExternal": false },
		"Pset_WallCommon": { "IsExternal": true }
	})");
	std::optional<bool> isExternal = DataManager::findBoolProperty(objectProperties, IfcPropertyID::psetWallCommon, IfcPropertyID::isExternal);
	ASSERT_TRUE(isExternal.has_value());
	EXPECT_TRUE(*isExternal);
}

TEST(PropertyLookupTest, NonBooleanValuesAreIgnored)
{
	nlohmann::json objectProperties = nlohmann::json::parse(R"({
		"Pset_WallCommon": { "IsExternal": "TRUE" },
		"PSet_Revit_Other": { "IsExternal": 1 }
	})");
	EXPECT_FALSE(DataManager::findBoolProperty(objectProperties, IfcPropertyID::psetWallCommon, IfcPropertyID::isExternal).has_value());
	EXPECT_FALSE(DataManager::findBoolProperty(nlohmann::json::object(), IfcPropertyID::psetWallCommon, IfcPropertyID::isExternal).has_value());
	EXPECT_FALSE(DataManager::findBoolProperty(nlohmann::json(), IfcPropertyID::psetWallCommon, IfcPropertyID::isExternal).has_value());
}

TEST(PropertyLookupTest, ExternalDoorFilter)
{
	EXPECT_TRUE(RoomExtractor::isExternalDoor(nlohmann::json::parse(R"({ "Pset_DoorCommon": { "IsExternal": true } })")));
	EXPECT_TRUE(RoomExtractor::isExternalDoor(nlohmann::json::parse(R"({ "PSet_Revit_Other": { "IsExternal": true } })")));
	EXPECT_FALSE(RoomExtractor::isExternalDoor(nlohmann::json::parse(R"({ "Pset_DoorCommon": { "IsExternal": false } })")));

	// a door without the flag is treated as internal
	EXPECT_FALSE(RoomExtractor::isExternalDoor(nlohmann::json::parse(R"({ "Pset_DoorCommon": { "FireRating": "EI30" } })")));
	EXPECT_FALSE(RoomExtractor::isExternalDoor(nlohmann::json::object()));
}
