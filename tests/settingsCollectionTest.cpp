#include "settingsCollection.h"
#include "errorCollection.h"

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include <fstream>
#include <functional>

namespace {
	class SettingsCollectionTest : public ::testing::Test {
	protected:
		void TearDown() override
		{
			SettingsCollection::getInstance().reset();
			ErrorCollection::getInstance().clear();
		}
	};

	bool throwsErrorID(const std::function<void()>& func, ErrorID expectedId)
	{
		try { func(); }
		catch (const ErrorID& exceptionId) { return exceptionId == expectedId; }
		return false;
	}
}

TEST(JsonValueTest, BoolValues)
{
	EXPECT_TRUE(getJsonBoolValue(nlohmann::json(true)));
	EXPECT_FALSE(getJsonBoolValue(nlohmann::json(false)));
	EXPECT_TRUE(getJsonBoolValue(nlohmann::json(1)));
	EXPECT_FALSE(getJsonBoolValue(nlohmann::json(0)));
	EXPECT_TRUE(throwsErrorID([]() { getJsonBoolValue(nlohmann::json(2)); }, ErrorID::errorJsonInvalBool));
	EXPECT_TRUE(throwsErrorID([]() { getJsonBoolValue(nlohmann::json("yes")); }, ErrorID::errorJsonInvalBool));
}

TEST(JsonValueTest, IntValues)
{
	EXPECT_EQ(getJsonInt(nlohmann::json(-4), false, false), -4);
	EXPECT_EQ(getJsonInt(nlohmann::json(0), true, false), 0);
	EXPECT_TRUE(throwsErrorID([]() { getJsonInt(nlohmann::json(1.5), false, false); }, ErrorID::errorJsonInvalInt));
	EXPECT_TRUE(throwsErrorID([]() { getJsonInt(nlohmann::json(-1), true, false); }, ErrorID::errorJsonInvalNegInt));
	EXPECT_TRUE(throwsErrorID([]() { getJsonInt(nlohmann::json(0), true, true); }, ErrorID::errorJsonInvalZeroInt));
}

TEST(JsonValueTest, DoubleValues)
{
	EXPECT_DOUBLE_EQ(getJsonDouble(nlohmann::json(0.6)), 0.6);
	EXPECT_DOUBLE_EQ(getJsonDouble(nlohmann::json(2)), 2.0);
	EXPECT_DOUBLE_EQ(getJsonDouble(nlohmann::json(1), 0, 1), 1.0);
	EXPECT_TRUE(throwsErrorID([]() { getJsonDouble(nlohmann::json("0.6")); }, ErrorID::errorJsonInvalNum));
	EXPECT_TRUE(throwsErrorID([]() { getJsonDouble(nlohmann::json(1.2), 0, 1); }, ErrorID::errorJsonInvalRange));
	EXPECT_TRUE(throwsErrorID([]() { getJsonDouble(nlohmann::json(-0.1), 0, 1); }, ErrorID::errorJsonInvalRange));
}

TEST(JsonValueTest, StringValues)
{
	EXPECT_EQ(getJsonString(nlohmann::json("A203")), "A203");
	EXPECT_TRUE(throwsErrorID([]() { getJsonString(nlohmann::json(203)); }, ErrorID::errorJsonInvalString));

	std::vector<std::string> stringList = getJsonStringList(nlohmann::json::array({ "Hallway", "Roof" }));
	ASSERT_EQ(stringList.size(), 2u);
	EXPECT_EQ(stringList[1], "Roof");
	EXPECT_TRUE(getJsonStringList(nlohmann::json::array()).empty());
	EXPECT_TRUE(throwsErrorID([]() { getJsonStringList(nlohmann::json("Hallway")); }, ErrorID::errorJsonInvalArray));
	EXPECT_TRUE(throwsErrorID([]() { getJsonStringList(nlohmann::json::array({ "Hallway", 3 })); }, ErrorID::errorJsonInvalString));
}

TEST(JsonValueTest, Paths)
{
	EXPECT_TRUE(hasExtension("model/house.IFC", "ifc"));
	EXPECT_TRUE(hasExtension("config.json", "json"));
	EXPECT_FALSE(hasExtension("config.json.bak", "json"));

	// only the parent folder has to exist for output paths
	EXPECT_EQ(getJsonPath(nlohmann::json("rooms.json"), true, "json"), "rooms.json");
	EXPECT_TRUE(throwsErrorID([]() { getJsonPath(nlohmann::json("rooms.txt"), true, "json"); }, ErrorID::errorJsonInvalPath));
	EXPECT_TRUE(throwsErrorID([]() { getJsonPath(nlohmann::json("/nonexistent_folder_for_test/rooms.json"), true, "json"); }, ErrorID::errorJsonNoRealPath));
	EXPECT_TRUE(throwsErrorID([]() { getJsonPath(nlohmann::json("/nonexistent_folder_for_test/model.ifc"), false, "ifc"); }, ErrorID::errorJsonNoRealPath));
}

TEST_F(SettingsCollectionTest, ExtractionSettings)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	nlohmann::json config = nlohmann::json::parse(R"({
		"Extraction": {
			"Excluded rooms": ["Stair"],
			"Default sill height": 0.45,
			"Search buffer": 0.25,
			"Wall types": ["IfcWall", "IfcCurtainWall"],
			"Use declared frame": true
		},
		"Tolerances": { "Angular": 0.01, "Wall plane": 0.3 }
	})");

	settingsCollection.setExtractionSettings(config);
	settingsCollection.setTolerances(config);

	ASSERT_EQ(settingsCollection.getExcludedRoomList().size(), 1u);
	EXPECT_EQ(settingsCollection.getExcludedRoomList()[0], "Stair");
	EXPECT_DOUBLE_EQ(settingsCollection.defaultSillHeight(), 0.45);
	EXPECT_DOUBLE_EQ(settingsCollection.searchBuffer(), 0.25);
	EXPECT_EQ(settingsCollection.getWallTypeList().size(), 2u);
	EXPECT_TRUE(settingsCollection.useDeclaredFrame());
	EXPECT_DOUBLE_EQ(settingsCollection.angularTolerance(), 0.01);
	EXPECT_DOUBLE_EQ(settingsCollection.wallPlaneTolerance(), 0.3);
}

TEST_F(SettingsCollectionTest, MissingSectionsKeepDefaults)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	nlohmann::json config = nlohmann::json::object();
	settingsCollection.setExtractionSettings(config);
	settingsCollection.setTolerances(config);
	settingsCollection.setAnalysisSettings(config);

	EXPECT_EQ(settingsCollection.getExcludedRoomList().size(), 3u);
	EXPECT_DOUBLE_EQ(settingsCollection.defaultSillHeight(), 0.1);
	EXPECT_DOUBLE_EQ(settingsCollection.searchBuffer(), 0.5);
	EXPECT_DOUBLE_EQ(settingsCollection.skyIlluminance(), 10000);
	EXPECT_DOUBLE_EQ(settingsCollection.daylightThreshold(), 2.1);
	EXPECT_DOUBLE_EQ(settingsCollection.requiredAreaPercentage(), 50);
	EXPECT_EQ(settingsCollection.getRoomCode(), "");
}

TEST_F(SettingsCollectionTest, UnsupportedWallTypeIsRejected)
{
	nlohmann::json config = nlohmann::json::parse(R"({ "Extraction": { "Wall types": ["IfcSlab"] } })");
	EXPECT_THROW(SettingsCollection::getInstance().setExtractionSettings(config), std::string);
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorJsonInvalEntry));
}

TEST_F(SettingsCollectionTest, AnalysisSettings)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	nlohmann::json config = nlohmann::json::parse(R"({
		"Analysis": {
			"Room code": "A203",
			"Light transmittance": 0.7,
			"Grid size": 0.25,
			"Analysis plane height": 0.8,
			"Sky illuminance": 12000,
			"Daylight factor threshold": 2.5,
			"Required area percentage": 60,
			"Illuminance results": "room/result.res",
			"Write STEP": 1
		}
	})");
	settingsCollection.setAnalysisSettings(config);

	EXPECT_EQ(settingsCollection.getRoomCode(), "A203");
	EXPECT_DOUBLE_EQ(settingsCollection.lightTransmittance(), 0.7);
	EXPECT_DOUBLE_EQ(settingsCollection.gridSize(), 0.25);
	EXPECT_DOUBLE_EQ(settingsCollection.analysisPlaneHeight(), 0.8);
	EXPECT_DOUBLE_EQ(settingsCollection.skyIlluminance(), 12000);
	EXPECT_DOUBLE_EQ(settingsCollection.daylightThreshold(), 2.5);
	EXPECT_DOUBLE_EQ(settingsCollection.requiredAreaPercentage(), 60);
	EXPECT_EQ(settingsCollection.getIlluminanceResultsPath(), "room/result.res");
	EXPECT_TRUE(settingsCollection.writeSTEP());
}

TEST_F(SettingsCollectionTest, InvalidAnalysisValuesAreRejected)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	EXPECT_THROW(settingsCollection.setAnalysisSettings(nlohmann::json::parse(R"({ "Analysis": { "Light transmittance": 1.5 } })")), std::string);
	EXPECT_THROW(settingsCollection.setAnalysisSettings(nlohmann::json::parse(R"({ "Analysis": { "Grid size": 0 } })")), std::string);
	EXPECT_THROW(settingsCollection.setAnalysisSettings(nlohmann::json::parse(R"({ "Analysis": { "Room code": 203 } })")), std::string);
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorJsonInvalRange));
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorJsonInvalZeroInt));
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorJsonInvalString));
}

TEST_F(SettingsCollectionTest, OutputPathsAreDerived)
{
	boost::filesystem::path tempFolder = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
	boost::filesystem::create_directories(tempFolder);
	std::string ifcPath = (tempFolder / "model.ifc").string();
	std::ofstream(ifcPath) << "ISO-10303-21;\n";

	nlohmann::json config;
	config["Filepaths"]["Input"] = nlohmann::json::array({ ifcPath });
	config["Filepaths"]["Output"] = (tempFolder / "rooms.json").string();
	config["Filepaths"]["Workbook"] = (tempFolder / "book.json").string();

	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	settingsCollection.setIOPaths(config);

	ASSERT_EQ(settingsCollection.getIfcPathList().size(), 1u);
	EXPECT_EQ(settingsCollection.getIfcPathList()[0], ifcPath);
	EXPECT_EQ(settingsCollection.getOutputReportPath(), (tempFolder / "rooms_report.json").string());
	EXPECT_EQ(settingsCollection.getOutputWorkbookPath(), (tempFolder / "book.json").string());
	EXPECT_EQ(settingsCollection.getOutputSimulationPath(), (tempFolder / "rooms_simulation.json").string());
	EXPECT_EQ(settingsCollection.getOutputSTEPPath(), (tempFolder / "rooms_simulation.step").string());

	boost::filesystem::remove_all(tempFolder);
}

TEST_F(SettingsCollectionTest, MissingInputIsRejected)
{
	nlohmann::json config;
	config["Filepaths"]["Output"] = "rooms.json";
	EXPECT_THROW(SettingsCollection::getInstance().setIOPaths(config), std::string);
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorJsonMissingEntry));

	EXPECT_THROW(SettingsCollection::getInstance().setIOPaths(nlohmann::json::object()), std::string);
}
