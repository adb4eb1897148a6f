#include "simulationModel.h"
#include "errorCollection.h"

#include <gtest/gtest.h>

namespace {
	WindowRecord makeWindow(const std::string& tag, Orientation orientation, double x, double y, double width, double height)
	{
		WindowRecord window;
		window.roomCode_ = "A203";
		window.tag_ = tag;
		window.width_ = width;
		window.height_ = height;
		window.hasWall_ = true;
		window.wallOrientation_ = orientation;
		window.locationX_ = x;
		window.locationY_ = y;
		return window;
	}

	Room makeRoom()
	{
		RoomRecord record;
		record.code_ = "A203";
		record.displayName_ = "Bedroom";
		record.width_ = 3.0;
		record.depth_ = 4.0;
		record.height_ = 2.5;
		return Room(record);
	}

	void expectPoint(const gp_Pnt& point, double x, double y, double z)
	{
		EXPECT_NEAR(point.X(), x, 1e-9);
		EXPECT_NEAR(point.Y(), y, 1e-9);
		EXPECT_NEAR(point.Z(), z, 1e-9);
	}
}

TEST(SimulationModelTest, WallFrames)
{
	expectPoint(SimulationModel::toRoomCoordinates(Orientation::Front, 3.0, 4.0, 1.0, 0.5), 1.0, 0.0, 0.5);
	expectPoint(SimulationModel::toRoomCoordinates(Orientation::Right, 3.0, 4.0, 1.0, 0.5), 3.0, 1.0, 0.5);
	expectPoint(SimulationModel::toRoomCoordinates(Orientation::Back, 3.0, 4.0, 1.0, 0.5), 2.0, 4.0, 0.5);
	expectPoint(SimulationModel::toRoomCoordinates(Orientation::Left, 3.0, 4.0, 1.0, 0.5), 0.0, 3.0, 0.5);

	EXPECT_DOUBLE_EQ(SimulationModel::getWallLength(Orientation::Front, 3.0, 4.0), 3.0);
	EXPECT_DOUBLE_EQ(SimulationModel::getWallLength(Orientation::Back, 3.0, 4.0), 3.0);
	EXPECT_DOUBLE_EQ(SimulationModel::getWallLength(Orientation::Right, 3.0, 4.0), 4.0);
	EXPECT_DOUBLE_EQ(SimulationModel::getWallLength(Orientation::Left, 3.0, 4.0), 4.0);
}

TEST(SimulationModelTest, ShoeboxWalls)
{
	SimulationModel model(makeRoom(), 0.6, 0.5, 0.75);

	const std::vector<SimulationSurface>& wallList = model.getWalls();
	ASSERT_EQ(wallList.size(), 4u);
	EXPECT_EQ(wallList[0].getName(), "front");
	EXPECT_EQ(wallList[1].getName(), "right");
	EXPECT_EQ(wallList[2].getName(), "back");
	EXPECT_EQ(wallList[3].getName(), "left");

	EXPECT_NEAR(wallList[0].getArea(), 7.5, 1e-6);
	EXPECT_NEAR(wallList[1].getArea(), 10.0, 1e-6);
	EXPECT_DOUBLE_EQ(wallList[0].getTransmittance(), 0.0);

	expectPoint(wallList[1].getVertices()[0], 3.0, 0.0, 0.0);
	expectPoint(wallList[1].getVertices()[2], 3.0, 4.0, 2.5);
}

TEST(SimulationModelTest, GlazingOnFrontWall)
{
	Room room = makeRoom();
	room.addWindow(Window(makeWindow("W1", Orientation::Front, 0.5, 1.0, 1.0, 1.2), 0.1));
	SimulationModel model(room, 0.6, 0.5, 0.75);

	ASSERT_EQ(model.getGlazing().size(), 1u);
	const SimulationSurface& glazing = model.getGlazing()[0];
	EXPECT_EQ(glazing.getName(), "W1");
	EXPECT_DOUBLE_EQ(glazing.getTransmittance(), 0.6);
	EXPECT_NEAR(glazing.getArea(), 1.2, 1e-6);

	expectPoint(glazing.getVertices()[0], 0.5, 0.0, 1.0);
	expectPoint(glazing.getVertices()[1], 1.5, 0.0, 1.0);
	expectPoint(glazing.getVertices()[2], 1.5, 0.0, 2.2);
	expectPoint(glazing.getVertices()[3], 0.5, 0.0, 2.2);
}

TEST(SimulationModelTest, GlazingOnLeftWall)
{
	Room room = makeRoom();
	room.addWindow(Window(makeWindow("W2", Orientation::Left, 1.0, 0.9, 2.0, 1.0), 0.1));
	SimulationModel model(room, 0.6, 0.5, 0.75);

	ASSERT_EQ(model.getGlazing().size(), 1u);
	const SimulationSurface& glazing = model.getGlazing()[0];
	expectPoint(glazing.getVertices()[0], 0.0, 3.0, 0.9);
	expectPoint(glazing.getVertices()[1], 0.0, 1.0, 0.9);
	EXPECT_NEAR(glazing.getArea(), 2.0, 1e-6);
}

TEST(SimulationModelTest, UnplaceableWindowsAreExcluded)
{
	WindowRecord noWall = makeWindow("W3", Orientation::Front, 0.5, 1.0, 1.0, 1.0);
	noWall.hasWall_ = false;
	WindowRecord outOfRange = makeWindow("W4", Orientation::Front, -2.0, 1.0, 1.0, 1.0);
	outOfRange.inRange_ = false;

	Room room = makeRoom();
	room.addWindow(Window(makeWindow("W1", Orientation::Back, 0.5, 1.0, 1.0, 1.0), 0.1));
	room.addWindow(Window(makeWindow("W2", Orientation::Unknown, 0.5, 1.0, 1.0, 1.0), 0.1));
	room.addWindow(Window(noWall, 0.1));
	room.addWindow(Window(outOfRange, 0.1));
	room.addWindow(Window(makeWindow("W5", Orientation::Right, 0.5, 1.0, 0.0, 1.0), 0.1));

	SimulationModel model(room, 0.6, 0.5, 0.75);
	ASSERT_EQ(model.getGlazing().size(), 1u);
	EXPECT_EQ(model.getGlazing()[0].getName(), "W1");

	const std::vector<std::string>& excludedList = model.getExcludedWindows();
	ASSERT_EQ(excludedList.size(), 4u);
	EXPECT_EQ(excludedList[0], "W2");
	EXPECT_EQ(excludedList[1], "W3");
	EXPECT_EQ(excludedList[2], "W4");
	EXPECT_EQ(excludedList[3], "W5");
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::warningWindowNotPlaced));
}

TEST(SimulationModelTest, TestPointGrid)
{
	SimulationModel model(makeRoom(), 0.6, 0.5, 0.75);

	EXPECT_EQ(model.getGridColumnCount(), 6);
	const std::vector<gp_Pnt>& testPointList = model.getTestPoints();
	ASSERT_EQ(testPointList.size(), 48u);
	expectPoint(testPointList[0], 0.25, 0.25, 0.75);
	expectPoint(testPointList[1], 0.75, 0.25, 0.75);
	expectPoint(testPointList[6], 0.25, 0.75, 0.75);
	expectPoint(testPointList[47], 2.75, 3.75, 0.75);
}

TEST(SimulationModelTest, PartialCellsAreDropped)
{
	RoomRecord record;
	record.code_ = "B";
	record.width_ = 1.3;
	record.depth_ = 0.9;
	record.height_ = 2.5;
	SimulationModel model(Room(record), 0.6, 0.5, 0.8);

	EXPECT_EQ(model.getGridColumnCount(), 2);
	EXPECT_EQ(model.getTestPoints().size(), 2u);
}

TEST(SimulationModelTest, FlatRoomHasNoWalls)
{
	RoomRecord record;
	record.code_ = "C";
	record.width_ = 3.0;
	record.depth_ = 0.0;
	record.height_ = 2.5;
	SimulationModel model(Room(record), 0.6, 0.5, 0.75);

	EXPECT_TRUE(model.getWalls().empty());
	EXPECT_TRUE(model.getTestPoints().empty());
}

TEST(SimulationModelTest, JsonLayout)
{
	Room room = makeRoom();
	room.addWindow(Window(makeWindow("W1", Orientation::Front, 0.5, 1.0, 1.0, 1.2), 0.1));
	nlohmann::json modelJson = SimulationModel(room, 0.6, 0.5, 0.75).toJson();

	EXPECT_EQ(modelJson["Code"], "A203");
	EXPECT_EQ(modelJson["Origin"], nlohmann::json::array({ 0, 0, 0 }));
	EXPECT_EQ(modelJson["Surfaces"]["Walls"].size(), 4u);
	ASSERT_EQ(modelJson["Surfaces"]["Glazing"].size(), 1u);
	EXPECT_DOUBLE_EQ(modelJson["Surfaces"]["Glazing"][0]["Transmittance"].get<double>(), 0.6);
	EXPECT_FALSE(modelJson["Surfaces"]["Walls"][0].contains("Transmittance"));
	EXPECT_EQ(modelJson["Test points"].size(), 48u);
	EXPECT_TRUE(modelJson["Excluded windows"].empty());
}
