#include "reportWriter.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <gtest/gtest.h>

namespace {
	Room makeRoom(const std::string& code, const std::string& name, bool isBoundingBox = false)
	{
		RoomRecord record;
		record.code_ = code;
		record.displayName_ = name;
		record.width_ = 3.0;
		record.depth_ = 4.0;
		record.height_ = 2.5;
		record.isBoundingBox_ = isBoundingBox;
		return Room(record);
	}

	WallRecord makeWall(const std::string& roomCode, const std::string& name, size_t layerCount)
	{
		WallRecord wall;
		wall.roomCode_ = roomCode;
		wall.name_ = name;
		wall.tag_ = name + "-tag";
		wall.isExternal_ = true;
		for (size_t i = 0; i < layerCount; i++)
		{
			MaterialLayer layer;
			layer.name_ = "Layer " + std::to_string(i);
			layer.thickness_ = 0.1;
			wall.layerList_.emplace_back(layer);
		}
		return wall;
	}

	const std::string valueKey = "Value";
	const std::string formatKey = "Format";
}

TEST(ReportSheetTest, AcceptsTwoAndThreeFieldCells)
{
	ReportSheet sheet("Test", { "A", "B", "C" });
	sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0, "name" }), nlohmann::json::array({ 2, 1.5, "highlight" }) }));
	ASSERT_EQ(sheet.rowCount(), 1u);

	nlohmann::json sheetJson = sheet.toJson();
	const nlohmann::json& row = sheetJson["Rows"][0];
	ASSERT_EQ(row.size(), 3u);
	EXPECT_EQ(row[0][valueKey], "name");
	EXPECT_FALSE(row[0].contains(formatKey));
	EXPECT_TRUE(row[1].is_null());
	EXPECT_DOUBLE_EQ(row[2][valueKey].get<double>(), 1.5);
	EXPECT_EQ(row[2][formatKey], "highlight");
}

TEST(ReportSheetTest, NullRowsLeaveNoGap)
{
	ReportSheet sheet("Test", { "A" });
	sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0, "first" }) }));
	sheet.addRow(nullptr);
	sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0, "second" }) }));

	ASSERT_EQ(sheet.rowCount(), 2u);
	EXPECT_EQ(sheet.toJson()["Rows"][1][0][valueKey], "second");
}

TEST(ReportSheetTest, MalformedCellsAreRejected)
{
	ReportSheet sheet("Test", { "A" });
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0 }) })), ErrorID);
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0, "a", "b", "c" }) })), ErrorID);
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ -1, "a" }) })), ErrorID);
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ "0", "a" }) })), ErrorID);
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 0, "a", 5 }) })), ErrorID);
	EXPECT_THROW(sheet.addRow(nlohmann::json::array({ "not a cell" })), ErrorID);
	EXPECT_THROW(sheet.addRow("not a row"), ErrorID);
	EXPECT_EQ(sheet.rowCount(), 0u);

	try
	{
		sheet.addRow(nlohmann::json::array({ nlohmann::json::array({ 1, 2, 3, 4 }) }));
		FAIL();
	}
	catch (const ErrorID& exceptionId)
	{
		EXPECT_EQ(exceptionId, ErrorID::errorMalformedReportRow);
	}
}

TEST(ReportSheetTest, HeaderIsExtended)
{
	ReportSheet sheet("Test", { "A" });
	sheet.setHeader(3, "D");
	ASSERT_EQ(sheet.getHeader().size(), 4u);
	EXPECT_EQ(sheet.getHeader()[0], "A");
	EXPECT_EQ(sheet.getHeader()[1], "");
	EXPECT_EQ(sheet.getHeader()[3], "D");
}

TEST(ReportWriterTest, BuildsAllSheets)
{
	ReportWriter writer;
	writer.build({ makeRoom("A203", "Bedroom") }, {}, {}, 0.1);

	ASSERT_EQ(writer.getSheets().size(), 5u);
	EXPECT_NE(writer.getSheet("Assumptions"), nullptr);
	EXPECT_NE(writer.getSheet("Spaces"), nullptr);
	EXPECT_NE(writer.getSheet("Windows"), nullptr);
	EXPECT_NE(writer.getSheet("External Doors"), nullptr);
	EXPECT_NE(writer.getSheet("Walls"), nullptr);
	EXPECT_EQ(writer.getSheet("Roofs"), nullptr);

	nlohmann::json workbook = writer.toJson();
	EXPECT_TRUE(workbook.contains("Spaces"));
	EXPECT_TRUE(workbook["Spaces"].contains("Columns"));
}

TEST(ReportWriterTest, AssumptionValues)
{
	ReportWriter writer;
	writer.build({}, {}, {}, 0.25);
	const ReportSheet* sheet = writer.getSheet("Assumptions");
	ASSERT_NE(sheet, nullptr);
	ASSERT_EQ(sheet->rowCount(), 8u);

	EXPECT_EQ(sheet->getRow(0)[0][2], "heading");
	EXPECT_EQ(sheet->getRow(1)[0][2], "highlight");
	EXPECT_DOUBLE_EQ(sheet->getRow(2)[1][1].get<double>(), 1.2);
	EXPECT_DOUBLE_EQ(sheet->getRow(3)[1][1].get<double>(), 1.5);
	EXPECT_DOUBLE_EQ(sheet->getRow(4)[1][1].get<double>(), 1.4);
	EXPECT_DOUBLE_EQ(sheet->getRow(5)[1][1].get<double>(), 0.09);
	EXPECT_DOUBLE_EQ(sheet->getRow(7)[1][1].get<double>(), 0.25);
}

TEST(ReportWriterTest, SpaceRowsMarkBoundingBoxes)
{
	ReportWriter writer;
	writer.build({ makeRoom("A", "Living"), makeRoom("B", "L-shape", true) }, {}, {}, 0.1);
	const ReportSheet* sheet = writer.getSheet("Spaces");
	ASSERT_NE(sheet, nullptr);
	ASSERT_EQ(sheet->rowCount(), 2u);

	nlohmann::json sheetJson = sheet->toJson();
	EXPECT_EQ(sheetJson["Rows"][0][0][valueKey], "Living");
	EXPECT_EQ(sheetJson["Rows"][0][1][valueKey], "A");
	EXPECT_DOUBLE_EQ(sheetJson["Rows"][0][2][valueKey].get<double>(), 3.0);
	EXPECT_TRUE(sheetJson["Rows"][0][5].is_null());
	EXPECT_EQ(sheetJson["Rows"][1][5][valueKey], "Based on bounding box");
}

TEST(ReportWriterTest, WindowRowsFollowTheirRoom)
{
	WindowRecord unresolved;
	unresolved.roomCode_ = "A";
	unresolved.tag_ = "W1";
	unresolved.width_ = 1.0;
	unresolved.height_ = 1.2;
	unresolved.hasWall_ = true;

	Room room = makeRoom("A", "Living");
	room.addWindow(Window(unresolved, 0.1));

	ReportWriter writer;
	writer.build({ room }, {}, {}, 0.1);
	const ReportSheet* sheet = writer.getSheet("Windows");
	ASSERT_NE(sheet, nullptr);
	ASSERT_EQ(sheet->rowCount(), 2u);

	nlohmann::json sheetJson = sheet->toJson();
	EXPECT_EQ(sheetJson["Rows"][0][0][valueKey], "Living");
	EXPECT_EQ(sheetJson["Rows"][0][0][formatKey], "highlight");
	EXPECT_TRUE(sheetJson["Rows"][1][0].is_null());
	EXPECT_EQ(sheetJson["Rows"][1][3][valueKey], "W1");
	EXPECT_DOUBLE_EQ(sheetJson["Rows"][1][6][valueKey].get<double>(), 0.1);
	EXPECT_EQ(sheetJson["Rows"][1][7][valueKey], "unresolved");
}

TEST(ReportWriterTest, DoorsAreTyped)
{
	DoorRecord glassDoor;
	glassDoor.roomCode_ = "A";
	glassDoor.name_ = "Glass door";
	glassDoor.isGlazed_ = true;

	DoorRecord solidDoor;
	solidDoor.roomCode_ = "A";
	solidDoor.name_ = "Front door";

	DoorRecord otherDoor;
	otherDoor.roomCode_ = "Z";

	ReportWriter writer;
	writer.build({ makeRoom("A", "Living") }, { glassDoor, solidDoor, otherDoor }, {}, 0.1);
	const ReportSheet* sheet = writer.getSheet("External Doors");
	ASSERT_NE(sheet, nullptr);
	ASSERT_EQ(sheet->rowCount(), 3u);
	EXPECT_EQ(sheet->getRow(1)[2][1], "External Glass Door");
	EXPECT_EQ(sheet->getRow(2)[2][1], "External No-glass Door");
}

TEST(ReportWriterTest, WallHeaderFitsLargestLayerCount)
{
	ReportWriter writer;
	writer.build({ makeRoom("A", "Living") }, {}, { makeWall("A", "Exterior", 2), makeWall("A", "Roof", 0) }, 0.1);
	const ReportSheet* sheet = writer.getSheet("Walls");
	ASSERT_NE(sheet, nullptr);

	const std::vector<std::string>& header = sheet->getHeader();
	ASSERT_EQ(header.size(), 10u);
	EXPECT_EQ(header[6], "Material 1");
	EXPECT_EQ(header[7], "Thickness");
	EXPECT_EQ(header[8], "Material 2");
	EXPECT_EQ(header[9], "Thickness");

	ASSERT_EQ(sheet->rowCount(), 3u);
	nlohmann::json sheetJson = sheet->toJson();
	EXPECT_EQ(sheetJson["Rows"][1][4][valueKey], true);
	EXPECT_EQ(sheetJson["Rows"][1][5][valueKey], 2);
	EXPECT_EQ(sheetJson["Rows"][1][8][valueKey], "Layer 1");
	EXPECT_EQ(sheetJson["Rows"][2][5][valueKey], 0);
	EXPECT_TRUE(sheetJson["Rows"][2][6].is_null());
}

TEST(ReportWriterTest, UnwritablePathThrows)
{
	ReportWriter writer;
	writer.build({}, {}, {}, 0.1);
	EXPECT_THROW(writer.write("/nonexistent_folder_for_test/workbook.json"), ErrorID);
}
