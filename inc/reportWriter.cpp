#include "reportWriter.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <algorithm>
#include <fstream>
#include <map>

namespace {
	std::string getReportString(ReportStringID id) { return ReportStringEnum::getString(id); }

	nlohmann::json makeCell(int column, const nlohmann::json& value) { return nlohmann::json::array({ column, value }); }

	nlohmann::json makeCell(int column, const nlohmann::json& value, ReportStringID format)
	{
		return nlohmann::json::array({ column, value, ReportStringEnum::getString(format) });
	}
}

ReportSheet::ReportSheet(const std::string& name, const std::vector<std::string>& header)
{
	name_ = name;
	header_ = header;
}

void ReportSheet::validateCell(const nlohmann::json& cell)
{
	if (!cell.is_array()) { throw ErrorID::errorMalformedReportRow; }
	if (cell.size() != 2 && cell.size() != 3) { throw ErrorID::errorMalformedReportRow; }
	if (!cell[0].is_number_integer() || cell[0].get<int>() < 0) { throw ErrorID::errorMalformedReportRow; }
	if (cell.size() == 3 && !cell[2].is_string()) { throw ErrorID::errorMalformedReportRow; }
}

void ReportSheet::addRow(const nlohmann::json& row)
{
	if (row.is_null()) { return; }
	if (!row.is_array()) { throw ErrorID::errorMalformedReportRow; }

	for (const nlohmann::json& cell : row) { validateCell(cell); }
	rowList_.emplace_back(row);
}

void ReportSheet::setHeader(size_t column, const std::string& value)
{
	if (header_.size() <= column) { header_.resize(column + 1, ""); }
	header_[column] = value;
}

nlohmann::json ReportSheet::toJson() const
{
	nlohmann::json rowListJson = nlohmann::json::array();
	for (const nlohmann::json& row : rowList_)
	{
		size_t columnCount = header_.size();
		for (const nlohmann::json& cell : row) { columnCount = std::max(columnCount, cell[0].get<size_t>() + 1); }

		nlohmann::json rowJson = nlohmann::json::array();
		for (size_t i = 0; i < columnCount; i++) { rowJson.emplace_back(nullptr); }

		for (const nlohmann::json& cell : row)
		{
			nlohmann::json cellJson;
			cellJson[OutputObjectEnum::getString(OutputObjectID::cellValue)] = cell[1];
			if (cell.size() == 3) { cellJson[OutputObjectEnum::getString(OutputObjectID::cellFormat)] = cell[2]; }
			rowJson[cell[0].get<size_t>()] = cellJson;
		}
		rowListJson.emplace_back(rowJson);
	}

	nlohmann::json sheetJson;
	sheetJson[OutputObjectEnum::getString(OutputObjectID::sheetColumns)] = header_;
	sheetJson[OutputObjectEnum::getString(OutputObjectID::sheetRows)] = rowListJson;
	return sheetJson;
}

nlohmann::json ReportWriter::makeRoomHeadingRow(const Room& room, size_t columnCount)
{
	nlohmann::json row = nlohmann::json::array();
	row.emplace_back(makeCell(0, room.getDisplayName(), ReportStringID::formatHighlight));
	row.emplace_back(makeCell(1, room.getCode(), ReportStringID::formatHighlight));
	for (size_t i = 2; i < columnCount; i++)
	{
		row.emplace_back(makeCell(static_cast<int>(i), " ", ReportStringID::formatHighlight));
	}
	return row;
}

ReportSheet ReportWriter::makeAssumptionSheet(double defaultSillHeight) const
{
	ReportSheet sheet(getReportString(ReportStringID::sheetAssumptions), {});

	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionTitle), ReportStringID::formatHeading) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionConductivity), ReportStringID::formatHighlight) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionWindows)), makeCell(1, 1.2) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionGlassDoors)), makeCell(1, 1.5) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionNonGlassDoors)), makeCell(1, 1.4) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionExternalWalls)), makeCell(1, 0.09) }));
	sheet.addRow(nlohmann::json::array({ makeCell(0, getReportString(ReportStringID::assumptionProfileNote)) }));
	sheet.addRow(nlohmann::json::array({
		makeCell(0, getReportString(ReportStringID::assumptionSillNote)),
		makeCell(1, defaultSillHeight),
		makeCell(2, UnitStringEnum::getString(UnitStringID::meter))
		}));
	return sheet;
}

ReportSheet ReportWriter::makeSpaceSheet(const std::vector<Room>& roomList) const
{
	ReportSheet sheet(
		getReportString(ReportStringID::sheetSpaces),
		{
			getReportString(ReportStringID::colSpaceName),
			getReportString(ReportStringID::colSpaceCode),
			getReportString(ReportStringID::colXDimension),
			getReportString(ReportStringID::colYDimension),
			getReportString(ReportStringID::colHeight),
			getReportString(ReportStringID::colBoundingBox)
		}
	);

	for (const Room& room : roomList)
	{
		nlohmann::json row = nlohmann::json::array({
			makeCell(0, room.getDisplayName()),
			makeCell(1, room.getCode()),
			makeCell(2, room.getWidth()),
			makeCell(3, room.getDepth()),
			makeCell(4, room.getHeight())
		});
		if (room.isBoundingBox()) { row.emplace_back(makeCell(5, getReportString(ReportStringID::basedOnBoundingBox))); }
		sheet.addRow(row);
	}
	return sheet;
}

ReportSheet ReportWriter::makeWindowSheet(const std::vector<Room>& roomList) const
{
	ReportSheet sheet(
		getReportString(ReportStringID::sheetWindows),
		{
			getReportString(ReportStringID::colSpaceName),
			getReportString(ReportStringID::colSpaceCode),
			getReportString(ReportStringID::colWindowName),
			getReportString(ReportStringID::colWindowTag),
			getReportString(ReportStringID::colHeight),
			getReportString(ReportStringID::colWidth),
			getReportString(ReportStringID::colSillHeight),
			getReportString(ReportStringID::colOrientation),
			getReportString(ReportStringID::colWallLength),
			getReportString(ReportStringID::colLocationX),
			getReportString(ReportStringID::colLocationY),
			getReportString(ReportStringID::colInRange)
		}
	);

	for (const Room& room : roomList)
	{
		sheet.addRow(makeRoomHeadingRow(room, sheet.getHeader().size()));
		for (const Window& window : room.getWindows())
		{
			sheet.addRow(nlohmann::json::array({
				makeCell(2, window.getName()),
				makeCell(3, window.getTag()),
				makeCell(4, window.getHeight()),
				makeCell(5, window.getWidth()),
				makeCell(6, window.getSillHeight()),
				makeCell(7, OrientationStringEnum::getString(window.getWallOrientation())),
				makeCell(8, window.getWallLength()),
				makeCell(9, window.getLocationX()),
				makeCell(10, window.getLocationY()),
				makeCell(11, window.isInRange())
				}));
		}
	}
	return sheet;
}

ReportSheet ReportWriter::makeDoorSheet(const std::vector<Room>& roomList, const std::vector<DoorRecord>& doorList) const
{
	ReportSheet sheet(
		getReportString(ReportStringID::sheetDoors),
		{
			getReportString(ReportStringID::colSpaceName),
			getReportString(ReportStringID::colSpaceCode),
			getReportString(ReportStringID::colDoorName),
			getReportString(ReportStringID::colDoorTag),
			getReportString(ReportStringID::colType),
			getReportString(ReportStringID::colHeight),
			getReportString(ReportStringID::colWidth)
		}
	);

	std::multimap<std::string, const DoorRecord*> doorLookup;
	for (const DoorRecord& door : doorList) { doorLookup.emplace(door.roomCode_, &door); }

	for (const Room& room : roomList)
	{
		sheet.addRow(makeRoomHeadingRow(room, sheet.getHeader().size()));

		auto doorRange = doorLookup.equal_range(room.getCode());
		for (auto doorIt = doorRange.first; doorIt != doorRange.second; ++doorIt)
		{
			const DoorRecord* door = doorIt->second;
			ReportStringID doorType = door->isGlazed_ ? ReportStringID::doorGlazed : ReportStringID::doorNotGlazed;
			sheet.addRow(nlohmann::json::array({
				makeCell(2, door->name_),
				makeCell(3, door->tag_),
				makeCell(4, getReportString(doorType)),
				makeCell(5, door->height_),
				makeCell(6, door->width_)
				}));
		}
	}
	return sheet;
}

ReportSheet ReportWriter::makeWallSheet(const std::vector<Room>& roomList, const std::vector<WallRecord>& wallList) const
{
	ReportSheet sheet(
		getReportString(ReportStringID::sheetWalls),
		{
			getReportString(ReportStringID::colSpaceName),
			getReportString(ReportStringID::colSpaceCode),
			getReportString(ReportStringID::colWallName),
			getReportString(ReportStringID::colWallTag),
			getReportString(ReportStringID::colIsExternal),
			getReportString(ReportStringID::colLayerCount)
		}
	);

	std::multimap<std::string, const WallRecord*> wallLookup;
	size_t maxLayerCount = 0;
	for (const WallRecord& wall : wallList)
	{
		wallLookup.emplace(wall.roomCode_, &wall);
		maxLayerCount = std::max(maxLayerCount, wall.layerList_.size());
	}

	// a material and thickness column pair per layer
	for (size_t i = 0; i < maxLayerCount; i++)
	{
		sheet.setHeader(6 + 2 * i, getReportString(ReportStringID::colMaterial) + std::to_string(i + 1));
		sheet.setHeader(7 + 2 * i, getReportString(ReportStringID::colThickness));
	}

	for (const Room& room : roomList)
	{
		sheet.addRow(makeRoomHeadingRow(room, sheet.getHeader().size()));

		auto wallRange = wallLookup.equal_range(room.getCode());
		for (auto wallIt = wallRange.first; wallIt != wallRange.second; ++wallIt)
		{
			const WallRecord* wall = wallIt->second;
			nlohmann::json row = nlohmann::json::array({
				makeCell(2, wall->name_),
				makeCell(3, wall->tag_)
			});
			if (wall->isExternal_.has_value()) { row.emplace_back(makeCell(4, *wall->isExternal_)); }
			row.emplace_back(makeCell(5, static_cast<int>(wall->layerList_.size())));

			int column = 6;
			for (const MaterialLayer& layer : wall->layerList_)
			{
				row.emplace_back(makeCell(column, layer.name_));
				row.emplace_back(makeCell(column + 1, layer.thickness_));
				column += 2;
			}
			sheet.addRow(row);
		}
	}
	return sheet;
}

void ReportWriter::build(
	const std::vector<Room>& roomList,
	const std::vector<DoorRecord>& doorList,
	const std::vector<WallRecord>& wallList,
	double defaultSillHeight)
{
	sheetList_.clear();
	sheetList_.emplace_back(makeAssumptionSheet(defaultSillHeight));
	sheetList_.emplace_back(makeSpaceSheet(roomList));
	sheetList_.emplace_back(makeWindowSheet(roomList));
	sheetList_.emplace_back(makeDoorSheet(roomList, doorList));
	sheetList_.emplace_back(makeWallSheet(roomList, wallList));
}

const ReportSheet* ReportWriter::getSheet(const std::string& name) const
{
	for (const ReportSheet& sheet : sheetList_)
	{
		if (sheet.getName() == name) { return &sheet; }
	}
	return nullptr;
}

nlohmann::json ReportWriter::toJson() const
{
	nlohmann::json workbook;
	for (const ReportSheet& sheet : sheetList_) { workbook[sheet.getName()] = sheet.toJson(); }
	return workbook;
}

void ReportWriter::write(const std::string& path) const
{
	std::ofstream workbookFile(path);
	if (!workbookFile.is_open()) { throw ErrorID::errorUnableToWriteFile; }
	workbookFile << toJson().dump(4);
	workbookFile.close();
}
