#include "roomData.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#ifndef REPORTWRITER_REPORTWRITER_H
#define REPORTWRITER_REPORTWRITER_H

// a single sheet of the workbook
// a row is a list of cells, a cell is [column, value] or [column, value, format]
class ReportSheet {
private:
	std::string name_;
	std::vector<std::string> header_;
	nlohmann::json rowList_ = nlohmann::json::array();

	/// throws ErrorID::errorMalformedReportRow if the cell is not [column, value] or [column, value, format]
	static void validateCell(const nlohmann::json& cell);

public:
	ReportSheet(const std::string& name, const std::vector<std::string>& header);

	/// appends the row, null rows are skipped without leaving a gap
	void addRow(const nlohmann::json& row);
	/// sets the header of a column, the header is extended if required
	void setHeader(size_t column, const std::string& value);

	const std::string& getName() const { return name_; }
	const std::vector<std::string>& getHeader() const { return header_; }
	size_t rowCount() const { return rowList_.size(); }
	const nlohmann::json& getRow(size_t i) const { return rowList_.at(i); }

	/// returns the sheet with every row spread out over the columns
	nlohmann::json toJson() const;
};

// renders the extracted data into the sheets of the workbook
class ReportWriter {
private:
	std::vector<ReportSheet> sheetList_;

	ReportSheet makeAssumptionSheet(double defaultSillHeight) const;
	ReportSheet makeSpaceSheet(const std::vector<Room>& roomList) const;
	ReportSheet makeWindowSheet(const std::vector<Room>& roomList) const;
	ReportSheet makeDoorSheet(const std::vector<Room>& roomList, const std::vector<DoorRecord>& doorList) const;
	ReportSheet makeWallSheet(const std::vector<Room>& roomList, const std::vector<WallRecord>& wallList) const;

	/// heading row of a room in the object sheets
	static nlohmann::json makeRoomHeadingRow(const Room& room, size_t columnCount);

public:
	/// (re)creates all the sheets
	void build(
		const std::vector<Room>& roomList,
		const std::vector<DoorRecord>& doorList,
		const std::vector<WallRecord>& wallList,
		double defaultSillHeight
	);

	const std::vector<ReportSheet>& getSheets() const { return sheetList_; }
	/// returns the sheet with the name, nullptr if not present
	const ReportSheet* getSheet(const std::string& name) const;

	nlohmann::json toJson() const;
	/// writes the workbook as json, throws ErrorID::errorUnableToWriteFile if the file can not be written
	void write(const std::string& path) const;
};

#endif // REPORTWRITER_REPORTWRITER_H
