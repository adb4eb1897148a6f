#include "helper.h"
#include "DataManager.h"
#include "daylightEvaluator.h"
#include "reportWriter.h"
#include "roomAssembler.h"
#include "roomData.h"
#include "settingsCollection.h"
#include "stringManager.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef IOMANAGER_IOMANAGER_H
#define IOMANAGER_IOMANAGER_H

/// <summary>
/// Manages and facilitates the communication between the user and the rest of the application
/// </summary>
class IOManager {
private:
	std::unique_ptr<DataManager> internalDataManager_;

	// the output of the run
	AssemblyResult assemblyResult_;
	std::vector<DoorRecord> doorList_;
	std::vector<WallRecord> wallList_;
	ReportWriter reportWriter_;
	std::optional<DaylightResult> daylightResult_;

	// counts for the report
	int windowCount_ = 0;
	int unresolvedCount_ = 0;
	int noWallCount_ = 0;
	int outOfRangeCount_ = 0;

	// time summary for the output
	long long timeInternalizing_ = 0;
	long long timeExtracting_ = 0;
	long long timeAssembling_ = 0;
	long long timeWorkbook_ = 0;
	long long timeSimulation_ = 0;
	long long timeDaylight_ = 0;

	// 1 is all the processing steps were succesfull
	bool succesfullExit_ = 1;

	// get target path from user when program is started with no args
	std::string getTargetPath();
	// attempts to get the settings from json file
	bool getJSONValues(const std::string& inputPath);

	// console outputs the settings that are utilized
	void printSummary();
	// console output the encountered errors
	void printErrors();
	// console output the counts of the extraction
	void printCounts();
	// outputs yes or no based on a input bool
	std::string boolToString(const bool boolValue);

	// returns a json object that is populated with the settings in the settingsobject
	nlohmann::json settingsToJSON();
	// returns a json object with the counts of the extraction
	nlohmann::json countsToJSON();
	/// internalize and index geometry
	void internalizeGeo();

	/// extracts the records and joins them into the room tree
	void processRooms();
	/// builds the workbook sheets
	void processWorkbook();
	/// builds and writes the simulation geometry of the selected room
	void processSimulation(const Room& room);
	/// evaluates the illuminance results of the selected room
	void processDaylight(const Room& room);

	/// returns the room with the code, nullptr if not present
	const Room* findRoom(const std::string& roomCode) const;

public:
	bool init(const std::vector<std::string>& inputPathList);

	bool run();

	bool write(bool reportOnly = false);

	/// prints the room and its windows in the fixed console layout
	static void printRoom(const Room& room);
};

#endif // IOMANAGER_IOMANAGER_H
