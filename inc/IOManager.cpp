#include "helper.h"
#include "IOManager.h"
#include "roomExtractor.h"
#include "simulationModel.h"
#include "stringManager.h"
#include "errorCollection.h"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <map>
#include <iostream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

template<typename T>
void addTimeToJSON(nlohmann::json* j, const std::string& valueName, T duration)
{
	std::string timeUnitString = "Unit";
	std::string timeDurationString = "Duration";
	nlohmann::json timeSet;
	if (duration == 0) { return; }
	else if (duration < 5000)
	{
		timeSet[timeDurationString] = duration;
		timeSet[timeUnitString] = UnitStringEnum::getString(UnitStringID::milliseconds);
	}
	else
	{
		timeSet[timeDurationString] = duration / 1000;
		timeSet[timeUnitString] = UnitStringEnum::getString(UnitStringID::seconds);
	}
	(*j)[valueName] = timeSet;
	return;
}

std::string IOManager::getTargetPath()
{
	// preload communcation strings
	std::string stringJSONRequest = CommunicationStringEnum::getString(CommunicationStringID::infoJsonRequest);
	std::string stringNoFilePath = CommunicationStringEnum::getString(CommunicationStringID::infoNoFilePath);
	std::string stringNoValFilePath = CommunicationStringEnum::getString(CommunicationStringID::infoNoValFilePath);

	std::cout << stringJSONRequest << std::endl;

	while (true)
	{
		std::cout << "Path: ";
		std::string singlepath = "";
		if (!std::getline(std::cin, singlepath))
		{
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths));
		}
		boost::algorithm::trim(singlepath);

		if (singlepath.size() == 0)
		{
			std::cout << stringNoFilePath << std::endl;
			std::cout << stringJSONRequest << std::endl;
			continue;
		}
		if (singlepath.size() > 1 && singlepath.front() == '"' && singlepath.back() == '"')
		{
			singlepath = singlepath.substr(1, singlepath.size() - 2);
		}
		if (!hasExtension(singlepath, "json"))
		{
			std::cout << stringNoValFilePath << std::endl;
			std::cout << stringJSONRequest << std::endl;
			continue;
		}
		if (!isValidPath(singlepath))
		{
			std::cout << stringNoValFilePath << std::endl;
			std::cout << stringJSONRequest << std::endl;
			continue;
		}
		return singlepath;
	}
}

bool IOManager::getJSONValues(const std::string& inputPath)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	// test if input configuration path is valid
	try { settingsCollection.setInputJSONPath(inputPath, true); }
	catch (const std::string& errorString) { throw errorString; }

	// read config file
	std::ifstream f(settingsCollection.getInputJSONPath());
	nlohmann::json json;
	try { json = nlohmann::json::parse(f); }
	catch (const nlohmann::json::parse_error&)
	{
		ErrorCollection::getInstance().addError(ErrorID::errorJsonUnreadable, inputPath);
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonUnreadable) + inputPath);
	}

	// in and output related settings
	try { settingsCollection.setIOPaths(json); }
	catch (const std::string& errorString) { throw errorString; }

	// set report output toggle
	try { settingsCollection.setWriteReport(json); }
	catch (const std::string& errorString) { throw errorString; }

	// set the room, opening and wall extraction values
	try { settingsCollection.setExtractionSettings(json); }
	catch (const std::string& errorString) { throw errorString; }

	// set the tolerances
	try { settingsCollection.setTolerances(json); }
	catch (const std::string& errorString) { throw errorString; }

	// set simulation and daylight values
	try { settingsCollection.setAnalysisSettings(json); }
	catch (const std::string& errorString) { throw errorString; }

	try { settingsCollection.generateGeneralSettings(); }
	catch (const std::string& errorString) { throw errorString; }

	return true;
}

void IOManager::printSummary()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	std::string indentString = CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent);

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << "\n\n";
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "Used settings:\n\n";

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "I/O settings\n";
	std::cout << "- Configuration file:\n";
	std::cout << indentString << settingsCollection.getInputJSONPath() << "\n";
	std::cout << "- Input File(s):\n";
	for (const std::string& inputPath : settingsCollection.getIfcPathList()) { std::cout << indentString << inputPath << "\n"; }
	std::cout << "- Output File:\n";
	std::cout << indentString << settingsCollection.getOutputPath() << "\n";
	std::cout << "- Workbook File:\n";
	std::cout << indentString << settingsCollection.getOutputWorkbookPath() << "\n";
	std::cout << "- Create Report:\n";
	std::cout << boolToString(settingsCollection.writeReport()) << "\n";
	if (settingsCollection.writeReport())
	{
		std::cout << "- Report File:\n";
		std::cout << indentString << settingsCollection.getOutputReportPath() << "\n";
	}
	std::cout << "\n";

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "Extraction settings\n";
	std::cout << "- Excluded rooms:\n";
	for (const std::string& roomName : settingsCollection.getExcludedRoomList()) { std::cout << indentString << roomName << "\n"; }
	std::cout << "- Default sill height:\n";
	std::cout << indentString << settingsCollection.defaultSillHeight() << UnitStringEnum::getString(UnitStringID::meter) << "\n";
	std::cout << "- Search buffer:\n";
	std::cout << indentString << settingsCollection.searchBuffer() << UnitStringEnum::getString(UnitStringID::meter) << "\n";
	std::cout << "- Wall types:\n";
	for (const std::string& wallType : settingsCollection.getWallTypeList()) { std::cout << indentString << boost::to_upper_copy(wallType) << "\n"; }
	std::cout << "- Use declared coordinate frame:\n";
	std::cout << boolToString(settingsCollection.useDeclaredFrame()) << "\n";
	std::cout << "- Angular tolerance:\n";
	std::cout << indentString << settingsCollection.angularTolerance() << "\n";
	std::cout << "- Wall plane tolerance:\n";
	std::cout << indentString << settingsCollection.wallPlaneTolerance() << UnitStringEnum::getString(UnitStringID::meter) << "\n\n";

	if (settingsCollection.getRoomCode() != "")
	{
		std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "Analysis settings\n";
		std::cout << "- Room code:\n";
		std::cout << indentString << settingsCollection.getRoomCode() << "\n";
		std::cout << "- Simulation File:\n";
		std::cout << indentString << settingsCollection.getOutputSimulationPath() << "\n";
		if (settingsCollection.writeSTEP()) { std::cout << indentString << settingsCollection.getOutputSTEPPath() << "\n"; }
		std::cout << "- Light transmittance:\n";
		std::cout << indentString << settingsCollection.lightTransmittance() << "\n";
		std::cout << "- Grid size:\n";
		std::cout << indentString << settingsCollection.gridSize() << UnitStringEnum::getString(UnitStringID::meter) << "\n";
		std::cout << "- Analysis plane height:\n";
		std::cout << indentString << settingsCollection.analysisPlaneHeight() << UnitStringEnum::getString(UnitStringID::meter) << "\n";
		if (settingsCollection.getIlluminanceResultsPath() != "")
		{
			std::cout << "- Illuminance results:\n";
			std::cout << indentString << settingsCollection.getIlluminanceResultsPath() << "\n";
			std::cout << "- Sky illuminance:\n";
			std::cout << indentString << settingsCollection.skyIlluminance() << UnitStringEnum::getString(UnitStringID::lux) << "\n";
			std::cout << "- Daylight factor threshold:\n";
			std::cout << indentString << settingsCollection.daylightThreshold() << UnitStringEnum::getString(UnitStringID::percentage) << "\n";
			std::cout << "- Required area percentage:\n";
			std::cout << indentString << settingsCollection.requiredAreaPercentage() << UnitStringEnum::getString(UnitStringID::percentage) << "\n";
		}
		std::cout << "\n";
	}
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << "\n\n";
	return;
}

void IOManager::printErrors()
{
	std::map<ErrorID, ErrorObject> errorCollection = ErrorCollection::getInstance().getErrorCollection();

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "Warnings/Errors:\n";
	if (errorCollection.empty())
	{
		std::cout << "\tCode 0\n";
		return;
	}

	for (const std::pair<const ErrorID, ErrorObject>& error : errorCollection)
	{
		const ErrorObject& currentError = error.second;
		std::cout << "\tCode " << currentError.errorCode_ << " : " << currentError.errorDescript_ << "\n";
	}
	return;
}

void IOManager::printCounts()
{
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) << "Extracted:\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentRoomCount) << assemblyResult_.rooms_.size() << "\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentWindowCount) << windowCount_ << "\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentUnmatchedWindowCount) << assemblyResult_.unmatchedWindows_.size() << "\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentUnresolvedCount) << unresolvedCount_ << "\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentNoWallCount) << noWallCount_ << "\n";
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentOutOfRangeCount) << outOfRangeCount_ << "\n\n";
	return;
}

std::string IOManager::boolToString(const bool boolValue)
{
	if (boolValue) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "yes"; }
	else { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "no"; }
}

nlohmann::json IOManager::settingsToJSON()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	nlohmann::json settingsJSON; // overal jsonFile

	// store the filepath data
	nlohmann::json ioJSON;
	ioJSON[JsonObjectInEnum::getString(JsonObjectInID::filePathsInput)] = settingsCollection.getIfcPathList();
	ioJSON[JsonObjectInEnum::getString(JsonObjectInID::filePathOutput)] = settingsCollection.getOutputPath();
	ioJSON[JsonObjectInEnum::getString(JsonObjectInID::filePathReport)] = settingsCollection.getOutputReportPath();
	ioJSON[JsonObjectInEnum::getString(JsonObjectInID::filePathWorkbook)] = settingsCollection.getOutputWorkbookPath();
	ioJSON[JsonObjectInEnum::getString(JsonObjectInID::filePathSimulation)] = settingsCollection.getOutputSimulationPath();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::filePaths)] = ioJSON;

	// store the report data
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::outputReport)] = settingsCollection.writeReport();

	// store the extraction data
	nlohmann::json extractionJSON;
	extractionJSON[JsonObjectInEnum::getString(JsonObjectInID::extractionExcludedRooms)] = settingsCollection.getExcludedRoomList();
	extractionJSON[JsonObjectInEnum::getString(JsonObjectInID::extractionDefaultSill)] = settingsCollection.defaultSillHeight();
	extractionJSON[JsonObjectInEnum::getString(JsonObjectInID::extractionSearchBuffer)] = settingsCollection.searchBuffer();
	extractionJSON[JsonObjectInEnum::getString(JsonObjectInID::extractionWallTypes)] = settingsCollection.getWallTypeList();
	extractionJSON[JsonObjectInEnum::getString(JsonObjectInID::extractionDeclaredFrame)] = settingsCollection.useDeclaredFrame();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::extraction)] = extractionJSON;

	// store the tolerance data
	nlohmann::json toleranceJSON;
	toleranceJSON[JsonObjectInEnum::getString(JsonObjectInID::tolerancesAngular)] = settingsCollection.angularTolerance();
	toleranceJSON[JsonObjectInEnum::getString(JsonObjectInID::tolerancesWallPlane)] = settingsCollection.wallPlaneTolerance();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::tolerances)] = toleranceJSON;

	// store the analysis data
	nlohmann::json analysisJSON;
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisRoomCode)] = settingsCollection.getRoomCode();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisTransmittance)] = settingsCollection.lightTransmittance();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisGridSize)] = settingsCollection.gridSize();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisPlaneHeight)] = settingsCollection.analysisPlaneHeight();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisSkyIlluminance)] = settingsCollection.skyIlluminance();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisDaylightThreshold)] = settingsCollection.daylightThreshold();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisRequiredPercentage)] = settingsCollection.requiredAreaPercentage();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisIlluminanceResults)] = settingsCollection.getIlluminanceResultsPath();
	analysisJSON[JsonObjectInEnum::getString(JsonObjectInID::analysisWriteSTEP)] = settingsCollection.writeSTEP();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::analysis)] = analysisJSON;

	return settingsJSON;
}

nlohmann::json IOManager::countsToJSON()
{
	nlohmann::json countJSON;
	countJSON[OutputObjectEnum::getString(OutputObjectID::rooms)] = assemblyResult_.rooms_.size();
	countJSON[OutputObjectEnum::getString(OutputObjectID::windows)] = windowCount_;
	countJSON["Unmatched windows"] = assemblyResult_.unmatchedWindows_.size();
	countJSON["Unresolved orientations"] = unresolvedCount_;
	countJSON["Windows without wall"] = noWallCount_;
	countJSON["Out of range placements"] = outOfRangeCount_;
	return countJSON;
}

void IOManager::internalizeGeo()
{
	// Time Collection Starts
	auto internalizingTime = std::chrono::high_resolution_clock::now();

	// internalize the helper data
	try
	{
		internalDataManager_->internalizeGeo();
		internalDataManager_->indexGeo();
	}
	catch (const std::string& exceptionString)
	{
		throw exceptionString;
	}
	timeInternalizing_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - internalizingTime).count();
	return;
}

void IOManager::processRooms()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	ErrorCollection& errorCollection = ErrorCollection::getInstance();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoExtractingRooms) << std::endl;
	auto extractionTime = std::chrono::high_resolution_clock::now();
	RoomExtractor extractor(internalDataManager_.get());
	extractor.extract();
	timeExtracting_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - extractionTime).count();

	for (const WindowRecord& windowRecord : extractor.getWindowList())
	{
		windowCount_++;
		if (!windowRecord.hasWall_) { noWallCount_++; }
		else if (windowRecord.wallOrientation_ == Orientation::Unknown) { unresolvedCount_++; }
		if (!windowRecord.inRange_) { outOfRangeCount_++; }
	}
	doorList_ = extractor.getDoorList();
	wallList_ = extractor.getWallList();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoAssemblingRooms) << std::endl;
	auto assemblyTime = std::chrono::high_resolution_clock::now();
	RoomAssembler assembler(settingsCollection.defaultSillHeight());
	assemblyResult_ = assembler.assemble(extractor.getRoomList(), extractor.getWindowList());
	timeAssembling_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - assemblyTime).count();

	for (const std::string& roomCode : assemblyResult_.duplicateRoomCodes_)
	{
		errorCollection.addError(ErrorID::warningDuplicateRoomCode, roomCode);
	}
	for (const WindowRecord& windowRecord : assemblyResult_.unmatchedWindows_)
	{
		errorCollection.addError(ErrorID::warningUnmatchedWindow, windowRecord.tag_);
	}
	std::cout << std::endl;
	return;
}

void IOManager::processWorkbook()
{
	auto workbookTime = std::chrono::high_resolution_clock::now();
	try
	{
		reportWriter_.build(assemblyResult_.rooms_, doorList_, wallList_, SettingsCollection::getInstance().defaultSillHeight());
	}
	catch (const ErrorID& exceptionId)
	{
		ErrorCollection::getInstance().addError(exceptionId);
		throw std::string(errorWarningStringEnum::getString(exceptionId));
	}
	timeWorkbook_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - workbookTime).count();
	return;
}

void IOManager::processSimulation(const Room& room)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoBuildingSimulation) << room.getCode() << std::endl;
	auto simulationTime = std::chrono::high_resolution_clock::now();
	SimulationModel simulationModel(
		room,
		settingsCollection.lightTransmittance(),
		settingsCollection.gridSize(),
		settingsCollection.analysisPlaneHeight()
	);

	if (!simulationModel.getExcludedWindows().empty())
	{
		std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentExcludedWindows) << simulationModel.getExcludedWindows().size() << std::endl;
	}

	try
	{
		simulationModel.write(settingsCollection.getOutputSimulationPath());
		if (settingsCollection.writeSTEP()) { helperFunctions::writeToSTEP(simulationModel.getFaces(), settingsCollection.getOutputSTEPPath()); }
	}
	catch (const ErrorID& exceptionId)
	{
		ErrorCollection::getInstance().addError(exceptionId, settingsCollection.getOutputSimulationPath());
		std::cout << errorWarningStringEnum::getString(exceptionId) << settingsCollection.getOutputSimulationPath() << std::endl;
		succesfullExit_ = 0;
	}
	timeSimulation_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - simulationTime).count();
	return;
}

void IOManager::processDaylight(const Room& room)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoEvaluatingDaylight) << std::endl;
	auto daylightTime = std::chrono::high_resolution_clock::now();

	std::vector<double> illuminanceList;
	try
	{
		illuminanceList = DaylightEvaluator::readIlluminance(settingsCollection.getIlluminanceResultsPath());
	}
	catch (const ErrorID& exceptionId)
	{
		ErrorCollection::getInstance().addError(exceptionId, settingsCollection.getIlluminanceResultsPath());
		std::cout << errorWarningStringEnum::getString(exceptionId) << settingsCollection.getIlluminanceResultsPath() << std::endl;
		return;
	}

	DaylightEvaluator evaluator(
		settingsCollection.skyIlluminance(),
		settingsCollection.daylightThreshold(),
		settingsCollection.requiredAreaPercentage(),
		settingsCollection.gridSize()
	);
	daylightResult_ = evaluator.evaluate(illuminanceList, room.getWidth());
	timeDaylight_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - daylightTime).count();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentDaylightShare) << helperFunctions::roundTo(daylightResult_->share_, 2) << UnitStringEnum::getString(UnitStringID::percentage) << std::endl;
	if (daylightResult_->passed_) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentDaylightPassed) << std::endl; }
	else { std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentDaylightFailed) << std::endl; }
	return;
}

const Room* IOManager::findRoom(const std::string& roomCode) const
{
	for (const Room& room : assemblyResult_.rooms_)
	{
		if (room.getCode() == roomCode) { return &room; }
	}
	return nullptr;
}

void IOManager::printRoom(const Room& room)
{
	std::ios_base::fmtflags originalFlags = std::cout.flags();
	std::streamsize originalPrecision = std::cout.precision();

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoRoomInformation) << "\n";
	std::cout << std::fixed;
	std::cout << "\n Space: \n";
	std::cout << " #### Name:" << room.getDisplayName()
		<< " | Code:" << room.getCode()
		<< " | Width:" << std::setprecision(2) << room.getWidth()
		<< " | Depth:" << std::setprecision(2) << room.getDepth()
		<< " | Height:" << std::setprecision(1) << room.getHeight() << "\n";

	for (const Window& window : room.getWindows())
	{
		std::cout << std::setprecision(2);
		std::cout << "\n Window: \n";
		std::cout << "Window tag: " << window.getTag()
			<< " | Width: " << window.getWidth()
			<< " | Height: " << window.getHeight()
			<< " | Sill height: " << window.getSillHeight() << "\n";
		std::cout << " Parent wall name: " << OrientationStringEnum::getString(window.getWallOrientation())
			<< " | Parent wall length: " << window.getWallLength()
			<< " | Window x location on wall: " << window.getLocationX()
			<< " | Window y location on wall: " << window.getLocationY() << "\n";
	}
	std::cout << std::endl;

	std::cout.flags(originalFlags);
	std::cout.precision(originalPrecision);
	return;
}

bool IOManager::init(const std::vector<std::string>& inputPathList)
{
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << std::endl;
	std::cout << "		IFC_DaylightExtractor " << buildVersion << std::endl;
	std::cout << "    Room, window and wall extractor for daylight analysis\n" << std::endl;
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << std::endl;
	std::cout << std::endl;

	std::string inputPath = "";
	if (inputPathList.size() == 0) { inputPath = getTargetPath(); }
	else if (inputPathList.size() > 1) { return false; } // too many args
	else { inputPath = inputPathList[0]; }

	try { getJSONValues(inputPath); }
	catch (const std::string& exceptionString)
	{
		throw exceptionString;
	}
	std::cout << std::endl;
	printSummary();

	internalDataManager_ = std::make_unique<DataManager>(SettingsCollection::getInstance().getIfcPathList());
	DataManager* internalManagerPtr = internalDataManager_.get();
	if (!internalManagerPtr->isPopulated()) { return false; }
	if (!internalManagerPtr->hasSetUnits()) { return false; }

	return true;
}

bool IOManager::run()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	// internalize the helper data
	try { internalizeGeo(); }
	catch (const std::string& exceptionString) { throw exceptionString; }

	processRooms();
	printCounts();

	try { processWorkbook(); }
	catch (const std::string& exceptionString) { throw exceptionString; }

	const std::string& roomCode = settingsCollection.getRoomCode();
	if (roomCode != "")
	{
		const Room* selectedRoom = findRoom(roomCode);
		if (selectedRoom == nullptr)
		{
			ErrorCollection::getInstance().addError(ErrorID::warningRoomCodeNotFound, roomCode);
			std::cout << errorWarningStringEnum::getString(ErrorID::warningRoomCodeNotFound) << roomCode << "\n" << std::endl;
		}
		else
		{
			printRoom(*selectedRoom);
			processSimulation(*selectedRoom);
			if (settingsCollection.getIlluminanceResultsPath() != "") { processDaylight(*selectedRoom); }
			std::cout << std::endl;
		}
	}

	printErrors();

	return succesfullExit_;
}

bool IOManager::write(bool reportOnly)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	if (settingsCollection.getOutputPath() == "") { return true; } // no output path set yet, cannot write to unknown location

	if (!reportOnly)
	{
		std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoWritingOutput) << settingsCollection.getOutputPath() << std::endl;
		nlohmann::json roomListJson = nlohmann::json::array();
		for (const Room& room : assemblyResult_.rooms_) { roomListJson.emplace_back(room.toJson()); }

		nlohmann::json roomTree;
		roomTree[OutputObjectEnum::getString(OutputObjectID::rooms)] = roomListJson;

		std::ofstream roomFile(settingsCollection.getOutputPath());
		if (!roomFile.is_open())
		{
			ErrorCollection::getInstance().addError(ErrorID::errorUnableToWriteFile, settingsCollection.getOutputPath());
			std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToWriteFile) << settingsCollection.getOutputPath() << std::endl;
			return false;
		}
		roomFile << roomTree.dump(4);
		roomFile.close();

		std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoWritingWorkbook) << settingsCollection.getOutputWorkbookPath() << std::endl;
		try { reportWriter_.write(settingsCollection.getOutputWorkbookPath()); }
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, settingsCollection.getOutputWorkbookPath());
			std::cout << errorWarningStringEnum::getString(exceptionId) << settingsCollection.getOutputWorkbookPath() << std::endl;
			return false;
		}
	}

	if (!settingsCollection.writeReport()) { return true; }
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoWritingReport) << settingsCollection.getOutputReportPath() << std::endl;

	nlohmann::json report;
	report[OutputObjectEnum::getString(OutputObjectID::inputSettings)] = settingsToJSON();

	nlohmann::json timeReport;
	addTimeToJSON(&timeReport, "Internalizing", timeInternalizing_);
	addTimeToJSON(&timeReport, "Extraction", timeExtracting_);
	addTimeToJSON(&timeReport, "Assembly", timeAssembling_);
	addTimeToJSON(&timeReport, "Workbook", timeWorkbook_);
	addTimeToJSON(&timeReport, "Simulation geometry", timeSimulation_);
	addTimeToJSON(&timeReport, "Daylight evaluation", timeDaylight_);
	addTimeToJSON(&timeReport, "Total Processing",
		timeInternalizing_ +
		timeExtracting_ +
		timeAssembling_ +
		timeWorkbook_ +
		timeSimulation_ +
		timeDaylight_
	);

	report[OutputObjectEnum::getString(OutputObjectID::duration)] = timeReport;
	report[OutputObjectEnum::getString(OutputObjectID::counts)] = countsToJSON();
	if (daylightResult_.has_value()) { report[OutputObjectEnum::getString(OutputObjectID::daylight)] = daylightResult_->toJson(); }
	report[OutputObjectEnum::getString(OutputObjectID::errors)] = ErrorCollection::getInstance().toJson();

	std::ofstream reportFile(settingsCollection.getOutputReportPath());
	if (!reportFile.is_open())
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToWriteFile) << settingsCollection.getOutputReportPath() << std::endl;
		return false;
	}
	reportFile << report;
	reportFile.close();
	return true;
}
