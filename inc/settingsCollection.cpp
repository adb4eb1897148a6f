#include "settingsCollection.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <nlohmann/json.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

bool hasExtension(const std::string& string, const std::string& ext)
{
	std::string substring = boost::to_lower_copy<std::string>(string.substr(string.find_last_of(".") + 1));
	if (substring == ext) { return true; }
	return false;
}

bool isValidPath(const std::string& path)
{
	return boost::filesystem::exists(path);
}

bool getJsonBoolValue(const nlohmann::json& jsonBoolValue)
{
	if (jsonBoolValue.is_boolean())
	{
		return static_cast<bool>(jsonBoolValue);
	}

	if (!jsonBoolValue.is_number_integer() &&
		!jsonBoolValue.is_number_unsigned())
	{
		throw ErrorID::errorJsonInvalBool;
	}

	int jsonBoolInt = static_cast<int>(jsonBoolValue);
	if (jsonBoolInt == 0) { return false; }
	if (jsonBoolInt == 1) { return true; }

	throw ErrorID::errorJsonInvalBool; //if not 0 or 1 invalid
}

int getJsonInt(const nlohmann::json& jsonIntValue, bool requiredPositive, bool requiredNonZero)
{
	if (!jsonIntValue.is_number_integer() &&
		!jsonIntValue.is_number_unsigned())
	{
		throw ErrorID::errorJsonInvalInt;
	}

	if (!requiredPositive) { return static_cast<int>(jsonIntValue); }

	int intValue = static_cast<int>(jsonIntValue);
	if (intValue < 0)
	{
		throw ErrorID::errorJsonInvalNegInt;
	}

	if (!requiredNonZero) { return intValue; }
	if (intValue == 0) { throw ErrorID::errorJsonInvalZeroInt; }
	return intValue;
}

double getJsonDouble(const nlohmann::json& jsonDouleValue)
{
	if (!jsonDouleValue.is_number_integer() &&
		!jsonDouleValue.is_number_unsigned() &&
		!jsonDouleValue.is_number_float())
	{
		throw ErrorID::errorJsonInvalNum;
	}
	return static_cast<double>(jsonDouleValue);
}

double getJsonDouble(const nlohmann::json& jsonDouleValue, double lowerBound, double upperBound)
{
	double doubleValue = getJsonDouble(jsonDouleValue);
	if (doubleValue < lowerBound || doubleValue > upperBound)
	{
		throw ErrorID::errorJsonInvalRange;
	}
	return doubleValue;
}

std::string getJsonString(const nlohmann::json& jsonStringValue)
{
	if (!jsonStringValue.is_string())
	{
		throw ErrorID::errorJsonInvalString;
	}
	return static_cast<std::string>(jsonStringValue);
}

std::vector<std::string> getJsonStringList(const nlohmann::json& jsonListValue)
{
	if (!jsonListValue.is_array())
	{
		throw ErrorID::errorJsonInvalArray;
	}

	std::vector<std::string> stringList;
	for (const nlohmann::json& jsonValue : jsonListValue)
	{
		stringList.emplace_back(getJsonString(jsonValue));
	}
	return stringList;
}

std::string getJsonPath(const nlohmann::json& jsonStringValue, bool valFolder, const std::string& fileExtension)
{
	std::string jsonPathPtr = getJsonString(jsonStringValue);

	if (!hasExtension(jsonPathPtr, fileExtension))
	{
		throw ErrorID::errorJsonInvalPath;
	}

	if (valFolder)
	{
		boost::filesystem::path folderPath(jsonPathPtr);
		std::string parentPath = folderPath.parent_path().string();

		// a bare filename is written to the working directory
		if (!parentPath.empty() && !isValidPath(parentPath))
		{
			throw ErrorID::errorJsonNoRealPath;
		}
		return jsonPathPtr;
	}

	if (!isValidPath(jsonPathPtr))
	{
		throw ErrorID::errorJsonNoRealPath;
	}

	return jsonPathPtr;
}

namespace {
	std::string derivePath(const std::string& outputPath, const std::string& suffix)
	{
		boost::filesystem::path filePath(outputPath);
		boost::filesystem::path parentFolder = filePath.parent_path();
		boost::filesystem::path fileNameStem = filePath.stem();
		return (parentFolder / (fileNameStem.string() + suffix)).string();
	}

	// reads an optional double entry, throws a string carrying the entry name on failure
	bool readDouble(const nlohmann::json& json, JsonObjectInID id, double lowerBound, double upperBound, double& value)
	{
		std::string oName = JsonObjectInEnum::getString(id);
		if (!json.contains(oName)) { return false; }

		try
		{
			value = getJsonDouble(json[oName], lowerBound, upperBound);
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, oName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + oName);
		}
		return true;
	}

	bool readBool(const nlohmann::json& json, JsonObjectInID id, bool& value)
	{
		std::string oName = JsonObjectInEnum::getString(id);
		if (!json.contains(oName)) { return false; }

		try
		{
			value = getJsonBoolValue(json[oName]);
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, oName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + oName);
		}
		return true;
	}
}

void SettingsCollection::setInputJSONPath(const std::string& inputString, bool validate)
{
	if (validate)
	{
		if (!isValidPath(inputString))
		{
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths));
		}
		else if (!hasExtension(inputString, "json")) {
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths));
		}
	}
	InputJsonPath_ = inputString;
	return;
}

void SettingsCollection::setIOPaths(const nlohmann::json& json)
{
	// get filepath object
	std::string filePathsOName = JsonObjectInEnum::getString(JsonObjectInID::filePaths);
	if (!json.contains(filePathsOName))
	{
		ErrorCollection::getInstance().addError(ErrorID::errorJsonMissingEntry, filePathsOName);
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + filePathsOName);
	}
	nlohmann::json filePaths = json[filePathsOName];

	// get the output room tree path
	std::string outputOName = JsonObjectInEnum::getString(JsonObjectInID::filePathOutput);
	if (!filePaths.contains(outputOName))
	{
		ErrorCollection::getInstance().addError(ErrorID::errorJsonMissingEntry, outputOName);
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + outputOName);
	}

	try
	{
		setOutputPath(getJsonPath(filePaths[outputOName], true, "json"));
	}
	catch (const ErrorID& exceptionId)
	{
		ErrorCollection::getInstance().addError(exceptionId, outputOName);
		throw std::string(errorWarningStringEnum::getString(exceptionId) + outputOName);
	}

	// the optional output paths default to the output stem with a suffix
	const std::vector<std::pair<JsonObjectInID, fileExtensionID>> derivedPathList = {
		{JsonObjectInID::filePathReport, fileExtensionID::report},
		{JsonObjectInID::filePathWorkbook, fileExtensionID::workbook},
		{JsonObjectInID::filePathSimulation, fileExtensionID::simulation}
	};

	for (const std::pair<JsonObjectInID, fileExtensionID>& derivedPath : derivedPathList)
	{
		std::string pathOName = JsonObjectInEnum::getString(derivedPath.first);
		std::string pathValue = derivePath(getOutputPath(), fileExtensionEnum::getString(derivedPath.second));

		if (filePaths.contains(pathOName))
		{
			try
			{
				pathValue = getJsonPath(filePaths[pathOName], true, "json");
			}
			catch (const ErrorID& exceptionId)
			{
				ErrorCollection::getInstance().addError(exceptionId, pathOName);
				throw std::string(errorWarningStringEnum::getString(exceptionId) + pathOName);
			}
		}

		if (derivedPath.first == JsonObjectInID::filePathReport) { setOutputReportPath(pathValue); }
		else if (derivedPath.first == JsonObjectInID::filePathWorkbook) { setOutputWorkbookPath(pathValue); }
		else { setOutputSimulationPath(pathValue); }
	}

	// get ifc input path array
	std::string inputOName = JsonObjectInEnum::getString(JsonObjectInID::filePathsInput);
	if (!filePaths.contains(inputOName))
	{
		ErrorCollection::getInstance().addError(ErrorID::errorJsonMissingEntry, inputOName);
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + inputOName);
	}
	nlohmann::json inputPaths = filePaths[inputOName];
	if (inputPaths.type() != nlohmann::json::value_t::array || inputPaths.empty())
	{
		ErrorCollection::getInstance().addError(ErrorID::errorJsonInvalArray, inputOName);
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray) + inputOName);
	}

	// store input ifc paths
	for (size_t i = 0; i < inputPaths.size(); i++) {
		try { addToIfcPathList(getJsonPath(inputPaths[i], false, "ifc")); }
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, inputOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + inputOName);
		}
	}
	return;
}

std::string SettingsCollection::getOutputSTEPPath() const
{
	return derivePath(outputSimulationPath_, fileExtensionEnum::getString(fileExtensionID::STEP));
}

void SettingsCollection::setWriteReport(const nlohmann::json& json)
{
	bool reportBool = writeReport_;
	if (readBool(json, JsonObjectInID::outputReport, reportBool)) { setWriteReport(reportBool); }
	return;
}

void SettingsCollection::setExtractionSettings(const nlohmann::json& json)
{
	std::string extractionOName = JsonObjectInEnum::getString(JsonObjectInID::extraction);
	if (!json.contains(extractionOName)) { return; }
	nlohmann::json extractionJson = json[extractionOName];

	std::string excludedOName = JsonObjectInEnum::getString(JsonObjectInID::extractionExcludedRooms);
	if (extractionJson.contains(excludedOName))
	{
		try
		{
			setExcludedRoomList(getJsonStringList(extractionJson[excludedOName]));
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, excludedOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + excludedOName);
		}
	}

	std::string wallTypeOName = JsonObjectInEnum::getString(JsonObjectInID::extractionWallTypes);
	if (extractionJson.contains(wallTypeOName))
	{
		std::vector<std::string> wallTypeList;
		try
		{
			wallTypeList = getJsonStringList(extractionJson[wallTypeOName]);
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, wallTypeOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + wallTypeOName);
		}

		for (const std::string& wallType : wallTypeList)
		{
			if (supportedWallTypeList_.find(boost::to_upper_copy(wallType)) == supportedWallTypeList_.end())
			{
				ErrorCollection::getInstance().addError(ErrorID::errorJsonInvalEntry, wallTypeOName);
				throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry) + wallTypeOName);
			}
		}

		if (wallTypeList.empty())
		{
			ErrorCollection::getInstance().addError(ErrorID::errorJsonInvalArray, wallTypeOName);
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray) + wallTypeOName);
		}
		setWallTypeList(wallTypeList);
	}

	readDouble(extractionJson, JsonObjectInID::extractionDefaultSill, 0, std::numeric_limits<double>::max(), defaultSillHeight_);
	readDouble(extractionJson, JsonObjectInID::extractionSearchBuffer, 0, std::numeric_limits<double>::max(), searchBuffer_);
	readBool(extractionJson, JsonObjectInID::extractionDeclaredFrame, useDeclaredFrame_);
	return;
}

void SettingsCollection::setTolerances(const nlohmann::json& json)
{
	std::string tolerancesOName = JsonObjectInEnum::getString(JsonObjectInID::tolerances);
	if (!json.contains(tolerancesOName)) { return; }
	nlohmann::json toleranceJson = json[tolerancesOName];

	readDouble(toleranceJson, JsonObjectInID::tolerancesAngular, 0, M_PI, angularTolerance_);
	readDouble(toleranceJson, JsonObjectInID::tolerancesWallPlane, 0, std::numeric_limits<double>::max(), wallPlaneTolerance_);
	return;
}

void SettingsCollection::setAnalysisSettings(const nlohmann::json& json)
{
	std::string analysisOName = JsonObjectInEnum::getString(JsonObjectInID::analysis);
	if (!json.contains(analysisOName)) { return; }
	nlohmann::json analysisJson = json[analysisOName];

	std::string roomCodeOName = JsonObjectInEnum::getString(JsonObjectInID::analysisRoomCode);
	if (analysisJson.contains(roomCodeOName))
	{
		try
		{
			setRoomCode(getJsonString(analysisJson[roomCodeOName]));
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, roomCodeOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + roomCodeOName);
		}
	}

	std::string resultsOName = JsonObjectInEnum::getString(JsonObjectInID::analysisIlluminanceResults);
	if (analysisJson.contains(resultsOName))
	{
		try
		{
			// the engine can run after the extraction so the file is not required to exist yet
			setIlluminanceResultsPath(getJsonString(analysisJson[resultsOName]));
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, resultsOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + resultsOName);
		}
	}

	const double maxValue = std::numeric_limits<double>::max();
	readDouble(analysisJson, JsonObjectInID::analysisTransmittance, 0, 1, lightTransmittance_);
	readDouble(analysisJson, JsonObjectInID::analysisPlaneHeight, 0, maxValue, analysisPlaneHeight_);
	readDouble(analysisJson, JsonObjectInID::analysisDaylightThreshold, 0, 100, daylightThreshold_);
	readDouble(analysisJson, JsonObjectInID::analysisRequiredPercentage, 0, 100, requiredAreaPercentage_);
	readBool(analysisJson, JsonObjectInID::analysisWriteSTEP, writeSTEP_);

	// zero is not a usable grid size or sky value
	double gridSize = gridSize_;
	if (readDouble(analysisJson, JsonObjectInID::analysisGridSize, 0, maxValue, gridSize))
	{
		if (gridSize <= 0)
		{
			std::string gridOName = JsonObjectInEnum::getString(JsonObjectInID::analysisGridSize);
			ErrorCollection::getInstance().addError(ErrorID::errorJsonInvalZeroInt, gridOName);
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalZeroInt) + gridOName);
		}
		setGridSize(gridSize);
	}

	double skyIlluminance = skyIlluminance_;
	if (readDouble(analysisJson, JsonObjectInID::analysisSkyIlluminance, 0, maxValue, skyIlluminance))
	{
		if (skyIlluminance <= 0)
		{
			std::string skyOName = JsonObjectInEnum::getString(JsonObjectInID::analysisSkyIlluminance);
			ErrorCollection::getInstance().addError(ErrorID::errorJsonInvalZeroInt, skyOName);
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalZeroInt) + skyOName);
		}
		setSkyIlluminance(skyIlluminance);
	}
	return;
}

void SettingsCollection::generateGeneralSettings()
{
	// openings are kept in the wall shapes, the window boxes are matched against full walls
	IfcGeom::IteratorSettings iteratorSettings;
	iteratorSettings.set(iteratorSettings.DISABLE_OPENING_SUBTRACTIONS, true);
	setIterator(iteratorSettings);
	return;
}

void SettingsCollection::reset()
{
	InputJsonPath_ = "";
	inputIFCPathList_.clear();
	outputPath_ = "";
	outputReportPath_ = "";
	outputWorkbookPath_ = "";
	outputSimulationPath_ = "";
	writeReport_ = true;

	excludedRoomList_ = { "Hallway", "Corridor", "Roof" };
	defaultSillHeight_ = 0.1;
	searchBuffer_ = 0.5;
	wallTypeList_ = { "IfcWall", "IfcWallStandardCase" };
	useDeclaredFrame_ = false;

	angularTolerance_ = 1e-4;
	wallPlaneTolerance_ = 0.5;

	roomCode_ = "";
	lightTransmittance_ = 0.6;
	gridSize_ = 0.5;
	analysisPlaneHeight_ = 0.75;
	skyIlluminance_ = 10000;
	daylightThreshold_ = 2.1;
	requiredAreaPercentage_ = 50;
	illuminanceResultsPath_ = "";
	writeSTEP_ = false;
	return;
}
