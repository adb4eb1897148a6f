#include <vector>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include "helper.h"

#ifndef SETTINGSCOLLECTION_SETTINGSCOLLECTION_H
#define SETTINGSCOLLECTION_SETTINGSCOLLECTION_H

// json value readers, throw an ErrorID if the value is not of the expected type
bool hasExtension(const std::string& string, const std::string& ext);
bool isValidPath(const std::string& path);
bool getJsonBoolValue(const nlohmann::json& jsonBoolValue);
int getJsonInt(const nlohmann::json& jsonIntValue, bool requiredPositive, bool requiredNonZero);
double getJsonDouble(const nlohmann::json& jsonDouleValue);
/// reads a double and checks if it falls within [lowerBound, upperBound]
double getJsonDouble(const nlohmann::json& jsonDouleValue, double lowerBound, double upperBound);
std::string getJsonString(const nlohmann::json& jsonStringValue);
std::vector<std::string> getJsonStringList(const nlohmann::json& jsonListValue);
/// reads a path, if valFolder only the parent folder has to exist
std::string getJsonPath(const nlohmann::json& jsonStringValue, bool valFolder, const std::string& fileExtension);

// collection of all the settings used by the extractor, both user set and internal code settings
struct SettingsCollection {

private:
	// Input settings
	std::string InputJsonPath_;
	std::vector<std::string> inputIFCPathList_ = {};
	std::string outputPath_ = "";
	std::string outputReportPath_ = "";
	std::string outputWorkbookPath_ = "";
	std::string outputSimulationPath_ = "";

	bool writeReport_ = true;

	// extraction settings
	std::vector<std::string> excludedRoomList_ = { "Hallway", "Corridor", "Roof" };
	double defaultSillHeight_ = 0.1;
	double searchBuffer_ = 0.5;
	std::vector<std::string> wallTypeList_ = { "IfcWall", "IfcWallStandardCase" };
	bool useDeclaredFrame_ = false;

	// precision settings
	double spatialTolerance_ = 1e-6;
	double angularTolerance_ = 1e-4;
	double wallPlaneTolerance_ = 0.5;

	// analysis settings
	std::string roomCode_ = "";
	double lightTransmittance_ = 0.6;
	double gridSize_ = 0.5;
	double analysisPlaneHeight_ = 0.75;
	double skyIlluminance_ = 10000;
	double daylightThreshold_ = 2.1;
	double requiredAreaPercentage_ = 50;
	std::string illuminanceResultsPath_ = "";
	bool writeSTEP_ = false;

	// set of the supported versions of the tool (read only!)
	std::unordered_set<std::string> ifcVersionList_ = { "IFC2X3", "IFC4X3", "IFC4" };

	// set of the wall types that can be requested (read only!)
	std::unordered_set<std::string> supportedWallTypeList_ = { "IFCWALL", "IFCWALLSTANDARDCASE", "IFCWALLELEMENTEDCASE", "IFCCURTAINWALL" };

	SettingsCollection() = default;

	IfcGeom::IteratorSettings iteratorSettings_;

public:
	static SettingsCollection& getInstance() {
		static SettingsCollection instance;
		return instance;
	}

	// disable asignement and copying
	SettingsCollection(const SettingsCollection&) = delete;
	SettingsCollection& operator=(const SettingsCollection&) = delete;

	// read and store the extraction related settings
	void setExtractionSettings(const nlohmann::json& json);
	// read and store the daylight analysis related settings
	void setAnalysisSettings(const nlohmann::json& json);
	// set the tolerances
	void setTolerances(const nlohmann::json& json);
	// set the generative settings related to the user submitted settings
	void generateGeneralSettings();

	// check if path is valid and stores it
	void setInputJSONPath(const std::string& inputString, bool validate);
	const std::string& getInputJSONPath() const { return InputJsonPath_; }

	// populates all the paths except the JSON config path
	void setIOPaths(const nlohmann::json& json);

	const std::vector<std::string>& getIfcPathList() const { return inputIFCPathList_; }
	void addToIfcPathList(const std::string& value) { inputIFCPathList_.emplace_back(value); }
	void clearIfcPathList() { inputIFCPathList_.clear(); }

	const std::string& getOutputPath() const { return outputPath_; }
	void setOutputPath(const std::string& value) { outputPath_ = value; }
	const std::string& getOutputReportPath() const { return outputReportPath_; }
	void setOutputReportPath(const std::string& value) { outputReportPath_ = value; }
	const std::string& getOutputWorkbookPath() const { return outputWorkbookPath_; }
	void setOutputWorkbookPath(const std::string& value) { outputWorkbookPath_ = value; }
	const std::string& getOutputSimulationPath() const { return outputSimulationPath_; }
	void setOutputSimulationPath(const std::string& value) { outputSimulationPath_ = value; }
	/// STEP file is written next to the simulation file
	std::string getOutputSTEPPath() const;

	bool writeReport() const { return writeReport_; }
	void setWriteReport(bool value) { writeReport_ = value; }
	void setWriteReport(const nlohmann::json& json);

	const std::vector<std::string>& getExcludedRoomList() const { return excludedRoomList_; }
	void setExcludedRoomList(const std::vector<std::string>& value) { excludedRoomList_ = value; }
	double defaultSillHeight() const { return defaultSillHeight_; }
	void setDefaultSillHeight(double value) { defaultSillHeight_ = value; }
	double searchBuffer() const { return searchBuffer_; }
	void setSearchBuffer(double value) { searchBuffer_ = value; }
	const std::vector<std::string>& getWallTypeList() const { return wallTypeList_; }
	void setWallTypeList(const std::vector<std::string>& value) { wallTypeList_ = value; }
	bool useDeclaredFrame() const { return useDeclaredFrame_; }
	void setUseDeclaredFrame(bool value) { useDeclaredFrame_ = value; }

	double spatialTolerance() const { return spatialTolerance_; }
	double angularTolerance() const { return angularTolerance_; }
	void setAngularTolerance(double value) { angularTolerance_ = value; }
	double wallPlaneTolerance() const { return wallPlaneTolerance_; }
	void setWallPlaneTolerance(double value) { wallPlaneTolerance_ = value; }

	const std::string& getRoomCode() const { return roomCode_; }
	void setRoomCode(const std::string& value) { roomCode_ = value; }
	double lightTransmittance() const { return lightTransmittance_; }
	void setLightTransmittance(double value) { lightTransmittance_ = value; }
	double gridSize() const { return gridSize_; }
	void setGridSize(double value) { gridSize_ = value; }
	double analysisPlaneHeight() const { return analysisPlaneHeight_; }
	void setAnalysisPlaneHeight(double value) { analysisPlaneHeight_ = value; }
	double skyIlluminance() const { return skyIlluminance_; }
	void setSkyIlluminance(double value) { skyIlluminance_ = value; }
	double daylightThreshold() const { return daylightThreshold_; }
	void setDaylightThreshold(double value) { daylightThreshold_ = value; }
	double requiredAreaPercentage() const { return requiredAreaPercentage_; }
	void setRequiredAreaPercentage(double value) { requiredAreaPercentage_ = value; }
	const std::string& getIlluminanceResultsPath() const { return illuminanceResultsPath_; }
	void setIlluminanceResultsPath(const std::string& value) { illuminanceResultsPath_ = value; }
	bool writeSTEP() const { return writeSTEP_; }
	void setWriteSTEP(bool value) { writeSTEP_ = value; }

	const std::unordered_set<std::string>& getSupportedIfcVersionList() const { return ifcVersionList_; }

	IfcGeom::IteratorSettings iteratorSettings() const { return iteratorSettings_; }
	void setIterator(const IfcGeom::IteratorSettings& settingsObject) { iteratorSettings_ = settingsObject; }

	/// resets all the user settable values to their defaults
	void reset();
};

#endif // SETTINGSCOLLECTION_SETTINGSCOLLECTION_H
