#include <string>
#include <map>

#include "errorCollection.h"
#include "roomData.h"

#include <nlohmann/json.hpp>

#ifndef STRINGMANAGER_H
#define STRINGMANAGER_H

// collects all the importance elements in communication with the user
enum class CommunicationStringImportanceID
{
	indent,
	info,
	warning,
	error,
	seperator
};

class CommunicationStringImportanceEnum {
public:
	static std::string getString(CommunicationStringImportanceID id);
};

// collects all the unit names for user comms, reports, and input
enum class UnitStringID {
	seconds,
	milliseconds,
	meter,
	sqrMeter,
	percentage,
	lux
};

class UnitStringEnum {
public:
	static std::string getString(UnitStringID id);
};

// collects all the normal cout communication with the user
enum class CommunicationStringID {
	infoJsonRequest,
	infoNoFilePath,
	infoNoValFilePath,
	infoParsingFile,
	infoParsingFiles,
	infoInternalizingGeo,
	infoCreateSpatialIndex,
	infoFoundUnits,

	infoExtractingRooms,
	infoAssemblingRooms,
	infoWritingOutput,
	infoWritingReport,
	infoWritingWorkbook,
	infoBuildingSimulation,
	infoEvaluatingDaylight,
	infoRoomInformation,
	infoTotalProcessCompleted,

	indentValidIFCFound,
	indentcompIFCFound,
	indentSuccesFinished,
	indentUnsuccesful,
	indentRoomCount,
	indentWindowCount,
	indentUnmatchedWindowCount,
	indentUnresolvedCount,
	indentNoWallCount,
	indentOutOfRangeCount,
	indentExcludedWindows,
	indentDaylightShare,
	indentDaylightPassed,
	indentDaylightFailed
};

class CommunicationStringEnum {
public:
	static std::string getString(CommunicationStringID id);
};

// collects all the errors and warnings for both cout and error object description
class errorWarningStringEnum {
public:
	static std::string getString(ErrorID id, bool withImportance = true);
};

/// collects all the file extension of the output
enum class fileExtensionID {
	JSON,
	STEP,
	IFC,
	report,
	workbook,
	simulation
};

class fileExtensionEnum {
public:
	static std::string getString(fileExtensionID id);
};

// collects all the JSON object of the config files
enum class JsonObjectInID {
	outputReport,
	filePaths,
	filePathsInput,
	filePathOutput,
	filePathReport,
	filePathWorkbook,
	filePathSimulation,

	extraction,
	extractionExcludedRooms,
	extractionDefaultSill,
	extractionSearchBuffer,
	extractionWallTypes,
	extractionDeclaredFrame,

	tolerances,
	tolerancesAngular,
	tolerancesWallPlane,

	analysis,
	analysisRoomCode,
	analysisTransmittance,
	analysisGridSize,
	analysisPlaneHeight,
	analysisSkyIlluminance,
	analysisDaylightThreshold,
	analysisRequiredPercentage,
	analysisIlluminanceResults,
	analysisWriteSTEP
};

class JsonObjectInEnum {
public:
	static std::string getString(JsonObjectInID id);
};

// keys of the room tree, the simulation file and the run report
enum class OutputObjectID {
	rooms,
	windows,
	code,
	name,
	tag,
	width,
	depth,
	height,
	sillHeight,
	boundingBox,
	wallOrientation,
	wallLength,
	locationX,
	locationY,
	coordinateFrame,
	hasWall,
	inRange,

	origin,
	surfaces,
	walls,
	glazing,
	vertices,
	transmittance,
	area,
	testPoints,
	gridSize,
	excludedWindows,

	inputSettings,
	duration,
	counts,
	errors,
	daylight,
	daylightShare,
	daylightPassed,
	daylightFactors,

	sheetColumns,
	sheetRows,
	cellValue,
	cellFormat
};

class OutputObjectEnum {
public:
	static std::string getString(OutputObjectID id);
};

class OrientationStringEnum {
public:
	static std::string getString(Orientation id);
	static std::string getString(CoordinateFrame id);
};

// names of the sheets and their fixed columns
enum class ReportStringID {
	sheetAssumptions,
	sheetSpaces,
	sheetWindows,
	sheetDoors,
	sheetWalls,

	colSpaceName,
	colSpaceCode,
	colXDimension,
	colYDimension,
	colHeight,
	colWidth,
	colBoundingBox,
	colWindowName,
	colWindowTag,
	colSillHeight,
	colOrientation,
	colWallLength,
	colLocationX,
	colLocationY,
	colInRange,
	colDoorName,
	colDoorTag,
	colType,
	colWallName,
	colWallTag,
	colIsExternal,
	colLayerCount,
	colMaterial,
	colThickness,

	doorGlazed,
	doorNotGlazed,
	basedOnBoundingBox,
	formatHighlight,
	formatHeading,

	assumptionTitle,
	assumptionConductivity,
	assumptionWindows,
	assumptionGlassDoors,
	assumptionNonGlassDoors,
	assumptionExternalWalls,
	assumptionProfileNote,
	assumptionSillNote
};

class ReportStringEnum {
public:
	static std::string getString(ReportStringID id);
};

// names of ifc properties and property sets that are read
enum class IfcPropertyID {
	psetDimensions,
	psetTypeDimensions,
	psetConstraints,
	psetWallCommon,
	psetDoorCommon,
	unboundedHeight,
	length,
	height,
	width,
	sillHeight,
	isExternal,
	glassKeyword,
	roofKeyword,
	body
};

class IfcPropertyEnum {
public:
	static std::string getString(IfcPropertyID id);
};

#endif // STRINGMANAGER_H
