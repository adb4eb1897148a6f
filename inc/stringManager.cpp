#include "stringManager.h"

#include <string>
#include <map>

#include <nlohmann/json.hpp>

std::string CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID id)
{
	//Include the spaces on the end for spacing
	switch (id) {
	case CommunicationStringImportanceID::indent:
		return "\t";
	case CommunicationStringImportanceID::info:
		return "[INFO] ";
	case CommunicationStringImportanceID::warning: 
		return "[WARNING] ";
	case CommunicationStringImportanceID::error:
		return "[Error] ";
	case CommunicationStringImportanceID::seperator:
		return "=============================================================";
	default:
		return "";
	}
}

std::string UnitStringEnum::getString(UnitStringID id)
{
	switch (id) {
	case UnitStringID::seconds:
		return "s";
	case UnitStringID::milliseconds:
		return "ms";
	case UnitStringID::meter:
		return "m";
	case UnitStringID::sqrMeter:
		return "m^2";
	case UnitStringID::percentage:
		return "%";
	case UnitStringID::lux:
		return "lux";
	default:
		return "";
	}
}

std::string CommunicationStringEnum::getString(CommunicationStringID id)
{
	switch (id) {
	case CommunicationStringID::infoJsonRequest:
		return "Enter filepath of the config JSON";
	case CommunicationStringID::infoNoFilePath:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "No filepath has been supplied";
	case CommunicationStringID::infoNoValFilePath:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "No valid filepath has been supplied";
	case CommunicationStringID::infoParsingFile:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Parsing file: ";
	case CommunicationStringID::infoParsingFiles:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Parsing file(s): ";
	case CommunicationStringID::infoInternalizingGeo:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Internalizing Geometry of Construction Model";
	case CommunicationStringID::infoCreateSpatialIndex:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Create Spatial Index";
	case CommunicationStringID::infoFoundUnits:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Found units:";

	case CommunicationStringID::infoExtractingRooms:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Extracting rooms, openings and walls";
	case CommunicationStringID::infoAssemblingRooms:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Assembling room tree";
	case CommunicationStringID::infoWritingOutput:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Writing room tree to: ";
	case CommunicationStringID::infoWritingReport:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Writing report to: ";
	case CommunicationStringID::infoWritingWorkbook:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Writing workbook to: ";
	case CommunicationStringID::infoBuildingSimulation:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Building simulation geometry for room: ";
	case CommunicationStringID::infoEvaluatingDaylight:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Evaluating daylight results";
	case CommunicationStringID::infoRoomInformation:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Room information:";
	case CommunicationStringID::infoTotalProcessCompleted:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Process completed in: ";

	case CommunicationStringID::indentValidIFCFound:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Valid IFC file found";
	case CommunicationStringID::indentcompIFCFound:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Compatible IFC file found";
	case CommunicationStringID::indentSuccesFinished:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Succesfully finished in: ";
	case CommunicationStringID::indentUnsuccesful:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Unable to finish";
	case CommunicationStringID::indentRoomCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Rooms: ";
	case CommunicationStringID::indentWindowCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Windows: ";
	case CommunicationStringID::indentUnmatchedWindowCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Unmatched windows: ";
	case CommunicationStringID::indentUnresolvedCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Unresolved orientations: ";
	case CommunicationStringID::indentNoWallCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Windows without wall: ";
	case CommunicationStringID::indentOutOfRangeCount:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Out of range placements: ";
	case CommunicationStringID::indentExcludedWindows:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Windows excluded from simulation: ";
	case CommunicationStringID::indentDaylightShare:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Area above daylight factor threshold: ";
	case CommunicationStringID::indentDaylightPassed:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Room meets the daylight requirement";
	case CommunicationStringID::indentDaylightFailed:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Room does not meet the daylight requirement";
	default:
		return "Output string not found";
	}
}

std::string errorWarningStringEnum::getString(ErrorID id, bool withImportance)
{
	switch (id) {
	case ErrorID::errorNoValFilePaths: {
		const std::string coms = "No valid filepaths have been supplied";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorUnableToProcessFile: {
		const std::string coms = "Unable to process the file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorNoUnits: {
		const std::string coms = "No units have been found in the file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorMultipleUnits: {
		const std::string coms = "Multiple unit assignments have been found in the file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorNoLengthUnit: {
		const std::string coms = "SI unit for length cannot be found";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }

	case ErrorID::errorJsonInvalBool: {
		const std::string coms = "JSON file does not contain a valid bool for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalInt: {
		const std::string coms = "JSON file does not contain a valid int for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalNegInt: {
		const std::string coms = "JSON file contains an invalid negative value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalZeroInt: {
		const std::string coms = "JSON file contains an invalid zero value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalNum: {
		const std::string coms = "JSON file does not contain a valid numeric value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalRange: {
		const std::string coms = "JSON file contains a value outside of the allowed range for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalString: {
		const std::string coms = "JSON file does not contain a valid string for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalPath: {
		const std::string coms = "JSON file contains a path to a file with incorrect type for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonNoRealPath: {
		const std::string coms = "JSON file contains an invalid path for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalArray: {
		const std::string coms = "JSON file does not contain a valid array for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalEntry: {
		const std::string coms = "JSON file does not contain a valid value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonMissingEntry: {
		const std::string coms = "JSON file does not contain required entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonUnreadable: {
		const std::string coms = "JSON file could not be read";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }

	case ErrorID::errorMalformedReportRow: {
		const std::string coms = "Report row contains a cell without 2 or 3 fields";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorUnableToWriteFile: {
		const std::string coms = "Unable to write file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }

	case ErrorID::warningIfcUnableToParse: {
		const std::string coms = "Unable to parse .ifc file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms + ": "; }
		return coms; }
	case ErrorID::warningIfcNoSchema: {
		const std::string coms = "No scheme found in file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms + ": "; }
		return coms; }
	case ErrorID::warningIfcIncomp: {
		const std::string coms = "Incompatible scheme found";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms + ": "; }
		return coms; }
	case ErrorID::warningIfcNoRoomObjects: {
		const std::string coms = "No room objects present in model";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningIfcNoObjectName: {
		const std::string coms = "Object name could not be found in file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningIfcNoRepresentation: {
		const std::string coms = "Object has no usable body representation";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningFailedObjectConversion: {
		const std::string coms = "Unable to convert object shape";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningIssueencountered: {
		const std::string coms = "Encountered an issue";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }

	case ErrorID::warningDegenerateProfile: {
		const std::string coms = "Room profile has fewer than two distinct vertices, dimensions are set to zero";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningUnsupportedProfile: {
		const std::string coms = "Room profile type is not supported, room is ignored";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningNoRoomHeight: {
		const std::string coms = "Room height could not be found, extrusion depth is used";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningDuplicateRoomCode: {
		const std::string coms = "Room code occurs more than once, first room is kept";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningMissingOpeningDimensions: {
		const std::string coms = "Window dimensions could not be found";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningNoSupportingWall: {
		const std::string coms = "No supporting wall found for window";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningOrientationUnresolved: {
		const std::string coms = "Wall orientation could not be resolved";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningLocationOutOfRange: {
		const std::string coms = "Corrected window location falls outside of the wall";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningUnmatchedWindow: {
		const std::string coms = "Window refers to a room that does not exist";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningWindowNotPlaced: {
		const std::string coms = "Window could not be placed in the simulation geometry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }

	case ErrorID::warningRoomCodeNotFound: {
		const std::string coms = "Requested room code could not be found";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms + ": "; }
		return coms; }
	case ErrorID::warningNoIlluminanceResults: {
		const std::string coms = "Illuminance results could not be read";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms + ": "; }
		return coms; }
	case ErrorID::warningInvalidIlluminanceValue: {
		const std::string coms = "Illuminance results contain a line without a valid value";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }

	case ErrorID::propertyNotImplemented: {
		const std::string coms = "Property not implemented";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }

	default:
		return "Output string not found";
	}
}

std::string fileExtensionEnum::getString(fileExtensionID id)
{
	switch (id) {
	case fileExtensionID::JSON:
		return ".json";
	case fileExtensionID::STEP:
		return ".step";
	case fileExtensionID::IFC:
		return ".ifc";
	case fileExtensionID::report:
		return "_report.json";
	case fileExtensionID::workbook:
		return "_workbook.json";
	case fileExtensionID::simulation:
		return "_simulation.json";
	default:
		return "";
	}
}

std::string JsonObjectInEnum::getString(JsonObjectInID id)
{
	switch (id) {
	case JsonObjectInID::filePaths:
		return "Filepaths";
	case JsonObjectInID::filePathsInput:
		return "Input";
	case JsonObjectInID::filePathOutput:
		return "Output";
	case JsonObjectInID::filePathReport:
		return "Report";
	case JsonObjectInID::filePathWorkbook:
		return "Workbook";
	case JsonObjectInID::filePathSimulation:
		return "Simulation";

	case JsonObjectInID::outputReport:
		return "Output report";

	case JsonObjectInID::extraction:
		return "Extraction";
	case JsonObjectInID::extractionExcludedRooms:
		return "Excluded rooms";
	case JsonObjectInID::extractionDefaultSill:
		return "Default sill height";
	case JsonObjectInID::extractionSearchBuffer:
		return "Search buffer";
	case JsonObjectInID::extractionWallTypes:
		return "Wall types";
	case JsonObjectInID::extractionDeclaredFrame:
		return "Use declared frame";

	case JsonObjectInID::tolerances:
		return "Tolerances";
	case JsonObjectInID::tolerancesAngular:
		return "Angular";
	case JsonObjectInID::tolerancesWallPlane:
		return "Wall plane";

	case JsonObjectInID::analysis:
		return "Analysis";
	case JsonObjectInID::analysisRoomCode:
		return "Room code";
	case JsonObjectInID::analysisTransmittance:
		return "Light transmittance";
	case JsonObjectInID::analysisGridSize:
		return "Grid size";
	case JsonObjectInID::analysisPlaneHeight:
		return "Analysis plane height";
	case JsonObjectInID::analysisSkyIlluminance:
		return "Sky illuminance";
	case JsonObjectInID::analysisDaylightThreshold:
		return "Daylight factor threshold";
	case JsonObjectInID::analysisRequiredPercentage:
		return "Required area percentage";
	case JsonObjectInID::analysisIlluminanceResults:
		return "Illuminance results";
	case JsonObjectInID::analysisWriteSTEP:
		return "Write STEP";
	default:
		return "";
	}
}

std::string OutputObjectEnum::getString(OutputObjectID id)
{
	switch (id) {
	case OutputObjectID::rooms:
		return "Rooms";
	case OutputObjectID::windows:
		return "Windows";
	case OutputObjectID::code:
		return "Code";
	case OutputObjectID::name:
		return "Name";
	case OutputObjectID::tag:
		return "Tag";
	case OutputObjectID::width:
		return "Width";
	case OutputObjectID::depth:
		return "Depth";
	case OutputObjectID::height:
		return "Height";
	case OutputObjectID::sillHeight:
		return "Sill height";
	case OutputObjectID::boundingBox:
		return "Bounding box";
	case OutputObjectID::wallOrientation:
		return "Wall orientation";
	case OutputObjectID::wallLength:
		return "Wall length";
	case OutputObjectID::locationX:
		return "Location x";
	case OutputObjectID::locationY:
		return "Location y";
	case OutputObjectID::coordinateFrame:
		return "Coordinate frame";
	case OutputObjectID::hasWall:
		return "Wall found";
	case OutputObjectID::inRange:
		return "In range";

	case OutputObjectID::origin:
		return "Origin";
	case OutputObjectID::surfaces:
		return "Surfaces";
	case OutputObjectID::walls:
		return "Walls";
	case OutputObjectID::glazing:
		return "Glazing";
	case OutputObjectID::vertices:
		return "Vertices";
	case OutputObjectID::transmittance:
		return "Transmittance";
	case OutputObjectID::area:
		return "Area";
	case OutputObjectID::testPoints:
		return "Test points";
	case OutputObjectID::gridSize:
		return "Grid size";
	case OutputObjectID::excludedWindows:
		return "Excluded windows";

	case OutputObjectID::inputSettings:
		return "Input settings";
	case OutputObjectID::duration:
		return "Duration";
	case OutputObjectID::counts:
		return "Counts";
	case OutputObjectID::errors:
		return "Errors";
	case OutputObjectID::daylight:
		return "Daylight";
	case OutputObjectID::daylightShare:
		return "Share above threshold";
	case OutputObjectID::daylightPassed:
		return "Passed";
	case OutputObjectID::daylightFactors:
		return "Daylight factors";

	case OutputObjectID::sheetColumns:
		return "Columns";
	case OutputObjectID::sheetRows:
		return "Rows";
	case OutputObjectID::cellValue:
		return "Value";
	case OutputObjectID::cellFormat:
		return "Format";
	default:
		return "";
	}
}

std::string OrientationStringEnum::getString(Orientation id)
{
	switch (id) {
	case Orientation::Front:
		return "front";
	case Orientation::Back:
		return "back";
	case Orientation::Left:
		return "left";
	case Orientation::Right:
		return "right";
	default:
		return "unresolved";
	}
}

std::string OrientationStringEnum::getString(CoordinateFrame id)
{
	switch (id) {
	case CoordinateFrame::AsGiven:
		return "as given";
	case CoordinateFrame::MirroredAlongWallAxis:
		return "mirrored along wall axis";
	default:
		return "";
	}
}

std::string ReportStringEnum::getString(ReportStringID id)
{
	switch (id) {
	case ReportStringID::sheetAssumptions:
		return "Assumptions";
	case ReportStringID::sheetSpaces:
		return "Spaces";
	case ReportStringID::sheetWindows:
		return "Windows";
	case ReportStringID::sheetDoors:
		return "External Doors";
	case ReportStringID::sheetWalls:
		return "Walls";

	case ReportStringID::colSpaceName:
		return "Space Name";
	case ReportStringID::colSpaceCode:
		return "Space Code";
	case ReportStringID::colXDimension:
		return "X Dimension";
	case ReportStringID::colYDimension:
		return "Y Dimension";
	case ReportStringID::colHeight:
		return "Height";
	case ReportStringID::colWidth:
		return "Width";
	case ReportStringID::colBoundingBox:
		return "Dimension source";
	case ReportStringID::colWindowName:
		return "Window Name";
	case ReportStringID::colWindowTag:
		return "Window Tag";
	case ReportStringID::colSillHeight:
		return "Sill Height";
	case ReportStringID::colOrientation:
		return "Wall Orientation";
	case ReportStringID::colWallLength:
		return "Wall Length";
	case ReportStringID::colLocationX:
		return "Location X";
	case ReportStringID::colLocationY:
		return "Location Y";
	case ReportStringID::colInRange:
		return "In Range";
	case ReportStringID::colDoorName:
		return "External Door Name";
	case ReportStringID::colDoorTag:
		return "Door Tag";
	case ReportStringID::colType:
		return "Type";
	case ReportStringID::colWallName:
		return "Wall Name";
	case ReportStringID::colWallTag:
		return "Wall Tag";
	case ReportStringID::colIsExternal:
		return "Is external?";
	case ReportStringID::colLayerCount:
		return "# layers";
	case ReportStringID::colMaterial:
		return "Material ";
	case ReportStringID::colThickness:
		return "Thickness";

	case ReportStringID::doorGlazed:
		return "External Glass Door";
	case ReportStringID::doorNotGlazed:
		return "External No-glass Door";
	case ReportStringID::basedOnBoundingBox:
		return "Based on bounding box";
	case ReportStringID::formatHighlight:
		return "highlight";
	case ReportStringID::formatHeading:
		return "heading";

	case ReportStringID::assumptionTitle:
		return "Assumptions";
	case ReportStringID::assumptionConductivity:
		return "Thermal transmittance (W/m2K)";
	case ReportStringID::assumptionWindows:
		return "Windows";
	case ReportStringID::assumptionGlassDoors:
		return "Glass Doors";
	case ReportStringID::assumptionNonGlassDoors:
		return "Non-glass External Doors";
	case ReportStringID::assumptionExternalWalls:
		return "External Walls";
	case ReportStringID::assumptionProfileNote:
		return "Spaces with non-rectangular floor profile will be analyzed based on their bounding box";
	case ReportStringID::assumptionSillNote:
		return "Windows without sill height are placed at the default sill height of ";
	default:
		return "";
	}
}

std::string IfcPropertyEnum::getString(IfcPropertyID id)
{
	switch (id) {
	case IfcPropertyID::psetDimensions:
		return "PSet_Revit_Dimensions";
	case IfcPropertyID::psetTypeDimensions:
		return "PSet_Revit_Type_Dimensions";
	case IfcPropertyID::psetConstraints:
		return "PSet_Revit_Constraints";
	case IfcPropertyID::psetWallCommon:
		return "Pset_WallCommon";
	case IfcPropertyID::psetDoorCommon:
		return "Pset_DoorCommon";
	case IfcPropertyID::unboundedHeight:
		return "Unbounded Height";
	case IfcPropertyID::length:
		return "Length";
	case IfcPropertyID::height:
		return "Height";
	case IfcPropertyID::width:
		return "Width";
	case IfcPropertyID::sillHeight:
		return "Sill Height";
	case IfcPropertyID::isExternal:
		return "IsExternal";
	case IfcPropertyID::glassKeyword:
		return "GLASS";
	case IfcPropertyID::roofKeyword:
		return "ROOF";
	case IfcPropertyID::body:
		return "Body";
	default:
		return "";
	}
}
