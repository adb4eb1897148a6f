#include "errorCollection.h"
#include "stringManager.h"

#include <map>
#include <nlohmann/json.hpp>
#include <algorithm>

ErrorObject::ErrorObject(const std::string& errorCode, const std::string& errorDescript)
{
	errorCode_ = errorCode;
	errorDescript_ = errorDescript;
	occuringObjectList_ = {};
}

ErrorObject::ErrorObject(const std::string& errorCode, const std::string& errorDescript, const std::string& occuringObb)
{
	errorCode_ = errorCode;
	errorDescript_ = errorDescript;
	occuringObjectList_ = { occuringObb };
}

nlohmann::json ErrorObject::toJson() const
{
	nlohmann::json jsonObject;
	jsonObject["ErrorCode"] = errorCode_;
	jsonObject["Error Description"] = errorDescript_;

	if (occuringObjectList_.size()) { jsonObject["Occuring Objects"] = occuringObjectList_; }
	return jsonObject;
}

void ErrorObject::addOccuringObject(const std::string& obb) {
	if (std::find(occuringObjectList_.begin(), occuringObjectList_.end(), obb) != occuringObjectList_.end()) { return;}
	occuringObjectList_.emplace_back(obb);
	return;
}

ErrorCollection::ErrorCollection() {
	errorCollection_ = {};
	errorMap_ = {
		{ErrorID::errorNoValFilePaths, ErrorObject("J0001", errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths, false))},
		{ErrorID::errorUnableToProcessFile, ErrorObject("J0002", errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile, false))},

		{ErrorID::errorJsonInvalBool, ErrorObject("J0003", errorWarningStringEnum::getString(ErrorID::errorJsonInvalBool, false))},
		{ErrorID::errorJsonInvalInt, ErrorObject("J0004", errorWarningStringEnum::getString(ErrorID::errorJsonInvalInt, false))},
		{ErrorID::errorJsonInvalNegInt, ErrorObject("J0005", errorWarningStringEnum::getString(ErrorID::errorJsonInvalNegInt, false))},
		{ErrorID::errorJsonInvalZeroInt, ErrorObject("J0005", errorWarningStringEnum::getString(ErrorID::errorJsonInvalZeroInt, false))},
		{ErrorID::errorJsonInvalNum, ErrorObject("J0006", errorWarningStringEnum::getString(ErrorID::errorJsonInvalNum, false))},
		{ErrorID::errorJsonInvalRange, ErrorObject("J0007", errorWarningStringEnum::getString(ErrorID::errorJsonInvalRange, false))},
		{ErrorID::errorJsonInvalString, ErrorObject("J0008", errorWarningStringEnum::getString(ErrorID::errorJsonInvalString, false))},
		{ErrorID::errorJsonInvalPath, ErrorObject("J0009", errorWarningStringEnum::getString(ErrorID::errorJsonInvalPath, false))},
		{ErrorID::errorJsonNoRealPath, ErrorObject("J0010", errorWarningStringEnum::getString(ErrorID::errorJsonNoRealPath, false))},
		{ErrorID::errorJsonInvalArray, ErrorObject("J0011", errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray, false))},
		{ErrorID::errorJsonInvalEntry, ErrorObject("J0012", errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry, false))},
		{ErrorID::errorJsonMissingEntry, ErrorObject("J0013", errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry, false))},
		{ErrorID::errorJsonUnreadable, ErrorObject("J0014", errorWarningStringEnum::getString(ErrorID::errorJsonUnreadable, false))},

		{ErrorID::errorNoUnits, ErrorObject("I0001", errorWarningStringEnum::getString(ErrorID::errorNoUnits, false))},
		{ErrorID::errorMultipleUnits, ErrorObject("I0002", errorWarningStringEnum::getString(ErrorID::errorMultipleUnits, false))},
		{ErrorID::errorNoLengthUnit, ErrorObject("I0003", errorWarningStringEnum::getString(ErrorID::errorNoLengthUnit, false))},
		{ErrorID::warningIfcUnableToParse, ErrorObject("I0004", errorWarningStringEnum::getString(ErrorID::warningIfcUnableToParse, false))},
		{ErrorID::warningIfcNoSchema, ErrorObject("I0005", errorWarningStringEnum::getString(ErrorID::warningIfcNoSchema, false))},
		{ErrorID::warningIfcIncomp, ErrorObject("I0006", errorWarningStringEnum::getString(ErrorID::warningIfcIncomp, false))},
		{ErrorID::warningIfcNoRoomObjects, ErrorObject("I0007", errorWarningStringEnum::getString(ErrorID::warningIfcNoRoomObjects, false))},
		{ErrorID::warningIfcNoObjectName, ErrorObject("I0008", errorWarningStringEnum::getString(ErrorID::warningIfcNoObjectName, false))},
		{ErrorID::warningIfcNoRepresentation, ErrorObject("I0009", errorWarningStringEnum::getString(ErrorID::warningIfcNoRepresentation, false))},
		{ErrorID::warningFailedObjectConversion, ErrorObject("I0010", errorWarningStringEnum::getString(ErrorID::warningFailedObjectConversion, false))},
		{ErrorID::warningIssueencountered, ErrorObject("I0011", errorWarningStringEnum::getString(ErrorID::warningIssueencountered, false))},

		{ErrorID::warningDegenerateProfile, ErrorObject("R0001", errorWarningStringEnum::getString(ErrorID::warningDegenerateProfile, false))},
		{ErrorID::warningUnsupportedProfile, ErrorObject("R0002", errorWarningStringEnum::getString(ErrorID::warningUnsupportedProfile, false))},
		{ErrorID::warningNoRoomHeight, ErrorObject("R0003", errorWarningStringEnum::getString(ErrorID::warningNoRoomHeight, false))},
		{ErrorID::warningDuplicateRoomCode, ErrorObject("R0004", errorWarningStringEnum::getString(ErrorID::warningDuplicateRoomCode, false))},
		{ErrorID::warningMissingOpeningDimensions, ErrorObject("R0005", errorWarningStringEnum::getString(ErrorID::warningMissingOpeningDimensions, false))},
		{ErrorID::warningNoSupportingWall, ErrorObject("R0006", errorWarningStringEnum::getString(ErrorID::warningNoSupportingWall, false))},
		{ErrorID::warningOrientationUnresolved, ErrorObject("R0007", errorWarningStringEnum::getString(ErrorID::warningOrientationUnresolved, false))},
		{ErrorID::warningLocationOutOfRange, ErrorObject("R0008", errorWarningStringEnum::getString(ErrorID::warningLocationOutOfRange, false))},
		{ErrorID::warningUnmatchedWindow, ErrorObject("R0009", errorWarningStringEnum::getString(ErrorID::warningUnmatchedWindow, false))},
		{ErrorID::warningWindowNotPlaced, ErrorObject("R0010", errorWarningStringEnum::getString(ErrorID::warningWindowNotPlaced, false))},

		{ErrorID::warningRoomCodeNotFound, ErrorObject("S0001", errorWarningStringEnum::getString(ErrorID::warningRoomCodeNotFound, false))},
		{ErrorID::warningNoIlluminanceResults, ErrorObject("S0002", errorWarningStringEnum::getString(ErrorID::warningNoIlluminanceResults, false))},
		{ErrorID::warningInvalidIlluminanceValue, ErrorObject("S0003", errorWarningStringEnum::getString(ErrorID::warningInvalidIlluminanceValue, false))},

		{ErrorID::errorMalformedReportRow, ErrorObject("O0001", errorWarningStringEnum::getString(ErrorID::errorMalformedReportRow, false))},
		{ErrorID::errorUnableToWriteFile, ErrorObject("O0002", errorWarningStringEnum::getString(ErrorID::errorUnableToWriteFile, false))},

		{ErrorID::propertyNotImplemented, ErrorObject("P0000", "Property not implemented")}
	};
}

void ErrorCollection::addErrorUnlocked(ErrorID id, const std::string& objectName)
{
	//search if error is present ignore or add object
	auto errorSearch = errorCollection_.find(id);
	if (errorSearch != errorCollection_.end())
	{
		if (objectName != "") { errorSearch->second.addOccuringObject(objectName); }
		return;
	}

	// new error and add object
	ErrorObject errorObject = errorMap_[id];
	if (objectName != "") { errorObject.addOccuringObject(objectName); }
	errorCollection_[id] = errorObject;
	return;
}

void ErrorCollection::addError(ErrorID id, const std::string& objectName)
{
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	addErrorUnlocked(id, objectName);
	return;
}

void ErrorCollection::addError(ErrorID id, const std::vector<std::string>& objectNameList) {
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	if (!objectNameList.size())
	{
		addErrorUnlocked(id, "");
		return;
	}

	for (const std::string& objectName : objectNameList)
	{
		addErrorUnlocked(id, objectName);
	}
	return;
}

void ErrorCollection::removeError(ErrorID id)
{
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	errorCollection_.erase(id);
	return;
}

void ErrorCollection::clear()
{
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	errorCollection_.clear();
	return;
}

std::vector<std::string> ErrorCollection::getOccuringObjects(ErrorID id) const
{
	auto errorSearch = errorCollection_.find(id);
	if (errorSearch == errorCollection_.end()) { return {}; }
	return errorSearch->second.occuringObjectList_;
}

nlohmann::json ErrorCollection::toJson() const {

	nlohmann::json jsonList = nlohmann::json::array();
	for (const std::pair<const ErrorID, ErrorObject>& errorPair : errorCollection_)
	{
		jsonList.emplace_back(errorPair.second.toJson());
	}
	return jsonList;
}
