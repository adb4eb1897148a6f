#include <map>
#include <nlohmann/json.hpp>
#include <mutex>

#ifndef ERRORCOLLECTION_ERRORCOLLECTION_H
#define ERRORCOLLECTION_ERRORCOLLECTION_H
enum class ErrorID {
	errorNoValFilePaths,
	errorUnableToProcessFile,
	errorNoUnits,
	errorMultipleUnits,
	errorNoLengthUnit,

	errorJsonInvalBool,
	errorJsonInvalInt,
	errorJsonInvalNegInt,
	errorJsonInvalZeroInt,
	errorJsonInvalNum,
	errorJsonInvalRange,
	errorJsonInvalString,
	errorJsonInvalPath,
	errorJsonNoRealPath,
	errorJsonInvalArray,
	errorJsonInvalEntry,
	errorJsonMissingEntry,
	errorJsonUnreadable,

	errorMalformedReportRow,
	errorUnableToWriteFile,

	warningIfcUnableToParse,
	warningIfcNoSchema,
	warningIfcIncomp,
	warningIfcNoRoomObjects,
	warningIfcNoObjectName,
	warningIfcNoRepresentation,
	warningFailedObjectConversion,

	warningIssueencountered,

	warningDegenerateProfile,
	warningUnsupportedProfile,
	warningNoRoomHeight,
	warningDuplicateRoomCode,
	warningMissingOpeningDimensions,
	warningNoSupportingWall,
	warningOrientationUnresolved,
	warningLocationOutOfRange,
	warningUnmatchedWindow,
	warningWindowNotPlaced,

	warningRoomCodeNotFound,
	warningNoIlluminanceResults,
	warningInvalidIlluminanceValue,

	propertyNotImplemented
};

struct ErrorObject {
	std::string errorCode_;
	std::string errorDescript_;
	std::vector<std::string> occuringObjectList_;

	ErrorObject() {};

	ErrorObject(
		const std::string& errorCode,
		const std::string& errorDescript
	);

	ErrorObject(
		const std::string& errorCode,
		const std::string& errorDescript,
		const std::string& occuringObb
	);

	nlohmann::json toJson() const;

	void addOccuringObject(const std::string& obb);
};

struct ErrorCollection {
private:
	//Errors and issues present in this process
	std::map<ErrorID, ErrorObject> errorCollection_;
	// collection of all the possible errors and issues
	std::map<ErrorID, ErrorObject> errorMap_;

	//Prevents datarace when writing to the instance
	std::mutex dataMutex_;

	explicit ErrorCollection();

	void addErrorUnlocked(ErrorID id, const std::string& objectName);

public:
	static ErrorCollection& getInstance() {
		static ErrorCollection instance;
		return instance;
	}

	// disable asignement and copying
	ErrorCollection(const ErrorCollection&) = delete;
	ErrorCollection& operator=(const ErrorCollection&) = delete;

	void addError(ErrorID id, const std::string& objectName = "");
	void addError(ErrorID id, const std::vector<std::string>& objectNameList);
	void removeError(ErrorID id);
	void clear();

	bool hasError() const { return !errorCollection_.empty(); }
	bool hasError(ErrorID id) const { return errorCollection_.find(id) != errorCollection_.end(); }
	/// returns the objects that were stored with the error, empty if the error did not occur
	std::vector<std::string> getOccuringObjects(ErrorID id) const;
	const std::map<ErrorID, ErrorObject>& getErrorCollection() const { return errorCollection_; }

	nlohmann::json toJson() const;
};
#endif // ERRORCOLLECTION_ERRORCOLLECTION_H
