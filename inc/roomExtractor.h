#include "DataManager.h"
#include "helper.h"
#include "openingLocator.h"
#include "placementCorrector.h"
#include "profileBounds.h"
#include "roomData.h"
#include "wallOrientation.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#ifndef ROOMEXTRACTOR_ROOMEXTRACTOR_H
#define ROOMEXTRACTOR_ROOMEXTRACTOR_H

// raw placement of an opening relative to its host
struct RawPlacement {
	double rawX_ = 0;
	double rawY_ = 0;
	// x axis of the host placement, absent if the placement has no reference direction
	std::optional<gp_Vec> hostAxis_;
};

/// <summary>
/// Produces the flat room, window, door and wall records from the IfcSpace objects
/// </summary>
class RoomExtractor {
private:
	DataManager* dataManager_;

	ProfileBoundsResolver resolver_;
	WallOrientationClassifier classifier_;
	OpeningLocator locator_;
	PlacementCorrector corrector_;

	std::vector<RoomRecord> roomList_;
	std::vector<WindowRecord> windowList_;
	std::vector<DoorRecord> doorList_;
	std::vector<WallRecord> wallList_;

	/// extracts a room and all the objects related to it
	void processSpace(IfcSchema::IfcSpace* space, int fileIdx);
	/// computes the room record from the first body item of the space, nullopt if the room can not be used
	std::optional<RoomRecord> extractRoom(IfcSchema::IfcSpace* space, int fileIdx);
	/// collects the windows and external doors that intersect the buffered space box
	void extractOpenings(IfcSchema::IfcSpace* space, const RoomRecord& room);
	/// collects the walls that bound the space
	void extractWalls(IfcSchema::IfcSpace* space, const RoomRecord& room, int fileIdx);

	WindowRecord extractWindow(IfcSchema::IfcWindow* window, const BoostBox3D& windowBox, const RoomRecord& room, int fileIdx);
	std::optional<DoorRecord> extractDoor(IfcSchema::IfcDoor* door, const RoomRecord& room, int fileIdx);

	/// reads the location of the host placement of the opening, axis 0 and 2 of the first point
	std::optional<RawPlacement> readRawPlacement(IfcSchema::IfcProduct* product, int fileIdx);

public:
	explicit RoomExtractor(DataManager* dataManager);

	/// extracts the records of every space in every file
	void extract();

	/// true if any pset of the door flags it as external, a missing flag is internal
	static bool isExternalDoor(const nlohmann::json& objectProperties);

	const std::vector<RoomRecord>& getRoomList() const { return roomList_; }
	const std::vector<WindowRecord>& getWindowList() const { return windowList_; }
	const std::vector<DoorRecord>& getDoorList() const { return doorList_; }
	const std::vector<WallRecord>& getWallList() const { return wallList_; }
};

#endif // ROOMEXTRACTOR_ROOMEXTRACTOR_H
