#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#ifndef ROOMDATA_ROOMDATA_H
#define ROOMDATA_ROOMDATA_H

// canonical wall labels, front is assumed to face north
enum class Orientation {
	Front,
	Back,
	Left,
	Right,
	Unknown
};

// frame in which the raw opening placement was measured
enum class CoordinateFrame {
	AsGiven,
	MirroredAlongWallAxis
};

// flat room record as extracted from a single space
struct RoomRecord {
	std::string code_;
	std::string displayName_;
	double width_ = 0;
	double depth_ = 0;
	double height_ = 0;
	// dimensions were taken from the bounding box of an arbitrary profile
	bool isBoundingBox_ = false;
};

// flat window record, refers to its room by code
struct WindowRecord {
	std::string roomCode_;
	std::string guid_;
	std::string tag_;
	std::string name_;
	double width_ = 0;
	double height_ = 0;
	std::optional<double> sillHeight_;

	bool hasWall_ = false;
	Orientation wallOrientation_ = Orientation::Unknown;
	double wallLength_ = 0;

	double locationX_ = 0;
	double locationY_ = 0;
	CoordinateFrame frame_ = CoordinateFrame::AsGiven;
	bool inRange_ = true;
};

struct DoorRecord {
	std::string roomCode_;
	std::string roomName_;
	std::string guid_;
	std::string name_;
	std::string tag_;
	double width_ = 0;
	double height_ = 0;
	bool isGlazed_ = false;
};

struct MaterialLayer {
	std::string name_;
	double thickness_ = 0;
};

struct WallRecord {
	std::string roomCode_;
	std::string roomName_;
	std::string guid_;
	std::string name_;
	std::string tag_;
	std::optional<bool> isExternal_;
	std::vector<MaterialLayer> layerList_;
};

/// window as it is consumed by the report writer and the simulation
class Window {
private:
	std::string tag_;
	std::string name_;
	double width_ = 0;
	double height_ = 0;
	double sillHeight_ = 0;
	bool hasWall_ = false;
	Orientation wallOrientation_ = Orientation::Unknown;
	double wallLength_ = 0;
	double locationX_ = 0;
	double locationY_ = 0;
	CoordinateFrame frame_ = CoordinateFrame::AsGiven;
	bool inRange_ = true;

public:
	/// makes a window from a record, the sill height is substituted if the record lacks it
	Window(const WindowRecord& record, double defaultSillHeight);

	const std::string& getTag() const { return tag_; }
	const std::string& getName() const { return name_; }
	double getWidth() const { return width_; }
	double getHeight() const { return height_; }
	double getSillHeight() const { return sillHeight_; }
	bool hasWall() const { return hasWall_; }
	Orientation getWallOrientation() const { return wallOrientation_; }
	double getWallLength() const { return wallLength_; }
	double getLocationX() const { return locationX_; }
	double getLocationY() const { return locationY_; }
	CoordinateFrame getFrame() const { return frame_; }
	bool isInRange() const { return inRange_; }

	/// true if the window can be set into a simulation wall
	bool isPlaceable() const;

	nlohmann::json toJson() const;
};

/// room that owns its windows
class Room {
private:
	std::string code_;
	std::string displayName_;
	double width_ = 0;
	double depth_ = 0;
	double height_ = 0;
	bool isBoundingBox_ = false;
	std::vector<Window> windowList_;

public:
	explicit Room(const RoomRecord& record);

	const std::string& getCode() const { return code_; }
	const std::string& getDisplayName() const { return displayName_; }
	double getWidth() const { return width_; }
	double getDepth() const { return depth_; }
	double getHeight() const { return height_; }
	bool isBoundingBox() const { return isBoundingBox_; }
	const std::vector<Window>& getWindows() const { return windowList_; }

	void addWindow(const Window& window) { windowList_.emplace_back(window); }

	nlohmann::json toJson() const;
};

#endif // ROOMDATA_ROOMDATA_H
