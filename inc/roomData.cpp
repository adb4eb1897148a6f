#include "roomData.h"
#include "stringManager.h"

#include <nlohmann/json.hpp>

Window::Window(const WindowRecord& record, double defaultSillHeight)
{
	tag_ = record.tag_;
	name_ = record.name_;
	width_ = record.width_;
	height_ = record.height_;
	sillHeight_ = record.sillHeight_.value_or(defaultSillHeight);
	hasWall_ = record.hasWall_;
	wallOrientation_ = record.wallOrientation_;
	wallLength_ = record.wallLength_;
	locationX_ = record.locationX_;
	locationY_ = record.locationY_;
	frame_ = record.frame_;
	inRange_ = record.inRange_;
}

bool Window::isPlaceable() const
{
	if (!hasWall_) { return false; }
	if (wallOrientation_ == Orientation::Unknown) { return false; }
	return inRange_;
}

nlohmann::json Window::toJson() const
{
	nlohmann::json windowJson;
	windowJson[OutputObjectEnum::getString(OutputObjectID::tag)] = tag_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::name)] = name_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::width)] = width_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::height)] = height_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::sillHeight)] = sillHeight_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::wallOrientation)] = OrientationStringEnum::getString(wallOrientation_);
	windowJson[OutputObjectEnum::getString(OutputObjectID::wallLength)] = wallLength_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::locationX)] = locationX_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::locationY)] = locationY_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::coordinateFrame)] = OrientationStringEnum::getString(frame_);
	windowJson[OutputObjectEnum::getString(OutputObjectID::hasWall)] = hasWall_;
	windowJson[OutputObjectEnum::getString(OutputObjectID::inRange)] = inRange_;
	return windowJson;
}

Room::Room(const RoomRecord& record)
{
	code_ = record.code_;
	displayName_ = record.displayName_;
	width_ = record.width_;
	depth_ = record.depth_;
	height_ = record.height_;
	isBoundingBox_ = record.isBoundingBox_;
}

nlohmann::json Room::toJson() const
{
	nlohmann::json roomJson;
	roomJson[OutputObjectEnum::getString(OutputObjectID::code)] = code_;
	roomJson[OutputObjectEnum::getString(OutputObjectID::name)] = displayName_;
	roomJson[OutputObjectEnum::getString(OutputObjectID::width)] = width_;
	roomJson[OutputObjectEnum::getString(OutputObjectID::depth)] = depth_;
	roomJson[OutputObjectEnum::getString(OutputObjectID::height)] = height_;
	roomJson[OutputObjectEnum::getString(OutputObjectID::boundingBox)] = isBoundingBox_;

	nlohmann::json windowListJson = nlohmann::json::array();
	for (const Window& window : windowList_) { windowListJson.emplace_back(window.toJson()); }
	roomJson[OutputObjectEnum::getString(OutputObjectID::windows)] = windowListJson;
	return roomJson;
}
