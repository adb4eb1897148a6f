#include "simulationModel.h"
#include "errorCollection.h"
#include "helper.h"
#include "stringManager.h"

#include <array>
#include <cmath>
#include <fstream>

SimulationSurface::SimulationSurface(const std::string& name, const std::vector<gp_Pnt>& vertexList, double transmittance)
{
	name_ = name;
	vertexList_ = vertexList;
	transmittance_ = transmittance;
	face_ = helperFunctions::createPlanarFace(vertexList[0], vertexList[1], vertexList[2], vertexList[3]);
	area_ = helperFunctions::computeArea(face_);
}

nlohmann::json SimulationSurface::toJson() const
{
	nlohmann::json vertexListJson = nlohmann::json::array();
	for (const gp_Pnt& vertex : vertexList_)
	{
		vertexListJson.emplace_back(nlohmann::json::array({
			helperFunctions::roundTo(vertex.X(), 3),
			helperFunctions::roundTo(vertex.Y(), 3),
			helperFunctions::roundTo(vertex.Z(), 3)
			}));
	}

	nlohmann::json surfaceJson;
	surfaceJson[OutputObjectEnum::getString(OutputObjectID::name)] = name_;
	surfaceJson[OutputObjectEnum::getString(OutputObjectID::vertices)] = vertexListJson;
	surfaceJson[OutputObjectEnum::getString(OutputObjectID::area)] = helperFunctions::roundTo(area_, 3);
	if (transmittance_ > 0) { surfaceJson[OutputObjectEnum::getString(OutputObjectID::transmittance)] = transmittance_; }
	return surfaceJson;
}

SimulationModel::SimulationModel(const Room& room, double transmittance, double gridSize, double planeHeight)
{
	roomCode_ = room.getCode();
	width_ = room.getWidth();
	depth_ = room.getDepth();
	height_ = room.getHeight();
	gridSize_ = gridSize;

	createWalls();
	createGlazing(room, transmittance);
	createTestPoints(planeHeight);
}

std::pair<gp_Pnt, gp_Vec> SimulationModel::getWallFrame(Orientation orientation, double width, double depth)
{
	switch (orientation) {
	case Orientation::Right:
		return { gp_Pnt(width, 0, 0), gp_Vec(0, 1, 0) };
	case Orientation::Back:
		return { gp_Pnt(width, depth, 0), gp_Vec(-1, 0, 0) };
	case Orientation::Left:
		return { gp_Pnt(0, depth, 0), gp_Vec(0, -1, 0) };
	default:
		return { gp_Pnt(0, 0, 0), gp_Vec(1, 0, 0) };
	}
}

double SimulationModel::getWallLength(Orientation orientation, double width, double depth)
{
	if (orientation == Orientation::Right || orientation == Orientation::Left) { return depth; }
	return width;
}

gp_Pnt SimulationModel::toRoomCoordinates(Orientation orientation, double width, double depth, double x, double y)
{
	std::pair<gp_Pnt, gp_Vec> wallFrame = getWallFrame(orientation, width, depth);
	return wallFrame.first.Translated(wallFrame.second * x + gp_Vec(0, 0, y));
}

void SimulationModel::createWalls()
{
	// a flat room has no walls to simulate
	if (width_ <= 0 || depth_ <= 0 || height_ <= 0) { return; }

	static const std::array<Orientation, 4> wallOrientationList = { Orientation::Front, Orientation::Right, Orientation::Back, Orientation::Left };
	for (Orientation orientation : wallOrientationList)
	{
		double wallLength = getWallLength(orientation, width_, depth_);
		std::vector<gp_Pnt> vertexList = {
			toRoomCoordinates(orientation, width_, depth_, 0, 0),
			toRoomCoordinates(orientation, width_, depth_, wallLength, 0),
			toRoomCoordinates(orientation, width_, depth_, wallLength, height_),
			toRoomCoordinates(orientation, width_, depth_, 0, height_)
		};
		wallList_.emplace_back(SimulationSurface(OrientationStringEnum::getString(orientation), vertexList));
	}
}

void SimulationModel::createGlazing(const Room& room, double transmittance)
{
	for (const Window& window : room.getWindows())
	{
		if (!window.isPlaceable() || window.getWidth() <= 0 || window.getHeight() <= 0)
		{
			excludedWindowList_.emplace_back(window.getTag());
			ErrorCollection::getInstance().addError(ErrorID::warningWindowNotPlaced, window.getTag());
			continue;
		}

		Orientation orientation = window.getWallOrientation();
		double x = window.getLocationX();
		double y = window.getLocationY();
		double w = window.getWidth();
		double h = window.getHeight();

		std::vector<gp_Pnt> vertexList = {
			toRoomCoordinates(orientation, width_, depth_, x, y),
			toRoomCoordinates(orientation, width_, depth_, x + w, y),
			toRoomCoordinates(orientation, width_, depth_, x + w, y + h),
			toRoomCoordinates(orientation, width_, depth_, x, y + h)
		};
		glazingList_.emplace_back(SimulationSurface(window.getTag(), vertexList, transmittance));
	}
}

void SimulationModel::createTestPoints(double planeHeight)
{
	if (gridSize_ <= 0) { return; }

	int columnCount = getGridColumnCount();
	int rowCount = static_cast<int>(std::floor(depth_ / gridSize_));
	for (int j = 0; j < rowCount; j++)
	{
		for (int i = 0; i < columnCount; i++)
		{
			testPointList_.emplace_back(gp_Pnt((i + 0.5) * gridSize_, (j + 0.5) * gridSize_, planeHeight));
		}
	}
}

int SimulationModel::getGridColumnCount() const
{
	if (gridSize_ <= 0) { return 0; }
	return static_cast<int>(std::floor(width_ / gridSize_));
}

std::vector<TopoDS_Face> SimulationModel::getFaces() const
{
	std::vector<TopoDS_Face> faceList;
	for (const SimulationSurface& surface : wallList_) { faceList.emplace_back(surface.getFace()); }
	for (const SimulationSurface& surface : glazingList_) { faceList.emplace_back(surface.getFace()); }
	return faceList;
}

nlohmann::json SimulationModel::toJson() const
{
	nlohmann::json wallListJson = nlohmann::json::array();
	for (const SimulationSurface& surface : wallList_) { wallListJson.emplace_back(surface.toJson()); }

	nlohmann::json glazingListJson = nlohmann::json::array();
	for (const SimulationSurface& surface : glazingList_) { glazingListJson.emplace_back(surface.toJson()); }

	nlohmann::json testPointListJson = nlohmann::json::array();
	for (const gp_Pnt& testPoint : testPointList_)
	{
		testPointListJson.emplace_back(nlohmann::json::array({
			helperFunctions::roundTo(testPoint.X(), 3),
			helperFunctions::roundTo(testPoint.Y(), 3),
			helperFunctions::roundTo(testPoint.Z(), 3)
			}));
	}

	nlohmann::json surfaceJson;
	surfaceJson[OutputObjectEnum::getString(OutputObjectID::walls)] = wallListJson;
	surfaceJson[OutputObjectEnum::getString(OutputObjectID::glazing)] = glazingListJson;

	nlohmann::json modelJson;
	modelJson[OutputObjectEnum::getString(OutputObjectID::code)] = roomCode_;
	modelJson[OutputObjectEnum::getString(OutputObjectID::origin)] = nlohmann::json::array({ 0, 0, 0 });
	modelJson[OutputObjectEnum::getString(OutputObjectID::width)] = width_;
	modelJson[OutputObjectEnum::getString(OutputObjectID::depth)] = depth_;
	modelJson[OutputObjectEnum::getString(OutputObjectID::height)] = height_;
	modelJson[OutputObjectEnum::getString(OutputObjectID::surfaces)] = surfaceJson;
	modelJson[OutputObjectEnum::getString(OutputObjectID::gridSize)] = gridSize_;
	modelJson[OutputObjectEnum::getString(OutputObjectID::testPoints)] = testPointListJson;
	modelJson[OutputObjectEnum::getString(OutputObjectID::excludedWindows)] = excludedWindowList_;
	return modelJson;
}

void SimulationModel::write(const std::string& path) const
{
	std::ofstream simulationFile(path);
	if (!simulationFile.is_open()) { throw ErrorID::errorUnableToWriteFile; }
	simulationFile << toJson().dump(4);
	simulationFile.close();
}
