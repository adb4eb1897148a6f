#include "roomData.h"

#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <TopoDS_Face.hxx>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#ifndef SIMULATIONMODEL_SIMULATIONMODEL_H
#define SIMULATIONMODEL_SIMULATIONMODEL_H

// planar quad of the simulation geometry in room coordinates
class SimulationSurface {
private:
	std::string name_;
	std::vector<gp_Pnt> vertexList_;
	TopoDS_Face face_;
	double area_ = 0;
	// visible light transmittance, 0 for opaque surfaces
	double transmittance_ = 0;

public:
	SimulationSurface(const std::string& name, const std::vector<gp_Pnt>& vertexList, double transmittance = 0);

	const std::string& getName() const { return name_; }
	const std::vector<gp_Pnt>& getVertices() const { return vertexList_; }
	const TopoDS_Face& getFace() const { return face_; }
	double getArea() const { return area_; }
	double getTransmittance() const { return transmittance_; }

	nlohmann::json toJson() const;
};

/// <summary>
/// Shoebox geometry of a single room with its glazing and analysis grid
/// origin at (0,0,0), width along x, depth along y and height along z
/// </summary>
class SimulationModel {
private:
	std::string roomCode_;
	double width_ = 0;
	double depth_ = 0;
	double height_ = 0;
	double gridSize_ = 0;

	std::vector<SimulationSurface> wallList_;
	std::vector<SimulationSurface> glazingList_;
	std::vector<gp_Pnt> testPointList_;
	// tags of the windows that could not be placed
	std::vector<std::string> excludedWindowList_;

	void createWalls();
	void createGlazing(const Room& room, double transmittance);
	void createTestPoints(double planeHeight);

public:
	SimulationModel(const Room& room, double transmittance, double gridSize, double planeHeight);

	/// returns the start point and horizontal direction of the wall, front (y = 0) is walked along +x
	static std::pair<gp_Pnt, gp_Vec> getWallFrame(Orientation orientation, double width, double depth);
	/// returns the length of the wall with the orientation
	static double getWallLength(Orientation orientation, double width, double depth);
	/// transforms a wall local point (along the wall, height) to room coordinates
	static gp_Pnt toRoomCoordinates(Orientation orientation, double width, double depth, double x, double y);

	const std::string& getRoomCode() const { return roomCode_; }
	const std::vector<SimulationSurface>& getWalls() const { return wallList_; }
	const std::vector<SimulationSurface>& getGlazing() const { return glazingList_; }
	const std::vector<gp_Pnt>& getTestPoints() const { return testPointList_; }
	const std::vector<std::string>& getExcludedWindows() const { return excludedWindowList_; }
	/// amount of test points in a grid row
	int getGridColumnCount() const;

	/// all the faces of the model
	std::vector<TopoDS_Face> getFaces() const;

	nlohmann::json toJson() const;
	/// writes the model as json, throws ErrorID::errorUnableToWriteFile if the file can not be written
	void write(const std::string& path) const;
};

#endif // SIMULATIONMODEL_SIMULATIONMODEL_H
