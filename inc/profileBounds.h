#include "helper.h"

#include <gp_Pnt.hxx>

#include <string>
#include <vector>

#ifndef PROFILEBOUNDS_PROFILEBOUNDS_H
#define PROFILEBOUNDS_PROFILEBOUNDS_H

// plan view dimensions of a room profile
struct ProfileBounds {
	double width_ = 0;
	double depth_ = 0;
	// the dimensions are the bounding box of an arbitrary profile
	bool isBoundingBox_ = false;
	// the profile had less than two distinct vertices
	bool isDegenerate_ = false;
};

class ProfileBoundsResolver {
private:
	std::vector<std::string> excludedRoomList_;

public:
	explicit ProfileBoundsResolver(const std::vector<std::string>& excludedRoomList);

	/// returns the dimensions of a rectangle profile rounded to 3 decimals
	ProfileBounds resolveRectangle(double xDim, double yDim) const;
	/// returns the plan bounding box dimensions of a polygon, the z values are ignored
	ProfileBounds resolvePolygon(const std::vector<gp_Pnt>& pointList) const;

	/// true if the room name matches one of the excluded categories
	bool isExcluded(const std::string& roomName) const;
};

#endif // PROFILEBOUNDS_PROFILEBOUNDS_H
