#include "profileBounds.h"
#include "helper.h"

#include <boost/algorithm/string.hpp>

#include <algorithm>

ProfileBoundsResolver::ProfileBoundsResolver(const std::vector<std::string>& excludedRoomList)
{
	excludedRoomList_ = excludedRoomList;
}

ProfileBounds ProfileBoundsResolver::resolveRectangle(double xDim, double yDim) const
{
	ProfileBounds bounds;
	bounds.width_ = helperFunctions::roundTo(xDim, 3);
	bounds.depth_ = helperFunctions::roundTo(yDim, 3);
	bounds.isDegenerate_ = bounds.width_ == 0 || bounds.depth_ == 0;
	return bounds;
}

ProfileBounds ProfileBoundsResolver::resolvePolygon(const std::vector<gp_Pnt>& pointList) const
{
	ProfileBounds bounds;
	bounds.isBoundingBox_ = true;

	if (pointList.size() <= 1)
	{
		bounds.isDegenerate_ = true;
		return bounds;
	}

	double minX = pointList[0].X();
	double maxX = pointList[0].X();
	double minY = pointList[0].Y();
	double maxY = pointList[0].Y();

	for (const gp_Pnt& point : pointList)
	{
		minX = std::min(minX, point.X());
		maxX = std::max(maxX, point.X());
		minY = std::min(minY, point.Y());
		maxY = std::max(maxY, point.Y());
	}

	bounds.width_ = helperFunctions::roundTo(maxX - minX, 3);
	bounds.depth_ = helperFunctions::roundTo(maxY - minY, 3);
	bounds.isDegenerate_ = bounds.width_ == 0 || bounds.depth_ == 0;
	return bounds;
}

bool ProfileBoundsResolver::isExcluded(const std::string& roomName) const
{
	for (const std::string& excludedName : excludedRoomList_)
	{
		if (boost::iequals(roomName, excludedName)) { return true; }
	}
	return false;
}
