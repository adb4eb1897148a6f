#include "openingLocator.h"
#include "helper.h"

#include <boost/algorithm/string.hpp>

#include <gp.hxx>
#include <gp_Dir.hxx>

#include <algorithm>
#include <iterator>

ElementSpatialData::ElementSpatialData(
	const std::string& guid,
	const std::string& typeName,
	const std::string& name,
	const std::string& tag,
	const BoostBox3D& box,
	const std::optional<WallGeometry>& wallGeometry)
{
	guid_ = guid;
	typeName_ = typeName;
	name_ = name;
	tag_ = tag;
	box_ = box;
	wallGeometry_ = wallGeometry;
}

int ElementIndex::addElement(const std::shared_ptr<ElementSpatialData>& element)
{
	int locationIdx = static_cast<int>(productLookup_.size());
	index_.insert(std::make_pair(element->getBox(), locationIdx));
	productLookup_.emplace_back(element);
	return locationIdx;
}

std::vector<int> ElementIndex::query(const BoostBox3D& box) const
{
	std::vector<Value> qResult;
	index_.query(bgi::intersects(box), std::back_inserter(qResult));

	std::vector<int> locationList;
	for (const Value& result : qResult) { locationList.emplace_back(result.second); }

	// the rtree returns in storage order
	std::sort(locationList.begin(), locationList.end());
	return locationList;
}

OpeningLocator::OpeningLocator(
	const ElementIndex* index,
	const WallOrientationClassifier& classifier,
	double searchBuffer,
	double planeTolerance,
	const std::vector<std::string>& wallTypeList)
	: classifier_(classifier)
{
	index_ = index;
	searchBuffer_ = searchBuffer;
	planeTolerance_ = planeTolerance;
	for (const std::string& wallType : wallTypeList) { wallTypeList_.emplace_back(boost::to_upper_copy(wallType)); }
}

bool OpeningLocator::isWallType(const std::string& typeName) const
{
	return std::find(wallTypeList_.begin(), wallTypeList_.end(), boost::to_upper_copy(typeName)) != wallTypeList_.end();
}

double OpeningLocator::computePlaneDistance(const ElementSpatialData& wall, const gp_Pnt& point) const
{
	const std::optional<WallGeometry>& wallGeometry = wall.getWallGeometry();
	if (wallGeometry.has_value())
	{
		const gp_Lin& axis = wallGeometry->axis_;
		gp_Vec flatDirection(axis.Direction().X(), axis.Direction().Y(), 0);

		// a vertical axis has no usable plane
		if (flatDirection.Magnitude() > gp::Resolution())
		{
			gp_Lin flatAxis(gp_Pnt(axis.Location().X(), axis.Location().Y(), 0), gp_Dir(flatDirection));
			return flatAxis.Distance(gp_Pnt(point.X(), point.Y(), 0));
		}
	}
	return bg::distance(helperFunctions::Point3DOTB(point), wall.getBox());
}

std::vector<int> OpeningLocator::findCandidates(const BoostBox3D& openingBox) const
{
	std::vector<int> candidateList;
	if (index_ == nullptr) { return candidateList; }

	BoostBox3D searchBox = helperFunctions::expandBBox(openingBox, searchBuffer_);
	for (int locationIdx : index_->query(searchBox))
	{
		if (!isWallType(index_->getLookup(locationIdx)->getTypeName())) { continue; }
		candidateList.emplace_back(locationIdx);
	}
	return candidateList;
}

std::optional<WallMatch> OpeningLocator::locate(const BoostBox3D& openingBox) const
{
	gp_Pnt openingCenter = helperFunctions::getBoxCenter(openingBox);

	std::optional<WallMatch> bestMatch;
	for (int locationIdx : findCandidates(openingBox))
	{
		std::shared_ptr<ElementSpatialData> wall = index_->getLookup(locationIdx);
		double planeDistance = computePlaneDistance(*wall, openingCenter);

		if (planeDistance > planeTolerance_) { continue; }
		// candidates are ascending so equal distances keep the first wall
		if (bestMatch.has_value() && planeDistance >= bestMatch->planeDistance_) { continue; }

		WallMatch match;
		match.index_ = locationIdx;
		match.guid_ = wall->getGuid();
		match.name_ = wall->getName();
		match.planeDistance_ = planeDistance;

		const std::optional<WallGeometry>& wallGeometry = wall->getWallGeometry();
		if (wallGeometry.has_value())
		{
			match.orientation_ = classifier_.classify(wallGeometry->referenceDirection_);
			match.wallLength_ = wallGeometry->length_;
		}
		bestMatch = match;
	}
	return bestMatch;
}
