#include "helper.h"
#include "roomData.h"
#include "wallOrientation.h"

#include <gp_Lin.hxx>
#include <gp_Vec.hxx>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef OPENINGLOCATOR_OPENINGLOCATOR_H
#define OPENINGLOCATOR_OPENINGLOCATOR_H

// placement data of a wall in world coordinates
struct WallGeometry {
	// horizontal line through the wall placement origin along the wall x axis
	gp_Lin axis_;
	// local reference direction as stored in the model, absent if not set
	std::optional<gp_Vec> referenceDirection_;
	double length_ = 0;
};

// lookup for the element spatial index
class ElementSpatialData {
private:
	std::string guid_;
	std::string typeName_;
	std::string name_;
	std::string tag_;
	BoostBox3D box_;
	std::optional<WallGeometry> wallGeometry_;

public:
	ElementSpatialData(
		const std::string& guid,
		const std::string& typeName,
		const std::string& name,
		const std::string& tag,
		const BoostBox3D& box,
		const std::optional<WallGeometry>& wallGeometry = std::nullopt
	);

	const std::string& getGuid() const { return guid_; }
	const std::string& getTypeName() const { return typeName_; }
	const std::string& getName() const { return name_; }
	const std::string& getTag() const { return tag_; }
	const BoostBox3D& getBox() const { return box_; }
	const std::optional<WallGeometry>& getWallGeometry() const { return wallGeometry_; }
};

// in memory rtree over the building elements, built once and read only afterwards
class ElementIndex {
private:
	static const int treeDepth = 5;

	bgi::rtree<Value, bgi::rstar<treeDepth>> index_;
	std::vector<std::shared_ptr<ElementSpatialData>> productLookup_;

public:
	/// adds the element to the index and returns its location in the lookup
	int addElement(const std::shared_ptr<ElementSpatialData>& element);
	/// returns the lookup locations of the elements that intersect the box, ascending
	std::vector<int> query(const BoostBox3D& box) const;

	std::shared_ptr<ElementSpatialData> getLookup(int i) const { return productLookup_.at(i); }
	size_t size() const { return productLookup_.size(); }
};

// the wall an opening is set into
struct WallMatch {
	int index_ = -1;
	std::string guid_;
	std::string name_;
	Orientation orientation_ = Orientation::Unknown;
	double wallLength_ = 0;
	double planeDistance_ = 0;
};

class OpeningLocator {
private:
	const ElementIndex* index_;
	WallOrientationClassifier classifier_;
	double searchBuffer_;
	double planeTolerance_;
	// upper case type names of the elements that count as walls
	std::vector<std::string> wallTypeList_;

	bool isWallType(const std::string& typeName) const;
	/// horizontal distance from the point to the wall plane, box distance if the wall has no axis
	double computePlaneDistance(const ElementSpatialData& wall, const gp_Pnt& point) const;

public:
	OpeningLocator(
		const ElementIndex* index,
		const WallOrientationClassifier& classifier,
		double searchBuffer,
		double planeTolerance,
		const std::vector<std::string>& wallTypeList
	);

	/// returns the wall type elements found in the buffered opening box
	std::vector<int> findCandidates(const BoostBox3D& openingBox) const;
	/// returns the wall whose plane is closest to the opening centroid, nullopt if none is within the tolerance
	std::optional<WallMatch> locate(const BoostBox3D& openingBox) const;
};

#endif // OPENINGLOCATOR_OPENINGLOCATOR_H
