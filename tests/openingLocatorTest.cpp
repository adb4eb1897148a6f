#include "openingLocator.h"

#include <gtest/gtest.h>

#include <gp_Dir.hxx>

namespace {
	BoostBox3D makeBox(double x0, double y0, double z0, double x1, double y1, double z1)
	{
		return BoostBox3D(BoostPoint3D(x0, y0, z0), BoostPoint3D(x1, y1, z1));
	}

	// wall running along x with its axis at height 0 through y
	std::shared_ptr<ElementSpatialData> makeWall(const std::string& guid, double y, const gp_Vec& refDirection, double length = 5.0)
	{
		WallGeometry wallGeometry;
		wallGeometry.axis_ = gp_Lin(gp_Pnt(0, y, 0), gp_Dir(1, 0, 0));
		wallGeometry.referenceDirection_ = refDirection;
		wallGeometry.length_ = length;

		return std::make_shared<ElementSpatialData>(
			guid,
			"IfcWallStandardCase",
			"Basic Wall " + guid,
			guid + "-tag",
			makeBox(0, y - 0.1, 0, length, y + 0.1, 3),
			wallGeometry
		);
	}

	OpeningLocator makeLocator(const ElementIndex* index, double planeTolerance = 0.5)
	{
		return OpeningLocator(index, WallOrientationClassifier(1e-4), 0.5, planeTolerance, { "IfcWall", "IfcWallStandardCase" });
	}

	// window set into the wall at y = 0
	const BoostBox3D windowBox = makeBox(1, -0.05, 1, 2, 0.05, 2);
}

TEST(ElementIndexTest, QueryReturnsAscendingLocations)
{
	ElementIndex index;
	EXPECT_EQ(index.addElement(makeWall("c", 0.2, gp_Vec(1, 0, 0))), 0);
	EXPECT_EQ(index.addElement(makeWall("a", 0.0, gp_Vec(1, 0, 0))), 1);
	EXPECT_EQ(index.addElement(makeWall("b", 10.0, gp_Vec(1, 0, 0))), 2);
	EXPECT_EQ(index.size(), 3u);

	std::vector<int> result = index.query(windowBox);
	ASSERT_EQ(result.size(), 1u);
	EXPECT_EQ(result[0], 1);

	result = index.query(makeBox(0, -1, 0, 5, 1, 3));
	ASSERT_EQ(result.size(), 2u);
	EXPECT_EQ(result[0], 0);
	EXPECT_EQ(result[1], 1);
	EXPECT_EQ(index.getLookup(0)->getGuid(), "c");
}

TEST(OpeningLocatorTest, NoWallInEmptyIndex)
{
	ElementIndex index;
	OpeningLocator locator = makeLocator(&index);
	EXPECT_TRUE(locator.findCandidates(windowBox).empty());
	EXPECT_FALSE(locator.locate(windowBox).has_value());
}

TEST(OpeningLocatorTest, SingleWallIsFound)
{
	ElementIndex index;
	index.addElement(makeWall("front", 0.0, gp_Vec(0, 1, 0), 4.0));
	OpeningLocator locator = makeLocator(&index);

	std::optional<WallMatch> match = locator.locate(windowBox);
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(match->guid_, "front");
	EXPECT_EQ(match->name_, "Basic Wall front");
	EXPECT_EQ(match->orientation_, Orientation::Left);
	EXPECT_DOUBLE_EQ(match->wallLength_, 4.0);
	EXPECT_NEAR(match->planeDistance_, 0.0, 1e-9);
}

TEST(OpeningLocatorTest, NearestPlaneBeatsIndexOrder)
{
	ElementIndex index;
	// reached through the search buffer but further away from the window
	index.addElement(makeWall("inner", 0.4, gp_Vec(-1, 0, 0)));
	index.addElement(makeWall("host", 0.0, gp_Vec(1, 0, 0)));
	OpeningLocator locator = makeLocator(&index);

	EXPECT_EQ(locator.findCandidates(windowBox).size(), 2u);

	std::optional<WallMatch> match = locator.locate(windowBox);
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(match->guid_, "host");
	EXPECT_EQ(match->index_, 1);
	EXPECT_EQ(match->orientation_, Orientation::Front);
}

TEST(OpeningLocatorTest, EqualDistanceKeepsFirstWall)
{
	ElementIndex index;
	index.addElement(makeWall("first", 0.0, gp_Vec(0, -1, 0)));
	index.addElement(makeWall("second", 0.0, gp_Vec(0, 1, 0)));
	OpeningLocator locator = makeLocator(&index);

	std::optional<WallMatch> match = locator.locate(windowBox);
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(match->guid_, "first");
	EXPECT_EQ(match->orientation_, Orientation::Right);
}

TEST(OpeningLocatorTest, WallOutsideToleranceIsIgnored)
{
	ElementIndex index;
	index.addElement(makeWall("inner", 0.4, gp_Vec(1, 0, 0)));
	OpeningLocator locator = makeLocator(&index, 0.1);

	EXPECT_EQ(locator.findCandidates(windowBox).size(), 1u);
	EXPECT_FALSE(locator.locate(windowBox).has_value());
}

TEST(OpeningLocatorTest, OtherTypesAreNotCandidates)
{
	ElementIndex index;
	index.addElement(std::make_shared<ElementSpatialData>("slab", "IfcSlab", "Floor", "", makeBox(-1, -1, 0.9, 6, 6, 1.1)));
	index.addElement(std::make_shared<ElementSpatialData>("door", "IfcDoor", "Door", "", makeBox(1.5, -0.05, 0, 2.5, 0.05, 2.1)));
	index.addElement(makeWall("wall", 0.0, gp_Vec(1, 0, 0)));
	OpeningLocator locator = makeLocator(&index);

	std::vector<int> candidateList = locator.findCandidates(windowBox);
	ASSERT_EQ(candidateList.size(), 1u);
	EXPECT_EQ(candidateList[0], 2);
}

TEST(OpeningLocatorTest, WallTypeNamesIgnoreCase)
{
	ElementIndex index;
	index.addElement(std::make_shared<ElementSpatialData>("wall", "IFCWALL", "Wall", "", makeBox(0, -0.1, 0, 5, 0.1, 3)));
	OpeningLocator locator(&index, WallOrientationClassifier(), 0.5, 0.5, { "ifcwall" });

	std::optional<WallMatch> match = locator.locate(windowBox);
	ASSERT_TRUE(match.has_value());
	// no placement data so the box distance is used and the orientation stays open
	EXPECT_NEAR(match->planeDistance_, 0.0, 1e-9);
	EXPECT_EQ(match->orientation_, Orientation::Unknown);
}

TEST(OpeningLocatorTest, SearchBufferReachesDetachedWall)
{
	ElementIndex index;
	index.addElement(makeWall("wall", 0.45, gp_Vec(1, 0, 0)));

	OpeningLocator tightLocator(&index, WallOrientationClassifier(), 0.0, 0.5, { "IfcWallStandardCase" });
	EXPECT_FALSE(tightLocator.locate(windowBox).has_value());

	OpeningLocator bufferedLocator(&index, WallOrientationClassifier(), 0.5, 0.5, { "IfcWallStandardCase" });
	std::optional<WallMatch> match = bufferedLocator.locate(windowBox);
	ASSERT_TRUE(match.has_value());
	EXPECT_NEAR(match->planeDistance_, 0.45, 1e-9);
}
