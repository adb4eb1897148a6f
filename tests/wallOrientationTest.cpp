#include "wallOrientation.h"

#include <gtest/gtest.h>

TEST(WallOrientationTest, CanonicalDirections)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(gp_Vec(0, 0, 0)), Orientation::Front);
	EXPECT_EQ(classifier.classify(gp_Vec(0, -1, 0)), Orientation::Right);
	EXPECT_EQ(classifier.classify(gp_Vec(0, 1, 0)), Orientation::Left);
	EXPECT_EQ(classifier.classify(gp_Vec(-1, 0, 0)), Orientation::Back);
}

TEST(WallOrientationTest, AbsentDirectionIsFront)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(std::optional<gp_Vec>()), Orientation::Front);
	EXPECT_EQ(classifier.classify(std::vector<double>()), Orientation::Front);
}

TEST(WallOrientationTest, DefaultAxisIsFront)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(gp_Vec(1, 0, 0)), Orientation::Front);
}

TEST(WallOrientationTest, OtherDirectionsAreUnknown)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(gp_Vec(1, 1, 0)), Orientation::Unknown);
	EXPECT_EQ(classifier.classify(gp_Vec(0, 0, 1)), Orientation::Unknown);
	EXPECT_EQ(classifier.classify(gp_Vec(0.5, -0.866, 0)), Orientation::Unknown);
}

TEST(WallOrientationTest, LengthDoesNotMatter)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(gp_Vec(0, 2.5, 0)), Orientation::Left);
	EXPECT_EQ(classifier.classify(gp_Vec(-1000, 0, 0)), Orientation::Back);
}

TEST(WallOrientationTest, NearAxisWithinTolerance)
{
	WallOrientationClassifier classifier(1e-4);
	EXPECT_EQ(classifier.classify(gp_Vec(1e-6, 1, 0)), Orientation::Left);
	EXPECT_EQ(classifier.classify(gp_Vec(-1, 1e-6, 0)), Orientation::Back);
	// about 1e-2 rad off axis
	EXPECT_EQ(classifier.classify(gp_Vec(1e-2, -1, 0)), Orientation::Unknown);

	WallOrientationClassifier looseClassifier(0.05);
	EXPECT_EQ(looseClassifier.classify(gp_Vec(1e-2, -1, 0)), Orientation::Right);
}

TEST(WallOrientationTest, DirectionRatios)
{
	WallOrientationClassifier classifier;
	EXPECT_EQ(classifier.classify(std::vector<double>{ 0, -1 }), Orientation::Right);
	EXPECT_EQ(classifier.classify(std::vector<double>{ -1, 0, 0 }), Orientation::Back);
	EXPECT_EQ(classifier.classify(std::vector<double>{ 0.7071, 0.7071, 0 }), Orientation::Unknown);
}

TEST(WallOrientationTest, SameInputSameLabel)
{
	WallOrientationClassifier classifier;
	gp_Vec direction(0.3, 0.4, 0);
	Orientation first = classifier.classify(direction);
	for (int i = 0; i < 5; i++) { EXPECT_EQ(classifier.classify(direction), first); }
}
