#include "placementCorrector.h"

#include <gtest/gtest.h>

namespace {
	PlacementInput makeInput(double rawX, double rawY, double wallLength, double openingWidth, double roomWidth, double roomDepth)
	{
		PlacementInput input;
		input.rawX_ = rawX;
		input.rawY_ = rawY;
		input.wallLength_ = wallLength;
		input.openingWidth_ = openingWidth;
		input.roomWidth_ = roomWidth;
		input.roomDepth_ = roomDepth;
		return input;
	}
}

TEST(PlacementCorrectorTest, NormalPlacementIsKept)
{
	PlacementCorrector corrector;
	CorrectedPlacement placement = corrector.correct(makeInput(1.25, 0.9, 4.0, 1.0, 3.0, 4.0));
	EXPECT_DOUBLE_EQ(placement.locationX_, 1.25);
	EXPECT_DOUBLE_EQ(placement.locationY_, 0.9);
	EXPECT_EQ(placement.frame_, CoordinateFrame::AsGiven);
	EXPECT_TRUE(placement.inRange_);
}

TEST(PlacementCorrectorTest, NormalPlacementIsIdempotent)
{
	PlacementCorrector corrector;
	CorrectedPlacement first = corrector.correct(makeInput(2.0, 1.1, 4.0, 1.0, 3.0, 4.0));
	CorrectedPlacement second = corrector.correct(makeInput(first.locationX_, first.locationY_, 4.0, 1.0, 3.0, 4.0));
	EXPECT_DOUBLE_EQ(second.locationX_, first.locationX_);
	EXPECT_DOUBLE_EQ(second.locationY_, first.locationY_);
	EXPECT_EQ(second.frame_, first.frame_);
}

TEST(PlacementCorrectorTest, FarEndPlacementIsMirrored)
{
	PlacementCorrector corrector;
	CorrectedPlacement placement = corrector.correct(makeInput(7.0, 1.0, 10.0, 1.2, 3.0, 4.0));
	EXPECT_EQ(placement.frame_, CoordinateFrame::MirroredAlongWallAxis);
	EXPECT_NEAR(placement.locationX_, 1.8, 1e-9);
	EXPECT_DOUBLE_EQ(placement.locationY_, 1.0);
	EXPECT_TRUE(placement.inRange_);
}

TEST(PlacementCorrectorTest, MirroredPlacementCanFallOutOfRange)
{
	// wall (0,1,0) is labeled left, the raw x exceeds both 3.0 and 4.0
	PlacementCorrector corrector;
	CorrectedPlacement placement = corrector.correct(makeInput(5.0, 1.2, 4.0, 1.0, 3.0, 4.0));
	EXPECT_EQ(placement.frame_, CoordinateFrame::MirroredAlongWallAxis);
	EXPECT_DOUBLE_EQ(placement.locationX_, -2.0);
	EXPECT_DOUBLE_EQ(placement.locationY_, 1.2);
	EXPECT_FALSE(placement.inRange_);
}

TEST(PlacementCorrectorTest, ExceedingOneDimensionIsNotMirrored)
{
	PlacementCorrector corrector;
	CorrectedPlacement placement = corrector.correct(makeInput(3.5, 1.0, 4.0, 0.4, 3.0, 4.0));
	EXPECT_EQ(placement.frame_, CoordinateFrame::AsGiven);
	EXPECT_DOUBLE_EQ(placement.locationX_, 3.5);
	EXPECT_TRUE(placement.inRange_);
}

TEST(PlacementCorrectorTest, WallEndsAreInRange)
{
	PlacementCorrector corrector;
	EXPECT_TRUE(corrector.correct(makeInput(0.0, 1.0, 4.0, 1.0, 5.0, 5.0)).inRange_);
	EXPECT_TRUE(corrector.correct(makeInput(4.0, 1.0, 4.0, 1.0, 5.0, 5.0)).inRange_);
	EXPECT_FALSE(corrector.correct(makeInput(4.01, 1.0, 4.0, 1.0, 5.0, 5.0)).inRange_);
	EXPECT_FALSE(corrector.correct(makeInput(-0.01, 1.0, 4.0, 1.0, 5.0, 5.0)).inRange_);
}

TEST(PlacementCorrectorTest, DeclaredFrameOverridesInference)
{
	PlacementCorrector corrector;

	PlacementInput asGivenInput = makeInput(5.0, 1.0, 6.0, 1.0, 3.0, 4.0);
	EXPECT_EQ(corrector.inferFrame(asGivenInput), CoordinateFrame::MirroredAlongWallAxis);
	asGivenInput.declaredFrame_ = CoordinateFrame::AsGiven;
	CorrectedPlacement asGivenPlacement = corrector.correct(asGivenInput);
	EXPECT_EQ(asGivenPlacement.frame_, CoordinateFrame::AsGiven);
	EXPECT_DOUBLE_EQ(asGivenPlacement.locationX_, 5.0);
	EXPECT_TRUE(asGivenPlacement.inRange_);

	PlacementInput mirroredInput = makeInput(1.0, 1.0, 4.0, 1.0, 3.0, 4.0);
	mirroredInput.declaredFrame_ = CoordinateFrame::MirroredAlongWallAxis;
	CorrectedPlacement mirroredPlacement = corrector.correct(mirroredInput);
	EXPECT_EQ(mirroredPlacement.frame_, CoordinateFrame::MirroredAlongWallAxis);
	EXPECT_DOUBLE_EQ(mirroredPlacement.locationX_, 2.0);
	EXPECT_DOUBLE_EQ(mirroredPlacement.locationY_, 1.0);
}

TEST(PlacementCorrectorTest, DeclaredFrameFromAxes)
{
	EXPECT_EQ(PlacementCorrector::declaredFrame(gp_Vec(1, 0, 0), gp_Vec(2, 0, 0), 1e-4), CoordinateFrame::AsGiven);
	EXPECT_EQ(PlacementCorrector::declaredFrame(gp_Vec(0, -1, 0), gp_Vec(0, 1, 0), 1e-4), CoordinateFrame::MirroredAlongWallAxis);
	EXPECT_FALSE(PlacementCorrector::declaredFrame(gp_Vec(1, 0, 0), gp_Vec(0, 1, 0), 1e-4).has_value());
	EXPECT_FALSE(PlacementCorrector::declaredFrame(gp_Vec(0, 0, 0), gp_Vec(1, 0, 0), 1e-4).has_value());
}
