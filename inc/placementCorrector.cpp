#include "placementCorrector.h"

#include <gp.hxx>

#include <cmath>

PlacementCorrector::PlacementCorrector(double tolerance)
{
	tolerance_ = tolerance;
}

CoordinateFrame PlacementCorrector::inferFrame(const PlacementInput& input) const
{
	if (input.rawX_ > input.roomWidth_ && input.rawX_ > input.roomDepth_) { return CoordinateFrame::MirroredAlongWallAxis; }
	return CoordinateFrame::AsGiven;
}

CorrectedPlacement PlacementCorrector::correct(const PlacementInput& input) const
{
	CorrectedPlacement placement;
	placement.frame_ = input.declaredFrame_.value_or(inferFrame(input));
	placement.locationY_ = input.rawY_;

	if (placement.frame_ == CoordinateFrame::MirroredAlongWallAxis)
	{
		placement.locationX_ = input.wallLength_ - input.rawX_ - input.openingWidth_;
	}
	else
	{
		placement.locationX_ = input.rawX_;
	}

	placement.inRange_ = placement.locationX_ >= -tolerance_ && placement.locationX_ <= input.wallLength_ + tolerance_;
	return placement;
}

std::optional<CoordinateFrame> PlacementCorrector::declaredFrame(const gp_Vec& openingAxis, const gp_Vec& wallAxis, double angularTolerance)
{
	if (openingAxis.Magnitude() <= gp::Resolution() || wallAxis.Magnitude() <= gp::Resolution()) { return std::nullopt; }

	double angle = openingAxis.Angle(wallAxis);
	if (angle <= angularTolerance) { return CoordinateFrame::AsGiven; }
	if (angle >= M_PI - angularTolerance) { return CoordinateFrame::MirroredAlongWallAxis; }
	return std::nullopt;
}
