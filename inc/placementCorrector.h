#include "roomData.h"

#include <gp_Vec.hxx>

#include <optional>

#ifndef PLACEMENTCORRECTOR_PLACEMENTCORRECTOR_H
#define PLACEMENTCORRECTOR_PLACEMENTCORRECTOR_H

// raw placement of an opening as read from the model, in meters
struct PlacementInput {
	double rawX_ = 0;
	double rawY_ = 0;
	double wallLength_ = 0;
	double openingWidth_ = 0;
	double roomWidth_ = 0;
	double roomDepth_ = 0;
	// frame derived from the placement axes, used instead of the inferred frame if set
	std::optional<CoordinateFrame> declaredFrame_;
};

struct CorrectedPlacement {
	double locationX_ = 0;
	double locationY_ = 0;
	CoordinateFrame frame_ = CoordinateFrame::AsGiven;
	bool inRange_ = true;
};

// brings the opening location into the wall local frame measured from the wall start
class PlacementCorrector {
private:
	double tolerance_;

public:
	explicit PlacementCorrector(double tolerance = 1e-6);

	/// a raw x larger than both room dimensions can only be measured along the mirrored axis
	CoordinateFrame inferFrame(const PlacementInput& input) const;
	CorrectedPlacement correct(const PlacementInput& input) const;

	/// compares the opening x axis with the wall x axis, nullopt if they are neither parallel nor antiparallel
	static std::optional<CoordinateFrame> declaredFrame(const gp_Vec& openingAxis, const gp_Vec& wallAxis, double angularTolerance);
};

#endif // PLACEMENTCORRECTOR_PLACEMENTCORRECTOR_H
