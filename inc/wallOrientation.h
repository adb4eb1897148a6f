#include "roomData.h"

#include <gp_Vec.hxx>

#include <optional>
#include <vector>

#ifndef WALLORIENTATION_WALLORIENTATION_H
#define WALLORIENTATION_WALLORIENTATION_H

// labels a wall by comparing its reference direction with the cardinal directions
class WallOrientationClassifier {
private:
	// max angle in radians between the direction and a cardinal direction
	double angularTolerance_;

public:
	explicit WallOrientationClassifier(double angularTolerance = 1e-4);

	/// an absent or zero direction is the default x axis and labeled front
	Orientation classify(const std::optional<gp_Vec>& refDirection) const;
	/// classify the direction ratios as stored in an IfcDirection, missing components are zero
	Orientation classify(const std::vector<double>& directionRatios) const;

	double getAngularTolerance() const { return angularTolerance_; }
};

#endif // WALLORIENTATION_WALLORIENTATION_H
