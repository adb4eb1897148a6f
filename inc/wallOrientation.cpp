#include "wallOrientation.h"

#include <gp.hxx>

#include <array>
#include <utility>

WallOrientationClassifier::WallOrientationClassifier(double angularTolerance)
{
	angularTolerance_ = angularTolerance;
}

Orientation WallOrientationClassifier::classify(const std::optional<gp_Vec>& refDirection) const
{
	if (!refDirection.has_value()) { return Orientation::Front; }
	if (refDirection->Magnitude() <= gp::Resolution()) { return Orientation::Front; }

	static const std::array<std::pair<gp_Vec, Orientation>, 4> cardinalList = { {
		{ gp_Vec(1, 0, 0), Orientation::Front },
		{ gp_Vec(-1, 0, 0), Orientation::Back },
		{ gp_Vec(0, 1, 0), Orientation::Left },
		{ gp_Vec(0, -1, 0), Orientation::Right }
	} };

	for (const std::pair<gp_Vec, Orientation>& cardinal : cardinalList)
	{
		if (refDirection->Angle(cardinal.first) <= angularTolerance_) { return cardinal.second; }
	}
	return Orientation::Unknown;
}

Orientation WallOrientationClassifier::classify(const std::vector<double>& directionRatios) const
{
	if (directionRatios.empty()) { return classify(std::optional<gp_Vec>()); }

	gp_Vec refDirection(
		directionRatios[0],
		directionRatios.size() > 1 ? directionRatios[1] : 0,
		directionRatios.size() > 2 ? directionRatios[2] : 0
	);
	return classify(std::optional<gp_Vec>(refDirection));
}
