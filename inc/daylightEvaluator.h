#include <nlohmann/json.hpp>

#include <istream>
#include <string>
#include <vector>

#ifndef DAYLIGHTEVALUATOR_DAYLIGHTEVALUATOR_H
#define DAYLIGHTEVALUATOR_DAYLIGHTEVALUATOR_H

struct DaylightResult {
	std::vector<double> daylightFactorList_;
	// percentage of the test points at or above the threshold
	double share_ = 0;
	bool passed_ = false;
	// daylight factors laid out in the rows of the test point grid
	std::vector<std::vector<double>> grid_;

	nlohmann::json toJson() const;
};

// turns the illuminance values of the external simulation into a daylight factor verdict
class DaylightEvaluator {
private:
	double skyIlluminance_;
	double threshold_;
	double requiredPercentage_;
	double gridSize_;

public:
	DaylightEvaluator(double skyIlluminance, double threshold, double requiredPercentage, double gridSize);

	/// reads one illuminance value per line, throws ErrorID::warningNoIlluminanceResults if the file can not be opened
	static std::vector<double> readIlluminance(const std::string& path);
	/// reads one illuminance value per line, invalid lines are reported and skipped
	static std::vector<double> parseIlluminance(std::istream& stream);

	double computeDaylightFactor(double illuminance) const;
	DaylightResult evaluate(const std::vector<double>& illuminanceList, double roomWidth) const;
};

#endif // DAYLIGHTEVALUATOR_DAYLIGHTEVALUATOR_H
