#include "daylightEvaluator.h"
#include "errorCollection.h"
#include "helper.h"
#include "stringManager.h"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

nlohmann::json DaylightResult::toJson() const
{
	nlohmann::json resultJson;
	resultJson[OutputObjectEnum::getString(OutputObjectID::daylightShare)] = helperFunctions::roundTo(share_, 2);
	resultJson[OutputObjectEnum::getString(OutputObjectID::daylightPassed)] = passed_;
	resultJson[OutputObjectEnum::getString(OutputObjectID::daylightFactors)] = grid_;
	return resultJson;
}

DaylightEvaluator::DaylightEvaluator(double skyIlluminance, double threshold, double requiredPercentage, double gridSize)
{
	skyIlluminance_ = skyIlluminance;
	threshold_ = threshold;
	requiredPercentage_ = requiredPercentage;
	gridSize_ = gridSize;
}

std::vector<double> DaylightEvaluator::readIlluminance(const std::string& path)
{
	std::ifstream resultFile(path);
	if (!resultFile.is_open()) { throw ErrorID::warningNoIlluminanceResults; }
	return parseIlluminance(resultFile);
}

std::vector<double> DaylightEvaluator::parseIlluminance(std::istream& stream)
{
	std::vector<double> illuminanceList;
	std::string line;
	int lineCount = 0;
	while (std::getline(stream, line))
	{
		lineCount++;
		boost::algorithm::trim(line);
		if (line.empty()) { continue; }

		size_t parsedCount = 0;
		double value = -1;
		try
		{
			value = std::stod(line, &parsedCount);
		}
		catch (const std::logic_error&)
		{
			parsedCount = 0;
		}

		if (parsedCount != line.size() || value < 0 || !std::isfinite(value))
		{
			ErrorCollection::getInstance().addError(ErrorID::warningInvalidIlluminanceValue, "line " + std::to_string(lineCount));
			continue;
		}
		illuminanceList.emplace_back(value);
	}
	return illuminanceList;
}

double DaylightEvaluator::computeDaylightFactor(double illuminance) const
{
	return illuminance / skyIlluminance_ * 100;
}

DaylightResult DaylightEvaluator::evaluate(const std::vector<double>& illuminanceList, double roomWidth) const
{
	DaylightResult result;
	if (illuminanceList.empty()) { return result; }

	int passingCount = 0;
	for (double illuminance : illuminanceList)
	{
		double daylightFactor = computeDaylightFactor(illuminance);
		result.daylightFactorList_.emplace_back(daylightFactor);

		// the division can land just below the threshold
		if (daylightFactor >= threshold_ - 1e-9) { passingCount++; }
	}

	result.share_ = static_cast<double>(passingCount) / static_cast<double>(illuminanceList.size()) * 100;
	result.passed_ = result.share_ >= requiredPercentage_;

	size_t columnCount = 1;
	if (gridSize_ > 0) { columnCount = std::max<size_t>(1, static_cast<size_t>(std::floor(roomWidth / gridSize_))); }

	for (size_t i = 0; i < result.daylightFactorList_.size(); i += columnCount)
	{
		size_t rowEnd = std::min(i + columnCount, result.daylightFactorList_.size());
		result.grid_.emplace_back(result.daylightFactorList_.begin() + i, result.daylightFactorList_.begin() + rowEnd);
	}
	return result;
}
