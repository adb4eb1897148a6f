#include "inc/helper.h"
#include "inc/IOManager.h"
#include "inc/stringManager.h"

// basic includes
#include <iostream>
#include <string>
#include <chrono>

// IfcOpenShell includes
#include <ifcparse/IfcLogger.h>

int main(int argc, char** argv) {
	std::cout << " " << std::endl;
	auto startTime = std::chrono::high_resolution_clock::now();
	std::string issueEncounterString = errorWarningStringEnum::getString(ErrorID::warningIssueencountered);

	// outputs errors related to the selected objects
	if (false) { Logger::SetOutput(&std::cout, &std::cout); }

	IOManager manager;
	bool success = false;
	try
	{
		if (argc > 1) { success = manager.init({ argv[1] }); }
		else { success = manager.init({}); }
	}
	catch (const std::string& exceptionString)
	{
		std::cout << issueEncounterString << std::endl;
		std::cout << exceptionString << std::endl;
		success = false;
	}
	if (!success)
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile) << std::endl;
		manager.write(true);
		return 1;
	}

	try
	{
		success = manager.run();
	}
	catch (const std::string& exceptionString)
	{
		std::cout << issueEncounterString << std::endl;
		std::cout << exceptionString << std::endl;
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile) << std::endl;
		manager.write(true);
		return 1;
	}

	if (!manager.write() || !success)
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile) << std::endl;
		return 1;
	}

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoTotalProcessCompleted) <<
		std::chrono::duration_cast<std::chrono::seconds>(std::chrono::high_resolution_clock::now() - startTime).count() <<
		UnitStringEnum::getString(UnitStringID::seconds) << std::endl;
	return 0;
}
