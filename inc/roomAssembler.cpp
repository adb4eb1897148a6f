#include "roomAssembler.h"

#include <unordered_map>

RoomAssembler::RoomAssembler(double defaultSillHeight)
{
	defaultSillHeight_ = defaultSillHeight;
}

AssemblyResult RoomAssembler::assemble(const std::vector<RoomRecord>& roomList, const std::vector<WindowRecord>& windowList) const
{
	AssemblyResult result;
	std::unordered_map<std::string, size_t> codeLookup;

	for (const RoomRecord& roomRecord : roomList)
	{
		if (codeLookup.find(roomRecord.code_) != codeLookup.end())
		{
			result.duplicateRoomCodes_.emplace_back(roomRecord.code_);
			continue;
		}
		codeLookup.emplace(roomRecord.code_, result.rooms_.size());
		result.rooms_.emplace_back(roomRecord);
	}

	for (const WindowRecord& windowRecord : windowList)
	{
		auto roomIt = codeLookup.find(windowRecord.roomCode_);
		if (roomIt == codeLookup.end())
		{
			result.unmatchedWindows_.emplace_back(windowRecord);
			continue;
		}
		result.rooms_[roomIt->second].addWindow(Window(windowRecord, defaultSillHeight_));
	}
	return result;
}
