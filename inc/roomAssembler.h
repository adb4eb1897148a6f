#include "roomData.h"

#include <string>
#include <vector>

#ifndef ROOMASSEMBLER_ROOMASSEMBLER_H
#define ROOMASSEMBLER_ROOMASSEMBLER_H

struct AssemblyResult {
	std::vector<Room> rooms_;
	// windows whose room code matches no room
	std::vector<WindowRecord> unmatchedWindows_;
	// codes that were supplied by more than one room, only the first is kept
	std::vector<std::string> duplicateRoomCodes_;
};

// joins the window records to the rooms they belong to
class RoomAssembler {
private:
	double defaultSillHeight_;

public:
	explicit RoomAssembler(double defaultSillHeight);

	/// rooms keep their input order, windows keep their input order within a room
	AssemblyResult assemble(const std::vector<RoomRecord>& roomList, const std::vector<WindowRecord>& windowList) const;
};

#endif // ROOMASSEMBLER_ROOMASSEMBLER_H
