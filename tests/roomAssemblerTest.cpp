#include "roomAssembler.h"

#include <gtest/gtest.h>

namespace {
	RoomRecord makeRoom(const std::string& code, const std::string& name, double width, double depth, double height)
	{
		RoomRecord room;
		room.code_ = code;
		room.displayName_ = name;
		room.width_ = width;
		room.depth_ = depth;
		room.height_ = height;
		return room;
	}

	WindowRecord makeWindow(const std::string& roomCode, const std::string& tag)
	{
		WindowRecord window;
		window.roomCode_ = roomCode;
		window.tag_ = tag;
		window.width_ = 1.0;
		window.height_ = 1.2;
		window.sillHeight_ = 0.9;
		window.hasWall_ = true;
		window.wallOrientation_ = Orientation::Front;
		return window;
	}
}

TEST(RoomAssemblerTest, WindowsJoinTheirRoom)
{
	RoomAssembler assembler(0.1);
	AssemblyResult result = assembler.assemble(
		{ makeRoom("A203", "Bedroom", 3.0, 4.0, 2.5) },
		{ makeWindow("A203", "W1"), makeWindow("B101", "W2") }
	);

	ASSERT_EQ(result.rooms_.size(), 1u);
	const Room& room = result.rooms_[0];
	EXPECT_EQ(room.getCode(), "A203");
	EXPECT_EQ(room.getDisplayName(), "Bedroom");
	EXPECT_DOUBLE_EQ(room.getWidth(), 3.0);
	EXPECT_DOUBLE_EQ(room.getDepth(), 4.0);
	EXPECT_DOUBLE_EQ(room.getHeight(), 2.5);
	ASSERT_EQ(room.getWindows().size(), 1u);
	EXPECT_EQ(room.getWindows()[0].getTag(), "W1");

	ASSERT_EQ(result.unmatchedWindows_.size(), 1u);
	EXPECT_EQ(result.unmatchedWindows_[0].tag_, "W2");
	EXPECT_TRUE(result.duplicateRoomCodes_.empty());
}

TEST(RoomAssemblerTest, WindowOrderIsKept)
{
	RoomAssembler assembler(0.1);
	AssemblyResult result = assembler.assemble(
		{ makeRoom("A", "Living", 5.0, 6.0, 2.6), makeRoom("B", "Kitchen", 3.0, 3.0, 2.6) },
		{ makeWindow("B", "W3"), makeWindow("A", "W1"), makeWindow("B", "W4"), makeWindow("A", "W2") }
	);

	ASSERT_EQ(result.rooms_.size(), 2u);
	EXPECT_EQ(result.rooms_[0].getCode(), "A");
	EXPECT_EQ(result.rooms_[1].getCode(), "B");

	ASSERT_EQ(result.rooms_[0].getWindows().size(), 2u);
	EXPECT_EQ(result.rooms_[0].getWindows()[0].getTag(), "W1");
	EXPECT_EQ(result.rooms_[0].getWindows()[1].getTag(), "W2");
	ASSERT_EQ(result.rooms_[1].getWindows().size(), 2u);
	EXPECT_EQ(result.rooms_[1].getWindows()[0].getTag(), "W3");
	EXPECT_EQ(result.rooms_[1].getWindows()[1].getTag(), "W4");
	EXPECT_TRUE(result.unmatchedWindows_.empty());
}

TEST(RoomAssemblerTest, MissingSillHeightIsDefaulted)
{
	WindowRecord window = makeWindow("A", "W1");
	window.sillHeight_.reset();

	RoomAssembler assembler(0.35);
	AssemblyResult result = assembler.assemble({ makeRoom("A", "Study", 3.0, 3.0, 2.5) }, { window, makeWindow("A", "W2") });

	ASSERT_EQ(result.rooms_[0].getWindows().size(), 2u);
	EXPECT_DOUBLE_EQ(result.rooms_[0].getWindows()[0].getSillHeight(), 0.35);
	EXPECT_DOUBLE_EQ(result.rooms_[0].getWindows()[1].getSillHeight(), 0.9);
}

TEST(RoomAssemblerTest, DuplicateCodeKeepsFirstRoom)
{
	RoomAssembler assembler(0.1);
	AssemblyResult result = assembler.assemble(
		{ makeRoom("A", "First", 3.0, 3.0, 2.5), makeRoom("A", "Second", 9.0, 9.0, 2.5) },
		{ makeWindow("A", "W1") }
	);

	ASSERT_EQ(result.rooms_.size(), 1u);
	EXPECT_EQ(result.rooms_[0].getDisplayName(), "First");
	EXPECT_EQ(result.rooms_[0].getWindows().size(), 1u);
	ASSERT_EQ(result.duplicateRoomCodes_.size(), 1u);
	EXPECT_EQ(result.duplicateRoomCodes_[0], "A");
}

TEST(RoomAssemblerTest, EmptyInput)
{
	RoomAssembler assembler(0.1);
	AssemblyResult result = assembler.assemble({}, { makeWindow("A", "W1") });
	EXPECT_TRUE(result.rooms_.empty());
	EXPECT_EQ(result.unmatchedWindows_.size(), 1u);
}

TEST(RoomAssemblerTest, WindowPlaceability)
{
	WindowRecord placeable = makeWindow("A", "W1");
	EXPECT_TRUE(Window(placeable, 0.1).isPlaceable());

	WindowRecord noWall = makeWindow("A", "W2");
	noWall.hasWall_ = false;
	EXPECT_FALSE(Window(noWall, 0.1).isPlaceable());

	WindowRecord unresolved = makeWindow("A", "W3");
	unresolved.wallOrientation_ = Orientation::Unknown;
	EXPECT_FALSE(Window(unresolved, 0.1).isPlaceable());

	WindowRecord outOfRange = makeWindow("A", "W4");
	outOfRange.inRange_ = false;
	EXPECT_FALSE(Window(outOfRange, 0.1).isPlaceable());
}
