// Copyright 2022 Ola Rozenfeld
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "src/room.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/setup.h"

namespace kripke {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;

TEST(RoomMap, Diamond) {
  const auto rooms = RoomMap::FromProto(DefaultSetup());
  ASSERT_TRUE(rooms.ok()) << rooms.status();
  EXPECT_THAT(rooms->RoomNames(), ElementsAre("A", "B", "C", "D"));
  EXPECT_EQ(rooms->MeetingRoom(), "Meeting");
  EXPECT_TRUE(rooms->HasRoom("Meeting"));
  EXPECT_TRUE(rooms->AreConnected("A", "B"));
  EXPECT_TRUE(rooms->AreConnected("B", "A"));
  EXPECT_FALSE(rooms->AreConnected("A", "D"));
  EXPECT_FALSE(rooms->AreConnected("A", "Nowhere"));
  EXPECT_THAT(rooms->ConnectedRooms("D"), ElementsAre("B", "C"));
  EXPECT_THAT(rooms->ConnectedRooms("Meeting"), IsEmpty());
  EXPECT_THAT(rooms->ConnectedRooms("Nowhere"), IsEmpty());
}

TEST(RoomMap, OneWayConnectionsAreBidirectional) {
  GameSetup setup;
  RoomSetup* hall = setup.add_rooms();
  hall->set_name("Hall");
  hall->add_connections("Kitchen");
  setup.add_rooms()->set_name("Kitchen");
  setup.add_rooms()->set_name("Cafeteria");
  setup.set_meeting_room("Cafeteria");
  const auto rooms = RoomMap::FromProto(setup);
  ASSERT_TRUE(rooms.ok()) << rooms.status();
  EXPECT_TRUE(rooms->AreConnected("Kitchen", "Hall"));
}

TEST(RoomMap, InvalidMaps) {
  GameSetup setup = DefaultSetup();
  setup.mutable_rooms(0)->add_connections("Nowhere");
  EXPECT_THAT(RoomMap::FromProto(setup).status().message(),
              HasSubstr("unknown room Nowhere"));

  setup = DefaultSetup();
  setup.mutable_rooms(0)->add_connections("A");
  EXPECT_THAT(RoomMap::FromProto(setup).status().message(),
              HasSubstr("connects to itself"));

  setup = DefaultSetup();
  setup.add_rooms()->set_name("B");
  EXPECT_THAT(RoomMap::FromProto(setup).status().message(),
              HasSubstr("Duplicate room B"));

  setup = DefaultSetup();
  setup.set_meeting_room("Lobby");
  EXPECT_THAT(RoomMap::FromProto(setup).status().message(),
              HasSubstr("Unknown meeting room"));

  setup = DefaultSetup();
  setup.mutable_rooms(0)->add_connections("Meeting");
  EXPECT_THAT(RoomMap::FromProto(setup).status().message(),
              HasSubstr("must not connect"));
}

}  // namespace
}  // namespace kripke

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
