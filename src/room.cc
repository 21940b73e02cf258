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

#include "absl/strings/str_format.h"

namespace kripke {

absl::StatusOr<RoomMap> RoomMap::FromProto(const GameSetup& setup) {
  RoomMap rooms;
  for (const auto& room : setup.rooms()) {
    if (room.name().empty()) {
      return absl::InvalidArgumentError("Room name cannot be empty string");
    }
    if (rooms.HasRoom(room.name())) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate room %s", room.name()));
    }
    rooms.adjacency_[room.name()];
  }
  for (const auto& room : setup.rooms()) {
    for (const string& other : room.connections()) {
      if (!rooms.HasRoom(other)) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Room %s connects to unknown room %s", room.name(), other));
      }
      if (other == room.name()) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Room %s connects to itself", other));
      }
      rooms.adjacency_[room.name()].insert(other);
      rooms.adjacency_[other].insert(room.name());
    }
  }
  if (!rooms.HasRoom(setup.meeting_room())) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unknown meeting room \"%s\"", setup.meeting_room()));
  }
  if (!rooms.adjacency_[setup.meeting_room()].empty()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Meeting room %s must not connect to any room", setup.meeting_room()));
  }
  rooms.meeting_room_ = setup.meeting_room();
  return rooms;
}

bool RoomMap::AreConnected(const string& from, const string& to) const {
  const auto it = adjacency_.find(from);
  return it != adjacency_.end() && it->second.count(to) > 0;
}

vector<string> RoomMap::ConnectedRooms(const string& room) const {
  const auto it = adjacency_.find(room);
  if (it == adjacency_.end()) {
    return {};
  }
  return vector<string>(it->second.begin(), it->second.end());
}

vector<string> RoomMap::RoomNames() const {
  vector<string> result;
  for (const auto& [name, unused] : adjacency_) {
    if (name != meeting_room_) {
      result.push_back(name);
    }
  }
  return result;
}

}  // namespace kripke
