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

#ifndef SRC_ROOM_H_
#define SRC_ROOM_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "src/game_log.pb.h"

namespace kripke {

using std::map;
using std::set;
using std::string;
using std::vector;

// Room connectivity. Edges are bidirectional; the meeting room has none, so
// nobody can walk in or out of it during a meeting.
class RoomMap {
 public:
  static absl::StatusOr<RoomMap> FromProto(const GameSetup& setup);

  bool HasRoom(const string& room) const {
    return adjacency_.find(room) != adjacency_.end();
  }
  bool AreConnected(const string& from, const string& to) const;
  // Sorted, empty for unknown rooms.
  vector<string> ConnectedRooms(const string& room) const;
  // All rooms but the meeting room, sorted.
  vector<string> RoomNames() const;
  const string& MeetingRoom() const { return meeting_room_; }

 private:
  RoomMap() = default;

  map<string, set<string>> adjacency_;
  string meeting_room_;
};

}  // namespace kripke

#endif  // SRC_ROOM_H_
