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

#ifndef SRC_SETUP_H_
#define SRC_SETUP_H_

#include <cstdint>

#include "absl/status/status.h"
#include "src/game_log.pb.h"

namespace kripke {

const double kDefaultMeetingStepInterval = 2.0;
const double kDefaultMeetingInterval = 60.0;
const double kDefaultEmergencyCooldown = 20.0;

// Checks that a setup describes a playable game: unique agent names, every
// agent with a role and a starting room, at least one agent of each team, and
// a valid isolated meeting room.
absl::Status ValidateSetup(const GameSetup& setup);

// The four-room diamond map (A-B, A-C, B-D, C-D) plus an isolated meeting
// room, with agents npc0..npc<num_agents-1> spread over the rooms and
// num_bad of them, chosen by the seed, bad.
GameSetup DefaultSetup(int num_agents = 8, int num_bad = 2, int64_t seed = 0);

}  // namespace kripke

#endif  // SRC_SETUP_H_
