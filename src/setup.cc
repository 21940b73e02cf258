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

#include "src/setup.h"

#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "src/room.h"

namespace kripke {

using std::string;
using std::unordered_set;
using std::vector;

absl::Status ValidateSetup(const GameSetup& setup) {
  const auto rooms = RoomMap::FromProto(setup);
  if (!rooms.ok()) {
    return rooms.status();
  }
  if (setup.agents_size() < 2) {
    return absl::InvalidArgumentError("A game needs at least two agents");
  }
  unordered_set<string> names;
  int num_bad = 0;
  for (const auto& agent : setup.agents()) {
    if (agent.name().empty()) {
      return absl::InvalidArgumentError("Agent name cannot be empty string");
    }
    if (!names.insert(agent.name()).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate agent name %s", agent.name()));
    }
    if (agent.role() != GOOD && agent.role() != BAD) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Agent %s has no role", agent.name()));
    }
    if (!rooms->HasRoom(agent.location()) ||
        agent.location() == rooms->MeetingRoom()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Agent %s starts in invalid room \"%s\"", agent.name(),
          agent.location()));
    }
    if (agent.role() == BAD) {
      ++num_bad;
    }
  }
  if (num_bad == 0 || num_bad >= setup.agents_size() - num_bad) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%d bad agents out of %d is not a playable game", num_bad,
        setup.agents_size()));
  }
  if (setup.meeting_step_interval() <= 0) {
    return absl::InvalidArgumentError("Meeting step interval must be positive");
  }
  if (setup.meeting_interval() < 0 || setup.emergency_cooldown() < 0) {
    return absl::InvalidArgumentError("Meeting timers cannot be negative");
  }
  return absl::OkStatus();
}

GameSetup DefaultSetup(int num_agents, int num_bad, int64_t seed) {
  CHECK(num_bad > 0 && num_bad < num_agents - num_bad)
      << num_bad << " bad agents out of " << num_agents;
  GameSetup setup;
  const vector<std::pair<string, vector<string>>> diamond = {
      {"A", {"B", "C"}}, {"B", {"A", "D"}}, {"C", {"A", "D"}},
      {"D", {"B", "C"}}};
  for (const auto& [name, connections] : diamond) {
    RoomSetup* room = setup.add_rooms();
    room->set_name(name);
    for (const string& other : connections) {
      room->add_connections(other);
    }
  }
  setup.add_rooms()->set_name("Meeting");
  setup.set_meeting_room("Meeting");
  setup.set_seed(seed);
  setup.set_meeting_step_interval(kDefaultMeetingStepInterval);
  setup.set_meeting_interval(kDefaultMeetingInterval);
  setup.set_emergency_cooldown(kDefaultEmergencyCooldown);

  // Partial Fisher-Yates over the agent indices picks the bad agents.
  std::mt19937_64 rng(seed);
  vector<int> order(num_agents);
  for (int i = 0; i < num_agents; ++i) {
    order[i] = i;
  }
  vector<Role> roles(num_agents, GOOD);
  for (int i = 0; i < num_bad; ++i) {
    const int j = absl::Uniform<int>(rng, i, num_agents);
    std::swap(order[i], order[j]);
    roles[order[i]] = BAD;
  }
  for (int i = 0; i < num_agents; ++i) {
    AgentSetup* agent = setup.add_agents();
    agent->set_name(absl::StrFormat("npc%d", i));
    agent->set_role(roles[i]);
    agent->set_location(diamond[i % diamond.size()].first);
  }
  return setup;
}

}  // namespace kripke
