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

#include "src/policy.h"

#include <algorithm>
#include <vector>

#include "absl/random/distributions.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "src/world.h"

namespace kripke {

using std::vector;

namespace {
// Picks a uniformly random element of a non-empty vector.
template<typename T>
const T& RandomElement(const vector<T>& v, absl::BitGenRef bitgen) {
  CHECK(!v.empty());
  return v[absl::Uniform<size_t>(bitgen, 0, v.size())];
}

vector<int> LivingOthers(const Agent& agent, const World& world) {
  vector<int> result;
  for (int i : world.LivingAgents()) {
    if (i != agent.Index()) {
      result.push_back(i);
    }
  }
  return result;
}

// The living agent with the highest suspicion above the threshold, lowest
// index first on ties.
int PrimeSuspect(const Agent& agent, const World& world) {
  int suspect = kNoAgent;
  double max_suspicion = kHighSuspicion;
  for (int i : LivingOthers(agent, world)) {
    if (agent.Suspicion(i) > max_suspicion) {
      max_suspicion = agent.Suspicion(i);
      suspect = i;
    }
  }
  return suspect;
}

// The living agents that are bad in the most candidate worlds.
vector<int> MostLikelyBad(const Agent& agent, const World& world,
                          int* max_count) {
  vector<int> result;
  *max_count = 0;
  for (int i : LivingOthers(agent, world)) {
    const int count = agent.CountWorldsWhereBad(i);
    if (count > *max_count) {
      *max_count = count;
      result = {i};
    } else if (count == *max_count && count > 0) {
      result.push_back(i);
    }
  }
  return result;
}

Action Wander(const Agent& agent, const World& world,
              absl::BitGenRef bitgen) {
  if (absl::Bernoulli(bitgen, 0.5)) {
    const vector<string> adjacent =
        world.Rooms().ConnectedRooms(agent.Location());
    if (!adjacent.empty()) {
      return Action::Enter(RandomElement(adjacent, bitgen));
    }
    return Action::Idle();
  }
  return Action::Task();
}

internal::Statement Accuse(const Agent& agent, int suspect) {
  return NewStatement(PREDICATE_ROLE, suspect, Role_Name(BAD), agent.Index());
}

// The partners a bad agent was told about at setup.
vector<int> LivingPartners(const Agent& agent, const World& world) {
  vector<int> result;
  const PossibleWorld& truth = agent.Worlds().front();
  for (int i : LivingOthers(agent, world)) {
    if (truth.IsBad(i)) {
      result.push_back(i);
    }
  }
  return result;
}

vector<int> LivingGood(const Agent& agent, const World& world) {
  vector<int> result;
  const PossibleWorld& truth = agent.Worlds().front();
  for (int i : LivingOthers(agent, world)) {
    if (truth.IsGood(i)) {
      result.push_back(i);
    }
  }
  return result;
}
}  // namespace

string ActionDebugString(const Action& action,
                         absl::Span<const string> names) {
  switch (action.kind) {
    case Action::kIdle:
      return "idle";
    case Action::kTask:
      return "task";
    case Action::kEnter:
      return absl::StrFormat("enter %s", action.room);
    case Action::kKill:
      return absl::StrFormat(
          "kill %s", action.target == kNoAgent ? "?" : names[action.target]);
    case Action::kSabotage:
      return "sabotage";
    case Action::kReport:
      return "report";
  }
  return "?";
}

Action GoodPolicy::ChooseAction(const Agent& agent, const World& world,
                                absl::BitGenRef bitgen) const {
  if (!world.DeadAgentsAt(agent.Location()).empty()) {
    return Action::Report();
  }
  const int num_worlds = agent.Worlds().size();
  if (num_worlds <= kEmergencyWorldsThreshold &&
      world.TimeSinceLastMeeting() >= world.EmergencyCooldown()) {
    return Action::Report();
  }
  const int suspect = PrimeSuspect(agent, world);
  if (suspect != kNoAgent) {
    const string& target_room = world.GetAgent(suspect).Location();
    if (target_room != agent.Location()) {
      if (world.Rooms().AreConnected(agent.Location(), target_room)) {
        return Action::Enter(target_room);
      }
      const vector<string> adjacent =
          world.Rooms().ConnectedRooms(agent.Location());
      if (!adjacent.empty()) {
        return Action::Enter(RandomElement(adjacent, bitgen));
      }
    }
  }
  if (absl::Bernoulli(bitgen, 0.8)) {
    return Wander(agent, world, bitgen);
  }
  return Action::Idle();
}

optional<internal::Statement> GoodPolicy::ChooseStatement(
    const Agent& agent, const World& world, absl::BitGenRef bitgen) const {
  const int self = agent.Index();
  // Killers seen first hand, latest first.
  const vector<MemoryItem>& memory = agent.Memory();
  for (auto it = memory.rbegin(); it != memory.rend(); ++it) {
    const internal::Event& event = it->GetEvent();
    if (it->IsFact() && event.action == KILL && event.actor != self &&
        world.GetAgent(event.actor).IsAlive()) {
      return Accuse(agent, event.actor);
    }
  }
  const int suspect = PrimeSuspect(agent, world);
  if (suspect != kNoAgent) {
    return Accuse(agent, suspect);
  }
  int max_count;
  const vector<int> likely_bad = MostLikelyBad(agent, world, &max_count);
  if (likely_bad.size() == 1 &&
      2 * max_count >= static_cast<int>(agent.Worlds().size()) &&
      absl::Bernoulli(bitgen, 0.7)) {
    return Accuse(agent, likely_bad[0]);
  }
  // Share the latest sighting of somebody else.
  for (auto it = memory.rbegin(); it != memory.rend(); ++it) {
    const internal::Event& event = it->GetEvent();
    if (it->IsFact() && event.action == ENTER && event.actor != self) {
      return NewStatement(PREDICATE_LOCATION, event.actor, event.location,
                          self);
    }
  }
  const string& where = world.PreMeetingLocation(self);
  if (!where.empty() && absl::Bernoulli(bitgen, 0.5)) {
    return NewStatement(PREDICATE_LOCATION, self, where, self);
  }
  return NewStatement(PREDICATE_DID, self, kDidTask, self);
}

int GoodPolicy::ChooseVote(const Agent& agent, const World& world,
                           absl::BitGenRef bitgen) const {
  int max_count;
  const vector<int> candidates = MostLikelyBad(agent, world, &max_count);
  if (candidates.empty()) {
    return kNoAgent;
  }
  if (candidates.size() == 1) {
    return candidates[0];
  }
  // Tie: only a unique positive suspicion decides.
  int best = kNoAgent;
  double max_suspicion = 0;
  bool unique = false;
  for (int i : candidates) {
    const double suspicion = agent.Suspicion(i);
    if (suspicion > max_suspicion) {
      max_suspicion = suspicion;
      best = i;
      unique = true;
    } else if (suspicion == max_suspicion) {
      unique = false;
    }
  }
  return unique ? best : kNoAgent;
}

int BadPolicy::KillTarget(const Agent& agent, const World& world) {
  vector<int> others;
  for (int i : world.AgentsAt(agent.Location())) {
    if (i != agent.Index()) {
      others.push_back(i);
    }
  }
  if (others.size() == 1 && agent.Worlds().front().IsGood(others[0])) {
    return others[0];
  }
  return kNoAgent;
}

Action BadPolicy::ChooseAction(const Agent& agent, const World& world,
                               absl::BitGenRef bitgen) const {
  const int target = KillTarget(agent, world);
  if (target != kNoAgent) {
    return Action::Kill(target);
  }
  if (absl::Bernoulli(bitgen, 0.1)) {
    return Action::Sabotage();
  }
  if (absl::Bernoulli(bitgen, 0.3)) {
    return Wander(agent, world, bitgen);
  }
  return Action::Idle();
}

optional<internal::Statement> BadPolicy::ChooseStatement(
    const Agent& agent, const World& world, absl::BitGenRef bitgen) const {
  const int self = agent.Index();
  const auto& meeting = world.Meeting();
  const string& where = world.PreMeetingLocation(self);
  if (meeting.has_value() && !meeting->body_location.empty() &&
      where == meeting->body_location) {
    vector<string> elsewhere;
    for (const string& room : world.Rooms().RoomNames()) {
      if (room != where) {
        elsewhere.push_back(room);
      }
    }
    if (!elsewhere.empty()) {
      return NewStatement(PREDICATE_LOCATION, self,
                          RandomElement(elsewhere, bitgen), self);
    }
  }
  const vector<int> good = LivingGood(agent, world);
  const vector<int> partners = LivingPartners(agent, world);
  const double r = absl::Uniform(bitgen, 0.0, 1.0);
  if (r < 0.5) {
    if (!good.empty()) {
      return Accuse(agent, RandomElement(good, bitgen));
    }
  } else if (r < 0.8) {
    // Confusion: a false sighting of somebody else.
    const vector<int> others = LivingOthers(agent, world);
    const vector<string> rooms = world.Rooms().RoomNames();
    if (!others.empty() && !rooms.empty()) {
      return NewStatement(PREDICATE_LOCATION, RandomElement(others, bitgen),
                          RandomElement(rooms, bitgen), self);
    }
  } else if (!partners.empty()) {
    return NewStatement(PREDICATE_ROLE, RandomElement(partners, bitgen),
                        Role_Name(GOOD), self);
  }
  return NewStatement(PREDICATE_DID, self, kDidTask, self);
}

int BadPolicy::ChooseVote(const Agent& agent, const World& world,
                          absl::BitGenRef bitgen) const {
  const vector<int> others = LivingOthers(agent, world);
  if (others.empty()) {
    return kNoAgent;
  }
  const vector<int> good = LivingGood(agent, world);
  if (!good.empty() && absl::Bernoulli(bitgen, 0.8)) {
    return RandomElement(good, bitgen);
  }
  return RandomElement(others, bitgen);
}

Policy PolicyForRole(Role role) {
  switch (role) {
    case GOOD:
      return GoodPolicy();
    case BAD:
      return BadPolicy();
    default:
      CHECK(false) << "No policy for role " << Role_Name(role);
  }
  return GoodPolicy();
}

Action ChooseAction(const Policy& policy, const Agent& agent,
                    const World& world, absl::BitGenRef bitgen) {
  return std::visit([&](const auto& p) {
    return p.ChooseAction(agent, world, bitgen);
  }, policy);
}

optional<internal::Statement> ChooseStatement(const Policy& policy,
                                              const Agent& agent,
                                              const World& world,
                                              absl::BitGenRef bitgen) {
  return std::visit([&](const auto& p) {
    return p.ChooseStatement(agent, world, bitgen);
  }, policy);
}

int ChooseVote(const Policy& policy, const Agent& agent, const World& world,
               absl::BitGenRef bitgen) {
  return std::visit([&](const auto& p) {
    return p.ChooseVote(agent, world, bitgen);
  }, policy);
}

}  // namespace kripke
