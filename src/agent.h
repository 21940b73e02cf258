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

#ifndef SRC_AGENT_H_
#define SRC_AGENT_H_

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "src/event.h"
#include "src/game_log.pb.h"
#include "src/memory.h"
#include "src/possible_world.h"

namespace kripke {

using std::string;
using std::unordered_map;
using std::vector;

// Suspicion deltas applied on hearsay.
const double kAccusationSuspicion = 0.1;
const double kSabotageSuspicion = 0.2;

// The Kripke model of one agent: the worlds it still considers possible,
// plus everything it remembers in arrival order.
struct Knowledge {
  vector<PossibleWorld> worlds;
  vector<MemoryItem> memory;
};

// An agent and its belief store. The World owns all agents and is the only
// caller of the mutators below.
class Agent {
 public:
  // Worlds are the initial candidates; the agent's own role has to hold in
  // every one of them.
  Agent(const string& name, int index, Role role, const string& location,
        int num_bad, vector<PossibleWorld> worlds);

  const string& Name() const { return name_; }
  int Index() const { return index_; }
  Role GetRole() const { return role_; }
  bool IsAlive() const { return life_state_ == ALIVE; }
  LifeState GetLifeState() const { return life_state_; }
  Behavior GetBehavior() const { return behavior_; }
  // Empty once the agent's body was removed.
  const string& Location() const { return location_; }
  ActionKind LastAction() const { return last_action_; }
  int NumAgents() const { return num_agents_; }
  int NumBad() const { return num_bad_; }

  const vector<PossibleWorld>& Worlds() const { return knowledge_.worlds; }
  const vector<MemoryItem>& Memory() const { return knowledge_.memory; }
  // Returns the number of candidate worlds in which the agent is bad.
  int CountWorldsWhereBad(int agent) const;
  double Suspicion(int agent) const;
  const unordered_map<int, double>& SuspicionMap() const { return suspicion_; }

  void SetLocation(const string& location) { location_ = location; }
  void SetBehavior(Behavior behavior) { behavior_ = behavior; }
  void SetLastAction(ActionKind action) { last_action_ = action; }
  void Kill();

  // NPC scheduling, in simulation seconds.
  double NextActionTime() const { return next_action_time_; }
  double LastActionTime() const { return last_action_time_; }
  void SetNextActionTime(double t) { next_action_time_ = t; }
  void SetLastActionTime(double t) { last_action_time_ = t; }

  // Appends to the memory log. Items are never removed.
  void UpdateKnowledge(const MemoryItem& item);
  // Updates the worlds and suspicion from one memory item. FACT items
  // eliminate inconsistent worlds, UNCERTAIN items only move suspicion. The
  // event itself is never touched.
  void UpdateBelief(const MemoryItem& item);

 private:
  void UpdateBeliefHard(const internal::Event& event);
  void UpdateBeliefSoft(const internal::Event& event);
  // Keeps the worlds satisfying the predicate. An elimination that would
  // leave no world is a contradiction: it is logged and skipped.
  void Eliminate(const std::function<bool(const PossibleWorld&)>& keep,
                 const string& reason);
  void AddSuspicion(int agent, double delta);

  string name_;
  int index_;
  Role role_;
  LifeState life_state_ = ALIVE;
  Behavior behavior_ = IDLE;
  string location_;
  ActionKind last_action_ = ACTION_KIND_UNSPECIFIED;
  int num_agents_;
  int num_bad_;  // Known to everyone from the setup.
  Knowledge knowledge_;
  unordered_map<int, double> suspicion_;  // x other agent, never negative.
  double next_action_time_ = 0;
  double last_action_time_ = 0;
};

}  // namespace kripke

#endif  // SRC_AGENT_H_
