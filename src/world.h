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

#ifndef SRC_WORLD_H_
#define SRC_WORLD_H_

#include <deque>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "src/agent.h"
#include "src/event.h"
#include "src/game_log.pb.h"
#include "src/policy.h"
#include "src/room.h"

namespace kripke {

using std::deque;
using std::map;
using std::optional;
using std::string;
using std::vector;

// Seconds a bad agent waits after acting before it takes a kill opportunity.
const double kKillCheckInterval = 2.0;
// Range of the delay between two scheduled NPC actions.
const double kMinActionDelay = 2.0;
const double kMaxActionDelay = 8.0;
const double kMinInitialDelay = 1.0;
const double kMaxInitialDelay = 5.0;

namespace internal {
// All the progress of a meeting lives here, so a meeting can be suspended
// between any two ticks.
struct MeetingSession {
  MeetingStep step = STATEMENTS;
  deque<int> speaking_queue;  // Ascending agent index.
  double timer = 0;
  // Location of every agent when the meeting started, restored afterwards.
  vector<string> restore_locations;
  map<int, int> votes;  // Voter -> target, abstentions omitted.
  int reporter = kNoAgent;  // kNoAgent for the periodic meeting.
  string body_location;  // Where the reported corpses lay, if any.
};
}  // namespace internal

// The simulation: owns the agents, the rooms and the phase, turns policy
// decisions into events, delivers the events to the right agents and runs
// the meeting state machine. The only mutator of game state.
class World {
 public:
  // CHECK-fails on setups that ValidateSetup rejects.
  explicit World(const GameSetup& setup);

  // Public state accessors.
  Phase CurrentPhase() const { return phase_; }
  // Simulation seconds spent playing; frozen during meetings.
  double ElapsedTime() const { return elapsed_time_; }
  int TurnCount() const { return turn_count_; }
  bool IsGameOver() const { return result_ != TEAM_UNSPECIFIED; }
  Team WinningTeam() const { return result_; }

  int NumAgents() const { return agents_.size(); }
  const vector<string>& AgentNames() const { return names_; }
  const Agent& GetAgent(int index) const;
  // Returns nullptr for unknown names.
  const Agent* AgentById(const string& name) const;
  int AgentIndex(const string& name) const;  // kNoAgent if unknown.
  vector<int> LivingAgents() const;
  // Living agents in the room.
  vector<int> AgentsAt(const string& location) const;
  // Unreported corpses in the room.
  vector<int> DeadAgentsAt(const string& location) const;
  const RoomMap& Rooms() const { return rooms_; }

  const optional<internal::MeetingSession>& Meeting() const {
    return meeting_;
  }
  // Where the agent was when the current meeting started, or its current
  // location outside meetings.
  const string& PreMeetingLocation(int agent) const;
  double TimeSinceLastMeeting() const {
    return elapsed_time_ - last_meeting_time_;
  }
  double EmergencyCooldown() const { return setup_.emergency_cooldown(); }

  // Runs one tick: the NPC pass while playing, or at most one unit of
  // meeting work. No-op once the game is over.
  void Advance(double delta_time);

  // Actions. Each returns the created event after delivering it, or nullptr
  // if the decision was invalid and nothing happened.
  EventPtr Apply(int agent, const Action& action);
  EventPtr Enter(int agent, const string& room);
  EventPtr Kill(int killer, int victim);
  EventPtr Sabotage(int agent);
  EventPtr Report(int agent);
  EventPtr Say(const internal::Statement& statement);

  // Moves everyone to the meeting room and queues the speakers.
  void StartMeeting(int reporter, const string& body_location);

  // Replaces the ballots collected in the voting step. Only valid votes are
  // kept.
  void OverrideVotesForTesting(const map<int, int>& votes);

  const vector<EventPtr>& EventHistory() const { return event_history_; }
  WorldSnapshot Snapshot() const;
  const GameLog& ToProto() const { return log_; }

 private:
  void UpdatePlaying(double delta_time);
  void UpdateMeeting(double delta_time);
  void RunStatementUnit();
  void RunVotingUnit();
  void RunResultUnit();
  void EndMeeting();

  bool IsValidAgent(int agent) const {
    return agent >= 0 && agent < agents_.size();
  }
  // Alive, playing, and the game is still on.
  bool CanAct(int agent) const;
  bool IsValidVote(int voter, int target) const;
  bool IsValidStatement(const internal::Statement& statement) const;
  // Good wins once no bad agent lives, bad wins at parity.
  Team EvaluateWinner() const;
  void CheckGameOver();
  // Seals the event, records it and hands every recipient its memory item.
  EventPtr Distribute(internal::Event event);
  void Deliver(int recipient, const MemoryItem& item);
  Agent& MutableAgent(int index);

  GameSetup setup_;
  RoomMap rooms_;
  vector<string> names_;
  vector<Agent> agents_;
  vector<Policy> policies_;  // x agent.
  std::mt19937_64 rng_;
  Phase phase_ = PLAYING;
  double elapsed_time_ = 0;
  double last_meeting_time_ = 0;
  int turn_count_ = 0;
  Team result_ = TEAM_UNSPECIFIED;
  optional<internal::MeetingSession> meeting_;
  vector<EventPtr> event_history_;
  GameLog log_;
};

}  // namespace kripke

#endif  // SRC_WORLD_H_
