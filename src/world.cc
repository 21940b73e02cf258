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

#include "src/world.h"

#include <algorithm>
#include <utility>

#include "absl/random/distributions.h"
#include "absl/status/status.h"
#include "ortools/base/logging.h"
#include "src/setup.h"

namespace kripke {

namespace {
RoomMap ValidatedRooms(const GameSetup& setup) {
  const absl::Status st = ValidateSetup(setup);
  CHECK(st.ok()) << st;
  return *RoomMap::FromProto(setup);
}
}  // namespace

World::World(const GameSetup& setup)
    : setup_(setup), rooms_(ValidatedRooms(setup)), rng_(setup.seed()) {
  vector<Role> roles;
  for (const auto& agent : setup.agents()) {
    names_.push_back(agent.name());
    roles.push_back(agent.role());
  }
  const int num_bad = std::count(roles.begin(), roles.end(), BAD);
  for (int i = 0; i < roles.size(); ++i) {
    agents_.emplace_back(names_[i], i, roles[i], setup.agents(i).location(),
                         num_bad, InitialWorlds(roles, i));
    policies_.push_back(PolicyForRole(roles[i]));
    agents_[i].SetNextActionTime(
        absl::Uniform(rng_, kMinInitialDelay, kMaxInitialDelay));
  }
  *log_.mutable_setup() = setup;
  LOG(INFO) << "Starting game of " << agents_.size() << " agents, " << num_bad
            << " bad";
}

const Agent& World::GetAgent(int index) const {
  CHECK(IsValidAgent(index)) << "Invalid agent index " << index;
  return agents_[index];
}

Agent& World::MutableAgent(int index) {
  CHECK(IsValidAgent(index)) << "Invalid agent index " << index;
  return agents_[index];
}

const Agent* World::AgentById(const string& name) const {
  const int i = AgentIndex(name);
  return i == kNoAgent ? nullptr : &agents_[i];
}

int World::AgentIndex(const string& name) const {
  const auto it = std::find(names_.begin(), names_.end(), name);
  return it == names_.end() ? kNoAgent : it - names_.begin();
}

vector<int> World::LivingAgents() const {
  vector<int> result;
  for (const Agent& agent : agents_) {
    if (agent.IsAlive()) {
      result.push_back(agent.Index());
    }
  }
  return result;
}

vector<int> World::AgentsAt(const string& location) const {
  vector<int> result;
  for (const Agent& agent : agents_) {
    if (agent.IsAlive() && agent.Location() == location) {
      result.push_back(agent.Index());
    }
  }
  return result;
}

vector<int> World::DeadAgentsAt(const string& location) const {
  vector<int> result;
  if (location.empty()) {
    return result;  // Removed bodies are nowhere.
  }
  for (const Agent& agent : agents_) {
    if (!agent.IsAlive() && agent.Location() == location) {
      result.push_back(agent.Index());
    }
  }
  return result;
}

const string& World::PreMeetingLocation(int agent) const {
  CHECK(IsValidAgent(agent)) << "Invalid agent index " << agent;
  if (meeting_.has_value()) {
    return meeting_->restore_locations[agent];
  }
  return agents_[agent].Location();
}

void World::Advance(double delta_time) {
  CHECK_GE(delta_time, 0) << "Time only moves forward";
  if (IsGameOver()) {
    return;
  }
  ++turn_count_;
  if (phase_ == MEETING) {
    UpdateMeeting(delta_time);
  } else {
    UpdatePlaying(delta_time);
  }
}

void World::UpdatePlaying(double delta_time) {
  elapsed_time_ += delta_time;
  for (int i = 0; i < agents_.size() && phase_ == PLAYING && !IsGameOver();
       ++i) {
    Agent& agent = agents_[i];
    if (!agent.IsAlive()) {
      continue;
    }
    if (agent.GetRole() == BAD &&
        elapsed_time_ - agent.LastActionTime() >= kKillCheckInterval) {
      const int target = BadPolicy::KillTarget(agent, *this);
      if (target != kNoAgent && Kill(i, target) != nullptr) {
        agent.SetLastActionTime(elapsed_time_);
        agent.SetNextActionTime(elapsed_time_ + kKillCheckInterval);
        continue;
      }
    }
    if (elapsed_time_ >= agent.NextActionTime()) {
      const Action action = ChooseAction(policies_[i], agent, *this, rng_);
      VLOG(1) << names_[i] << " decides: " << ActionDebugString(action, names_);
      Apply(i, action);
      agent.SetLastActionTime(elapsed_time_);
      agent.SetNextActionTime(elapsed_time_ + absl::Uniform(
          rng_, kMinActionDelay, kMaxActionDelay));
    }
  }
  CheckGameOver();
  if (!IsGameOver() && phase_ == PLAYING && setup_.meeting_interval() > 0 &&
      TimeSinceLastMeeting() >= setup_.meeting_interval()) {
    StartMeeting(kNoAgent, "");
  }
}

void World::UpdateMeeting(double delta_time) {
  CHECK(meeting_.has_value()) << "Meeting phase without a meeting";
  meeting_->timer += delta_time;
  if (meeting_->timer < setup_.meeting_step_interval()) {
    return;
  }
  // One unit of work per tick, however much time has passed.
  meeting_->timer -= setup_.meeting_step_interval();
  switch (meeting_->step) {
    case STATEMENTS:
      RunStatementUnit();
      break;
    case VOTING_STEP:
      RunVotingUnit();
      break;
    case RESULT:
      RunResultUnit();
      break;
    default:
      CHECK(false) << "Invalid meeting step "
                   << MeetingStep_Name(meeting_->step);
  }
}

void World::RunStatementUnit() {
  deque<int>& queue = meeting_->speaking_queue;
  while (!queue.empty()) {
    const int speaker = queue.front();
    queue.pop_front();
    if (!agents_[speaker].IsAlive()) {
      continue;  // The dead don't speak.
    }
    const auto statement =
        ChooseStatement(policies_[speaker], agents_[speaker], *this, rng_);
    if (statement.has_value()) {
      Say(*statement);
    }
    break;
  }
  if (queue.empty()) {
    meeting_->step = VOTING_STEP;
    LOG(INFO) << "Statements are over, voting";
  }
}

void World::RunVotingUnit() {
  meeting_->votes.clear();
  for (int voter : LivingAgents()) {
    const int target =
        ChooseVote(policies_[voter], agents_[voter], *this, rng_);
    if (target == kNoAgent) {
      continue;
    }
    if (!IsValidVote(voter, target)) {
      VLOG(1) << names_[voter] << " cast an invalid vote, counted as "
              << "abstention";
      continue;
    }
    meeting_->votes[voter] = target;
  }
  meeting_->step = RESULT;
}

void World::RunResultUnit() {
  map<int, int> tally;
  for (const auto& [voter, target] : meeting_->votes) {
    ++tally[target];
  }
  int ejected = kNoAgent;
  int max_votes = 0;
  for (const auto& [target, count] : tally) {
    if (count > max_votes) {
      max_votes = count;
      ejected = target;
    } else if (count == max_votes) {
      ejected = kNoAgent;  // Tie.
    }
  }
  if (ejected != kNoAgent) {
    Agent& agent = agents_[ejected];
    agent.Kill();
    agent.SetLocation("");
  }
  const Team winner = EvaluateWinner();
  internal::VoteResult vote_result = {
      .ejected = ejected, .game_over = winner != TEAM_UNSPECIFIED,
      .votes = meeting_->votes};
  for (const Agent& agent : agents_) {
    if (!agent.IsAlive()) {
      vote_result.dead.push_back(agent.Index());
    }
  }
  Distribute({.action = VOTE_RESULT, .location = rooms_.MeetingRoom(),
              .timestamp = elapsed_time_, .visibility = PUBLIC,
              .vote_result = std::move(vote_result)});
  CheckGameOver();
  if (!IsGameOver()) {
    EndMeeting();
  }
}

void World::EndMeeting() {
  for (Agent& agent : agents_) {
    if (agent.IsAlive()) {
      agent.SetLocation(meeting_->restore_locations[agent.Index()]);
      agent.SetBehavior(IDLE);
    }
  }
  meeting_.reset();
  phase_ = PLAYING;
  last_meeting_time_ = elapsed_time_;
  LOG(INFO) << "Meeting is over, back to play";
}

void World::StartMeeting(int reporter, const string& body_location) {
  CHECK_EQ(phase_, PLAYING) << "A meeting is already in progress";
  CHECK(!IsGameOver()) << "Game is over";
  internal::MeetingSession meeting;
  meeting.reporter = reporter;
  meeting.body_location = body_location;
  for (Agent& agent : agents_) {
    meeting.restore_locations.push_back(agent.Location());
    if (agent.IsAlive()) {
      agent.SetLocation(rooms_.MeetingRoom());
      agent.SetBehavior(VOTING);
      meeting.speaking_queue.push_back(agent.Index());
    }
  }
  meeting_ = std::move(meeting);
  phase_ = MEETING;
  LOG(INFO) << "Meeting called by "
            << (reporter == kNoAgent ? "the timer" : names_[reporter])
            << (body_location.empty() ? ""
                                      : ", body found in " + body_location);
}

void World::OverrideVotesForTesting(const map<int, int>& votes) {
  CHECK(meeting_.has_value()) << "No meeting in progress";
  meeting_->votes.clear();
  for (const auto& [voter, target] : votes) {
    if (IsValidAgent(voter) && agents_[voter].IsAlive() &&
        IsValidVote(voter, target)) {
      meeting_->votes[voter] = target;
    }
  }
}

bool World::CanAct(int agent) const {
  return IsValidAgent(agent) && agents_[agent].IsAlive() &&
         phase_ == PLAYING && !IsGameOver();
}

bool World::IsValidVote(int voter, int target) const {
  return IsValidAgent(target) && target != voter && agents_[target].IsAlive();
}

bool World::IsValidStatement(const internal::Statement& statement) const {
  if (!statement.IsWellDefined() || !IsValidAgent(statement.speaker) ||
      !IsValidAgent(statement.subject) ||
      !agents_[statement.speaker].IsAlive()) {
    return false;
  }
  switch (statement.predicate) {
    case PREDICATE_ROLE:
      return statement.value == Role_Name(GOOD) ||
             statement.value == Role_Name(BAD);
    case PREDICATE_LOCATION:
      return rooms_.HasRoom(statement.value) &&
             statement.value != rooms_.MeetingRoom();
    case PREDICATE_DID:
      return statement.value == kDidTask;
    default:
      return false;
  }
}

Team World::EvaluateWinner() const {
  int num_good = 0, num_bad = 0;
  for (const Agent& agent : agents_) {
    if (!agent.IsAlive()) {
      continue;
    }
    if (agent.GetRole() == BAD) {
      ++num_bad;
    } else {
      ++num_good;
    }
  }
  if (num_bad == 0) {
    return TEAM_GOOD;
  }
  if (num_bad >= num_good) {
    return TEAM_BAD;
  }
  return TEAM_UNSPECIFIED;
}

void World::CheckGameOver() {
  if (IsGameOver()) {
    return;
  }
  result_ = EvaluateWinner();
  if (IsGameOver()) {
    LOG(INFO) << Team_Name(result_) << " wins after " << turn_count_
              << " turns";
  }
}

EventPtr World::Apply(int agent, const Action& action) {
  switch (action.kind) {
    case Action::kIdle:
    case Action::kTask:
      if (CanAct(agent)) {
        MutableAgent(agent).SetBehavior(action.kind == Action::kTask ? TASK
                                                                     : IDLE);
      }
      return nullptr;
    case Action::kEnter:
      return Enter(agent, action.room);
    case Action::kKill:
      return Kill(agent, action.target);
    case Action::kSabotage:
      return Sabotage(agent);
    case Action::kReport:
      return Report(agent);
  }
  return nullptr;
}

EventPtr World::Enter(int agent, const string& room) {
  if (!CanAct(agent) || !rooms_.AreConnected(agents_[agent].Location(), room)) {
    VLOG(1) << "Rejected: agent " << agent << " entering \"" << room << "\"";
    return nullptr;
  }
  Agent& mover = MutableAgent(agent);
  vector<int> witnesses = AgentsAt(room);
  mover.SetLocation(room);
  mover.SetBehavior(IDLE);
  mover.SetLastAction(ENTER);
  return Distribute({.action = ENTER, .actor = agent, .location = room,
                     .witnesses = witnesses, .timestamp = elapsed_time_,
                     .visibility = witnesses.empty() ? PRIVATE : WITNESSED});
}

EventPtr World::Kill(int killer, int victim) {
  if (!CanAct(killer) || agents_[killer].GetRole() != BAD ||
      !IsValidAgent(victim) || victim == killer ||
      !agents_[victim].IsAlive() ||
      agents_[victim].Location() != agents_[killer].Location()) {
    VLOG(1) << "Rejected: agent " << killer << " killing agent " << victim;
    return nullptr;
  }
  const string location = agents_[killer].Location();
  vector<int> witnesses;
  for (int i : AgentsAt(location)) {
    if (i != killer && i != victim) {
      witnesses.push_back(i);
    }
  }
  MutableAgent(victim).Kill();
  Agent& agent = MutableAgent(killer);
  agent.SetBehavior(IDLE);
  agent.SetLastAction(KILL);
  EventPtr event = Distribute({
      .action = KILL, .actor = killer, .location = location,
      .witnesses = witnesses, .timestamp = elapsed_time_,
      .visibility = witnesses.empty() ? PRIVATE : WITNESSED,
      .victim = victim});
  CheckGameOver();
  return event;
}

EventPtr World::Sabotage(int agent) {
  if (!CanAct(agent) || agents_[agent].GetRole() != BAD) {
    VLOG(1) << "Rejected: agent " << agent << " sabotaging";
    return nullptr;
  }
  Agent& saboteur = MutableAgent(agent);
  vector<int> witnesses;
  for (int i : AgentsAt(saboteur.Location())) {
    if (i != agent) {
      witnesses.push_back(i);
    }
  }
  saboteur.SetBehavior(IDLE);
  saboteur.SetLastAction(SABOTAGE);
  return Distribute({.action = SABOTAGE, .actor = agent,
                     .location = saboteur.Location(), .witnesses = witnesses,
                     .timestamp = elapsed_time_,
                     .visibility = witnesses.empty() ? PRIVATE : WITNESSED});
}

EventPtr World::Report(int agent) {
  if (!CanAct(agent)) {
    VLOG(1) << "Rejected: agent " << agent << " reporting";
    return nullptr;
  }
  Agent& reporter = MutableAgent(agent);
  const string location = reporter.Location();
  vector<int> witnesses;
  for (int i : LivingAgents()) {
    if (i != agent) {
      witnesses.push_back(i);
    }
  }
  reporter.SetLastAction(REPORT);
  EventPtr event = Distribute({.action = REPORT, .actor = agent,
                               .location = location, .witnesses = witnesses,
                               .timestamp = elapsed_time_,
                               .visibility = PUBLIC});
  const vector<int> bodies = DeadAgentsAt(location);
  for (int i : bodies) {
    MutableAgent(i).SetLocation("");
  }
  StartMeeting(agent, bodies.empty() ? "" : location);
  return event;
}

EventPtr World::Say(const internal::Statement& statement) {
  if (phase_ != MEETING || IsGameOver() || !IsValidStatement(statement)) {
    VLOG(1) << "Rejected statement by agent " << statement.speaker
            << " about agent " << statement.subject << ": "
            << statement.value;
    return nullptr;
  }
  internal::Statement said = statement;
  said.timestamp = elapsed_time_;
  Agent& speaker = MutableAgent(said.speaker);
  speaker.SetLastAction(SAY);
  vector<int> witnesses;
  for (int i : LivingAgents()) {
    if (i != said.speaker) {
      witnesses.push_back(i);
    }
  }
  return Distribute({.action = SAY, .actor = said.speaker,
                     .location = speaker.Location(), .witnesses = witnesses,
                     .timestamp = elapsed_time_, .visibility = PUBLIC,
                     .statement = said});
}

EventPtr World::Distribute(internal::Event event) {
  const EventPtr sealed = NewEvent(std::move(event));
  event_history_.push_back(sealed);
  *log_.add_events() = EventToProto(*sealed, names_);
  LOG(INFO) << EventDebugString(*sealed, names_);
  if (sealed->actor == kNoAgent) {
    // World announcements are seen first hand by everyone concerned,
    // including the agent that was just voted out.
    const int ejected = sealed->vote_result.has_value()
                            ? sealed->vote_result->ejected
                            : kNoAgent;
    for (const Agent& agent : agents_) {
      if (agent.IsAlive() || agent.Index() == ejected) {
        Deliver(agent.Index(), MemoryItem::Observation(sealed));
      }
    }
    return sealed;
  }
  Deliver(sealed->actor, MemoryItem::Observation(sealed));
  switch (sealed->visibility) {
    case WITNESSED:
      for (int i : sealed->witnesses) {
        Deliver(i, MemoryItem::Observation(sealed));
      }
      break;
    case PUBLIC:
      for (int i : LivingAgents()) {
        if (i != sealed->actor) {
          Deliver(i, MemoryItem::Hearsay(sealed, sealed->actor));
        }
      }
      break;
    default:
      break;
  }
  return sealed;
}

void World::Deliver(int recipient, const MemoryItem& item) {
  Agent& agent = MutableAgent(recipient);
  agent.UpdateKnowledge(item);
  agent.UpdateBelief(item);
}

WorldSnapshot World::Snapshot() const {
  WorldSnapshot snapshot;
  snapshot.set_phase(phase_);
  snapshot.set_elapsed_time(elapsed_time_);
  snapshot.set_turn_count(turn_count_);
  snapshot.set_result(result_);
  if (meeting_.has_value()) {
    snapshot.set_meeting_step(meeting_->step);
    snapshot.set_meeting_timer(meeting_->timer);
    for (int i : meeting_->speaking_queue) {
      snapshot.add_speaking_queue(names_[i]);
    }
  }
  for (const Agent& agent : agents_) {
    AgentSnapshot* pb = snapshot.add_agents();
    pb->set_name(agent.Name());
    pb->set_role(agent.GetRole());
    pb->set_life_state(agent.GetLifeState());
    pb->set_location(agent.Location());
    pb->set_behavior(agent.GetBehavior());
    pb->set_last_action(agent.LastAction());
    pb->set_num_worlds(agent.Worlds().size());
    pb->set_num_memories(agent.Memory().size());
    for (const auto& [other, suspicion] : agent.SuspicionMap()) {
      (*pb->mutable_suspicion())[names_[other]] = suspicion;
    }
  }
  return snapshot;
}

}  // namespace kripke
