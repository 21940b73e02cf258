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

#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ortools/base/logging.h"
#include "src/setup.h"

namespace kripke {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

// The diamond map, with the given agents and no periodic meetings.
GameSetup MakeSetup(const vector<Role>& roles, const vector<string>& rooms) {
  CHECK_EQ(roles.size(), rooms.size());
  GameSetup setup = DefaultSetup(8, 2, 7);
  setup.clear_agents();
  for (int i = 0; i < roles.size(); ++i) {
    AgentSetup* agent = setup.add_agents();
    agent->set_name(absl::StrFormat("npc%d", i));
    agent->set_role(roles[i]);
    agent->set_location(rooms[i]);
  }
  setup.set_meeting_interval(0);
  return setup;
}

// npc1 and npc4 are bad.
GameSetup SixAgents() {
  return MakeSetup({GOOD, BAD, GOOD, GOOD, BAD, GOOD},
                   {"A", "B", "C", "D", "A", "B"});
}

int CountEvents(const World& world, ActionKind action) {
  int count = 0;
  for (const auto& e : world.EventHistory()) {
    if (e->action == action) {
      ++count;
    }
  }
  return count;
}

void AdvanceUntilStep(World* world, MeetingStep step) {
  for (int i = 0; i < 100 && world->Meeting()->step != step; ++i) {
    world->Advance(1.0);
  }
  ASSERT_EQ(world->Meeting()->step, step);
}

TEST(World, InitialState) {
  const World world(SixAgents());
  EXPECT_EQ(world.CurrentPhase(), PLAYING);
  EXPECT_EQ(world.ElapsedTime(), 0);
  EXPECT_EQ(world.TurnCount(), 0);
  EXPECT_FALSE(world.IsGameOver());
  EXPECT_EQ(world.NumAgents(), 6);
  EXPECT_THAT(world.LivingAgents(), ElementsAre(0, 1, 2, 3, 4, 5));
  EXPECT_THAT(world.AgentsAt("A"), ElementsAre(0, 4));
  EXPECT_THAT(world.DeadAgentsAt("A"), IsEmpty());
  ASSERT_NE(world.AgentById("npc4"), nullptr);
  EXPECT_EQ(world.AgentById("npc4")->GetRole(), BAD);
  EXPECT_EQ(world.AgentById("npc9"), nullptr);
  EXPECT_EQ(world.AgentIndex("npc3"), 3);
  EXPECT_EQ(world.GetAgent(0).Worlds().size(), 10);  // C(5, 2)
  EXPECT_EQ(world.GetAgent(1).Worlds().size(), 1);
}

TEST(World, RejectsInvalidSetups) {
  GameSetup setup = SixAgents();
  setup.mutable_agents(2)->set_location("Meeting");
  EXPECT_DEATH(World w(setup), "invalid room");
}

TEST(World, EnterIsSeenByTheAgentsInTheRoom) {
  World world(SixAgents());
  // npc0 goes from A to B, where npc1 and npc5 are.
  const EventPtr e = world.Enter(0, "B");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, WITNESSED);
  EXPECT_THAT(e->witnesses, ElementsAre(1, 5));
  EXPECT_EQ(world.GetAgent(0).Location(), "B");
  for (int i : {0, 1, 5}) {
    ASSERT_EQ(world.GetAgent(i).Memory().size(), 1) << i;
    EXPECT_EQ(world.GetAgent(i).Memory()[0].GetCertainty(), FACT);
  }
  for (int i : {2, 3, 4}) {
    EXPECT_THAT(world.GetAgent(i).Memory(), IsEmpty()) << i;
  }
  // C is not adjacent to B.
  EXPECT_EQ(world.Enter(0, "C"), nullptr);
  EXPECT_EQ(world.Enter(0, "Meeting"), nullptr);
  EXPECT_EQ(world.Enter(0, "Nowhere"), nullptr);
  EXPECT_EQ(world.GetAgent(0).Location(), "B");
  EXPECT_EQ(world.EventHistory().size(), 1);
}

TEST(World, EnteringAnEmptyRoomIsPrivate) {
  World world(SixAgents());
  ASSERT_NE(world.Enter(3, "B"), nullptr);  // Leaves D empty.
  const EventPtr e = world.Enter(2, "D");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, PRIVATE);
  EXPECT_THAT(e->witnesses, IsEmpty());
  EXPECT_EQ(world.GetAgent(2).Memory().size(), 1);
  EXPECT_EQ(world.GetAgent(3).Memory().size(), 1);
}

TEST(World, WitnessedKill) {
  World world(MakeSetup({BAD, GOOD, GOOD, GOOD, GOOD},
                        {"A", "A", "A", "B", "C"}));
  const EventPtr e = world.Kill(0, 1);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, WITNESSED);
  EXPECT_THAT(e->witnesses, ElementsAre(2));
  EXPECT_FALSE(world.GetAgent(1).IsAlive());
  EXPECT_THAT(world.DeadAgentsAt("A"), ElementsAre(1));
  // The witness now knows the killer.
  EXPECT_EQ(world.GetAgent(2).Worlds().size(), 1);
  EXPECT_EQ(world.GetAgent(2).CountWorldsWhereBad(0), 1);
  // Nobody else learned anything; the victim least of all.
  EXPECT_THAT(world.GetAgent(1).Memory(), IsEmpty());
  EXPECT_EQ(world.GetAgent(3).Worlds().size(), 4);
  EXPECT_THAT(world.GetAgent(3).Memory(), IsEmpty());
}

TEST(World, InvalidKillsAreNoops) {
  World world(MakeSetup({BAD, GOOD, GOOD, GOOD, GOOD},
                        {"A", "A", "B", "B", "C"}));
  EXPECT_EQ(world.Kill(1, 0), nullptr);  // Good agents don't kill.
  EXPECT_EQ(world.Kill(0, 2), nullptr);  // Not in the same room.
  EXPECT_EQ(world.Kill(0, 0), nullptr);
  EXPECT_EQ(world.Kill(0, 7), nullptr);
  EXPECT_EQ(world.Sabotage(2), nullptr);  // Good agents don't sabotage.
  EXPECT_THAT(world.LivingAgents(), ElementsAre(0, 1, 2, 3, 4));
  EXPECT_THAT(world.EventHistory(), IsEmpty());
  ASSERT_NE(world.Kill(0, 1), nullptr);
  EXPECT_EQ(world.Kill(0, 1), nullptr);  // Already dead.
  EXPECT_EQ(world.Enter(1, "B"), nullptr);  // The dead don't walk.
}

TEST(World, SabotageIsSeenByTheRoom) {
  World world(SixAgents());
  const EventPtr e = world.Sabotage(1);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, WITNESSED);
  EXPECT_THAT(e->witnesses, ElementsAre(5));
  // A first-hand sabotage is a fact, but says nothing about roles.
  EXPECT_EQ(world.GetAgent(5).Memory().size(), 1);
  EXPECT_EQ(world.GetAgent(5).Worlds().size(), 10);
  EXPECT_EQ(world.GetAgent(5).Suspicion(1), 0);
}

TEST(World, ReportIsPublicAndStartsAMeeting) {
  World world(MakeSetup({BAD, GOOD, GOOD, GOOD, GOOD},
                        {"A", "A", "A", "B", "C"}));
  ASSERT_NE(world.Kill(0, 1), nullptr);
  const EventPtr e = world.Report(2);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, PUBLIC);
  EXPECT_EQ(e->location, "A");
  // The reporter saw it, everyone else alive heard about it from it.
  const MemoryItem& seen = world.GetAgent(2).Memory().back();
  EXPECT_EQ(seen.GetSourceType(), OBSERVATION);
  for (int i : {0, 3, 4}) {
    const MemoryItem& heard = world.GetAgent(i).Memory().back();
    EXPECT_EQ(heard.GetSourceType(), HEARSAY) << i;
    EXPECT_EQ(heard.GetCertainty(), UNCERTAIN) << i;
    EXPECT_EQ(heard.SourceId(), 2) << i;
    EXPECT_EQ(&heard.GetEvent(), e.get());
  }
  EXPECT_THAT(world.GetAgent(1).Memory(), IsEmpty());
  // The body is removed, and the meeting is on.
  EXPECT_EQ(world.GetAgent(1).Location(), "");
  EXPECT_THAT(world.DeadAgentsAt("A"), IsEmpty());
  EXPECT_EQ(world.CurrentPhase(), MEETING);
  ASSERT_TRUE(world.Meeting().has_value());
  EXPECT_EQ(world.Meeting()->reporter, 2);
  EXPECT_EQ(world.Meeting()->body_location, "A");
  EXPECT_THAT(world.Meeting()->speaking_queue, ElementsAre(0, 2, 3, 4));
  for (int i : world.LivingAgents()) {
    EXPECT_EQ(world.GetAgent(i).Location(), "Meeting");
    EXPECT_EQ(world.GetAgent(i).GetBehavior(), VOTING);
  }
  EXPECT_EQ(world.PreMeetingLocation(3), "B");
  // No actions during meetings.
  EXPECT_EQ(world.Report(3), nullptr);
  EXPECT_EQ(world.Enter(3, "A"), nullptr);
}

TEST(Meeting, OneStatementPerStepInterval) {
  World world(SixAgents());
  world.StartMeeting(kNoAgent, "");
  const int n = 6;
  for (int tick = 1; tick <= 2 * n; ++tick) {
    EXPECT_EQ(world.Meeting()->step, STATEMENTS) << tick;
    world.Advance(1.0);
    // A statement is made on every second tick, and not a tick earlier.
    EXPECT_EQ(CountEvents(world, SAY), tick / 2) << tick;
    // Everyone already heard it.
    for (int i = 0; i < n; ++i) {
      EXPECT_EQ(world.GetAgent(i).Memory().size(), tick / 2) << tick;
    }
  }
  EXPECT_EQ(world.Meeting()->step, VOTING_STEP);
  EXPECT_THAT(world.Meeting()->speaking_queue, IsEmpty());
  EXPECT_EQ(world.ElapsedTime(), 0);  // Frozen during the meeting.
  EXPECT_EQ(world.TurnCount(), 2 * n);
  // Speakers take turns in index order.
  vector<int> speakers;
  for (const auto& e : world.EventHistory()) {
    speakers.push_back(e->actor);
  }
  EXPECT_THAT(speakers, ElementsAre(0, 1, 2, 3, 4, 5));
}

TEST(Meeting, LongTicksStillRunOneUnitEach) {
  World world(SixAgents());
  world.StartMeeting(kNoAgent, "");
  world.Advance(10.0);
  EXPECT_EQ(CountEvents(world, SAY), 1);
  world.Advance(0.0);
  EXPECT_EQ(CountEvents(world, SAY), 2);
}

TEST(Meeting, TieEjectsNobody) {
  World world(SixAgents());
  world.StartMeeting(kNoAgent, "");
  AdvanceUntilStep(&world, RESULT);
  world.OverrideVotesForTesting({{0, 2}, {1, 2}, {3, 4}, {5, 4}});
  world.Advance(1.0);
  world.Advance(1.0);
  EXPECT_EQ(world.CurrentPhase(), PLAYING);
  EXPECT_FALSE(world.Meeting().has_value());
  EXPECT_THAT(world.LivingAgents(), ElementsAre(0, 1, 2, 3, 4, 5));
  const EventPtr& last = world.EventHistory().back();
  ASSERT_EQ(last->action, VOTE_RESULT);
  EXPECT_EQ(last->vote_result->ejected, kNoAgent);
  EXPECT_FALSE(last->vote_result->game_over);
}

TEST(Meeting, InvalidVotesAreAbstentions) {
  World world(SixAgents());
  world.StartMeeting(kNoAgent, "");
  AdvanceUntilStep(&world, RESULT);
  world.OverrideVotesForTesting({{0, 0}, {1, 9}, {2, 3}});
  EXPECT_THAT(world.Meeting()->votes, ElementsAre(testing::Pair(2, 3)));
}

TEST(Meeting, EjectionRestoresEveryoneElse) {
  const GameSetup setup = SixAgents();
  World world(setup);
  world.StartMeeting(kNoAgent, "");
  AdvanceUntilStep(&world, RESULT);
  world.OverrideVotesForTesting({{0, 2}, {1, 2}, {4, 2}, {3, 5}});
  world.Advance(1.0);
  world.Advance(1.0);
  EXPECT_EQ(world.CurrentPhase(), PLAYING);
  EXPECT_FALSE(world.Meeting().has_value());
  EXPECT_FALSE(world.GetAgent(2).IsAlive());
  EXPECT_EQ(world.GetAgent(2).Location(), "");
  for (int i : world.LivingAgents()) {
    EXPECT_EQ(world.GetAgent(i).Location(), setup.agents(i).location()) << i;
    EXPECT_EQ(world.GetAgent(i).GetBehavior(), IDLE) << i;
  }
  const EventPtr& last = world.EventHistory().back();
  ASSERT_EQ(last->action, VOTE_RESULT);
  EXPECT_EQ(last->vote_result->ejected, 2);
  EXPECT_THAT(last->vote_result->dead, ElementsAre(2));
  EXPECT_THAT(last->vote_result->VotersFor(2), ElementsAre(0, 1, 4));
  // The game goes on, so everyone takes npc2 for good. npc2 itself heard it,
  // and knows that npc0, npc1 or npc4 is bad.
  for (int i = 0; i < 6; ++i) {
    EXPECT_EQ(world.GetAgent(i).CountWorldsWhereBad(2), 0) << i;
    EXPECT_EQ(world.GetAgent(i).Memory().back().GetEventPtr(), last) << i;
  }
  // Only the world where npc3 and npc5 are bad is ruled out.
  EXPECT_EQ(world.GetAgent(2).Worlds().size(), 9);
  // The next tick is a normal playing tick again.
  world.Advance(1.0);
  EXPECT_EQ(world.ElapsedTime(), 1.0);
}

TEST(Meeting, ReportedBodyStaysRemoved) {
  World world(MakeSetup({BAD, GOOD, GOOD, GOOD, GOOD},
                        {"A", "A", "A", "B", "C"}));
  ASSERT_NE(world.Kill(0, 1), nullptr);
  ASSERT_NE(world.Report(2), nullptr);
  AdvanceUntilStep(&world, RESULT);
  world.OverrideVotesForTesting({});
  world.Advance(2.0);
  EXPECT_EQ(world.CurrentPhase(), PLAYING);
  EXPECT_EQ(world.GetAgent(1).Location(), "");
  EXPECT_EQ(world.GetAgent(0).Location(), "A");
  EXPECT_EQ(world.GetAgent(2).Location(), "A");
  EXPECT_EQ(world.GetAgent(3).Location(), "B");
}

TEST(Meeting, StatementsAreValidated) {
  World world(SixAgents());
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_DID, 0, kDidTask, 0)), nullptr)
      << "Statements are only made in meetings";
  world.StartMeeting(kNoAgent, "");
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_LOCATION, 1, "Nowhere", 0)),
            nullptr);
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_LOCATION, 1, "Meeting", 0)),
            nullptr);
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_ROLE, 1, "EVIL", 0)), nullptr);
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_DID, 0, "dance", 0)), nullptr);
  EXPECT_EQ(world.Say(NewStatement(PREDICATE_ROLE, 8, Role_Name(BAD), 0)),
            nullptr);
  EXPECT_THAT(world.EventHistory(), IsEmpty());
  const EventPtr e =
      world.Say(NewStatement(PREDICATE_ROLE, 1, Role_Name(BAD), 0));
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->visibility, PUBLIC);
  EXPECT_THAT(e->witnesses, ElementsAre(1, 2, 3, 4, 5));
  // The hearers grow suspicious, nobody drops a world.
  for (int i = 1; i < 6; ++i) {
    EXPECT_EQ(world.GetAgent(i).Memory().back().GetCertainty(), UNCERTAIN);
    EXPECT_EQ(world.GetAgent(i).Worlds().size(), i == 1 || i == 4 ? 1 : 10);
  }
  EXPECT_DOUBLE_EQ(world.GetAgent(2).Suspicion(1), kAccusationSuspicion);
  EXPECT_EQ(world.GetAgent(0).Suspicion(1), 0);
}

TEST(WinCondition, EjectingTheLastBadAgentEndsTheGame) {
  World world(MakeSetup({BAD, GOOD, GOOD, GOOD, GOOD},
                        {"A", "B", "C", "D", "A"}));
  world.StartMeeting(kNoAgent, "");
  AdvanceUntilStep(&world, RESULT);
  world.OverrideVotesForTesting({{1, 0}, {2, 0}, {3, 0}});
  world.Advance(1.0);
  world.Advance(1.0);
  EXPECT_TRUE(world.IsGameOver());
  EXPECT_EQ(world.WinningTeam(), TEAM_GOOD);
  const EventPtr& last = world.EventHistory().back();
  ASSERT_EQ(last->action, VOTE_RESULT);
  EXPECT_TRUE(last->vote_result->game_over);
  // Nothing moves anymore.
  const int turns = world.TurnCount();
  const int events = world.EventHistory().size();
  const WorldSnapshot before = world.Snapshot();
  for (int i = 0; i < 10; ++i) {
    world.Advance(1.0);
  }
  EXPECT_EQ(world.TurnCount(), turns);
  EXPECT_EQ(world.EventHistory().size(), events);
  EXPECT_EQ(world.WinningTeam(), TEAM_GOOD);
  EXPECT_EQ(world.Snapshot().DebugString(), before.DebugString());
}

TEST(WinCondition, BadWinsAtParity) {
  World world(MakeSetup({BAD, GOOD, GOOD}, {"A", "A", "D"}));
  ASSERT_NE(world.Kill(0, 1), nullptr);
  world.Advance(0.5);
  EXPECT_TRUE(world.IsGameOver());
  EXPECT_EQ(world.WinningTeam(), TEAM_BAD);
  EXPECT_EQ(world.Report(2), nullptr);
}

TEST(WinCondition, NobodyActsAfterTheDecidingKill) {
  GameSetup setup = MakeSetup({BAD, GOOD, GOOD}, {"A", "A", "B"});
  setup.set_emergency_cooldown(0);
  World world(setup);
  world.Advance(5.0);
  EXPECT_TRUE(world.IsGameOver());
  EXPECT_EQ(world.WinningTeam(), TEAM_BAD);
  EXPECT_EQ(world.CurrentPhase(), PLAYING);
  EXPECT_FALSE(world.Meeting().has_value());
  ASSERT_EQ(world.EventHistory().size(), 1);
  EXPECT_EQ(world.EventHistory()[0]->action, KILL);
}

TEST(World, PeriodicMeeting) {
  // Crowded in one room, nobody gets killed unseen.
  GameSetup setup = MakeSetup({GOOD, BAD, GOOD, GOOD, BAD, GOOD, GOOD, GOOD},
                              vector<string>(8, "A"));
  setup.set_meeting_interval(10);
  World world(setup);
  for (int i = 0; i < 10 && world.CurrentPhase() == PLAYING; ++i) {
    world.Advance(1.0);
  }
  EXPECT_EQ(world.CurrentPhase(), MEETING);
  EXPECT_LE(world.ElapsedTime(), 10);
}

TEST(World, SameSeedSameGame) {
  const GameSetup setup = DefaultSetup(8, 2, 42);
  World a(setup);
  World b(setup);
  for (int i = 0; i < 300; ++i) {
    a.Advance(1.0);
    b.Advance(1.0);
  }
  EXPECT_EQ(a.ToProto().DebugString(), b.ToProto().DebugString());
  EXPECT_EQ(a.Snapshot().DebugString(), b.Snapshot().DebugString());
}

TEST(World, FullGamesKeepBeliefsConsistent) {
  for (int seed = 0; seed < 5; ++seed) {
    World world(DefaultSetup(8, 2, seed));
    for (int i = 0; i < 2000 && !world.IsGameOver(); ++i) {
      world.Advance(1.0);
    }
    for (int i = 0; i < world.NumAgents(); ++i) {
      const Agent& agent = world.GetAgent(i);
      EXPECT_FALSE(agent.Worlds().empty()) << agent.Name();
      for (const PossibleWorld& w : agent.Worlds()) {
        EXPECT_EQ(w.GetRole(i), agent.GetRole());
      }
    }
    const WorldSnapshot snapshot = world.Snapshot();
    EXPECT_EQ(snapshot.agents_size(), 8);
    EXPECT_EQ(snapshot.result(), world.WinningTeam());
    EXPECT_EQ(world.ToProto().events_size(), world.EventHistory().size());
  }
}

TEST(World, Snapshot) {
  World world(SixAgents());
  world.StartMeeting(kNoAgent, "");
  world.Advance(2.0);
  const WorldSnapshot snapshot = world.Snapshot();
  EXPECT_EQ(snapshot.phase(), MEETING);
  EXPECT_EQ(snapshot.meeting_step(), STATEMENTS);
  EXPECT_EQ(snapshot.turn_count(), 1);
  EXPECT_EQ(snapshot.result(), TEAM_UNSPECIFIED);
  EXPECT_THAT(snapshot.speaking_queue(),
              ElementsAre("npc1", "npc2", "npc3", "npc4", "npc5"));
  ASSERT_EQ(snapshot.agents_size(), 6);
  const AgentSnapshot& npc1 = snapshot.agents(1);
  EXPECT_EQ(npc1.name(), "npc1");
  EXPECT_EQ(npc1.role(), BAD);
  EXPECT_EQ(npc1.life_state(), ALIVE);
  EXPECT_EQ(npc1.location(), "Meeting");
  EXPECT_EQ(npc1.behavior(), VOTING);
  EXPECT_EQ(npc1.num_worlds(), 1);
  EXPECT_EQ(npc1.num_memories(), 1);
  EXPECT_EQ(npc1.suspicion_size(), 5);
  EXPECT_EQ(npc1.last_action(), ACTION_KIND_UNSPECIFIED);
  EXPECT_EQ(snapshot.agents(0).last_action(), SAY);
}

}  // namespace
}  // namespace kripke

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
