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

#ifndef SRC_POLICY_H_
#define SRC_POLICY_H_

#include <optional>
#include <string>
#include <variant>

#include "absl/random/bit_gen_ref.h"
#include "src/agent.h"
#include "src/event.h"

namespace kripke {

using std::optional;
using std::string;

class World;

// Suspicion above which a good agent acts on it.
const double kHighSuspicion = 0.5;
// Candidate worlds at or below which a good agent calls an emergency meeting.
const int kEmergencyWorldsThreshold = 2;

// A non-verbal decision. The World validates it and creates the event.
struct Action {
  enum Kind { kIdle, kTask, kEnter, kKill, kSabotage, kReport };

  Kind kind = kIdle;
  string room;  // kEnter
  int target = kNoAgent;  // kKill

  static Action Idle() { return {.kind = kIdle}; }
  static Action Task() { return {.kind = kTask}; }
  static Action Enter(const string& room) {
    return {.kind = kEnter, .room = room};
  }
  static Action Kill(int target) { return {.kind = kKill, .target = target}; }
  static Action Sabotage() { return {.kind = kSabotage}; }
  static Action Report() { return {.kind = kReport}; }

  bool operator==(const Action& other) const {
    return kind == other.kind && room == other.room && target == other.target;
  }
};

string ActionDebugString(const Action& action,
                         absl::Span<const string> names);

// Decision functions read the agent's own beliefs and the public state of the
// world, and never change either. All randomness comes from the passed
// generator, so a seeded generator replays the same decisions.
class GoodPolicy {
 public:
  // Report a corpse > emergency meeting > chase the prime suspect > wander or
  // do a task > idle.
  Action ChooseAction(const Agent& agent, const World& world,
                      absl::BitGenRef bitgen) const;
  // Accuse a witnessed killer > accuse the prime suspect > share what the
  // worlds say, or a sighting > self alibi.
  optional<internal::Statement> ChooseStatement(const Agent& agent,
                                                const World& world,
                                                absl::BitGenRef bitgen) const;
  // The living agent that is bad in the most candidate worlds, ties broken by
  // suspicion. Returns kNoAgent to abstain.
  int ChooseVote(const Agent& agent, const World& world,
                 absl::BitGenRef bitgen) const;
};

class BadPolicy {
 public:
  // The only good agent sharing the room with this agent, or kNoAgent if the
  // kill would be seen (or there is nobody to kill).
  static int KillTarget(const Agent& agent, const World& world);

  Action ChooseAction(const Agent& agent, const World& world,
                      absl::BitGenRef bitgen) const;
  // Fake alibi when the body was found where this agent was > framing,
  // confusion or partner vouching at random > "I did my task".
  optional<internal::Statement> ChooseStatement(const Agent& agent,
                                                const World& world,
                                                absl::BitGenRef bitgen) const;
  int ChooseVote(const Agent& agent, const World& world,
                 absl::BitGenRef bitgen) const;
};

using Policy = std::variant<GoodPolicy, BadPolicy>;

// Policies are picked once, when the agent is created.
Policy PolicyForRole(Role role);

Action ChooseAction(const Policy& policy, const Agent& agent,
                    const World& world, absl::BitGenRef bitgen);
optional<internal::Statement> ChooseStatement(const Policy& policy,
                                              const Agent& agent,
                                              const World& world,
                                              absl::BitGenRef bitgen);
int ChooseVote(const Policy& policy, const Agent& agent, const World& world,
               absl::BitGenRef bitgen);

}  // namespace kripke

#endif  // SRC_POLICY_H_
