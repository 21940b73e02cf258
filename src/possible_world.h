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

#ifndef SRC_POSSIBLE_WORLD_H_
#define SRC_POSSIBLE_WORLD_H_

#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/game_log.pb.h"

namespace kripke {

using std::string;
using std::vector;

const int kNoAgent = -1;  // Used in place of agent index.

// One complete hypothesis of the role of every agent, indexed by the agent
// indices fixed at setup.
class PossibleWorld {
 public:
  explicit PossibleWorld(absl::Span<const Role> roles);
  // A world of num_agents agents, where exactly the given agents are bad.
  static PossibleWorld FromBadAgents(int num_agents,
                                     absl::Span<const int> bad_agents);

  int NumAgents() const { return roles_.size(); }
  Role GetRole(int agent) const;
  bool IsBad(int agent) const { return GetRole(agent) == BAD; }
  bool IsGood(int agent) const { return GetRole(agent) == GOOD; }
  int NumBad() const;
  vector<int> BadAgents() const;
  const vector<Role>& Roles() const { return roles_; }
  // E.g. "{npc1, npc4}", the names of the bad agents.
  string DebugString(absl::Span<const string> names) const;

  bool operator==(const PossibleWorld& other) const {
    return roles_ == other.roles_;
  }
  bool operator<(const PossibleWorld& other) const {
    return roles_ < other.roles_;
  }

 private:
  vector<Role> roles_;  // x agent.
};

// All worlds with exactly num_bad bad agents in which the given agent has the
// given role, in lexicographic order of the bad agent indices.
vector<PossibleWorld> EnumerateWorlds(int num_agents, int num_bad, int agent,
                                      Role role);

// The worlds an agent starts the game with. A good agent only knows its own
// role; a bad agent is told who its partners are, so it holds the true world.
vector<PossibleWorld> InitialWorlds(absl::Span<const Role> true_roles,
                                    int agent);

}  // namespace kripke

#endif  // SRC_POSSIBLE_WORLD_H_
