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

#include "src/possible_world.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/util.h"

namespace kripke {

PossibleWorld::PossibleWorld(absl::Span<const Role> roles)
    : roles_(roles.begin(), roles.end()) {
  CHECK(!roles_.empty()) << "A world needs at least one agent";
  for (int i = 0; i < roles_.size(); ++i) {
    CHECK(roles_[i] == GOOD || roles_[i] == BAD)
        << "Agent " << i << " has no role assigned: " << Role_Name(roles_[i]);
  }
}

PossibleWorld PossibleWorld::FromBadAgents(int num_agents,
                                           absl::Span<const int> bad_agents) {
  vector<Role> roles(num_agents, GOOD);
  for (int i : bad_agents) {
    CHECK(i >= 0 && i < num_agents) << "Invalid agent index " << i;
    CHECK_EQ(roles[i], GOOD) << "Agent " << i << " listed as bad twice";
    roles[i] = BAD;
  }
  return PossibleWorld(roles);
}

Role PossibleWorld::GetRole(int agent) const {
  CHECK(agent >= 0 && agent < roles_.size()) << "Invalid agent index "
                                             << agent;
  return roles_[agent];
}

int PossibleWorld::NumBad() const {
  return std::count(roles_.begin(), roles_.end(), BAD);
}

vector<int> PossibleWorld::BadAgents() const {
  vector<int> result;
  for (int i = 0; i < roles_.size(); ++i) {
    if (roles_[i] == BAD) {
      result.push_back(i);
    }
  }
  return result;
}

string PossibleWorld::DebugString(absl::Span<const string> names) const {
  CHECK_EQ(names.size(), roles_.size());
  return absl::StrFormat(
      "{%s}", absl::StrJoin(IndicesToNames(BadAgents(), names), ", "));
}

vector<PossibleWorld> EnumerateWorlds(int num_agents, int num_bad, int agent,
                                      Role role) {
  CHECK_GT(num_agents, 0);
  CHECK(num_bad >= 0 && num_bad <= num_agents)
      << num_bad << " bad agents out of " << num_agents;
  CHECK(agent >= 0 && agent < num_agents) << "Invalid agent index " << agent;
  vector<PossibleWorld> result;
  // The first num_bad selectors are set; prev_permutation walks through all
  // subsets of that size in lexicographic order.
  vector<bool> selected(num_agents, false);
  std::fill(selected.begin(), selected.begin() + num_bad, true);
  do {
    vector<int> bad_agents;
    for (int i = 0; i < num_agents; ++i) {
      if (selected[i]) {
        bad_agents.push_back(i);
      }
    }
    PossibleWorld world = PossibleWorld::FromBadAgents(num_agents, bad_agents);
    if (world.GetRole(agent) == role) {
      result.push_back(world);
    }
  } while (std::prev_permutation(selected.begin(), selected.end()));
  return result;
}

vector<PossibleWorld> InitialWorlds(absl::Span<const Role> true_roles,
                                    int agent) {
  const PossibleWorld truth(true_roles);
  const Role role = truth.GetRole(agent);
  if (role == BAD) {
    return {truth};
  }
  return EnumerateWorlds(truth.NumAgents(), truth.NumBad(), agent, role);
}

}  // namespace kripke
