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

#include "src/agent.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace kripke {

Agent::Agent(const string& name, int index, Role role, const string& location,
             int num_bad, vector<PossibleWorld> worlds)
    : name_(name), index_(index), role_(role), location_(location),
      num_bad_(num_bad) {
  CHECK(!name_.empty()) << "Agent name cannot be empty string";
  CHECK(role_ == GOOD || role_ == BAD)
      << "Agent " << name_ << " needs a role, got " << Role_Name(role_);
  CHECK(!worlds.empty()) << "Agent " << name_ << " starts with no worlds";
  num_agents_ = worlds.front().NumAgents();
  CHECK(index_ >= 0 && index_ < num_agents_) << "Invalid agent index "
                                             << index_;
  for (const PossibleWorld& w : worlds) {
    CHECK_EQ(w.NumAgents(), num_agents_)
        << "Every world needs to assign a role to every agent";
    CHECK_EQ(w.NumBad(), num_bad_)
        << "Every world needs exactly " << num_bad_ << " bad agents";
    CHECK_EQ(w.GetRole(index_), role_)
        << "Agent " << name_ << " never doubts its own role";
  }
  knowledge_.worlds = std::move(worlds);
  for (int i = 0; i < num_agents_; ++i) {
    if (i != index_) {
      suspicion_[i] = 0;
    }
  }
}

int Agent::CountWorldsWhereBad(int agent) const {
  return std::count_if(
      knowledge_.worlds.begin(), knowledge_.worlds.end(),
      [agent](const PossibleWorld& w) { return w.IsBad(agent); });
}

double Agent::Suspicion(int agent) const {
  const auto it = suspicion_.find(agent);
  return it == suspicion_.end() ? 0 : it->second;
}

void Agent::Kill() {
  CHECK(IsAlive()) << "What is dead may never die: " << name_;
  life_state_ = DEAD;
}

void Agent::UpdateKnowledge(const MemoryItem& item) {
  knowledge_.memory.push_back(item);
}

void Agent::UpdateBelief(const MemoryItem& item) {
  switch (item.GetCertainty()) {
    case FACT:
      UpdateBeliefHard(item.GetEvent());
      break;
    case UNCERTAIN:
      UpdateBeliefSoft(item.GetEvent());
      break;
    default:
      // VERIFIED and DISPROVED items carry no update rules yet.
      break;
  }
}

void Agent::UpdateBeliefHard(const internal::Event& event) {
  switch (event.action) {
    case KILL: {
      const int killer = event.actor;
      Eliminate([killer](const PossibleWorld& w) { return w.IsBad(killer); },
                absl::StrFormat("kill by agent %d", killer));
      break;
    }
    case VOTE_RESULT: {
      const internal::VoteResult& vr = *event.vote_result;
      if (vr.ejected != kNoAgent && !vr.game_over) {
        // The game went on, so the ejected agent was good.
        const int ejected = vr.ejected;
        Eliminate([ejected](const PossibleWorld& w) {
                    return w.IsGood(ejected);
                  },
                  absl::StrFormat("agent %d ejected, game continues", ejected));
      }
      if (vr.ejected == index_ && role_ == GOOD) {
        // Not all of my voters can be good: keep the worlds where at least
        // one of them is bad.
        vector<int> voters = vr.VotersFor(index_);
        voters.erase(std::remove(voters.begin(), voters.end(), index_),
                     voters.end());
        if (!voters.empty()) {
          Eliminate([&voters](const PossibleWorld& w) {
                      return std::any_of(voters.begin(), voters.end(),
                                         [&w](int v) { return w.IsBad(v); });
                    },
                    "voted out while good");
        }
      }
      const int num_dead = vr.dead.size();
      if (!vr.game_over && num_dead > 0 && num_dead >= num_bad_) {
        // If every dead agent were bad, the game would be over.
        const vector<int>& dead = vr.dead;
        Eliminate([&dead](const PossibleWorld& w) {
                    return !std::all_of(dead.begin(), dead.end(),
                                        [&w](int d) { return w.IsBad(d); });
                  },
                  "game continues with every dead agent bad");
      }
      break;
    }
    default:
      // Entering, sabotage, reports and statements seen first hand do not
      // rule out any role assignment.
      break;
  }
}

void Agent::UpdateBeliefSoft(const internal::Event& event) {
  switch (event.action) {
    case SAY: {
      const internal::Statement& s = *event.statement;
      if (s.predicate == PREDICATE_ROLE && s.value == Role_Name(BAD)) {
        AddSuspicion(s.subject, kAccusationSuspicion);
      }
      break;
    }
    case SABOTAGE:
      AddSuspicion(event.actor, kSabotageSuspicion);
      break;
    default:
      break;
  }
}

void Agent::Eliminate(const std::function<bool(const PossibleWorld&)>& keep,
                      const string& reason) {
  vector<PossibleWorld>& worlds = knowledge_.worlds;
  if (worlds.empty()) {
    return;
  }
  vector<PossibleWorld> kept;
  std::copy_if(worlds.begin(), worlds.end(), std::back_inserter(kept), keep);
  if (kept.empty()) {
    LOG(WARNING) << name_ << ": contradiction, ignoring fact (" << reason
                 << ") that would eliminate all " << worlds.size()
                 << " worlds";
    return;
  }
  if (kept.size() < worlds.size()) {
    VLOG(1) << name_ << ": " << reason << " eliminated "
            << worlds.size() - kept.size() << " worlds, " << kept.size()
            << " left";
  }
  worlds = std::move(kept);
}

void Agent::AddSuspicion(int agent, double delta) {
  auto it = suspicion_.find(agent);
  if (it == suspicion_.end()) {
    return;  // Own id, or not an agent.
  }
  it->second = std::max(0.0, it->second + delta);
}

}  // namespace kripke
