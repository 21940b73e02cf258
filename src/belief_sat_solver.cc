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

#include "src/belief_sat_solver.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace kripke {

using operations_research::sat::CpSolverResponse;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::LinearExpr;
using operations_research::sat::NewFeasibleSolutionObserver;
using operations_research::sat::NewSatParameters;
using operations_research::sat::SatParameters;
using operations_research::sat::SolutionBooleanValue;
using operations_research::sat::SolveCpModel;

BeliefSatSolver::BeliefSatSolver(const Agent& agent,
                                 absl::Span<const string> names)
    : agent_(agent), names_(names.begin(), names.end()) {
  CHECK_EQ(names_.size(), agent_.NumAgents())
      << "Need a name for every agent";
  CompileSatModel();
}

void BeliefSatSolver::CompileSatModel() {
  for (int i = 0; i < names_.size(); ++i) {
    is_bad_.push_back(
        model_.NewBoolVar().WithName(absl::StrFormat("bad_%s", names_[i])));
  }
  AddRoleSetupConstraints();
  for (const MemoryItem& item : agent_.Memory()) {
    if (!item.IsFact()) {
      continue;  // Hearsay never rules out a world.
    }
    const internal::Event& event = item.GetEvent();
    switch (event.action) {
      case KILL:
        AddKillConstraints(event);
        break;
      case VOTE_RESULT:
        AddVoteResultConstraints(event);
        break;
      default:
        break;
    }
  }
}

void BeliefSatSolver::AddRoleSetupConstraints() {
  model_.AddEquality(LinearExpr::Sum(is_bad_), agent_.NumBad());
  const int self = agent_.Index();
  model_.FixVariable(is_bad_[self], agent_.GetRole() == BAD);
  if (agent_.GetRole() == BAD) {
    // Bad agents were told their partners, and hold that one world for the
    // whole game.
    CHECK(agent_.Worlds().size() == 1) << "Bad agents hold a single world";
    const PossibleWorld& truth = agent_.Worlds().front();
    for (int i = 0; i < names_.size(); ++i) {
      model_.FixVariable(is_bad_[i], truth.IsBad(i));
    }
  }
}

void BeliefSatSolver::AddKillConstraints(const internal::Event& event) {
  model_.FixVariable(is_bad_[event.actor], true);
}

void BeliefSatSolver::AddVoteResultConstraints(const internal::Event& event) {
  const internal::VoteResult& vr = *event.vote_result;
  if (vr.ejected != kNoAgent && !vr.game_over) {
    model_.FixVariable(is_bad_[vr.ejected], false);
  }
  const int self = agent_.Index();
  if (vr.ejected == self && agent_.GetRole() == GOOD) {
    vector<BoolVar> voters_bad;
    for (int voter : vr.VotersFor(self)) {
      if (voter != self) {
        voters_bad.push_back(is_bad_[voter]);
      }
    }
    if (!voters_bad.empty()) {
      model_.AddBoolOr(voters_bad);
    }
  }
  const int num_dead = vr.dead.size();
  if (!vr.game_over && num_dead > 0 && num_dead >= agent_.NumBad()) {
    vector<BoolVar> dead_good;
    for (int d : vr.dead) {
      dead_good.push_back(Not(is_bad_[d]));
    }
    model_.AddBoolOr(dead_good);
  }
}

vector<BoolVar> BeliefSatSolver::CollectAssumptionLiterals(
    const google::protobuf::Map<string, Role>& assumptions) const {
  vector<BoolVar> literals;
  for (const auto& [name, role] : assumptions) {
    const auto it = std::find(names_.begin(), names_.end(), name);
    CHECK(it != names_.end()) << "Unknown agent " << name;
    CHECK(role == GOOD || role == BAD)
        << "Invalid assumption " << Role_Name(role) << " for " << name;
    const BoolVar var = is_bad_[it - names_.begin()];
    literals.push_back(role == BAD ? var : Not(var));
  }
  return literals;
}

SolverResponse BeliefSatSolver::Solve(const SolverRequest& request) {
  SolverResponse result;
  // Making a copy to add assumptions.
  CpModelBuilder cp_model(model_);
  cp_model.AddBoolAnd(CollectAssumptionLiterals(request.assumptions()));
  operations_research::sat::Model model;
  SatParameters parameters;
  parameters.set_enumerate_all_solutions(!request.stop_after_first_solution());
  model.Add(NewSatParameters(parameters));
  model.Add(NewFeasibleSolutionObserver([&](const CpSolverResponse& r) {
    SolverResponse::World* world = result.add_worlds();
    for (int i = 0; i < names_.size(); ++i) {
      (*world->mutable_roles())[names_[i]] =
          SolutionBooleanValue(r, is_bad_[i]) ? BAD : GOOD;
    }
  }));
  const CpSolverResponse response = SolveCpModel(cp_model.Build(), &model);
  CHECK(response.status() != CpSolverStatus::MODEL_INVALID)
      << "Invalid belief model for " << agent_.Name();
  VLOG(1) << agent_.Name() << ": " << result.worlds_size()
          << " worlds satisfy the facts";
  return result;
}

vector<PossibleWorld> WorldsFromResponse(const SolverResponse& response,
                                         absl::Span<const string> names) {
  vector<PossibleWorld> result;
  for (const auto& world : response.worlds()) {
    vector<Role> roles;
    for (const string& name : names) {
      const auto it = world.roles().find(name);
      CHECK(it != world.roles().end()) << "No role for " << name;
      roles.push_back(it->second);
    }
    result.emplace_back(roles);
  }
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace kripke
