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

#ifndef SRC_BELIEF_SAT_SOLVER_H_
#define SRC_BELIEF_SAT_SOLVER_H_

#include <string>
#include <vector>

#include "absl/types/span.h"
#include "ortools/sat/cp_model.h"
#include "src/agent.h"
#include "src/event.h"
#include "src/possible_world.h"
#include "src/solver.pb.h"

namespace kripke {

using operations_research::sat::BoolVar;
using operations_research::sat::CpModelBuilder;
using std::string;
using std::vector;

// Compiles the first-hand facts an agent remembers into a SAT model over the
// role of every agent, and enumerates the worlds that satisfy all of them.
// For a consistent set of facts the solutions are exactly the worlds the
// agent holds after its incremental eliminations.
class BeliefSatSolver {
 public:
  BeliefSatSolver(const Agent& agent, absl::Span<const string> names);

  // Solves the model and returns all valid worlds.
  SolverResponse Solve() { return Solve(SolverRequest()); }
  // Solves the model using options from the request.
  SolverResponse Solve(const SolverRequest& request);
  // Returns whether a valid world exists.
  bool IsValidWorld() { return IsValidWorld(SolverRequest()); }
  // Returns whether a valid world exists given all assumptions in the request.
  bool IsValidWorld(const SolverRequest& request) {
    SolverRequest r = request;
    r.set_stop_after_first_solution(true);
    return Solve(r).worlds_size() > 0;
  }

 private:
  void CompileSatModel();
  void AddRoleSetupConstraints();
  void AddKillConstraints(const internal::Event& event);
  void AddVoteResultConstraints(const internal::Event& event);
  vector<BoolVar> CollectAssumptionLiterals(
      const google::protobuf::Map<string, Role>& assumptions) const;

  const Agent& agent_;
  vector<string> names_;
  CpModelBuilder model_;
  vector<BoolVar> is_bad_;  // x agent.
};

// The worlds of a solver response, sorted.
vector<PossibleWorld> WorldsFromResponse(const SolverResponse& response,
                                         absl::Span<const string> names);

}  // namespace kripke

#endif  // SRC_BELIEF_SAT_SOLVER_H_
