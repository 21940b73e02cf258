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

#include <chrono>  // NOLINT [build/c++11]
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "ortools/base/logging.h"
#include "src/belief_sat_solver.h"
#include "src/setup.h"
#include "src/util.h"
#include "src/world.h"

using std::cerr;
using std::chrono::duration;
using std::chrono::steady_clock;
using std::cout;
using std::endl;
using std::filesystem::path;
using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, setup, "",
          "Game setup file path. Uses the default 8 agent map if empty.");
ABSL_FLAG(int, ticks, 1000, "Maximal number of ticks to simulate.");
ABSL_FLAG(double, delta_time, 1.0, "Simulation seconds per tick.");
ABSL_FLAG(int64_t, seed, -1, "Random seed, overrides the setup seed if set.");
ABSL_FLAG(string, output_snapshot, "", "Optional final snapshot output file.");
ABSL_FLAG(string, output_log, "", "Optional game log output file.");
ABSL_FLAG(string, solve_agent, "",
          "If set, solves the facts known to this agent at the end.");
ABSL_FLAG(string, solver_parameters, "", "Solver parameters file path.");

namespace kripke {

int Run() {
  GameSetup setup;
  const path setup_file = absl::GetFlag(FLAGS_setup);
  const int64_t seed = absl::GetFlag(FLAGS_seed);
  if (setup_file.empty()) {
    setup = DefaultSetup(8, 2, seed >= 0 ? seed : 0);
  } else {
    const absl::Status st = ReadProtoFromFile(setup_file, &setup);
    if (!st.ok()) {
      cerr << st << endl;
      return 1;
    }
  }
  if (seed >= 0) {
    setup.set_seed(seed);
  }
  const absl::Status st = ValidateSetup(setup);
  if (!st.ok()) {
    cerr << "Invalid setup: " << st << endl;
    return 1;
  }

  World world(setup);
  const int ticks = absl::GetFlag(FLAGS_ticks);
  const double delta_time = absl::GetFlag(FLAGS_delta_time);
  CHECK_GT(delta_time, 0) << "Set --delta_time to a positive number";
  for (int t = 0; t < ticks && !world.IsGameOver(); ++t) {
    world.Advance(delta_time);
  }
  if (world.IsGameOver()) {
    cout << Team_Name(world.WinningTeam()) << " wins after "
         << world.TurnCount() << " turns (" << world.ElapsedTime()
         << "s of play)" << endl;
  } else {
    cout << "No winner after " << world.TurnCount() << " turns" << endl;
  }

  const path output_snapshot = absl::GetFlag(FLAGS_output_snapshot);
  if (!output_snapshot.empty()) {
    const absl::Status write_st =
        WriteProtoToFile(world.Snapshot(), output_snapshot);
    CHECK(write_st.ok()) << write_st;
    cout << "Snapshot written to " << output_snapshot << endl;
  } else {
    cout << "Final snapshot:\n" << world.Snapshot().DebugString() << endl;
  }
  const path output_log = absl::GetFlag(FLAGS_output_log);
  if (!output_log.empty()) {
    const absl::Status write_st = WriteProtoToFile(world.ToProto(), output_log);
    CHECK(write_st.ok()) << write_st;
    cout << "Game log written to " << output_log << endl;
  }

  const string solve_agent = absl::GetFlag(FLAGS_solve_agent);
  if (solve_agent.empty()) {
    return 0;
  }
  const Agent* agent = world.AgentById(solve_agent);
  if (agent == nullptr) {
    cerr << "Unknown agent " << solve_agent << endl;
    return 1;
  }
  SolverRequest request;  // If file present, read from file.
  const path solver_parameters = absl::GetFlag(FLAGS_solver_parameters);
  if (!solver_parameters.empty()) {
    const absl::Status read_st = ReadProtoFromFile(solver_parameters, &request);
    CHECK(read_st.ok()) << read_st;
  }
  BeliefSatSolver s(*agent, world.AgentNames());
  steady_clock::time_point begin = steady_clock::now();
  const SolverResponse solution = s.Solve(request);
  steady_clock::time_point end = steady_clock::now();
  cout << solve_agent << " holds " << agent->Worlds().size()
       << " worlds; the solver finds " << solution.worlds_size() << endl;
  cout << "Solve response:\n" << solution.DebugString() << endl;
  cout << "Solve time: " << duration<double>(end - begin).count() << "[s]\n";
  return 0;
}
}  // namespace kripke

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  return kripke::Run();
}
