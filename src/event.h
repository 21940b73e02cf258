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

#ifndef SRC_EVENT_H_
#define SRC_EVENT_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/possible_world.h"

namespace kripke {

using std::map;
using std::optional;
using std::shared_ptr;
using std::string;
using std::vector;

// Action tags used as Statement values for the DID predicate.
const char kDidTask[] = "task";

namespace internal {
// Here and below, the structs are translations of the corresponding proto
// messages, with agent names replaced by indices.
struct Statement {
  Predicate predicate = PREDICATE_UNSPECIFIED;
  int subject = kNoAgent;
  string value;  // Role name, room name or action tag, by predicate.
  int speaker = kNoAgent;
  double timestamp = 0;

  bool IsWellDefined() const;
};

struct VoteResult {
  int ejected = kNoAgent;
  bool game_over = false;
  map<int, int> votes;  // Voter -> target, abstentions omitted.
  vector<int> dead;  // Every dead agent at resolution time.

  // The agents that voted for the given target.
  vector<int> VotersFor(int target) const;
};

// A game action. Once sealed by NewEvent it is shared, never copied or
// changed, by every memory item that refers to it.
struct Event {
  ActionKind action = ACTION_KIND_UNSPECIFIED;
  int actor = kNoAgent;  // kNoAgent for world announcements (VOTE_RESULT).
  string location;
  vector<int> witnesses;
  double timestamp = 0;
  Visibility visibility = VISIBILITY_UNSPECIFIED;
  // Payloads, by action.
  optional<Statement> statement;  // SAY
  optional<VoteResult> vote_result;  // VOTE_RESULT
  int victim = kNoAgent;  // KILL
};
}  // namespace internal

using EventPtr = shared_ptr<const internal::Event>;

// Validates and seals an event. Malformed events are programming errors and
// fail a CHECK here, before anyone can observe them.
EventPtr NewEvent(internal::Event event);

// Syntactic sugar.
internal::Statement NewStatement(Predicate predicate, int subject,
                                 const string& value, int speaker);

Statement StatementToProto(const internal::Statement& statement,
                           absl::Span<const string> names);
Event EventToProto(const internal::Event& event,
                   absl::Span<const string> names);
// E.g. "npc3 says: npc1's role is BAD".
string StatementDebugString(const internal::Statement& statement,
                            absl::Span<const string> names);
string EventDebugString(const internal::Event& event,
                        absl::Span<const string> names);

}  // namespace kripke

#endif  // SRC_EVENT_H_
