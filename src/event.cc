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

#include "src/event.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/util.h"

namespace kripke {

namespace {
string NameOrEmpty(int i, absl::Span<const string> names) {
  return i == kNoAgent ? "" : names[i];
}

string PredicateName(Predicate p) {
  switch (p) {
    case PREDICATE_ROLE:
      return "role";
    case PREDICATE_LOCATION:
      return "location";
    case PREDICATE_DID:
      return "did";
    default:
      return "?";
  }
}
}  // namespace

namespace internal {
bool Statement::IsWellDefined() const {
  return predicate != PREDICATE_UNSPECIFIED && subject != kNoAgent &&
         speaker != kNoAgent && !value.empty();
}

vector<int> VoteResult::VotersFor(int target) const {
  vector<int> result;
  for (const auto& [voter, voted] : votes) {
    if (voted == target) {
      result.push_back(voter);
    }
  }
  return result;
}
}  // namespace internal

EventPtr NewEvent(internal::Event event) {
  CHECK_NE(event.action, ACTION_KIND_UNSPECIFIED)
      << "Events need to specify an action";
  CHECK_NE(event.visibility, VISIBILITY_UNSPECIFIED)
      << "Events need to specify a visibility";
  if (event.action == VOTE_RESULT) {
    CHECK(event.vote_result.has_value()) << "Vote result without a payload";
    CHECK_EQ(event.visibility, PUBLIC) << "Vote results are announced publicly";
  } else {
    CHECK_NE(event.actor, kNoAgent)
        << ActionKind_Name(event.action) << " needs an actor";
  }
  CHECK(std::find(event.witnesses.begin(), event.witnesses.end(),
                  event.actor) == event.witnesses.end())
      << "The actor is not a witness of its own action";
  if (event.visibility == PRIVATE) {
    CHECK(event.witnesses.empty()) << "Private events have no witnesses";
  }
  switch (event.action) {
    case SAY:
      CHECK(event.statement.has_value() && event.statement->IsWellDefined())
          << "SAY needs a well defined statement";
      CHECK_EQ(event.statement->speaker, event.actor)
          << "Agents only speak for themselves";
      CHECK_EQ(event.visibility, PUBLIC) << "Statements are public";
      break;
    case KILL:
      CHECK_NE(event.victim, kNoAgent) << "KILL needs a victim";
      CHECK_NE(event.victim, event.actor) << "Agents cannot kill themselves";
      break;
    case REPORT:
      CHECK_EQ(event.visibility, PUBLIC) << "Reports are public";
      break;
    default:
      break;
  }
  return std::make_shared<const internal::Event>(std::move(event));
}

internal::Statement NewStatement(Predicate predicate, int subject,
                                 const string& value, int speaker) {
  return {.predicate = predicate, .subject = subject, .value = value,
          .speaker = speaker};
}

Statement StatementToProto(const internal::Statement& statement,
                           absl::Span<const string> names) {
  Statement pb;
  pb.set_predicate(statement.predicate);
  pb.set_subject(NameOrEmpty(statement.subject, names));
  pb.set_value(statement.value);
  pb.set_speaker(NameOrEmpty(statement.speaker, names));
  pb.set_timestamp(statement.timestamp);
  return pb;
}

Event EventToProto(const internal::Event& event,
                   absl::Span<const string> names) {
  Event pb;
  pb.set_action(event.action);
  pb.set_actor(NameOrEmpty(event.actor, names));
  pb.set_location(event.location);
  for (const string& name : IndicesToNames(event.witnesses, names)) {
    pb.add_witnesses(name);
  }
  pb.set_timestamp(event.timestamp);
  pb.set_visibility(event.visibility);
  if (event.statement.has_value()) {
    *pb.mutable_statement() = StatementToProto(*event.statement, names);
  } else if (event.vote_result.has_value()) {
    const internal::VoteResult& vr = *event.vote_result;
    auto* vote_result_pb = pb.mutable_vote_result();
    vote_result_pb->set_ejected(NameOrEmpty(vr.ejected, names));
    vote_result_pb->set_game_over(vr.game_over);
    for (const auto& [voter, target] : vr.votes) {
      (*vote_result_pb->mutable_votes())[names[voter]] = names[target];
    }
    for (const string& name : IndicesToNames(vr.dead, names)) {
      vote_result_pb->add_dead(name);
    }
  } else if (event.victim != kNoAgent) {
    pb.set_victim(names[event.victim]);
  }
  return pb;
}

string StatementDebugString(const internal::Statement& statement,
                            absl::Span<const string> names) {
  return absl::StrFormat("%s says: %s's %s is %s",
                         NameOrEmpty(statement.speaker, names),
                         NameOrEmpty(statement.subject, names),
                         PredicateName(statement.predicate), statement.value);
}

string EventDebugString(const internal::Event& event,
                        absl::Span<const string> names) {
  string details;
  if (event.statement.has_value()) {
    details = StatementDebugString(*event.statement, names);
  } else if (event.vote_result.has_value()) {
    const int ejected = event.vote_result->ejected;
    details = ejected == kNoAgent
                  ? "nobody ejected"
                  : absl::StrFormat("%s ejected", names[ejected]);
  } else if (event.victim != kNoAgent) {
    details = absl::StrFormat("victim %s", names[event.victim]);
  }
  return absl::StrFormat(
      "%s by %s at %s (%s%s%s) t=%.1f", ActionKind_Name(event.action),
      event.actor == kNoAgent ? "<world>" : names[event.actor],
      event.location.empty() ? "<unknown>" : event.location,
      Visibility_Name(event.visibility),
      event.witnesses.empty() ? "" : ", witnesses: " + absl::StrJoin(
          IndicesToNames(event.witnesses, names), " "),
      details.empty() ? "" : "; " + details, event.timestamp);
}

}  // namespace kripke
