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

#include "src/memory.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace kripke {

Certainty InitialCertainty(SourceType source_type) {
  switch (source_type) {
    case OBSERVATION:
      return FACT;
    case HEARSAY:
      return UNCERTAIN;
    default:
      CHECK(false) << "Invalid source type: " << SourceType_Name(source_type);
  }
  return UNCERTAIN;
}

MemoryItem::MemoryItem(EventPtr event, SourceType source_type, int source_id)
    : event_(std::move(event)), source_type_(source_type),
      source_id_(source_id), certainty_(InitialCertainty(source_type)) {
  CHECK(event_ != nullptr) << "Memory items need an event";
}

MemoryItem MemoryItem::Observation(EventPtr event) {
  return MemoryItem(std::move(event), OBSERVATION, kNoAgent);
}

MemoryItem MemoryItem::Hearsay(EventPtr event, int source) {
  CHECK_NE(source, kNoAgent) << "Hearsay needs an informant";
  return MemoryItem(std::move(event), HEARSAY, source);
}

absl::Status MemoryItem::Resolve(Certainty verdict) {
  if (verdict != VERIFIED && verdict != DISPROVED) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Hearsay resolves to VERIFIED or DISPROVED, got %s",
        Certainty_Name(verdict)));
  }
  if (certainty_ != UNCERTAIN) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Only UNCERTAIN items can be resolved, this one is %s",
        Certainty_Name(certainty_)));
  }
  certainty_ = verdict;
  return absl::OkStatus();
}

string MemoryItem::DebugString(absl::Span<const string> names) const {
  return absl::StrFormat(
      "%s %s %s: %s", SourceType_Name(source_type_), Certainty_Name(certainty_),
      source_id_ == kNoAgent ? "direct" : "from " + names[source_id_],
      EventDebugString(*event_, names));
}

optional<Certainty> CorroborationVerdict(const MemoryItem& hearsay,
                                         absl::Span<const MemoryItem> memory) {
  if (hearsay.GetCertainty() != UNCERTAIN) {
    return std::nullopt;
  }
  // TODO(olaola): check LOCATION statements against the ENTER events the
  // agent saw first hand, and DISPROVE the ones that contradict them.
  return std::nullopt;
}

}  // namespace kripke
