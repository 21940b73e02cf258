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

#ifndef SRC_MEMORY_H_
#define SRC_MEMORY_H_

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/event.h"
#include "src/game_log.pb.h"

namespace kripke {

using std::optional;
using std::string;

// Observation is first hand, hence FACT; hearsay is UNCERTAIN.
Certainty InitialCertainty(SourceType source_type);

// The unit of storage in an agent's memory: a shared event plus how this
// particular agent came to know about it.
class MemoryItem {
 public:
  static MemoryItem Observation(EventPtr event);
  static MemoryItem Hearsay(EventPtr event, int source);

  const internal::Event& GetEvent() const { return *event_; }
  const EventPtr& GetEventPtr() const { return event_; }
  SourceType GetSourceType() const { return source_type_; }
  // The claimed informant, kNoAgent for observations.
  int SourceId() const { return source_id_; }
  Certainty GetCertainty() const { return certainty_; }
  double TimeStart() const { return event_->timestamp; }
  bool IsFact() const { return certainty_ == FACT; }

  // Settles an UNCERTAIN item as VERIFIED or DISPROVED. Certainty only moves
  // forward: FACT items and already settled items are never changed.
  absl::Status Resolve(Certainty verdict);

  string DebugString(absl::Span<const string> names) const;

 private:
  MemoryItem(EventPtr event, SourceType source_type, int source_id);

  EventPtr event_;
  SourceType source_type_;
  int source_id_;
  Certainty certainty_;
};

// Checks hearsay against the first-hand facts in a memory log. There are no
// corroboration or contradiction rules yet, so this always returns nullopt;
// callers feed a returned verdict to MemoryItem::Resolve.
optional<Certainty> CorroborationVerdict(const MemoryItem& hearsay,
                                         absl::Span<const MemoryItem> memory);

}  // namespace kripke

#endif  // SRC_MEMORY_H_
