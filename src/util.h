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

#ifndef SRC_UTIL_H_
#define SRC_UTIL_H_

#include <filesystem>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "google/protobuf/message.h"

namespace kripke {
using google::protobuf::Message;
using std::filesystem::path;
using std::string;
using std::vector;

// Text-format proto files are used for game setups and snapshots.
absl::Status ReadProtoFromFile(const path& filename, Message* msg);
absl::Status WriteProtoToFile(const Message& msg, const path& filename);

// Returns the names of the given agent indices, in order.
vector<string> IndicesToNames(absl::Span<const int> indices,
                              absl::Span<const string> names);
}  // namespace kripke

#endif  // SRC_UTIL_H_
