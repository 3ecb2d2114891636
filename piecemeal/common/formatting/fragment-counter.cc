// Copyright 2017-2020 The Verible Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "piecemeal/common/formatting/fragment-counter.h"

#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace piecemeal {
namespace {
class NullFragmentCounter final : public FragmentCounter {
 public:
  void Count(absl::string_view) final {}
};
}  // namespace

FragmentCounter *FragmentCounter::Null() {
  static NullFragmentCounter null_counter;
  return &null_counter;
}

void TallyFragmentCounter::Count(absl::string_view label) {
  const auto found = tallies_.find(label);
  if (found != tallies_.end()) {
    ++found->second;
  } else {
    tallies_.emplace(std::string(label), 1);
  }
}

int TallyFragmentCounter::Tally(absl::string_view label) const {
  const auto found = tallies_.find(label);
  return found == tallies_.end() ? 0 : found->second;
}

std::ostream &operator<<(std::ostream &stream,
                         const TallyFragmentCounter &counter) {
  for (const auto &tally : counter.Tallies()) {
    stream << tally.first << ": " << tally.second << '\n';
  }
  return stream;
}

}  // namespace piecemeal
