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

#ifndef PIECEMEAL_COMMON_FORMATTING_FRAGMENT_COUNTER_H_
#define PIECEMEAL_COMMON_FORMATTING_FRAGMENT_COUNTER_H_

#include <functional>
#include <iosfwd>
#include <map>
#include <string>

#include "absl/strings/string_view.h"

namespace piecemeal {

// FragmentCounter collects instrumentation events emitted while a fragment
// tree is built, such as "create Chain".  A counter is handed to fragment
// constructors explicitly; there is no process-wide sink.
class FragmentCounter {
 public:
  virtual ~FragmentCounter() = default;

  virtual void Count(absl::string_view label) = 0;

  // Returns a shared counter that discards everything.
  // This is what fragments use when constructed without a counter.
  static FragmentCounter *Null();
};

// Keeps a running total per label.
class TallyFragmentCounter : public FragmentCounter {
 public:
  using tally_map_type = std::map<std::string, int, std::less<>>;

  void Count(absl::string_view label) final;

  // Returns the number of times 'label' was counted.
  int Tally(absl::string_view label) const;

  const tally_map_type &Tallies() const { return tallies_; }

 private:
  tally_map_type tallies_;
};

// Prints one "label: count" line per label, sorted by label.
std::ostream &operator<<(std::ostream &, const TallyFragmentCounter &);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_FRAGMENT_COUNTER_H_
