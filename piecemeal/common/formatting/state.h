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

#ifndef PIECEMEAL_COMMON_FORMATTING_STATE_H_
#define PIECEMEAL_COMMON_FORMATTING_STATE_H_

#include <iosfwd>

namespace piecemeal {

// A State identifies one way that a fragment can be split into multiple lines,
// and carries the cost a solution pays for choosing it.
//
// Each fragment kind interprets its own state values.  Only Unsplit() and
// FullSplit() mean the same thing to every fragment: everything on one line,
// and split everywhere.  Fragment kinds with intermediate states keep their
// own private enumeration of values in between and convert them to State.
class State {
 public:
  // The largest state value.  Intermediate states must be below this.
  static constexpr int kMaxValue = 255;

  constexpr State(int value, int cost) : value_(value), cost_(cost) {}

  // The implicit initial state of every fragment.
  static constexpr State Unsplit() { return State(0, 0); }

  // The maximally split state a fragment can be in.
  static constexpr State FullSplit() { return State(kMaxValue, 1); }

  constexpr int value() const { return value_; }

  // How much a solution is penalized when this state is chosen.
  constexpr int cost() const { return cost_; }

  constexpr bool IsUnsplit() const { return value_ == 0; }

  // States are identified by value alone; a fragment never declares two
  // states with the same value.
  constexpr bool operator==(const State &r) const { return value_ == r.value_; }
  constexpr bool operator!=(const State &r) const { return value_ != r.value_; }
  constexpr bool operator<(const State &r) const { return value_ < r.value_; }
  constexpr bool operator>(const State &r) const { return value_ > r.value_; }
  constexpr bool operator<=(const State &r) const { return value_ <= r.value_; }
  constexpr bool operator>=(const State &r) const { return value_ >= r.value_; }

 private:
  int value_;
  int cost_;
};

// Human-readable form, for debugging.
std::ostream &operator<<(std::ostream &, const State &);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_STATE_H_
