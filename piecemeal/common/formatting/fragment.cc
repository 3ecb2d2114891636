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

#include "piecemeal/common/formatting/fragment.h"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

static int NextFragmentId() {
  static int next_id = 0;
  return next_id++;
}

Fragment::Fragment(absl::string_view debug_name, FragmentCounter *counter)
    : id_(NextFragmentId()), debug_name_(debug_name) {
  if (counter == nullptr) counter = FragmentCounter::Null();
  counter->Count(absl::StrCat("create ", debug_name));
}

void Fragment::DeclareStates(std::vector<State> states) {
  CHECK(additional_states_.empty()) << *this << " declared states twice";
  int previous = State::Unsplit().value();
  for (const State &state : states) {
    CHECK_GT(state.value(), previous)
        << *this << ": states must be strictly ascending, after unsplit";
    CHECK_LE(state.value(), State::kMaxValue) << *this;
    CHECK_GE(state.cost(), 0) << *this << ": negative cost for " << state;
    previous = state.value();
  }
  additional_states_ = std::move(states);
}

std::vector<State> Fragment::LegalStates() const {
  std::vector<State> states;
  states.reserve(additional_states_.size() + 1);
  states.push_back(State::Unsplit());
  states.insert(states.end(), additional_states_.begin(),
                additional_states_.end());
  return states;
}

bool Fragment::IsLegalState(State state) const {
  if (state.IsUnsplit()) return true;
  for (const State &declared : additional_states_) {
    if (declared == state) return true;
  }
  return false;
}

bool Fragment::ContainsNewline(State state) const {
  return !state.IsUnsplit() || ContainsHardNewline();
}

void Fragment::Pin(State state) {
  // Only pin once.  This happens when, say, a fragment prevented from
  // splitting is also large enough for FixedStateForPageWidth() to try to pin
  // it to its split state.
  if (pinned_state_.has_value()) return;

  CHECK(IsLegalState(state)) << "cannot pin " << *this << " to " << state;
  pinned_state_ = state;
  VLOG(kVerbosePins) << "pinned " << *this;

  // Pin whatever this state constrains too, recursively.
  ApplyConstraints(state, [](Fragment *other, State constrained_state) {
    CHECK_NOTNULL(other);
    other->Pin(constrained_state);
  });
}

bool Fragment::ContainsHardNewline() const {
  CHECK(finalized_) << "metrics of " << *this << " queried before finalize";
  return contains_hard_newline_;
}

int Fragment::TotalCharacters() const {
  CHECK(finalized_) << "metrics of " << *this << " queried before finalize";
  return total_characters_;
}

const std::vector<Fragment *> &Fragment::StatefulOffspring() const {
  CHECK(finalized_) << "metrics of " << *this << " queried before finalize";
  return stateful_offspring_;
}

bool Fragment::CalculateContainsHardNewline() const {
  bool any_has_newline = false;
  ForEachChild([&any_has_newline](Fragment *child) {
    any_has_newline |= child->ContainsHardNewline();
  });
  return any_has_newline;
}

int Fragment::CalculateTotalCharacters() const {
  int total = 0;
  ForEachChild(
      [&total](Fragment *child) { total += child->TotalCharacters(); });
  return total;
}

void Fragment::Finalize() {
  if (finalized_) return;
  ForEachChild([](Fragment *child) {
    CHECK_NOTNULL(child);
    child->Finalize();
  });

  // The solver relies on binding a state never lowering the cost of a
  // partial solution.
  const int unsplit_cost = StateCost(State::Unsplit());
  CHECK_GE(unsplit_cost, 0) << *this;
  for (const State &state : additional_states_) {
    CHECK_LE(unsplit_cost, StateCost(state))
        << *this << ": " << state << " is cheaper than unsplit";
  }

  contains_hard_newline_ = CalculateContainsHardNewline();
  total_characters_ = CalculateTotalCharacters();
  if (IsStateful()) stateful_offspring_.push_back(this);
  ForEachChild([this](Fragment *child) {
    const auto &offspring = child->stateful_offspring_;
    stateful_offspring_.insert(stateful_offspring_.end(), offspring.begin(),
                               offspring.end());
  });
  finalized_ = true;
}

void FinalizeFragmentTree(Fragment *root) {
  CHECK_NOTNULL(root);
  root->Finalize();
  VLOG(kVerboseSearch) << "finalized fragment tree:\n"
                       << FragmentTreePrinter(*root);
}

std::ostream &operator<<(std::ostream &stream, const Fragment &fragment) {
  stream << fragment.DebugName() << fragment.id();
  const auto pinned = fragment.PinnedState();
  if (pinned.has_value()) stream << '[' << *pinned << ']';
  return stream;
}

static void PrintFragmentTree(std::ostream &stream, const Fragment &fragment,
                              int depth) {
  stream << std::string(depth * 2, ' ') << fragment;
  if (fragment.IsFinalized()) {
    stream << " (chars: " << fragment.TotalCharacters()
           << (fragment.ContainsHardNewline() ? ", hard newline" : "") << ')';
  }
  stream << '\n';
  fragment.ForEachChild([&stream, depth](Fragment *child) {
    PrintFragmentTree(stream, *child, depth + 1);
  });
}

std::ostream &operator<<(std::ostream &stream,
                         const FragmentTreePrinter &printer) {
  PrintFragmentTree(stream, printer.root, 0);
  return stream;
}

}  // namespace piecemeal
