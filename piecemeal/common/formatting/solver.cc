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

#include "piecemeal/common/formatting/solver.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <queue>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {
namespace internal {

// Shared, immutable lookup structure for all partial solutions of one tree.
struct FragmentIndex {
  explicit FragmentIndex(const Fragment &root)
      : stateful(root.StatefulOffspring()) {
    for (size_t i = 0; i < stateful.size(); ++i) {
      slots.emplace(stateful[i], static_cast<int>(i));
      legal_states.push_back(stateful[i]->LegalStates());
    }
    IndexParents(root);
  }

  void IndexParents(const Fragment &parent) {
    parent.ForEachChild([this, &parent](Fragment *child) {
      parents.emplace(child, &parent);
      IndexParents(*child);
    });
  }

  // Position of 'fragment' in 'stateful', or -1.
  int SlotOf(const Fragment &fragment) const {
    const auto found = slots.find(&fragment);
    return found == slots.end() ? -1 : found->second;
  }

  const Fragment *ParentOf(const Fragment &fragment) const {
    const auto found = parents.find(&fragment);
    return found == parents.end() ? nullptr : found->second;
  }

  const std::vector<Fragment *> stateful;
  absl::flat_hash_map<const Fragment *, int> slots;
  // LegalStates() of each fragment in 'stateful'.
  std::vector<std::vector<State>> legal_states;
  absl::flat_hash_map<const Fragment *, const Fragment *> parents;
};

}  // namespace internal

// Search priority of partial solutions: lowest cost first, then least
// overflow, then the bindings in traversal order.
class SolutionOrdering {
 public:
  static bool Before(const Solution &l, const Solution &r) {
    return std::tie(l.cost_, l.overflow_, l.bindings_) <
           std::tie(r.cost_, r.overflow_, r.bindings_);
  }

  // Preference among fitting solutions of equal cost: the least state values
  // in traversal order, so that earlier fragments split less.
  static bool Preferred(const Solution &l, const Solution &r) {
    return l.States() < r.States();
  }

  // Preference among legal solutions that do not fit.
  static bool Better(const Solution &l, const Solution &r) {
    return std::tie(l.overflow_, l.cost_, l.bindings_) <
           std::tie(r.overflow_, r.cost_, r.bindings_);
  }

  static const std::vector<int> &Bindings(const Solution &s) {
    return s.bindings_;
  }

  static const Fragment *ExpandCandidate(const Solution &s) {
    return s.expand_candidate_;
  }
};

Solution::Solution(std::shared_ptr<const internal::FragmentIndex> index)
    : index_(std::move(index)), bindings_(index_->stateful.size(), -1) {
  for (const Fragment *fragment : index_->stateful) {
    cost_ += fragment->StateCost(State::Unsplit());
  }
}

std::optional<State> Solution::BoundState(const Fragment &fragment) const {
  const int slot = index_->SlotOf(fragment);
  if (slot < 0 || bindings_[slot] < 0) return std::nullopt;
  return index_->legal_states[slot][bindings_[slot]];
}

State Solution::StateOf(const Fragment &fragment) const {
  const std::optional<State> bound = BoundState(fragment);
  if (bound.has_value()) return *bound;
  return fragment.PinnedState().value_or(State::Unsplit());
}

const std::vector<Fragment *> &Solution::StatefulFragments() const {
  return index_->stateful;
}

std::vector<State> Solution::States() const {
  std::vector<State> states;
  states.reserve(index_->stateful.size());
  for (const Fragment *fragment : index_->stateful) {
    states.push_back(StateOf(*fragment));
  }
  return states;
}

bool Solution::TryBind(const Fragment &fragment, State state) {
  const int slot = index_->SlotOf(fragment);
  // Stateless fragments are always unsplit.
  if (slot < 0) return state.IsUnsplit();

  const std::vector<State> &legal = index_->legal_states[slot];
  const auto found = std::find(legal.begin(), legal.end(), state);
  CHECK(found != legal.end()) << fragment << " has no " << state;
  const int position = static_cast<int>(found - legal.begin());
  if (bindings_[slot] >= 0) return bindings_[slot] == position;

  bindings_[slot] = position;
  cost_ += fragment.StateCost(state) - fragment.StateCost(State::Unsplit());

  bool consistent = true;
  fragment.ApplyConstraints(
      state, [this, &consistent](Fragment *other, State constrained) {
        CHECK_NOTNULL(other);
        if (consistent && !TryBind(*other, constrained)) consistent = false;
      });
  return consistent;
}

bool Solution::CertainlyIllegal(const Fragment &fragment, State state) const {
  if (!fragment.ContainsNewline(state)) return false;
  const Fragment *parent = index_->ParentOf(fragment);
  if (parent == nullptr) return false;

  // The parent's constraint is only known once its state is.
  State parent_state = State::Unsplit();
  if (parent->IsStateful()) {
    const std::optional<State> bound = BoundState(*parent);
    if (!bound.has_value()) return false;
    parent_state = *bound;
  }
  return parent->AllowedChildShapes(parent_state, fragment) ==
         ShapeSet::OnlyInline();
}

void Solution::Evaluate(const FormatStyle &style, const Fragment &root) {
  CodeWriter writer(style, *this, /*measure_only=*/true);
  writer.Format(root);
  overflow_ = writer.Overflow();
  valid_ = writer.IsValid();
  expand_candidate_ = writer.ExpandCandidate();
  if (expand_candidate_ == nullptr && !(valid_ && overflow_ == 0)) {
    for (size_t i = 0; i < bindings_.size(); ++i) {
      if (bindings_[i] < 0) {
        expand_candidate_ = index_->stateful[i];
        break;
      }
    }
  }
}

void Solution::BindRemainingToMaximalStates() {
  for (size_t i = 0; i < bindings_.size(); ++i) {
    if (bindings_[i] >= 0) continue;
    Solution attempt(*this);
    const Fragment &fragment = *index_->stateful[i];
    if (attempt.TryBind(fragment, index_->legal_states[i].back())) {
      *this = std::move(attempt);
    } else {
      // Settle for unsplit; this cannot conflict since nothing bound it.
      TryBind(fragment, State::Unsplit());
    }
  }
}

std::ostream &operator<<(std::ostream &stream, const Solution &solution) {
  stream << "cost: " << solution.Cost() << ", overflow: " << solution.Overflow()
         << ", valid: " << (solution.IsValid() ? "yes" : "NO")
         << ", complete: " << (solution.CompletedSearch() ? "yes" : "NO");
  for (const Fragment *fragment : solution.StatefulFragments()) {
    stream << "\n  " << *fragment << ": " << solution.StateOf(*fragment);
  }
  return stream;
}

namespace {

// Wrapper around Solution for the sake of adapting to a std::priority_queue
// interface.
struct SearchState {
  std::shared_ptr<const Solution> solution;

  explicit SearchState(std::shared_ptr<const Solution> s)
      : solution(std::move(s)) {}

  // Inverted to min-heap: the *first* in SolutionOrdering has the highest
  // search priority.
  bool operator<(const SearchState &r) const {
    return SolutionOrdering::Before(*r.solution, *solution);
  }
};

// Offers every unpinned fragment the chance to fix its state from the
// metrics alone.
void PinFixedStates(const Fragment &root, int page_width) {
  for (Fragment *fragment : root.StatefulOffspring()) {
    if (fragment->PinnedState().has_value()) continue;
    const std::optional<State> fixed =
        fragment->FixedStateForPageWidth(page_width);
    if (fixed.has_value()) {
      VLOG(kVerbosePins) << "fixed " << *fragment << " at " << *fixed;
      fragment->Pin(*fixed);
    }
  }
}

}  // namespace

Solution SolveFragmentTree(const FormatStyle &style, Fragment *root) {
  CHECK_NOTNULL(root);
  CHECK(root->IsFinalized()) << "solving a tree before finalizing it";
  VLOG(kVerboseSolution) << "SolveFragmentTree on:\n"
                         << FragmentTreePrinter(*root);

  PinFixedStates(*root, style.column_limit);

  auto index = std::make_shared<const internal::FragmentIndex>(*root);
  Solution initial(index);
  for (const Fragment *fragment : index->stateful) {
    const std::optional<State> pinned = fragment->PinnedState();
    if (pinned.has_value() && !initial.TryBind(*fragment, *pinned)) {
      LOG(DFATAL) << "conflicting pins on " << *fragment;
    }
  }
  initial.Evaluate(style, *root);

  // Worklist of partial solutions, ordered by SolutionOrdering.
  std::priority_queue<SearchState> worklist;
  worklist.push(SearchState(std::make_shared<const Solution>(initial)));
  absl::flat_hash_set<std::vector<int>> seen;
  seen.insert(SolutionOrdering::Bindings(initial));

  // The first fitting solution popped has the least cost.  The rest of that
  // cost are still popped, and the Preferred() one among them wins.
  std::shared_ptr<const Solution> best_fit;
  std::shared_ptr<const Solution> best_legal;
  int state_count = 0;
  while (!worklist.empty()) {
    const std::shared_ptr<const Solution> next = worklist.top().solution;
    if (best_fit != nullptr && next->Cost() > best_fit->Cost()) break;
    worklist.pop();
    ++state_count;

    VLOG(kVerboseSearch) << "---- solver state " << state_count << " ----\n"
                         << *next;

    if (next->IsValid()) {
      if (next->Fits()) {
        if (best_fit == nullptr ||
            SolutionOrdering::Preferred(*next, *best_fit)) {
          best_fit = next;
        }
      } else if (best_legal == nullptr ||
                 SolutionOrdering::Better(*next, *best_legal)) {
        best_legal = next;
      }
    }

    if (state_count >= style.max_search_states) {
      // Search limit exceeded, abandon search.
      VLOG(kVerboseSolution) << "search limit of " << style.max_search_states
                             << " reached";
      const std::shared_ptr<const Solution> &best =
          best_fit != nullptr ? best_fit : best_legal;
      Solution result(best != nullptr ? *best : *next);
      if (best == nullptr) {
        // Greedily split everything left, and hope for the best.
        result.BindRemainingToMaximalStates();
        result.Evaluate(style, *root);
      }
      result.completed_ = false;
      return result;
    }

    const Fragment *candidate = SolutionOrdering::ExpandCandidate(*next);
    // Fitting solutions need no expansion.  A fully bound solution that does
    // not fit is a dead end.
    if (candidate == nullptr) continue;

    // Consider every state of the candidate.
    for (const State &state : candidate->LegalStates()) {
      if (next->CertainlyIllegal(*candidate, state)) {
        VLOG(kVerboseSearch) << "pruned " << *candidate << " in " << state;
        continue;
      }
      auto expanded = std::make_shared<Solution>(*next);
      if (!expanded->TryBind(*candidate, state)) continue;
      if (!seen.insert(SolutionOrdering::Bindings(*expanded)).second) continue;
      expanded->Evaluate(style, *root);
      worklist.push(SearchState(std::move(expanded)));
    }
  }  // while (!worklist.empty())

  if (best_fit != nullptr) {
    VLOG(kVerboseSolution) << "solution: " << *best_fit;
    return *best_fit;
  }
  if (best_legal != nullptr) {
    VLOG(kVerboseSolution) << "nothing fits, best solution: "
                           << *best_legal;
    return *best_legal;
  }
  LOG(WARNING) << "no state assignment satisfies the shape constraints of:\n"
               << FragmentTreePrinter(*root);
  return initial;
}

Solution SolveFragmentTree(Fragment *root, int page_width) {
  FormatStyle style;
  style.column_limit = page_width;
  return SolveFragmentTree(style, root);
}

}  // namespace piecemeal
