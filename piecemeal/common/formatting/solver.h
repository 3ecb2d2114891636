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

#ifndef PIECEMEAL_COMMON_FORMATTING_SOLVER_H_
#define PIECEMEAL_COMMON_FORMATTING_SOLVER_H_

#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {
namespace internal {
struct FragmentIndex;
}  // namespace internal

// A Solution assigns a state to each stateful fragment of a tree.
//
// While searching, it is a partial assignment: fragments without a binding
// format as State::Unsplit().  The Solution returned by SolveFragmentTree()
// is total in that sense: StateOf() answers for every fragment.
class Solution final : public StateAssignment {
 public:
  Solution(const Solution &) = default;
  Solution &operator=(const Solution &) = default;

  std::optional<State> BoundState(const Fragment &fragment) const final;

  // The state 'fragment' formats in.  State::Unsplit() for stateless and
  // unbound fragments.
  State StateOf(const Fragment &fragment) const;

  // The stateful fragments of the tree, in pre-order.
  const std::vector<Fragment *> &StatefulFragments() const;

  // StateOf() each of StatefulFragments().
  std::vector<State> States() const;

  // Sum of the state costs of all stateful fragments.
  int Cost() const { return cost_; }

  // Characters past the column limit, summed over all lines.
  int Overflow() const { return overflow_; }

  bool Fits() const { return overflow_ == 0; }

  // False only if no assignment satisfies the shape constraints.
  bool IsValid() const { return valid_; }

  // False if the search gave up at FormatStyle::max_search_states.  The
  // solution is then a greedy completion and may be far from optimal.
  bool CompletedSearch() const { return completed_; }

 private:
  friend Solution SolveFragmentTree(const FormatStyle &style, Fragment *root);
  friend class SolutionOrdering;

  explicit Solution(std::shared_ptr<const internal::FragmentIndex> index);

  // Binds 'fragment' to 'state' and, transitively, everything that state
  // constrains.  Returns false on a conflict with an existing binding.
  bool TryBind(const Fragment &fragment, State state);

  // Measures the assignment and records overflow, validity, and the fragment
  // to expand next.
  void Evaluate(const FormatStyle &style, const Fragment &root);

  // True if binding 'fragment' to 'state' must violate the shape the parent
  // of 'fragment' allows under this assignment.
  bool CertainlyIllegal(const Fragment &fragment, State state) const;

  // Binds every unbound fragment to its most split state, where
  // constraints permit.
  void BindRemainingToMaximalStates();

  std::shared_ptr<const internal::FragmentIndex> index_;

  // Per stateful fragment, the position of its state in LegalStates(), or
  // -1 if unbound.
  std::vector<int> bindings_;

  int cost_ = 0;
  int overflow_ = 0;
  bool valid_ = true;
  bool completed_ = true;
  const Fragment *expand_candidate_ = nullptr;
};

std::ostream &operator<<(std::ostream &, const Solution &);

// Chooses a state for every stateful fragment under 'root' such that the
// output fits within style.column_limit, with the lowest total state cost,
// and without violating any shape constraint.
//
// Before searching, fragments whose FixedStateForPageWidth() is known are
// pinned.  'root' must be finalized (see FinalizeFragmentTree()).
//
// Among solutions of equal cost, prefers the least States() in pre-order,
// so that earlier fragments split less.
//
// When nothing fits, returns the legal solution with the least overflow.
// This explores at most style.max_search_states partial solutions, and is
// deterministic.
Solution SolveFragmentTree(const FormatStyle &style, Fragment *root);

// Same, with a default FormatStyle at 'page_width' columns.
Solution SolveFragmentTree(Fragment *root, int page_width);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_SOLVER_H_
