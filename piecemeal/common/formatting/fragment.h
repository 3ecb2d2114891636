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

#ifndef PIECEMEAL_COMMON_FORMATTING_FRAGMENT_H_
#define PIECEMEAL_COMMON_FORMATTING_FRAGMENT_H_

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

class CodeWriter;
class Fragment;

// Fragments exclusively own their children.
using FragmentPtr = std::unique_ptr<Fragment>;

// Base class of the layout tree used for line splitting.
//
// A front end walks a syntax tree and builds a tree of Fragments that roughly
// follows it.  Each stateful fragment offers a small, ordered set of ways to
// split (States).  The solver picks one State per stateful fragment such that
// the rendered output fits the page, minimizing the total state cost and
// never violating the shape constraints parents place on their children.
//
// Lifecycle:
//   1) Fragments are created bottom-up; a fragment's children are fixed by the
//      time its constructor returns.
//   2) FinalizeFragmentTree() computes the memoized metrics
//      (ContainsHardNewline(), TotalCharacters(), StatefulOffspring()) once.
//      Querying them earlier is a fatal error.
//   3) The solver and the renderer only read the tree, except for pinning,
//      which changes each fragment at most once.
//
// Contract for subclasses: in State::Unsplit(), Format() writes its children
// inline, writes no text of its own, and admits kInline children.  All
// characters come from leaf fragments.  This makes TotalCharacters() the exact
// width of the unsplit fragment.
class Fragment {
 public:
  using ChildVisitor = std::function<void(Fragment *)>;
  using ConstrainFunction = std::function<void(Fragment *other, State state)>;

  virtual ~Fragment() = default;

  Fragment(const Fragment &) = delete;
  Fragment(Fragment &&) = delete;
  Fragment &operator=(const Fragment &) = delete;
  Fragment &operator=(Fragment &&) = delete;

  // Unique, for debug output only.
  int id() const { return id_; }

  // Name of the fragment kind as it appears in debug output, e.g. "Chain".
  absl::string_view DebugName() const { return debug_name_; }

  // The ordered list of states beyond the implicit State::Unsplit().
  // Empty for fragments that cannot split.  Fixed at construction.
  const std::vector<State> &AdditionalStates() const {
    return additional_states_;
  }

  // Returns State::Unsplit() followed by AdditionalStates().
  std::vector<State> LegalStates() const;

  // Returns true if 'state' is one of LegalStates().
  bool IsLegalState(State state) const;

  // True if this fragment has any state beyond State::Unsplit().
  bool IsStateful() const { return !additional_states_.empty(); }

  // The cost a solution pays when this fragment is in 'state'.
  // Subclasses may tweak the intrinsic cost of a state in context.
  virtual int StateCost(State state) const { return state.cost(); }

  // What shapes 'child' may take while this fragment is in 'state'.
  virtual ShapeSet AllowedChildShapes(State state,
                                      const Fragment &child) const {
    return ShapeSet::All();
  }

  // Whether this fragment always writes a newline (itself, or through one of
  // its children) when in 'state'.  This must only return true if a newline
  // is certain; "maybe" is false.
  virtual bool ContainsNewline(State state) const;

  // When this fragment is bound to 'state', calls 'constrain' for every other
  // fragment that must then be in a specific state.
  virtual void ApplyConstraints(State state,
                                const ConstrainFunction &constrain) const {}

  // If the memoized metrics alone prove that this fragment always ends up in
  // one state at 'page_width', returns that state.  This only prunes the
  // search: a wrong answer is a bug, std::nullopt is always safe.
  virtual std::optional<State> FixedStateForPageWidth(int page_width) const {
    return std::nullopt;
  }

  // Produces output for this fragment in 'state' through 'writer'.
  virtual void Format(CodeWriter *writer, State state) const = 0;

  // Calls 'visitor' on each direct child, in order.
  virtual void ForEachChild(const ChildVisitor &visitor) const = 0;

  // If this fragment has been pinned to a specific state, that state.
  std::optional<State> PinnedState() const { return pinned_state_; }

  // Forces this fragment to always use 'state', and recursively pins every
  // fragment that 'state' constrains.  Only the first pin takes effect.
  void Pin(State state);

  // Pins the fragment to whatever state prevents it from splitting.
  virtual void PreventSplit() { Pin(State::Unsplit()); }

  // Memoized metrics.  These are fatal errors before FinalizeFragmentTree().

  bool IsFinalized() const { return finalized_; }

  // Whether this fragment or any descendant contains a mandatory newline.
  bool ContainsHardNewline() const;

  // Number of characters of content in this fragment and its descendants.
  int TotalCharacters() const;

  // This fragment (if stateful) and all stateful descendants, in pre-order.
  const std::vector<Fragment *> &StatefulOffspring() const;

 protected:
  // 'debug_name' must outlive the fragment; string literals are expected.
  // Construction is counted as "create <debug_name>" in 'counter', or nowhere
  // if 'counter' is null.
  Fragment(absl::string_view debug_name, FragmentCounter *counter);

  // Declares the states beyond State::Unsplit().  They must be strictly
  // ascending by value, and within (0, State::kMaxValue].  Call once, from
  // the subclass constructor.
  void DeclareStates(std::vector<State> states);

  // Called once by FinalizeFragmentTree(), after all children are finalized.
  // The defaults fold the children's metrics.
  virtual bool CalculateContainsHardNewline() const;
  virtual int CalculateTotalCharacters() const;

 private:
  friend void FinalizeFragmentTree(Fragment *root);

  void Finalize();

  const int id_;
  const absl::string_view debug_name_;

  std::vector<State> additional_states_;
  std::optional<State> pinned_state_;

  bool finalized_ = false;
  bool contains_hard_newline_ = false;
  int total_characters_ = 0;
  std::vector<Fragment *> stateful_offspring_;
};

// Computes the memoized metrics of every fragment under 'root' bottom-up, and
// checks the state declarations the solver relies on.  Subtrees that are
// already finalized are left alone.
void FinalizeFragmentTree(Fragment *root);

// Human-readable form, for debugging: name, id, and pinned state if any.
std::ostream &operator<<(std::ostream &, const Fragment &);

// Prints the fragment tree, one fragment per line, indented by depth.
struct FragmentTreePrinter {
  explicit FragmentTreePrinter(const Fragment &root) : root(root) {}

  const Fragment &root;
};

std::ostream &operator<<(std::ostream &, const FragmentTreePrinter &);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_FRAGMENT_H_
