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

#ifndef PIECEMEAL_COMMON_FORMATTING_FRAGMENT_TEST_UTILS_H_
#define PIECEMEAL_COMMON_FORMATTING_FRAGMENT_TEST_UTILS_H_

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/chain-fragment.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// Helpers for building small fragment trees in tests with compact syntax.
//
// Example use:
//
//   auto root = Seq(Text("f"), List("(", Text("a"), Text("b")));
//   FinalizeFragmentTree(root.get());
//
//   auto chain = Chain("target", Calls(Property(".getter"),
//                                      Call(".method", {"arg"})));

FragmentPtr Text(absl::string_view text);

// Collects fragments into a vector, which cannot be brace-initialized from
// move-only elements.
template <typename... Ts>
std::vector<FragmentPtr> Fragments(Ts &&...fragments) {
  std::vector<FragmentPtr> result;
  (result.push_back(std::forward<Ts>(fragments)), ...);
  return result;
}

FragmentPtr SequenceFragmentFrom(std::vector<FragmentPtr> children);

template <typename... Ts>
FragmentPtr Seq(Ts &&...children) {
  return SequenceFragmentFrom(Fragments(std::forward<Ts>(children)...));
}

// Matching closing delimiter for "(", "[" and "{".
absl::string_view CloseDelimiter(absl::string_view open);

FragmentPtr ListFragmentFrom(absl::string_view open,
                             std::vector<FragmentPtr> elements,
                             absl::string_view close);

// open elements... close
template <typename... Ts>
FragmentPtr List(absl::string_view open, Ts &&...elements) {
  return ListFragmentFrom(open, Fragments(std::forward<Ts>(elements)...),
                          CloseDelimiter(open));
}

// The calls' 'text' includes the leading "." or "..".

// A property access like ".name".
ChainCall Property(absl::string_view text);

// A call with no arguments like ".name()", which cannot split.
ChainCall EmptyCall(absl::string_view text);

// ".name(arguments...)", with each argument as a text fragment.
ChainCall Call(absl::string_view text,
               const std::vector<std::string> &arguments,
               CallType type = CallType::kSplittableCall);

// Same as Fragments(), for chain calls.
template <typename... Ts>
std::vector<ChainCall> Calls(Ts &&...calls) {
  std::vector<ChainCall> result;
  (result.push_back(std::forward<Ts>(calls)), ...);
  return result;
}

// Builds a chain with ChainFragment::DeriveOptions().
std::unique_ptr<ChainFragment> Chain(absl::string_view target,
                                     std::vector<ChainCall> calls,
                                     bool cascade = false,
                                     const FormatStyle &style = FormatStyle());

// Builds a cascade, like "target..first()..second(x)".
std::unique_ptr<ChainFragment> Cascade(absl::string_view target,
                                       std::vector<ChainCall> calls);

// Assignment with explicitly bound states, for rendering in tests.
class FixedStateAssignment final : public StateAssignment {
 public:
  FixedStateAssignment() = default;

  FixedStateAssignment &Bind(const Fragment &fragment, State state) {
    states_.insert_or_assign(&fragment, state);
    return *this;
  }

  std::optional<State> BoundState(const Fragment &fragment) const final {
    const auto found = states_.find(&fragment);
    if (found == states_.end()) return std::nullopt;
    return found->second;
  }

 private:
  absl::flat_hash_map<const Fragment *, State> states_;
};

// Default style at 'column_limit'.
FormatStyle StyleWithColumnLimit(int column_limit);

// Renders 'root' (which must be finalized) with 'states' at 'column_limit'.
RenderResult Render(const Fragment &root, const StateAssignment &states,
                    int column_limit = 80);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_FRAGMENT_TEST_UTILS_H_
