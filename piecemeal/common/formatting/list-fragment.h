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

#ifndef PIECEMEAL_COMMON_FORMATTING_LIST_FRAGMENT_H_
#define PIECEMEAL_COMMON_FORMATTING_LIST_FRAGMENT_H_

#include <optional>
#include <vector>

#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// A delimited, comma-separated list such as an argument list or a collection
// literal.
//
// State::Unsplit():
//
//     (first, second)
//
// State::FullSplit() puts every element on its own block-indented line and is
// block-shaped:
//
//     (
//       first,
//       second
//     )
//
// An empty list, like "()", cannot split.
class ListFragment final : public Fragment {
 public:
  ListFragment(absl::string_view open, std::vector<FragmentPtr> elements,
               absl::string_view close, FragmentCounter *counter = nullptr);

  size_t size() const { return elements_.size(); }

  ShapeSet AllowedChildShapes(State state, const Fragment &child) const final;
  std::optional<State> FixedStateForPageWidth(int page_width) const final;
  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final;

 private:
  const FragmentPtr open_;
  const std::vector<FragmentPtr> elements_;
  // One comma and one space between each pair of elements.
  std::vector<FragmentPtr> commas_;
  std::vector<FragmentPtr> spaces_;
  const FragmentPtr close_;
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_LIST_FRAGMENT_H_
