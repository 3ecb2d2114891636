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

#ifndef PIECEMEAL_COMMON_FORMATTING_INFIX_FRAGMENT_H_
#define PIECEMEAL_COMMON_FORMATTING_INFIX_FRAGMENT_H_

#include <optional>
#include <string>
#include <vector>

#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// A series of operands joined by binary operators, like "a + b + c".
// State::FullSplit() breaks after every operator:
//
//     first +
//         second +
//         third
class InfixFragment final : public Fragment {
 public:
  // Requires at least two operands and one operator between each pair.
  InfixFragment(std::vector<FragmentPtr> operands,
                const std::vector<std::string> &operators,
                FragmentCounter *counter = nullptr);

  ShapeSet AllowedChildShapes(State state, const Fragment &child) const final;
  std::optional<State> FixedStateForPageWidth(int page_width) const final;
  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final;

 private:
  // The text between operands[i] and operands[i + 1]: " op ".
  struct Joint {
    FragmentPtr space_before;
    FragmentPtr op;
    FragmentPtr space_after;
  };

  const std::vector<FragmentPtr> operands_;
  std::vector<Joint> joints_;
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_INFIX_FRAGMENT_H_
