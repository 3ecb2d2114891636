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

#include "piecemeal/common/formatting/infix-fragment.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "piecemeal/common/formatting/basic-fragments.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

InfixFragment::InfixFragment(std::vector<FragmentPtr> operands,
                             const std::vector<std::string> &operators,
                             FragmentCounter *counter)
    : Fragment("Infix", counter), operands_(std::move(operands)) {
  CHECK_GE(operands_.size(), 2) << "an operator sequence needs two operands";
  CHECK_EQ(operators.size() + 1, operands_.size())
      << "expected one operator between each pair of operands";
  for (const auto &operand : operands_) CHECK_NOTNULL(operand.get());
  for (const auto &op : operators) {
    joints_.push_back({std::make_unique<SpaceFragment>(counter),
                       std::make_unique<TextFragment>(op, counter),
                       std::make_unique<SpaceFragment>(counter)});
  }
  DeclareStates({State::FullSplit()});
}

ShapeSet InfixFragment::AllowedChildShapes(State state,
                                           const Fragment &child) const {
  return ShapeSet::AnyIf(!state.IsUnsplit());
}

std::optional<State> InfixFragment::FixedStateForPageWidth(
    int page_width) const {
  int total_length = 0;
  for (const auto &operand : operands_) {
    // An operand with a mandatory newline forces the operators to split.
    if (operand->ContainsHardNewline()) return State::FullSplit();
    total_length += operand->TotalCharacters();
    if (total_length > page_width) break;
  }
  // The operands alone do not fit on one line.
  if (total_length > page_width) return State::FullSplit();
  return std::nullopt;
}

void InfixFragment::Format(CodeWriter *writer, State state) const {
  if (state.IsUnsplit()) {
    writer->Format(*operands_.front());
    for (size_t i = 0; i < joints_.size(); ++i) {
      writer->Format(*joints_[i].space_before);
      writer->Format(*joints_[i].op);
      writer->Format(*joints_[i].space_after);
      writer->Format(*operands_[i + 1]);
    }
    return;
  }

  const ScopedIndent indent(writer, IndentKind::kExpression);
  writer->Format(*operands_.front());
  for (size_t i = 0; i < joints_.size(); ++i) {
    writer->Format(*joints_[i].space_before);
    writer->Format(*joints_[i].op);
    writer->Newline();
    writer->Format(*operands_[i + 1]);
  }
}

void InfixFragment::ForEachChild(const ChildVisitor &visitor) const {
  visitor(operands_.front().get());
  for (size_t i = 0; i < joints_.size(); ++i) {
    visitor(joints_[i].space_before.get());
    visitor(joints_[i].op.get());
    visitor(joints_[i].space_after.get());
    visitor(operands_[i + 1].get());
  }
}

}  // namespace piecemeal
