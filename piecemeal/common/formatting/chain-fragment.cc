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

#include "piecemeal/common/formatting/chain-fragment.h"

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/enum-flags.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

static const EnumNameMap<CallType> &CallTypeNames() {
  static const EnumNameMap<CallType> kCallTypeNames({
      {"property", CallType::kProperty},
      {"unsplittable-call", CallType::kUnsplittableCall},
      {"splittable-call", CallType::kSplittableCall},
      {"block-format-call", CallType::kBlockFormatCall},
  });
  return kCallTypeNames;
}

std::ostream &operator<<(std::ostream &stream, CallType type) {
  return CallTypeNames().Unparse(type, stream);
}

ChainCall::ChainCall(FragmentPtr call, CallType type)
    : call_(std::move(call)), type_(type) {
  CHECK_NOTNULL(call_.get());
}

void ChainCall::WrapPostfix(
    const std::function<FragmentPtr(FragmentPtr)> &create_postfix) {
  call_ = create_postfix(std::move(call_));
  CHECK_NOTNULL(call_.get());
}

ChainFragment::ChainFragment(FragmentPtr target, std::vector<ChainCall> calls,
                             const ChainOptions &options,
                             FragmentCounter *counter)
    : Fragment("Chain", counter),
      target_(std::move(target)),
      calls_(std::move(calls)),
      options_(options) {
  CHECK_NOTNULL(target_.get());
  // If there are no calls, there should be no chain.
  CHECK(!calls_.empty()) << "a chain needs at least one call";
  const int num_calls = static_cast<int>(calls_.size());
  CHECK_GE(options_.leading_properties, 0);
  CHECK_LE(options_.leading_properties, num_calls);
  CHECK_GE(options_.block_call_index, -1);
  CHECK_LT(options_.block_call_index, num_calls)
      << "block call index out of range";

  std::vector<State> states;
  if (options_.block_call_index != -1) {
    states.push_back(BlockFormatTrailingCall());
  }
  // With nothing but properties, this would be the same as unsplit.
  if (options_.leading_properties > 0 &&
      options_.leading_properties < num_calls) {
    states.push_back(SplitAfterProperties());
  }
  states.push_back(State::FullSplit());
  DeclareStates(std::move(states));
}

int ChainFragment::StateCost(State state) const {
  if (state == State::FullSplit()) {
    // Prefer splitting a cascade over splitting its target:
    //
    //     [element1, element2]
    //       ..cascade();
    if (options_.cascade) return 0;
    // Keep a chain of only properties together, and let the context split
    // instead:
    //
    //     variable =
    //         target.property.another;
    if (options_.leading_properties == static_cast<int>(calls_.size())) {
      return 2;
    }
  }
  return state.cost();
}

int ChainFragment::CallIndex(const Fragment &child) const {
  for (size_t i = 0; i < calls_.size(); ++i) {
    if (calls_[i].fragment() == &child) return static_cast<int>(i);
  }
  return -1;
}

ShapeSet ChainFragment::AllowedTargetShapes(State state) const {
  switch (options_.target_policy) {
    case ChainTargetPolicy::kLegacy:
      return ShapeSet::AnyIf(options_.allow_split_in_target ||
                             state == State::FullSplit());
    case ChainTargetPolicy::kCurrent:
      // Unless the chain itself splits before every call, only a block
      // shaped target may split.
      if (state == State::FullSplit()) return ShapeSet::All();
      return {Shape::kInline, Shape::kBlock};
  }
  LOG(DFATAL) << "unhandled target policy";
  return ShapeSet::All();
}

ShapeSet ChainFragment::AllowedChildShapes(State state,
                                           const Fragment &child) const {
  if (&child == target_.get()) return AllowedTargetShapes(state);

  const int index = CallIndex(child);
  switch (static_cast<ChainState>(state.value())) {
    case ChainState::kUnsplit:
      return ShapeSet::OnlyInline();
    case ChainState::kBlockFormatTrailingCall:
      return ShapeSet::AnyIf(index == options_.block_call_index);
    case ChainState::kSplitAfterProperties:
      // No splitting inside the properties that stay with the target.
      return ShapeSet::AnyIf(index >= options_.leading_properties);
    case ChainState::kFullSplit:
      return ShapeSet::All();
  }
  LOG(DFATAL) << *this << " has no " << state;
  return ShapeSet::All();
}

bool ChainFragment::ContainsNewline(State state) const {
  // Block formatting only breaks if the block call itself does.
  if (state == BlockFormatTrailingCall()) return ContainsHardNewline();
  return Fragment::ContainsNewline(state);
}

void ChainFragment::FormatSplit(CodeWriter *writer, int first_split) const {
  const int num_calls = static_cast<int>(calls_.size());
  const ScopedIndent indent(writer, options_.indent);
  writer->SetShapeMode(ShapeMode::kBeforeHeadline);
  writer->Format(*target_);
  for (int i = 0; i < first_split; ++i) {
    writer->Format(*calls_[i].fragment());
  }

  writer->SetShapeMode(ShapeMode::kAfterHeadline);
  for (int i = first_split; i < num_calls; ++i) {
    writer->Newline();
    // Every call except the last owns its line.
    writer->Format(*calls_[i].fragment(), /*separate=*/i < num_calls - 1);
  }
}

void ChainFragment::Format(CodeWriter *writer, State state) const {
  switch (static_cast<ChainState>(state.value())) {
    case ChainState::kBlockFormatTrailingCall:
      // A block formatted cascade is not block shaped to the surrounding
      // context.  Prefer:
      //
      //     variable = target
      //       ..cascade(argument);
      //
      // over:
      //
      //     variable = target..cascade(
      //       argument,
      //     );
      if (options_.cascade) writer->SetShapeMode(ShapeMode::kOther);
      ABSL_FALLTHROUGH_INTENDED;
    case ChainState::kUnsplit:
      writer->Format(*target_);
      for (const ChainCall &call : calls_) writer->Format(*call.fragment());
      return;
    case ChainState::kSplitAfterProperties:
      FormatSplit(writer, options_.leading_properties);
      return;
    case ChainState::kFullSplit:
      FormatSplit(writer, 0);
      return;
  }
  LOG(DFATAL) << *this << " cannot format in " << state;
}

void ChainFragment::ForEachChild(const ChildVisitor &visitor) const {
  visitor(target_.get());
  for (const ChainCall &call : calls_) visitor(call.fragment());
}

int ChainFragment::CountLeadingProperties(
    const std::vector<ChainCall> &calls) {
  int count = 0;
  for (const ChainCall &call : calls) {
    if (call.type() != CallType::kProperty) break;
    ++count;
  }
  return count;
}

int ChainFragment::FindBlockCallIndex(const std::vector<ChainCall> &calls) {
  const int num_calls = static_cast<int>(calls.size());
  if (num_calls == 0) return -1;
  const CallType last = calls.back().type();
  if (last == CallType::kBlockFormatCall) return num_calls - 1;
  // Allow a hanging property or unsplittable call after the block call:
  //
  //     target.method(
  //       argument,
  //     ).length;
  if (num_calls >= 2 &&
      (last == CallType::kProperty || last == CallType::kUnsplittableCall) &&
      calls[num_calls - 2].type() == CallType::kBlockFormatCall) {
    return num_calls - 2;
  }
  return -1;
}

ChainOptions ChainFragment::DeriveOptions(const FormatStyle &style,
                                          const std::vector<ChainCall> &calls,
                                          bool cascade) {
  ChainOptions options;
  options.cascade = cascade;
  options.leading_properties = CountLeadingProperties(calls);
  options.block_call_index = FindBlockCallIndex(calls);
  options.indent = cascade ? IndentKind::kCascade : IndentKind::kExpression;
  options.target_policy = style.chain_target_policy;
  return options;
}

}  // namespace piecemeal
