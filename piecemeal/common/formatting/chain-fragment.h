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

#ifndef PIECEMEAL_COMMON_FORMATTING_CHAIN_FRAGMENT_H_
#define PIECEMEAL_COMMON_FORMATTING_CHAIN_FRAGMENT_H_

#include <functional>
#include <iosfwd>
#include <vector>

#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// What kind of "call" a dotted expression in a call chain is.
enum class CallType {
  // A property access, like ".foo".
  kProperty,
  // A method call with an empty argument list that cannot split.
  kUnsplittableCall,
  // A method call with a non-empty argument list that can split, but not
  // block format.
  kSplittableCall,
  // A method call with a non-empty argument list that can block format.
  kBlockFormatCall,
};

std::ostream &operator<<(std::ostream &, CallType);

// One method or getter call in a chain, with any postfix operations applied
// to it.
class ChainCall {
 public:
  ChainCall(FragmentPtr call, CallType type);

  ChainCall(ChainCall &&) = default;
  ChainCall &operator=(ChainCall &&) = default;

  Fragment *fragment() const { return call_.get(); }

  CallType type() const { return type_; }

  bool CanSplit() const {
    return type_ == CallType::kSplittableCall ||
           type_ == CallType::kBlockFormatCall;
  }

  // Replaces the call with create_postfix(call), which must return a new
  // fragment containing the old one followed by the postfix operation
  // (like "!" or "[index]").
  void WrapPostfix(
      const std::function<FragmentPtr(FragmentPtr)> &create_postfix);

 private:
  FragmentPtr call_;
  CallType type_;
};

struct ChainOptions {
  // True for a cascade: a series of operations on one receiver.
  bool cascade = false;

  // Number of contiguous properties at the start of the calls.
  int leading_properties = 0;

  // Index of the call that may block format, or -1 if none can.
  int block_call_index = -1;

  // kExpression for regular chains, kCascade for cascades.
  IndentKind indent = IndentKind::kExpression;

  ChainTargetPolicy target_policy = ChainTargetPolicy::kCurrent;

  // Under ChainTargetPolicy::kLegacy, whether the target may contain newlines
  // when the chain is not fully split.  False for delimited targets, to
  // avoid:
  //
  //     function(
  //       argument,
  //     )
  //         .method();
  bool allow_split_in_target = true;
};

// A dotted series of property accesses or method calls, like:
//
//     target.getter.method().another.method();
//
// Handles splitting before the "." and controls which argument lists in the
// calls may contain newlines.  A chain splits in up to four ways.
//
// State::Unsplit(), everything on one line:
//
//     target.getter.method().another.method();
//
// BlockFormatTrailingCall(): no split before any ".", and only the block
// call's argument list may split, like a block:
//
//     target.property.first(1).block(
//       argument,
//     );
//
// SplitAfterProperties(): the leading properties stay with the target, and
// every later call goes on its own line:
//
//     motorcycle.wheels.front
//         .rotate();
//
// State::FullSplit(), split before every ".":
//
//     target
//         .getter
//         .method(argument)
//         .another;
class ChainFragment final : public Fragment {
 public:
  // 'calls' must not be empty.
  ChainFragment(FragmentPtr target, std::vector<ChainCall> calls,
                const ChainOptions &options,
                FragmentCounter *counter = nullptr);

  static constexpr State BlockFormatTrailingCall() {
    return State(static_cast<int>(ChainState::kBlockFormatTrailingCall), 0);
  }
  static constexpr State SplitAfterProperties() {
    return State(static_cast<int>(ChainState::kSplitAfterProperties), 1);
  }

  const Fragment &target() const { return *target_; }
  const std::vector<ChainCall> &calls() const { return calls_; }
  const ChainOptions &options() const { return options_; }

  int StateCost(State state) const final;
  ShapeSet AllowedChildShapes(State state, const Fragment &child) const final;
  bool ContainsNewline(State state) const final;
  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final;

  // Number of contiguous kProperty calls at the start of 'calls'.
  static int CountLeadingProperties(const std::vector<ChainCall> &calls);

  // The index of the call that may block format: the last call, or the
  // second-to-last if the last one is a property or unsplittable call
  // hanging off of it.  -1 if no call can block format.
  static int FindBlockCallIndex(const std::vector<ChainCall> &calls);

  // Options for a chain of 'calls' formatted with 'style'.  The leading
  // properties and block call come from 'calls', the target policy from
  // 'style'.  allow_split_in_target is left for the caller to decide.
  static ChainOptions DeriveOptions(const FormatStyle &style,
                                    const std::vector<ChainCall> &calls,
                                    bool cascade);

 private:
  enum class ChainState {
    kUnsplit = 0,
    kBlockFormatTrailingCall = 1,
    kSplitAfterProperties = 2,
    kFullSplit = State::kMaxValue,
  };

  // Index of 'child' in calls_, or -1 if it is not a call.
  int CallIndex(const Fragment &child) const;

  ShapeSet AllowedTargetShapes(State state) const;

  // Target, then the calls from 'first_split' on each on their own line.
  void FormatSplit(CodeWriter *writer, int first_split) const;

  const FragmentPtr target_;
  const std::vector<ChainCall> calls_;
  const ChainOptions options_;
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_CHAIN_FRAGMENT_H_
