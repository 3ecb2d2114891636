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

#include "piecemeal/common/formatting/code-writer.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

void CodeWriter::Frame::AddNewline(std::optional<Shape> child_shape) {
  any_newline = true;
  switch (mode) {
    case ShapeMode::kMerge:
      merged = MergeShapes(merged, child_shape.value_or(Shape::kOther));
      break;
    case ShapeMode::kBlock:
      block_newline = true;
      break;
    case ShapeMode::kBeforeHeadline:
      headline_broken = true;
      break;
    case ShapeMode::kAfterHeadline:
      after_headline_newline = true;
      break;
    case ShapeMode::kOther:
      other_newline = true;
      break;
  }
}

Shape CodeWriter::Frame::ResultShape() const {
  if (!any_newline) return Shape::kInline;
  if (other_newline || headline_broken) return Shape::kOther;
  if (after_headline_newline) {
    return (merged == Shape::kInline && !block_newline) ? Shape::kHeadline
                                                        : Shape::kOther;
  }
  if (block_newline) {
    return merged == Shape::kInline ? Shape::kBlock : Shape::kOther;
  }
  return merged;
}

CodeWriter::CodeWriter(const FormatStyle &style, const StateAssignment &states,
                       bool measure_only)
    : style_(style), states_(states), measure_only_(measure_only) {}

void CodeWriter::PushIndent(IndentKind kind) {
  const int spaces = style_.IndentationFor(kind);
  indents_.push_back(spaces);
  indentation_ += spaces;
}

void CodeWriter::PopIndent() {
  CHECK(!indents_.empty()) << "PopIndent() without PushIndent()";
  indentation_ -= indents_.back();
  indents_.pop_back();
}

void CodeWriter::SetShapeMode(ShapeMode mode) {
  CHECK(!frames_.empty()) << "shape mode set outside of any fragment";
  frames_.back().mode = mode;
}

void CodeWriter::Newline() {
  if (!frames_.empty()) frames_.back().AddNewline(std::nullopt);
  if (!measure_only_) text_.push_back('\n');
  column_ = 0;
  at_line_start_ = true;
  line_indentation_ = indentation_;
  must_break_ = false;
}

State CodeWriter::StateOf(const Fragment &fragment, bool *bound) const {
  std::optional<State> state = states_.BoundState(fragment);
  if (!state.has_value()) state = fragment.PinnedState();
  *bound = state.has_value();
  return state.value_or(State::Unsplit());
}

bool CodeWriter::FormatsInline(const Fragment &fragment) const {
  if (fragment.ContainsHardNewline()) return false;
  bool bound = false;
  for (const Fragment *offspring : fragment.StatefulOffspring()) {
    if (!StateOf(*offspring, &bound).IsUnsplit()) return false;
  }
  return true;
}

void CodeWriter::Format(const Fragment &fragment, bool separate) {
  if (measure_only_ && FormatsInline(fragment)) {
    // The whole fragment lands on the current line, so only its width
    // matters.  Once the line overflows, only the overflow is accumulated.
    const int length = fragment.TotalCharacters();
    if (length > 0) {
      BeginText();
      AdvanceColumn(length, fragment);
    }
    EndFragment(fragment, Shape::kInline, separate);
    return;
  }

  bool bound = false;
  const State state = StateOf(fragment, &bound);
  frames_.emplace_back(&fragment, state, bound);
  const size_t indent_depth = indents_.size();

  fragment.Format(this, state);

  CHECK_EQ(indents_.size(), indent_depth)
      << fragment << " left its indentation unbalanced in " << state;
  const Shape shape = frames_.back().ResultShape();
  frames_.pop_back();
  EndFragment(fragment, shape, separate);
}

void CodeWriter::EndFragment(const Fragment &fragment, Shape shape,
                             bool separate) {
  if (frames_.empty()) {
    root_shape_ = shape;
  } else {
    Frame &parent = frames_.back();
    const ShapeSet allowed =
        parent.fragment->AllowedChildShapes(parent.state, fragment);
    if (!allowed.Contains(shape)) {
      VLOG(kVerboseSearch) << *parent.fragment << " in " << parent.state
                           << " allows " << allowed << " for " << fragment
                           << ", got " << shape;
      valid_ = false;
      RecordProblem(fragment);
    }
    if (shape != Shape::kInline) parent.AddNewline(shape);
  }
  if (separate) must_break_ = true;
}

void CodeWriter::Write(absl::string_view text) {
  CHECK(!frames_.empty()) << "text must be written by a fragment";
  const Fragment &site = *frames_.back().fragment;
  const std::vector<absl::string_view> lines = absl::StrSplit(text, '\n');
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) Newline();
    const absl::string_view line = lines[i];
    if (line.empty()) continue;
    BeginText();
    if (!measure_only_) text_.append(line.data(), line.size());
    AdvanceColumn(static_cast<int>(line.size()), site);
  }
}

void CodeWriter::BeginText() {
  if (must_break_) Newline();
  if (at_line_start_) {
    if (!measure_only_) text_.append(line_indentation_, ' ');
    column_ = line_indentation_;
    at_line_start_ = false;
  }
}

void CodeWriter::AdvanceColumn(int length, const Fragment &site) {
  const int limit = style_.column_limit;
  const int start = column_;
  column_ += length;
  if (column_ > limit) {
    overflow_ += column_ - std::max(start, limit);
    RecordProblem(site);
  }
}

void CodeWriter::RecordProblem(const Fragment &site) {
  if (problem_recorded_) return;
  problem_recorded_ = true;
  for (const Frame &frame : frames_) {
    if (frame.fragment->IsStateful() && !frame.bound) {
      expand_candidate_ = frame.fragment;
      return;
    }
  }
  bool bound = false;
  for (const Fragment *offspring : site.StatefulOffspring()) {
    StateOf(*offspring, &bound);
    if (!bound) {
      expand_candidate_ = offspring;
      return;
    }
  }
}

RenderResult RenderFragmentTree(const FormatStyle &style, const Fragment &root,
                                const StateAssignment &states) {
  CodeWriter writer(style, states, /*measure_only=*/false);
  writer.Format(root);
  RenderResult result;
  result.text = writer.Text();
  result.shape = writer.RootShape();
  result.overflow = writer.Overflow();
  result.valid = writer.IsValid();
  return result;
}

std::ostream &operator<<(std::ostream &stream, const RenderResult &result) {
  return stream << "shape: " << result.shape
                << ", overflow: " << result.overflow
                << ", valid: " << (result.valid ? "yes" : "NO") << "\n"
                << result.text;
}

}  // namespace piecemeal
