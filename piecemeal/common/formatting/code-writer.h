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

#ifndef PIECEMEAL_COMMON_FORMATTING_CODE_WRITER_H_
#define PIECEMEAL_COMMON_FORMATTING_CODE_WRITER_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// Read-only view of which state each fragment is bound to.
class StateAssignment {
 public:
  virtual ~StateAssignment() = default;

  // Returns the state 'fragment' is bound to, or std::nullopt if it is
  // unbound.  Unbound fragments format as State::Unsplit().
  virtual std::optional<State> BoundState(const Fragment &fragment) const = 0;
};

// Assignment that binds exactly the pinned fragments.
class PinnedStateAssignment final : public StateAssignment {
 public:
  std::optional<State> BoundState(const Fragment &fragment) const final {
    return fragment.PinnedState();
  }
};

// CodeWriter is the sink fragments format themselves into.
//
// It tracks indentation, the current column, and how far lines run past the
// column limit.  While each fragment is formatted, it classifies the
// fragment's Shape and checks it against what the parent fragment allows.
//
// In measuring mode (used by the solver), no text is produced: a fragment that
// cannot contain a newline under the current assignment is accounted for by
// its TotalCharacters() without being visited.
class CodeWriter {
 public:
  CodeWriter(const FormatStyle &style, const StateAssignment &states,
             bool measure_only);

  CodeWriter(const CodeWriter &) = delete;
  CodeWriter &operator=(const CodeWriter &) = delete;

  // -- Operations for Fragment::Format() implementations.

  // Increases the indentation of lines started by later Newline() calls by
  // one level of 'kind'.  The current line keeps its indentation.
  // Must be paired with PopIndent(); prefer ScopedIndent.
  void PushIndent(IndentKind kind);

  void PopIndent();

  // Changes how the shape of the fragment currently being formatted is
  // determined from here on.
  void SetShapeMode(ShapeMode mode);

  // Ends the current line.  The next line gets the indentation in effect now;
  // it is written with the line's first text.
  void Newline();

  // Formats 'fragment' in the state the assignment gives it.
  // If 'separate' is true, 'fragment' owns its last line: text written
  // afterwards starts on a new line.
  void Format(const Fragment &fragment, bool separate = false);

  // Writes literal text.  Only leaf fragments should call this.
  // Embedded newlines are hard line breaks.
  void Write(absl::string_view text);

  // -- Results.

  // The formatted text.  Empty in measuring mode.
  const std::string &Text() const { return text_; }

  // Total number of characters past the column limit, over all lines.
  int Overflow() const { return overflow_; }

  // False if any fragment took a shape its parent does not allow.
  bool IsValid() const { return valid_; }

  // Shape of the outermost fragment formatted.
  Shape RootShape() const { return root_shape_; }

  // The unbound stateful fragment that the first problem (overflow or shape
  // violation) points at: the outermost unbound one on the formatting stack,
  // else the first unbound one within the fragment where the problem was
  // found.  nullptr if there was no problem or no such fragment.
  const Fragment *ExpandCandidate() const { return expand_candidate_; }

 private:
  // Formatting state of one fragment on the stack.
  struct Frame {
    const Fragment *fragment;
    State state;
    bool bound;

    ShapeMode mode = ShapeMode::kMerge;
    bool any_newline = false;
    // Merge of the shapes seen in kMerge mode.
    Shape merged = Shape::kInline;
    bool block_newline = false;
    bool other_newline = false;
    bool headline_broken = false;
    bool after_headline_newline = false;

    Frame(const Fragment *f, State s, bool b)
        : fragment(f), state(s), bound(b) {}

    // Accounts for a newline written directly (child_shape == nullopt) or a
    // child of non-inline shape.
    void AddNewline(std::optional<Shape> child_shape);

    Shape ResultShape() const;
  };

  State StateOf(const Fragment &fragment, bool *bound) const;

  // True if 'fragment' is guaranteed to format on one line with exactly
  // TotalCharacters() characters under the current assignment.
  bool FormatsInline(const Fragment &fragment) const;

  void BeginText();
  void AdvanceColumn(int length, const Fragment &site);
  void EndFragment(const Fragment &fragment, Shape shape, bool separate);
  void RecordProblem(const Fragment &site);

  const FormatStyle &style_;
  const StateAssignment &states_;
  const bool measure_only_;

  std::string text_;
  int column_ = 0;
  bool at_line_start_ = true;
  bool must_break_ = false;

  std::vector<int> indents_;
  int indentation_ = 0;
  // Indentation of the current line, fixed when the line was started.
  int line_indentation_ = 0;

  std::vector<Frame> frames_;

  int overflow_ = 0;
  bool valid_ = true;
  bool problem_recorded_ = false;
  const Fragment *expand_candidate_ = nullptr;
  Shape root_shape_ = Shape::kInline;
};

// Pushes indentation for the lifetime of this object.  The matching pop
// happens on every exit path.
class ScopedIndent {
 public:
  ScopedIndent(CodeWriter *writer, IndentKind kind) : writer_(writer) {
    writer_->PushIndent(kind);
  }
  ~ScopedIndent() { writer_->PopIndent(); }

  ScopedIndent(const ScopedIndent &) = delete;
  ScopedIndent(ScopedIndent &&) = delete;
  ScopedIndent &operator=(const ScopedIndent &) = delete;
  ScopedIndent &operator=(ScopedIndent &&) = delete;

 private:
  CodeWriter *writer_;
};

struct RenderResult {
  std::string text;
  Shape shape = Shape::kInline;
  int overflow = 0;
  bool valid = true;
};

// Formats 'root' with the states of 'states' and returns the text.
RenderResult RenderFragmentTree(const FormatStyle &style, const Fragment &root,
                                const StateAssignment &states);

std::ostream &operator<<(std::ostream &, const RenderResult &);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_CODE_WRITER_H_
