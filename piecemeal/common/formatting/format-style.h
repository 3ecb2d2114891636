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

#ifndef PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_H_
#define PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_H_

#include <iosfwd>
#include <string>

#include "absl/strings/string_view.h"

namespace piecemeal {

// How a chain fragment treats line breaks inside its target expression when
// the chain itself is not fully split.
enum class ChainTargetPolicy {
  // The target may contain newlines unless the chain was built with
  // allow_split_in_target = false (delimited targets), in which case it must
  // stay on one line until the chain fully splits.
  kLegacy,
  // The target may be block-shaped (for example a collection literal) but not
  // headline- or other-shaped until the chain fully splits.
  kCurrent,
};

std::ostream &operator<<(std::ostream &, ChainTargetPolicy);

bool AbslParseFlag(absl::string_view, ChainTargetPolicy *, std::string *);

std::string AbslUnparseFlag(const ChainTargetPolicy &);

// Kinds of indentation a fragment may push while it is formatted.
enum class IndentKind {
  // No additional indentation.
  kNone,
  // Body of a delimited block: FormatStyle::indentation_spaces.
  kBlock,
  // Continuation of a split expression: FormatStyle::wrap_spaces.
  kExpression,
  // Sections of a cascade: FormatStyle::cascade_indentation_spaces.
  kCascade,
};

std::ostream &operator<<(std::ostream &, IndentKind);

bool AbslParseFlag(absl::string_view, IndentKind *, std::string *);

std::string AbslUnparseFlag(const IndentKind &);

// Style configuration for fragment layout.
struct FormatStyle {
  // Each block indentation level adds this many spaces.
  int indentation_spaces = 2;

  // Each expression continuation level adds this many spaces.
  int wrap_spaces = 4;

  // Each cascade section level adds this many spaces.
  int cascade_indentation_spaces = 2;

  // Target line length limit to stay under when formatting.  This is the
  // page width handed to the solver.
  int column_limit = 80;

  // Bounds the number of partial solutions the solver explores.  When this is
  // exceeded the best legal solution found so far is returned, or a greedily
  // completed one if none is legal yet.
  int max_search_states = 100000;

  // Target line-breaking convention used by chain fragments built from this
  // style.
  ChainTargetPolicy chain_target_policy = ChainTargetPolicy::kCurrent;

  // Returns the number of spaces one level of 'kind' indents by.
  int IndentationFor(IndentKind kind) const;

  // -- Note: when adding new fields, add them in format-style-init.cc
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_H_
