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

#ifndef PIECEMEAL_COMMON_FORMATTING_BASIC_FRAGMENTS_H_
#define PIECEMEAL_COMMON_FORMATTING_BASIC_FRAGMENTS_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {

// Leaf fragment holding literal text, such as a token.
// Text containing '\n' (a multi-line string, a line comment with its line
// break) is a hard newline.
class TextFragment final : public Fragment {
 public:
  explicit TextFragment(absl::string_view text,
                        FragmentCounter *counter = nullptr);

  const std::string &text() const { return text_; }

  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final {}

 protected:
  bool CalculateContainsHardNewline() const final;
  int CalculateTotalCharacters() const final;

 private:
  const std::string text_;
};

// Leaf fragment for a single space.  Containers keep spaces as separate
// children so that they can drop them where they split.
class SpaceFragment final : public Fragment {
 public:
  explicit SpaceFragment(FragmentCounter *counter = nullptr);

  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final {}

 protected:
  bool CalculateContainsHardNewline() const final { return false; }
  int CalculateTotalCharacters() const final { return 1; }
};

// Stateless concatenation of children.
class SequenceFragment final : public Fragment {
 public:
  explicit SequenceFragment(std::vector<FragmentPtr> children,
                            FragmentCounter *counter = nullptr);

  void Format(CodeWriter *writer, State state) const final;
  void ForEachChild(const ChildVisitor &visitor) const final;

 private:
  const std::vector<FragmentPtr> children_;
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_BASIC_FRAGMENTS_H_
