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

#include "piecemeal/common/formatting/basic-fragments.h"

#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

TextFragment::TextFragment(absl::string_view text, FragmentCounter *counter)
    : Fragment("Text", counter), text_(text) {}

void TextFragment::Format(CodeWriter *writer, State state) const {
  writer->Write(text_);
}

bool TextFragment::CalculateContainsHardNewline() const {
  return absl::StrContains(text_, '\n');
}

int TextFragment::CalculateTotalCharacters() const {
  return static_cast<int>(text_.length());
}

SpaceFragment::SpaceFragment(FragmentCounter *counter)
    : Fragment("Space", counter) {}

void SpaceFragment::Format(CodeWriter *writer, State state) const {
  writer->Write(" ");
}

SequenceFragment::SequenceFragment(std::vector<FragmentPtr> children,
                                   FragmentCounter *counter)
    : Fragment("Sequence", counter), children_(std::move(children)) {
  for (const auto &child : children_) CHECK_NOTNULL(child.get());
}

void SequenceFragment::Format(CodeWriter *writer, State state) const {
  for (const auto &child : children_) writer->Format(*child);
}

void SequenceFragment::ForEachChild(const ChildVisitor &visitor) const {
  for (const auto &child : children_) visitor(child.get());
}

}  // namespace piecemeal
