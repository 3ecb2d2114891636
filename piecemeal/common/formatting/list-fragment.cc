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

#include "piecemeal/common/formatting/list-fragment.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/basic-fragments.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

ListFragment::ListFragment(absl::string_view open,
                           std::vector<FragmentPtr> elements,
                           absl::string_view close, FragmentCounter *counter)
    : Fragment("List", counter),
      open_(std::make_unique<TextFragment>(open, counter)),
      elements_(std::move(elements)),
      close_(std::make_unique<TextFragment>(close, counter)) {
  for (size_t i = 0; i < elements_.size(); ++i) {
    CHECK_NOTNULL(elements_[i].get());
    if (i + 1 < elements_.size()) {
      commas_.push_back(std::make_unique<TextFragment>(",", counter));
      spaces_.push_back(std::make_unique<SpaceFragment>(counter));
    }
  }
  // Don't split an empty list.
  if (!elements_.empty()) DeclareStates({State::FullSplit()});
}

ShapeSet ListFragment::AllowedChildShapes(State state,
                                          const Fragment &child) const {
  return ShapeSet::AnyIf(!state.IsUnsplit());
}

std::optional<State> ListFragment::FixedStateForPageWidth(
    int page_width) const {
  // An unsplit list only admits inline elements, so an element with a
  // mandatory newline leaves no choice.
  for (const auto &element : elements_) {
    if (element->ContainsHardNewline()) return State::FullSplit();
  }
  return std::nullopt;
}

void ListFragment::Format(CodeWriter *writer, State state) const {
  if (state.IsUnsplit()) {
    writer->Format(*open_);
    for (size_t i = 0; i < elements_.size(); ++i) {
      writer->Format(*elements_[i]);
      if (i < commas_.size()) {
        writer->Format(*commas_[i]);
        writer->Format(*spaces_[i]);
      }
    }
    writer->Format(*close_);
    return;
  }

  writer->SetShapeMode(ShapeMode::kBlock);
  writer->Format(*open_);
  {
    const ScopedIndent indent(writer, IndentKind::kBlock);
    for (size_t i = 0; i < elements_.size(); ++i) {
      writer->Newline();
      writer->Format(*elements_[i]);
      if (i < commas_.size()) writer->Format(*commas_[i]);
    }
  }
  writer->Newline();
  writer->Format(*close_);
}

void ListFragment::ForEachChild(const ChildVisitor &visitor) const {
  visitor(open_.get());
  for (size_t i = 0; i < elements_.size(); ++i) {
    visitor(elements_[i].get());
    if (i < commas_.size()) {
      visitor(commas_[i].get());
      visitor(spaces_[i].get());
    }
  }
  visitor(close_.get());
}

}  // namespace piecemeal
