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

#include "piecemeal/common/formatting/fragment-test-utils.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/formatting/basic-fragments.h"
#include "piecemeal/common/formatting/chain-fragment.h"
#include "piecemeal/common/formatting/code-writer.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/list-fragment.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

FragmentPtr Text(absl::string_view text) {
  return std::make_unique<TextFragment>(text);
}

FragmentPtr SequenceFragmentFrom(std::vector<FragmentPtr> children) {
  return std::make_unique<SequenceFragment>(std::move(children));
}

absl::string_view CloseDelimiter(absl::string_view open) {
  if (open == "(") return ")";
  if (open == "[") return "]";
  if (open == "{") return "}";
  LOG(FATAL) << "no closing delimiter for " << open;
  return "";
}

FragmentPtr ListFragmentFrom(absl::string_view open,
                             std::vector<FragmentPtr> elements,
                             absl::string_view close) {
  return std::make_unique<ListFragment>(open, std::move(elements), close);
}

ChainCall Property(absl::string_view text) {
  return ChainCall(Text(text), CallType::kProperty);
}

ChainCall EmptyCall(absl::string_view text) {
  return ChainCall(Text(absl::StrCat(text, "()")),
                   CallType::kUnsplittableCall);
}

ChainCall Call(absl::string_view text,
               const std::vector<std::string> &arguments, CallType type) {
  std::vector<FragmentPtr> elements;
  for (const std::string &argument : arguments) {
    elements.push_back(Text(argument));
  }
  return ChainCall(
      Seq(Text(text), ListFragmentFrom("(", std::move(elements), ")")), type);
}

std::unique_ptr<ChainFragment> Chain(absl::string_view target,
                                     std::vector<ChainCall> calls,
                                     bool cascade, const FormatStyle &style) {
  const ChainOptions options =
      ChainFragment::DeriveOptions(style, calls, cascade);
  return std::make_unique<ChainFragment>(Text(target), std::move(calls),
                                         options);
}

std::unique_ptr<ChainFragment> Cascade(absl::string_view target,
                                       std::vector<ChainCall> calls) {
  return Chain(target, std::move(calls), /*cascade=*/true);
}

FormatStyle StyleWithColumnLimit(int column_limit) {
  FormatStyle style;
  style.column_limit = column_limit;
  return style;
}

RenderResult Render(const Fragment &root, const StateAssignment &states,
                    int column_limit) {
  return RenderFragmentTree(StyleWithColumnLimit(column_limit), root, states);
}

}  // namespace piecemeal
