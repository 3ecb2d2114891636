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

#include "piecemeal/common/formatting/format-style.h"

#include <iostream>
#include <sstream>
#include <string>

#include "absl/strings/string_view.h"
#include "piecemeal/common/util/enum-flags.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

// This mapping defines how this enum is displayed and parsed.
static const EnumNameMap<ChainTargetPolicy> &ChainTargetPolicyStrings() {
  static const EnumNameMap<ChainTargetPolicy> kChainTargetPolicyStringMap({
      {"legacy", ChainTargetPolicy::kLegacy},
      {"current", ChainTargetPolicy::kCurrent},
  });
  return kChainTargetPolicyStringMap;
}

std::ostream &operator<<(std::ostream &stream, ChainTargetPolicy p) {
  return ChainTargetPolicyStrings().Unparse(p, stream);
}

bool AbslParseFlag(absl::string_view text, ChainTargetPolicy *policy,
                   std::string *error) {
  return ChainTargetPolicyStrings().Parse(text, policy, error,
                                          "ChainTargetPolicy");
}

std::string AbslUnparseFlag(const ChainTargetPolicy &policy) {
  return std::string{ChainTargetPolicyStrings().EnumName(policy)};
}

static const EnumNameMap<IndentKind> &IndentKindStrings() {
  static const EnumNameMap<IndentKind> kIndentKindStringMap({
      {"none", IndentKind::kNone},
      {"block", IndentKind::kBlock},
      {"expression", IndentKind::kExpression},
      {"cascade", IndentKind::kCascade},
  });
  return kIndentKindStringMap;
}

std::ostream &operator<<(std::ostream &stream, IndentKind kind) {
  return IndentKindStrings().Unparse(kind, stream);
}

bool AbslParseFlag(absl::string_view text, IndentKind *kind,
                   std::string *error) {
  return IndentKindStrings().Parse(text, kind, error, "IndentKind");
}

std::string AbslUnparseFlag(const IndentKind &kind) {
  std::ostringstream stream;
  stream << kind;
  return stream.str();
}

int FormatStyle::IndentationFor(IndentKind kind) const {
  switch (kind) {
    case IndentKind::kNone:
      return 0;
    case IndentKind::kBlock:
      return indentation_spaces;
    case IndentKind::kExpression:
      return wrap_spaces;
    case IndentKind::kCascade:
      return cascade_indentation_spaces;
  }
  LOG(DFATAL) << "Unknown indentation kind: " << static_cast<int>(kind);
  return 0;
}

}  // namespace piecemeal
