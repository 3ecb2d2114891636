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

#include "piecemeal/common/formatting/format-style-init.h"

#include "absl/flags/flag.h"
#include "piecemeal/common/formatting/format-style.h"

ABSL_FLAG(int, indentation_spaces, 2,
          "Each block indentation level adds this many spaces.");

ABSL_FLAG(int, wrap_spaces, 4,
          "Each expression continuation level adds this many spaces.  This "
          "applies to split operator sequences and split call chains.");

ABSL_FLAG(int, cascade_indentation_spaces, 2,
          "Each cascade section level adds this many spaces.");

ABSL_FLAG(int, column_limit, 80,
          "Target line length limit to stay under when formatting.");

ABSL_FLAG(int, max_search_states, 100000,
          "Limits the number of partial solutions explored by the layout "
          "solver.  Beyond this, the best legal solution found so far is "
          "used.");

ABSL_FLAG(piecemeal::ChainTargetPolicy, chain_target_policy,
          piecemeal::ChainTargetPolicy::kCurrent,
          "Whether the target of an unsplit call chain may break: "
          "{legacy,current}.");

namespace piecemeal {
void InitializeFromFlags(FormatStyle *style) {
#define STYLE_FROM_FLAG(name) style->name = absl::GetFlag(FLAGS_##name)

  // Simply in the sequence as declared in struct FormatStyle
  STYLE_FROM_FLAG(indentation_spaces);
  STYLE_FROM_FLAG(wrap_spaces);
  STYLE_FROM_FLAG(cascade_indentation_spaces);
  STYLE_FROM_FLAG(column_limit);
  STYLE_FROM_FLAG(max_search_states);
  STYLE_FROM_FLAG(chain_target_policy);

#undef STYLE_FROM_FLAG
}
}  // namespace piecemeal
