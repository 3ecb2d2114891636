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

#ifndef PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_INIT_H_
#define PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_INIT_H_

#include "piecemeal/common/formatting/format-style.h"

namespace piecemeal {

// Initialize format style from flags.
// Each field of FormatStyle can be configured by the flag of the same name.
void InitializeFromFlags(FormatStyle *style);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_FORMAT_STYLE_INIT_H_
