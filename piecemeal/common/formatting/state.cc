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

#include "piecemeal/common/formatting/state.h"

#include <ostream>

namespace piecemeal {

std::ostream &operator<<(std::ostream &stream, const State &state) {
  if (state.IsUnsplit()) return stream << "unsplit";
  if (state == State::FullSplit()) return stream << "split";
  return stream << "state" << state.value() << "/" << state.cost();
}

}  // namespace piecemeal
