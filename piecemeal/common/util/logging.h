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

#ifndef PIECEMEAL_COMMON_UTIL_LOGGING_H_
#define PIECEMEAL_COMMON_UTIL_LOGGING_H_

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#include "absl/log/check.h"  // IWYU pragma: export
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include "absl/log/die_if_null.h"  // IWYU pragma: export
#include "absl/log/log.h"          // IWYU pragma: export

#define CHECK_NOTNULL(p) (void)ABSL_DIE_IF_NULL(p)

namespace piecemeal {

// Verbosity levels for VLOG tracing of layout decisions (--v=N).
enum VerboseLevel : int {
  // Solver entry and its final answer.
  kVerboseSolution = 2,
  // States fixed ahead of the search.
  kVerbosePins = 3,
  // Every solver step and shape check; very noisy.
  kVerboseSearch = 4,
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_UTIL_LOGGING_H_
