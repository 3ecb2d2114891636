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

#include "piecemeal/common/formatting/shape.h"

#include <ostream>

#include "piecemeal/common/util/enum-flags.h"

namespace piecemeal {

static const EnumNameMap<Shape> &ShapeStrings() {
  static const EnumNameMap<Shape> kShapeStringMap({
      {"inline", Shape::kInline},
      {"block", Shape::kBlock},
      {"headline", Shape::kHeadline},
      {"other", Shape::kOther},
  });
  return kShapeStringMap;
}

std::ostream &operator<<(std::ostream &stream, Shape shape) {
  return ShapeStrings().Unparse(shape, stream);
}

std::ostream &operator<<(std::ostream &stream, const ShapeSet &shapes) {
  stream << '{';
  const char *separator = "";
  for (const Shape shape :
       {Shape::kInline, Shape::kBlock, Shape::kHeadline, Shape::kOther}) {
    if (shapes.Contains(shape)) {
      stream << separator << shape;
      separator = ",";
    }
  }
  return stream << '}';
}

static const EnumNameMap<ShapeMode> &ShapeModeStrings() {
  static const EnumNameMap<ShapeMode> kShapeModeStringMap({
      {"merge", ShapeMode::kMerge},
      {"block", ShapeMode::kBlock},
      {"before-headline", ShapeMode::kBeforeHeadline},
      {"after-headline", ShapeMode::kAfterHeadline},
      {"other", ShapeMode::kOther},
  });
  return kShapeModeStringMap;
}

std::ostream &operator<<(std::ostream &stream, ShapeMode mode) {
  return ShapeModeStrings().Unparse(mode, stream);
}

}  // namespace piecemeal
