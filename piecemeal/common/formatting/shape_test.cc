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

#include <sstream>

#include "gtest/gtest.h"

namespace piecemeal {
namespace {

constexpr Shape kAllShapes[] = {Shape::kInline, Shape::kBlock,
                                Shape::kHeadline, Shape::kOther};

TEST(MergeShapesTest, InlineIsIdentity) {
  for (const Shape shape : kAllShapes) {
    EXPECT_EQ(MergeShapes(Shape::kInline, shape), shape);
    EXPECT_EQ(MergeShapes(shape, Shape::kInline), shape);
  }
}

TEST(MergeShapesTest, TwoNonInlineShapesMakeOther) {
  for (const Shape left : kAllShapes) {
    if (left == Shape::kInline) continue;
    for (const Shape right : kAllShapes) {
      if (right == Shape::kInline) continue;
      EXPECT_EQ(MergeShapes(left, right), Shape::kOther)
          << left << " + " << right;
    }
  }
}

TEST(MergeShapesTest, Commutative) {
  for (const Shape left : kAllShapes) {
    for (const Shape right : kAllShapes) {
      EXPECT_EQ(MergeShapes(left, right), MergeShapes(right, left));
    }
  }
}

TEST(MergeShapesTest, Associative) {
  for (const Shape a : kAllShapes) {
    for (const Shape b : kAllShapes) {
      for (const Shape c : kAllShapes) {
        EXPECT_EQ(MergeShapes(MergeShapes(a, b), c),
                  MergeShapes(a, MergeShapes(b, c)))
            << a << ", " << b << ", " << c;
      }
    }
  }
}

TEST(ShapeSetTest, Empty) {
  const ShapeSet none;
  EXPECT_TRUE(none.empty());
  for (const Shape shape : kAllShapes) EXPECT_FALSE(none.Contains(shape));
}

TEST(ShapeSetTest, All) {
  const ShapeSet all = ShapeSet::All();
  for (const Shape shape : kAllShapes) EXPECT_TRUE(all.Contains(shape));
  EXPECT_EQ(all, ShapeSet({Shape::kInline, Shape::kBlock, Shape::kHeadline,
                           Shape::kOther}));
}

TEST(ShapeSetTest, OnlyInlineAndOnlyBlock) {
  EXPECT_EQ(ShapeSet::OnlyInline(), ShapeSet({Shape::kInline}));
  EXPECT_EQ(ShapeSet::OnlyBlock(), ShapeSet({Shape::kBlock}));
  EXPECT_NE(ShapeSet::OnlyInline(), ShapeSet::OnlyBlock());
  EXPECT_FALSE(ShapeSet::OnlyBlock().Contains(Shape::kInline));
}

TEST(ShapeSetTest, AnyIf) {
  EXPECT_EQ(ShapeSet::AnyIf(true), ShapeSet::All());
  EXPECT_EQ(ShapeSet::AnyIf(false), ShapeSet::OnlyInline());
}

TEST(ShapeSetTest, Print) {
  std::ostringstream stream;
  stream << ShapeSet({Shape::kOther, Shape::kInline}) << ' ' << ShapeSet();
  EXPECT_EQ(stream.str(), "{inline,other} {}");
}

TEST(ShapeModeTest, Print) {
  std::ostringstream stream;
  stream << ShapeMode::kBeforeHeadline << ' ' << Shape::kHeadline;
  EXPECT_EQ(stream.str(), "before-headline headline");
}

}  // namespace
}  // namespace piecemeal
