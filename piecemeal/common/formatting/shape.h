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

#ifndef PIECEMEAL_COMMON_FORMATTING_SHAPE_H_
#define PIECEMEAL_COMMON_FORMATTING_SHAPE_H_

#include <cstdint>
#include <initializer_list>
#include <iosfwd>

namespace piecemeal {

// The spatial "shape" of a formatted fragment.
//
// Much of the formatting style is expressed as constraints on which shapes a
// child may take while its parent is in a given state.  For example, a newline
// inside an operand forces the surrounding operator sequence to split, while an
// assignment may tolerate a block-shaped right-hand side without splitting.
enum class Shape {
  // Fits entirely on one line.
  kInline,
  // A delimited, block-indented structure like a function body, collection
  // literal, or argument list.
  kBlock,
  // A single leading line followed by further lines, as in:
  //
  //     target.header
  //         .method()
  //         .chain()
  kHeadline,
  // Split across lines, but in no other well-defined shape.
  kOther,
};

std::ostream &operator<<(std::ostream &, Shape);

// Determines the shape of a parent whose children have shapes 'left' and
// 'right'.  kInline is the identity; two non-inline shapes make kOther.
constexpr Shape MergeShapes(Shape left, Shape right) {
  if (left == Shape::kInline) return right;
  if (right == Shape::kInline) return left;
  return Shape::kOther;
}

// A set of shapes, used to express which shapes a child is allowed to take.
class ShapeSet {
 public:
  constexpr ShapeSet() = default;

  ShapeSet(std::initializer_list<Shape> shapes) {
    for (const Shape shape : shapes) bits_ |= Bit(shape);
  }

  // Allows all shapes.
  static constexpr ShapeSet All() { return ShapeSet(0x0f); }

  // Prohibits any newlines at all.
  static constexpr ShapeSet OnlyInline() {
    return ShapeSet(Bit(Shape::kInline));
  }

  // Must be block shaped.
  static constexpr ShapeSet OnlyBlock() { return ShapeSet(Bit(Shape::kBlock)); }

  // All shapes if 'condition' holds, otherwise only inline.
  static constexpr ShapeSet AnyIf(bool condition) {
    return condition ? All() : OnlyInline();
  }

  constexpr bool Contains(Shape shape) const {
    return (bits_ & Bit(shape)) != 0;
  }

  constexpr bool empty() const { return bits_ == 0; }

  constexpr bool operator==(const ShapeSet &r) const {
    return bits_ == r.bits_;
  }
  constexpr bool operator!=(const ShapeSet &r) const {
    return bits_ != r.bits_;
  }

 private:
  explicit constexpr ShapeSet(uint8_t bits) : bits_(bits) {}

  static constexpr uint8_t Bit(Shape shape) {
    return static_cast<uint8_t>(1u << static_cast<int>(shape));
  }

  uint8_t bits_ = 0;
};

std::ostream &operator<<(std::ostream &, const ShapeSet &);

// Controls how a fragment's own newlines and its children's shapes combine
// into the fragment's resulting shape while it is being formatted.
// A fragment that writes no newline at all is always kInline.
enum class ShapeMode {
  // Merge the children's shapes; a newline written directly makes kOther.
  kMerge,
  // Any newline makes the result kBlock.
  kBlock,
  // Content written in this mode must stay on one line.  A newline here makes
  // the result kOther.
  kBeforeHeadline,
  // Newlines after the headline make the result kHeadline, provided the
  // content before it stayed on one line.
  kAfterHeadline,
  // Any newline makes the result kOther.
  kOther,
};

std::ostream &operator<<(std::ostream &, ShapeMode);

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_FORMATTING_SHAPE_H_
