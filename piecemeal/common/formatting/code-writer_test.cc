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

#include "piecemeal/common/formatting/code-writer.h"

#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "piecemeal/common/formatting/format-style.h"
#include "piecemeal/common/formatting/fragment-test-utils.h"
#include "piecemeal/common/formatting/fragment.h"
#include "piecemeal/common/formatting/infix-fragment.h"
#include "piecemeal/common/formatting/shape.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {
namespace {

using ::testing::HasSubstr;

// Stateless fragment whose formatting is given by a function, for exercising
// the writer operations directly.
class ScriptedFragment final : public Fragment {
 public:
  using Script = std::function<void(CodeWriter *,
                                    const std::vector<FragmentPtr> &)>;

  ScriptedFragment(std::vector<FragmentPtr> children, Script script)
      : Fragment("Scripted", nullptr),
        children_(std::move(children)),
        script_(std::move(script)) {}

  void Format(CodeWriter *writer, State) const final {
    script_(writer, children_);
  }
  void ForEachChild(const ChildVisitor &visitor) const final {
    for (const auto &child : children_) visitor(child.get());
  }

 private:
  const std::vector<FragmentPtr> children_;
  const Script script_;
};

RenderResult RenderScript(std::vector<FragmentPtr> children,
                          ScriptedFragment::Script script,
                          int column_limit = 80) {
  ScriptedFragment root(std::move(children), std::move(script));
  FinalizeFragmentTree(&root);
  return Render(root, PinnedStateAssignment(), column_limit);
}

TEST(CodeWriterTest, IndentationIsWrittenWithText) {
  const RenderResult result = RenderScript(
      Fragments(Text("a"), Text("b"), Text("c")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        writer->Format(*children[0]);
        {
          const ScopedIndent indent(writer, IndentKind::kBlock);
          writer->Newline();
          writer->Format(*children[1]);
          const ScopedIndent more(writer, IndentKind::kExpression);
          writer->Newline();
          writer->Newline();
          writer->Format(*children[2]);
        }
      });
  // Blank lines carry no indentation.
  EXPECT_EQ(result.text, "a\n  b\n\n      c");
}

TEST(CodeWriterTest, IndentationStartsWithTheNextLine) {
  const RenderResult result = RenderScript(
      Fragments(Text("a"), Text("b"), Text("c"), Text("d")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        {
          const ScopedIndent indent(writer, IndentKind::kExpression);
          writer->Format(*children[0]);
          writer->Newline();
          writer->Format(*children[1]);
          // Pushed mid-line: "b" stays where it is.
          const ScopedIndent more(writer, IndentKind::kBlock);
          writer->Format(*children[2]);
          writer->Newline();
          writer->Format(*children[3]);
        }
      },
      /*column_limit=*/6);
  EXPECT_EQ(result.text, "a\n    bc\n      d");
  EXPECT_EQ(result.overflow, 1);
}

TEST(CodeWriterTest, MeasuredIndentationStartsWithTheNextLine) {
  // Split, the infix is "first +\n    second".
  auto infix = std::make_unique<InfixFragment>(
      Fragments(Text("first"), Text("second")), std::vector<std::string>{"+"});
  FinalizeFragmentTree(infix.get());
  const FormatStyle style = StyleWithColumnLimit(10);
  const FixedStateAssignment states =
      FixedStateAssignment().Bind(*infix, State::FullSplit());
  CodeWriter writer(style, states, /*measure_only=*/true);
  writer.Format(*infix);
  EXPECT_EQ(writer.Overflow(), 0);
  EXPECT_EQ(writer.ExpandCandidate(), nullptr);
}

TEST(CodeWriterTest, CascadeAndNoneIndentation) {
  FormatStyle style;
  style.cascade_indentation_spaces = 3;
  ScriptedFragment root(
      Fragments(Text("x"), Text("y")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        const ScopedIndent none(writer, IndentKind::kNone);
        writer->Format(*children[0]);
        const ScopedIndent cascade(writer, IndentKind::kCascade);
        writer->Newline();
        writer->Format(*children[1]);
      });
  FinalizeFragmentTree(&root);
  EXPECT_EQ(RenderFragmentTree(style, root, PinnedStateAssignment()).text,
            "x\n   y");
}

TEST(CodeWriterTest, UnbalancedIndentationIsFatal) {
  ScriptedFragment root(Fragments(), [](CodeWriter *writer,
                                        const std::vector<FragmentPtr> &) {
    writer->PushIndent(IndentKind::kBlock);
  });
  FinalizeFragmentTree(&root);
  EXPECT_DEATH(Render(root, PinnedStateAssignment()), "unbalanced");
}

TEST(CodeWriterTest, PopWithoutPushIsFatal) {
  ScriptedFragment root(Fragments(), [](CodeWriter *writer,
                                        const std::vector<FragmentPtr> &) {
    writer->PopIndent();
  });
  FinalizeFragmentTree(&root);
  EXPECT_DEATH(Render(root, PinnedStateAssignment()), "without PushIndent");
}

TEST(CodeWriterTest, SeparateChildOwnsItsLastLine) {
  const RenderResult result = RenderScript(
      Fragments(Text("a"), Text("b"), Text("c")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        writer->Format(*children[0], /*separate=*/true);
        writer->Format(*children[1]);
        writer->Newline();
        writer->Format(*children[2], /*separate=*/true);
      });
  // Nothing follows "c", so no newline is written after it.
  EXPECT_EQ(result.text, "a\nb\nc");
}

TEST(CodeWriterTest, OverflowSumsCharactersPastLimit) {
  const RenderResult result = RenderScript(
      Fragments(Text("123456789012"), Text("1234567"), Text("123456789ab")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        writer->Format(*children[0]);
        writer->Newline();
        writer->Format(*children[1]);
        writer->Newline();
        writer->Format(*children[2]);
      },
      /*column_limit=*/10);
  EXPECT_EQ(result.overflow, 2 + 0 + 1);
  EXPECT_TRUE(result.valid);
}

TEST(CodeWriterTest, OverflowWithinOneLine) {
  const RenderResult result = RenderScript(
      Fragments(Text("12345678"), Text("abcd"), Text("ef")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        for (const auto &child : children) writer->Format(*child);
      },
      /*column_limit=*/10);
  EXPECT_EQ(result.text, "12345678abcdef");
  EXPECT_EQ(result.overflow, 4);
}

TEST(CodeWriterTest, MeasuringProducesNoText) {
  auto list = List("(", Text("aaaa"), Text("bbbb"));
  FinalizeFragmentTree(list.get());
  const FormatStyle style = StyleWithColumnLimit(8);
  PinnedStateAssignment states;
  CodeWriter writer(style, states, /*measure_only=*/true);
  writer.Format(*list);
  EXPECT_TRUE(writer.Text().empty());
  // "(aaaa, bbbb)"
  EXPECT_EQ(writer.Overflow(), 4);
  EXPECT_TRUE(writer.IsValid());
  EXPECT_EQ(writer.RootShape(), Shape::kInline);
  EXPECT_EQ(writer.ExpandCandidate(), list.get());
}

TEST(CodeWriterTest, MeasuringMatchesRendering) {
  auto list = List("(", Text("aaaa"), Seq(Text("f"), List("[", Text("x"))));
  FinalizeFragmentTree(list.get());
  const FormatStyle style = StyleWithColumnLimit(6);
  const FixedStateAssignment states =
      FixedStateAssignment().Bind(*list, State::FullSplit());
  CodeWriter measure(style, states, /*measure_only=*/true);
  measure.Format(*list);
  const RenderResult rendered = RenderFragmentTree(style, *list, states);
  EXPECT_EQ(measure.Overflow(), rendered.overflow);
  EXPECT_EQ(measure.RootShape(), rendered.shape);
  EXPECT_EQ(measure.IsValid(), rendered.valid);
  EXPECT_EQ(rendered.text, "(\n  aaaa,\n  f[x]\n)");
}

TEST(CodeWriterTest, NoProblemNoCandidate) {
  auto list = List("(", Text("a"));
  FinalizeFragmentTree(list.get());
  FormatStyle style;
  PinnedStateAssignment states;
  CodeWriter writer(style, states, /*measure_only=*/true);
  writer.Format(*list);
  EXPECT_EQ(writer.Overflow(), 0);
  EXPECT_EQ(writer.ExpandCandidate(), nullptr);
}

TEST(CodeWriterTest, ShapeViolationPointsAtOutermostUnbound) {
  auto inner = List("(", Text("x"));
  const Fragment &inner_ref = *inner;
  auto outer = List("(", std::move(inner));
  FinalizeFragmentTree(outer.get());
  FormatStyle style;
  const FixedStateAssignment states =
      FixedStateAssignment().Bind(inner_ref, State::FullSplit());
  CodeWriter writer(style, states, /*measure_only=*/true);
  writer.Format(*outer);
  EXPECT_FALSE(writer.IsValid());
  EXPECT_EQ(writer.ExpandCandidate(), outer.get());
}

TEST(CodeWriterTest, ShapeModes) {
  struct TestCase {
    ShapeMode mode;
    Shape expected;
  };
  const TestCase kTestCases[] = {
      {ShapeMode::kMerge, Shape::kOther},
      {ShapeMode::kBlock, Shape::kBlock},
      {ShapeMode::kBeforeHeadline, Shape::kOther},
      {ShapeMode::kAfterHeadline, Shape::kHeadline},
      {ShapeMode::kOther, Shape::kOther},
  };
  for (const auto &test : kTestCases) {
    const RenderResult result = RenderScript(
        Fragments(Text("a"), Text("b")),
        [&test](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
          writer->Format(*children[0]);
          writer->SetShapeMode(test.mode);
          writer->Newline();
          writer->Format(*children[1]);
        });
    EXPECT_EQ(result.shape, test.expected) << test.mode;
  }
}

TEST(CodeWriterTest, InlineWithoutNewlines) {
  const RenderResult result = RenderScript(
      Fragments(Text("a")),
      [](CodeWriter *writer, const std::vector<FragmentPtr> &children) {
        writer->SetShapeMode(ShapeMode::kOther);
        writer->Format(*children[0]);
      });
  EXPECT_EQ(result.shape, Shape::kInline);
}

TEST(CodeWriterTest, MergedChildShape) {
  auto list = List("(", Text("x"));
  const Fragment &list_ref = *list;
  auto root = Seq(Text("f"), std::move(list));
  FinalizeFragmentTree(root.get());
  const RenderResult result =
      Render(*root, FixedStateAssignment().Bind(list_ref, State::FullSplit()));
  EXPECT_EQ(result.shape, Shape::kBlock);
  EXPECT_EQ(result.text, "f(\n  x\n)");
}

TEST(CodeWriterTest, PinnedStatesApplyWhenUnbound) {
  auto list = List("(", Text("x"));
  list->Pin(State::FullSplit());
  FinalizeFragmentTree(list.get());
  EXPECT_EQ(Render(*list, FixedStateAssignment()).text, "(\n  x\n)");
}

TEST(RenderResultTest, Print) {
  RenderResult result;
  result.text = "x";
  result.overflow = 3;
  std::ostringstream stream;
  stream << result;
  EXPECT_THAT(stream.str(), HasSubstr("overflow: 3"));
  EXPECT_THAT(stream.str(), HasSubstr("\nx"));
}

}  // namespace
}  // namespace piecemeal
