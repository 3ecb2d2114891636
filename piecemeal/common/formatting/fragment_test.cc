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

#include "piecemeal/common/formatting/fragment.h"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "piecemeal/common/formatting/basic-fragments.h"
#include "piecemeal/common/formatting/fragment-counter.h"
#include "piecemeal/common/formatting/fragment-test-utils.h"
#include "piecemeal/common/formatting/list-fragment.h"
#include "piecemeal/common/formatting/state.h"

namespace piecemeal {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Leaf with arbitrary declared states, and no text.
class StatesFragment final : public Fragment {
 public:
  explicit StatesFragment(std::vector<State> states)
      : Fragment("States", nullptr) {
    DeclareStates(std::move(states));
  }

  void Format(CodeWriter *, State) const final {}
  void ForEachChild(const ChildVisitor &) const final {}
};

// When fully split, forces all of its children to fully split too.
class ConstrainingFragment final : public Fragment {
 public:
  explicit ConstrainingFragment(std::vector<FragmentPtr> children)
      : Fragment("Constraining", nullptr), children_(std::move(children)) {
    DeclareStates({State::FullSplit()});
  }

  void ApplyConstraints(State state,
                        const ConstrainFunction &constrain) const final {
    if (state != State::FullSplit()) return;
    for (const auto &child : children_) constrain(child.get(), state);
  }

  void Format(CodeWriter *, State) const final {}
  void ForEachChild(const ChildVisitor &visitor) const final {
    for (const auto &child : children_) visitor(child.get());
  }

 private:
  const std::vector<FragmentPtr> children_;
};

// Checks that each memoized metric equals its recursive definition.
void ExpectMetricsFollowChildren(const Fragment &fragment) {
  int num_children = 0;
  int total = 0;
  bool hard_newline = false;
  fragment.ForEachChild([&](Fragment *child) {
    ++num_children;
    total += child->TotalCharacters();
    hard_newline |= child->ContainsHardNewline();
    ExpectMetricsFollowChildren(*child);
  });
  if (num_children == 0) return;  // leaves define their own
  EXPECT_EQ(fragment.TotalCharacters(), total) << fragment;
  EXPECT_EQ(fragment.ContainsHardNewline(), hard_newline) << fragment;
}

TEST(FragmentTest, LegalStatesStartWithUnsplit) {
  const StatesFragment fragment({State(1, 0), State(7, 2), State::FullSplit()});
  EXPECT_TRUE(fragment.IsStateful());
  EXPECT_THAT(fragment.LegalStates(),
              ElementsAre(State::Unsplit(), State(1, 0), State(7, 2),
                          State::FullSplit()));
  EXPECT_TRUE(fragment.IsLegalState(State::Unsplit()));
  EXPECT_TRUE(fragment.IsLegalState(State(7, 2)));
  EXPECT_FALSE(fragment.IsLegalState(State(2, 1)));
}

TEST(FragmentTest, StatelessFragment) {
  const TextFragment text("abc");
  EXPECT_FALSE(text.IsStateful());
  EXPECT_TRUE(text.AdditionalStates().empty());
  EXPECT_THAT(text.LegalStates(), ElementsAre(State::Unsplit()));
}

TEST(FragmentTest, UnsortedStatesAreFatal) {
  EXPECT_DEATH(StatesFragment({State::FullSplit(), State(2, 1)}),
               "strictly ascending");
}

TEST(FragmentTest, RedeclaredUnsplitIsFatal) {
  EXPECT_DEATH(StatesFragment({State::Unsplit(), State::FullSplit()}),
               "strictly ascending");
}

TEST(FragmentTest, MetricsBeforeFinalizeAreFatal) {
  const TextFragment text("abc");
  EXPECT_DEATH(text.TotalCharacters(), "before finalize");
  EXPECT_DEATH(text.ContainsHardNewline(), "before finalize");
  EXPECT_DEATH(text.StatefulOffspring(), "before finalize");
}

TEST(FragmentTest, MetricsFollowChildren) {
  auto root = Seq(Text("ab"), List("(", Text("c"), Text("de")),
                  Seq(Text("x"), Text("// comment\n")));
  FinalizeFragmentTree(root.get());
  EXPECT_TRUE(root->IsFinalized());
  ExpectMetricsFollowChildren(*root);
  // "ab" + "(c, de)" + "x" + "// comment\n"
  EXPECT_EQ(root->TotalCharacters(), 2 + 7 + 1 + 11);
  EXPECT_TRUE(root->ContainsHardNewline());
}

TEST(FragmentTest, NoHardNewline) {
  auto root = Seq(Text("a"), List("[", Text("b")));
  FinalizeFragmentTree(root.get());
  ExpectMetricsFollowChildren(*root);
  EXPECT_FALSE(root->ContainsHardNewline());
  EXPECT_EQ(root->TotalCharacters(), 4);
}

TEST(FragmentTest, StatefulOffspringInPreOrder) {
  auto inner = List("(", Text("x"));
  const Fragment *inner_ptr = inner.get();
  auto outer = List("(", Text("a"), std::move(inner));
  const Fragment *outer_ptr = outer.get();
  auto other = List("[", Text("b"));
  const Fragment *other_ptr = other.get();
  auto root = Seq(std::move(outer), Text("+"), std::move(other));
  FinalizeFragmentTree(root.get());

  EXPECT_THAT(root->StatefulOffspring(),
              ElementsAre(outer_ptr, inner_ptr, other_ptr));
  EXPECT_THAT(inner_ptr->StatefulOffspring(), ElementsAre(inner_ptr));
}

TEST(FragmentTest, FinalizeIsIdempotent) {
  auto root = Seq(Text("a"), List("(", Text("b")));
  FinalizeFragmentTree(root.get());
  FinalizeFragmentTree(root.get());
  EXPECT_EQ(root->StatefulOffspring().size(), 1u);
}

TEST(FragmentTest, ContainsNewlineDefault) {
  auto plain = List("(", Text("a"));
  auto broken = List("(", Text("a\n"));
  FinalizeFragmentTree(plain.get());
  FinalizeFragmentTree(broken.get());
  EXPECT_FALSE(plain->ContainsNewline(State::Unsplit()));
  EXPECT_TRUE(plain->ContainsNewline(State::FullSplit()));
  EXPECT_TRUE(broken->ContainsNewline(State::Unsplit()));
}

TEST(FragmentTest, PinIsIdempotent) {
  StatesFragment fragment({State(1, 0), State::FullSplit()});
  EXPECT_FALSE(fragment.PinnedState().has_value());
  fragment.Pin(State(1, 0));
  fragment.Pin(State::FullSplit());
  ASSERT_TRUE(fragment.PinnedState().has_value());
  EXPECT_EQ(*fragment.PinnedState(), State(1, 0));
}

TEST(FragmentTest, PinIllegalStateIsFatal) {
  StatesFragment fragment({State::FullSplit()});
  EXPECT_DEATH(fragment.Pin(State(3, 1)), "cannot pin");
}

TEST(FragmentTest, PreventSplitPinsUnsplit) {
  StatesFragment fragment({State::FullSplit()});
  fragment.PreventSplit();
  ASSERT_TRUE(fragment.PinnedState().has_value());
  EXPECT_TRUE(fragment.PinnedState()->IsUnsplit());
}

TEST(FragmentTest, PinFollowsConstraints) {
  auto leaf = List("(", Text("a"));
  Fragment *leaf_ptr = leaf.get();
  auto middle = std::make_unique<ConstrainingFragment>(Fragments(
      std::move(leaf)));
  Fragment *middle_ptr = middle.get();
  ConstrainingFragment root(Fragments(std::move(middle), Text("b")));

  root.Pin(State::FullSplit());
  EXPECT_EQ(root.PinnedState(), State::FullSplit());
  EXPECT_EQ(middle_ptr->PinnedState(), State::FullSplit());
  EXPECT_EQ(leaf_ptr->PinnedState(), State::FullSplit());
}

TEST(FragmentTest, UnsplitPinConstrainsNothing) {
  auto leaf = List("(", Text("a"));
  Fragment *leaf_ptr = leaf.get();
  ConstrainingFragment root(Fragments(std::move(leaf)));
  root.Pin(State::Unsplit());
  EXPECT_EQ(root.PinnedState(), State::Unsplit());
  EXPECT_FALSE(leaf_ptr->PinnedState().has_value());
}

TEST(FragmentTest, CountsCreation) {
  TallyFragmentCounter counter;
  const TextFragment a("a", &counter);
  const TextFragment b("b", &counter);
  const SpaceFragment space(&counter);
  EXPECT_EQ(counter.Tally("create Text"), 2);
  EXPECT_EQ(counter.Tally("create Space"), 1);
}

TEST(FragmentTest, Print) {
  StatesFragment fragment({State::FullSplit()});
  EXPECT_EQ(fragment.DebugName(), "States");
  {
    std::ostringstream stream;
    stream << fragment;
    EXPECT_EQ(stream.str(), absl::StrCat("States", fragment.id()));
  }
  fragment.Pin(State::FullSplit());
  {
    std::ostringstream stream;
    stream << fragment;
    EXPECT_EQ(stream.str(), absl::StrCat("States", fragment.id(), "[split]"));
  }
}

TEST(FragmentTest, UniqueIds) {
  const TextFragment a("a");
  const TextFragment b("b");
  EXPECT_NE(a.id(), b.id());
}

TEST(FragmentTreePrinterTest, Indented) {
  auto root = Seq(Text("a"), List("(", Text("b")));
  FinalizeFragmentTree(root.get());
  std::ostringstream stream;
  stream << FragmentTreePrinter(*root);
  const std::string printed = stream.str();
  EXPECT_THAT(printed, HasSubstr("Sequence"));
  EXPECT_THAT(printed, HasSubstr("\n  List"));
  EXPECT_THAT(printed, HasSubstr("\n    Text"));
  EXPECT_THAT(printed, HasSubstr("(chars: 4)"));
}

}  // namespace
}  // namespace piecemeal
