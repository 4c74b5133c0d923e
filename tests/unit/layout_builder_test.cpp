#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"
#include "flatrec/layout/layout_builder.hpp"

namespace flatrec {
namespace {

auto MakeField(
    std::size_t index, std::optional<std::string> name, std::size_t start,
    std::size_t width, Alignment alignment = Alignment::kLeft,
    char32_t padding = U' ') -> Field {
  return Field{
      .index = index,
      .name = std::move(name),
      .start = start,
      .width = width,
      .alignment = alignment,
      .padding = padding,
  };
}

class LayoutBuilderTest : public ::testing::Test {
 protected:
  LayoutBuilder builder_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(LayoutBuilderTest, DefaultsAreLeftAndSpace) {
  EXPECT_EQ(builder_.Defaults().alignment, Alignment::kLeft);
  EXPECT_EQ(builder_.Defaults().padding, U' ');
}

TEST_F(LayoutBuilderTest, DefaultPadding) {
  builder_.DefaultPadding('X');
  EXPECT_EQ(builder_.Defaults().padding, U'X');
}

TEST_F(LayoutBuilderTest, DefaultAlignmentFromValue) {
  builder_.DefaultAlignment(Alignment::kRight);
  EXPECT_EQ(builder_.Defaults().alignment, Alignment::kRight);
}

TEST_F(LayoutBuilderTest, DefaultAlignmentFromString) {
  builder_.DefaultAlignment("RIGHT");
  EXPECT_EQ(builder_.Defaults().alignment, Alignment::kRight);
}

TEST_F(LayoutBuilderTest, UnknownDefaultAlignmentFailsBuild) {
  builder_.DefaultAlignment("banana");
  EXPECT_EQ(builder_.Defaults().alignment, Alignment::kLeft);

  auto layout = builder_.AddField("first").Width(20).Append().Build();
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidAlignment);
  ASSERT_EQ(layout.error().notes.size(), 1U);
}

TEST_F(LayoutBuilderTest, NewFieldStartsFromDefaults) {
  builder_.DefaultAlignment(Alignment::kRight).DefaultPadding('0');
  auto field = builder_.AddField("amount");
  field.Position(3).Width(8);

  const FieldSpec& spec = field.Spec();
  EXPECT_EQ(spec.name, std::optional<std::string>("amount"));
  EXPECT_EQ(spec.start, std::optional<std::size_t>(3));
  EXPECT_EQ(spec.width, std::optional<std::size_t>(8));
  EXPECT_EQ(spec.alignment, Alignment::kRight);
  EXPECT_EQ(spec.padding, U'0');
  EXPECT_TRUE(builder_.Specs().empty());
}

// =============================================================================
// Single fields
// =============================================================================

TEST_F(LayoutBuilderTest, OneFieldWithWidth) {
  auto layout = builder_.AddField("first").Width(20).Append().Build();

  ASSERT_TRUE(layout.has_value()) << layout.error().Message();
  ASSERT_EQ(layout->Size(), 1U);
  EXPECT_EQ(layout->Fields()[0], MakeField(0, "first", 0, 20));
  EXPECT_EQ(layout->TotalWidth(), 20U);
}

TEST_F(LayoutBuilderTest, OneFieldWithOverriddenDefaults) {
  auto layout = builder_.DefaultAlignment(Alignment::kRight)
                    .DefaultPadding('-')
                    .AddField("first")
                    .Width(20)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(
      layout->Fields()[0],
      MakeField(0, "first", 0, 20, Alignment::kRight, U'-'));
}

TEST_F(LayoutBuilderTest, FieldAlignmentFromString) {
  auto layout =
      builder_.AddField("first").Width(20).Align("right").Append().Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0].alignment, Alignment::kRight);
  EXPECT_TRUE(builder_.Diagnostics().GetDiagnostics().empty());
}

TEST_F(LayoutBuilderTest, UnknownFieldAlignmentKeepsPreviousAndWarns) {
  auto layout = builder_.DefaultAlignment(Alignment::kRight)
                    .AddField("first")
                    .Width(20)
                    .Align("banana")
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(
      layout->Fields()[0], MakeField(0, "first", 0, 20, Alignment::kRight));

  const auto& diags = builder_.Diagnostics().GetDiagnostics();
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].Kind(), DiagKind::kWarning);
  EXPECT_NE(diags[0].Message().find("banana"), std::string::npos);
  EXPECT_FALSE(builder_.Diagnostics().HasErrors());
}

TEST_F(LayoutBuilderTest, FieldPadding) {
  auto layout =
      builder_.AddField("first").Width(20).Padding('X').Append().Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0].padding, U'X');
}

TEST_F(LayoutBuilderTest, FieldRangeSetsStartAndWidth) {
  auto layout = builder_.AddField("first").Range(5, 20).Append().Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0], MakeField(0, "first", 5, 15));
  EXPECT_EQ(layout->TotalWidth(), 20U);
}

TEST_F(LayoutBuilderTest, Spacer) {
  auto layout = builder_.AddSpacer(5, 15).Append().Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0], MakeField(0, std::nullopt, 5, 10));
  EXPECT_TRUE(layout->Fields()[0].IsSpacer());
}

TEST_F(LayoutBuilderTest, EmptyBuilderYieldsEmptyLayout) {
  auto layout = builder_.Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_TRUE(layout->Empty());
  EXPECT_EQ(layout->TotalWidth(), 0U);
}

// =============================================================================
// Multiple fields
// =============================================================================

TEST_F(LayoutBuilderTest, TwoFields) {
  auto layout = builder_.AddField("first")
                    .Width(20)
                    .Append()
                    .AddField("second")
                    .Range(20, 50)
                    .Align(Alignment::kRight)
                    .Padding('0')
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  ASSERT_EQ(layout->Size(), 2U);
  EXPECT_EQ(layout->Fields()[0], MakeField(0, "first", 0, 20));
  EXPECT_EQ(
      layout->Fields()[1],
      MakeField(1, "second", 20, 30, Alignment::kRight, U'0'));
  EXPECT_EQ(layout->TotalWidth(), 50U);
}

TEST_F(LayoutBuilderTest, TwoStageDeclaration) {
  builder_.AddField("first").Width(20).Append();
  builder_.AddField("second").Range(20, 50).Append();

  auto layout = builder_.Build();
  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Size(), 2U);
  EXPECT_EQ(layout->Fields()[1].start, 20U);
}

TEST_F(LayoutBuilderTest, InsertAtFront) {
  auto layout = builder_.AddField("first")
                    .Width(20)
                    .Append()
                    .AddField("second")
                    .Width(30)
                    .Align(Alignment::kRight)
                    .Padding('X')
                    .Insert(0)
                    .Build();

  ASSERT_TRUE(layout.has_value());
  ASSERT_EQ(layout->Size(), 2U);
  EXPECT_EQ(
      layout->Fields()[0],
      MakeField(0, "second", 0, 30, Alignment::kRight, U'X'));
  EXPECT_EQ(layout->Fields()[1], MakeField(1, "first", 30, 20));
}

TEST_F(LayoutBuilderTest, InsertPastEndFailsBuild) {
  auto layout = builder_.AddField("first").Width(5).Insert(3).Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidInsert);
}

TEST_F(LayoutBuilderTest, SequentialWidthsAreContiguous) {
  auto layout = builder_.AddField("a")
                    .Width(3)
                    .Append()
                    .AddSpacer()
                    .Width(2)
                    .Append()
                    .AddField("b")
                    .Width(4)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[1], MakeField(1, std::nullopt, 3, 2));
  EXPECT_EQ(layout->Fields()[2], MakeField(2, "b", 5, 4));
  EXPECT_EQ(layout->TotalWidth(), 9U);
}

TEST_F(LayoutBuilderTest, ExplicitStartLeavesGap) {
  auto layout = builder_.AddField("a")
                    .Width(3)
                    .Append()
                    .AddField("b")
                    .Position(10)
                    .Width(2)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[1], MakeField(1, "b", 10, 2));
  EXPECT_EQ(layout->TotalWidth(), 12U);
}

// =============================================================================
// Width inference
// =============================================================================

TEST_F(LayoutBuilderTest, WidthInferredFromNextStart) {
  auto layout = builder_.AddField("a")
                    .Position(0)
                    .Append()
                    .AddField("b")
                    .Position(50)
                    .Width(10)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0], MakeField(0, "a", 0, 50));
  EXPECT_EQ(layout->Fields()[1], MakeField(1, "b", 50, 10));
  EXPECT_EQ(layout->TotalWidth(), 60U);
}

TEST_F(LayoutBuilderTest, WidthInferredForFieldWithoutStart) {
  // "a" starts at the cursor (5) and runs up to "b".
  auto layout = builder_.AddSpacer(0, 5)
                    .Append()
                    .AddField("a")
                    .Append()
                    .AddField("b")
                    .Range(12, 20)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[1], MakeField(1, "a", 5, 7));
}

TEST_F(LayoutBuilderTest, ChainOfOpenFieldsEachClosedByNextStart) {
  auto layout = builder_.AddField("a")
                    .Position(0)
                    .Append()
                    .AddField("b")
                    .Position(4)
                    .Append()
                    .AddField("c")
                    .Position(9)
                    .Width(1)
                    .Append()
                    .Build();

  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->Fields()[0].width, 4U);
  EXPECT_EQ(layout->Fields()[1].width, 5U);
  EXPECT_EQ(layout->TotalWidth(), 10U);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(LayoutBuilderTest, StartBeforeCursorIsOrderingError) {
  auto layout = builder_.AddField("a")
                    .Position(5)
                    .Width(1)
                    .Append()
                    .AddField("b")
                    .Position(3)
                    .Width(1)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kOrdering);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(1));
}

TEST_F(LayoutBuilderTest, OverlappingRangeIsOrderingError) {
  auto layout = builder_.AddField("a")
                    .Range(0, 10)
                    .Append()
                    .AddField("b")
                    .Range(8, 12)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kOrdering);
}

TEST_F(LayoutBuilderTest, OpenFieldBeforeEarlierStartIsOrderingError) {
  auto layout = builder_.AddField("a")
                    .Position(5)
                    .Append()
                    .AddField("b")
                    .Position(3)
                    .Width(1)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kOrdering);
}

TEST_F(LayoutBuilderTest, MissingWidthOnLastField) {
  auto layout = builder_.AddField("first").Append().Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kMissingSpecification);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(0));
}

TEST_F(LayoutBuilderTest, MissingWidthWhenNextFieldHasNoStart) {
  auto layout = builder_.AddField("a")
                    .Append()
                    .AddField("b")
                    .Width(5)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kMissingSpecification);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(0));
}

TEST_F(LayoutBuilderTest, ZeroWidthIsRejected) {
  auto layout = builder_.AddField("a").Width(0).Append().Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidWidth);
}

TEST_F(LayoutBuilderTest, EmptyInferredWidthIsRejected) {
  auto layout = builder_.AddField("a")
                    .Position(4)
                    .Append()
                    .AddField("b")
                    .Position(4)
                    .Width(2)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidWidth);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(0));
}

TEST_F(LayoutBuilderTest, ReversedRangeIsRejected) {
  auto layout = builder_.AddField("a").Range(10, 5).Append().Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidWidth);
}

TEST_F(LayoutBuilderTest, WidthPastLargestColumnIsRejected) {
  constexpr auto kMax = std::numeric_limits<std::size_t>::max();
  auto layout = builder_.AddField("a")
                    .Position(kMax - 1)
                    .Width(4)
                    .Append()
                    .AddField("b")
                    .Width(3)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidWidth);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(0));
}

TEST_F(LayoutBuilderTest, FieldEndingAtLargestColumnIsAccepted) {
  constexpr auto kMax = std::numeric_limits<std::size_t>::max();
  auto layout =
      builder_.AddField("a").Position(kMax - 4).Width(4).Append().Build();

  ASSERT_TRUE(layout.has_value()) << layout.error().Message();
  EXPECT_EQ(layout->Fields()[0].End(), kMax);
  EXPECT_EQ(layout->TotalWidth(), kMax);
}

TEST_F(LayoutBuilderTest, CursorPastLargestColumnIsRejected) {
  constexpr auto kMax = std::numeric_limits<std::size_t>::max();
  auto layout = builder_.AddField("a")
                    .Position(kMax - 4)
                    .Width(4)
                    .Append()
                    .AddField("b")
                    .Width(1)
                    .Append()
                    .Build();

  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().Kind(), DiagKind::kInvalidWidth);
  EXPECT_EQ(layout.error().field_index, std::optional<std::size_t>(1));
}

TEST_F(LayoutBuilderTest, BuildDoesNotConsumeDeclarations) {
  builder_.AddField("a").Width(2).Append();
  auto first = builder_.Build();
  auto second = builder_.Build();

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->TotalWidth(), second->TotalWidth());
  EXPECT_EQ(builder_.Specs().size(), 1U);
}

}  // namespace
}  // namespace flatrec
