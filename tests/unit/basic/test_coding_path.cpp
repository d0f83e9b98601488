// test_coding_path.cpp - Unit tests for coding path bookkeeping
//
#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "treecoder/basic/coding_path.hpp"

namespace treecoder
{

TEST(CodingPathTest, EmptyPathRendersAsRoot)
{
  const CodingPath root;
  EXPECT_TRUE(root.empty());
  EXPECT_EQ(root.size(), 0u);
  EXPECT_EQ(root.to_string(), "<root>");
}

TEST(CodingPathTest, AppendingDoesNotMutateParent)
{
  const CodingPath parent = CodingPath{}.appending_field("servers");
  const CodingPath first = parent.appending_index(0);
  const CodingPath second = parent.appending_index(1);

  EXPECT_EQ(parent.size(), 1u);
  EXPECT_EQ(first.size(), 2u);
  EXPECT_EQ(second.size(), 2u);
  EXPECT_EQ(parent.to_string(), "servers");
  EXPECT_EQ(first.to_string(), "servers[0]");
  EXPECT_EQ(second.to_string(), "servers[1]");
}

TEST(CodingPathTest, RendersMixedSegments)
{
  const CodingPath path =
    CodingPath{}.appending_field("servers").appending_index(1).appending_field("port");
  EXPECT_EQ(path.to_string(), "servers[1].port");
}

TEST(CodingPathTest, LeadingIndex)
{
  const CodingPath path = CodingPath{}.appending_index(3).appending_field("bar");
  EXPECT_EQ(path.to_string(), "[3].bar");
}

TEST(CodingPathTest, QuotesNonIdentifierFields)
{
  const CodingPath path =
    CodingPath{}.appending_field("tags").appending_field("a b").appending_field("say \"hi\"");
  EXPECT_EQ(path.to_string(), R"(tags["a b"]["say \"hi\""])");
}

TEST(CodingPathTest, SegmentAccessors)
{
  const CodingPath path = CodingPath{}.appending_field("foo").appending_index(7);
  ASSERT_EQ(path.size(), 2u);

  const auto & field = path.segments()[0];
  EXPECT_TRUE(field.is_field());
  EXPECT_EQ(field.name(), "foo");

  const auto & index = path.segments()[1];
  EXPECT_TRUE(index.is_index());
  EXPECT_EQ(index.position(), 7u);
}

TEST(CodingPathTest, Equality)
{
  const CodingPath a = CodingPath{}.appending_field("x").appending_index(0);
  const CodingPath b = CodingPath{}.appending_field("x").appending_index(0);
  const CodingPath c = CodingPath{}.appending_field("x").appending_index(1);

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_NE(PathSegment::field("0"), PathSegment::index(0));
}

// ============================================================================
// Parsing
// ============================================================================

TEST(CodingPathParseTest, ParsesRenderedForms)
{
  for (const char * text :
       {"servers[1].port", "[3].bar", "a.b.c", "matrix[0][2]", R"(tags["a b"].x)"}) {
    const auto parsed = CodingPath::parse(text);
    ASSERT_TRUE(parsed.has_value()) << text;
    EXPECT_EQ(parsed->to_string(), text);
  }
}

TEST(CodingPathParseTest, ParsesSegments)
{
  const auto parsed = CodingPath::parse("servers[12].host");
  ASSERT_TRUE(parsed.has_value());

  const CodingPath expected =
    CodingPath{}.appending_field("servers").appending_index(12).appending_field("host");
  EXPECT_EQ(*parsed, expected);
}

TEST(CodingPathParseTest, RootForms)
{
  ASSERT_TRUE(CodingPath::parse("").has_value());
  EXPECT_TRUE(CodingPath::parse("")->empty());
  ASSERT_TRUE(CodingPath::parse("<root>").has_value());
  EXPECT_TRUE(CodingPath::parse("<root>")->empty());
}

TEST(CodingPathParseTest, RejectsMalformed)
{
  EXPECT_FALSE(CodingPath::parse(".foo").has_value());
  EXPECT_FALSE(CodingPath::parse("foo.").has_value());
  EXPECT_FALSE(CodingPath::parse("foo..bar").has_value());
  EXPECT_FALSE(CodingPath::parse("foo[").has_value());
  EXPECT_FALSE(CodingPath::parse("foo[]").has_value());
  EXPECT_FALSE(CodingPath::parse("foo[x]").has_value());
  EXPECT_FALSE(CodingPath::parse("foo[0]bar").has_value());
  EXPECT_FALSE(CodingPath::parse(R"(foo["open)").has_value());
}

TEST(CodingPathParseTest, RejectsIndexOverflow)
{
  EXPECT_FALSE(CodingPath::parse("items[18446744073709551617]").has_value());
  EXPECT_FALSE(CodingPath::parse("[99999999999999999999999]").has_value());

  const auto largest = CodingPath::parse("[18446744073709551615]");
  ASSERT_TRUE(largest.has_value());
  EXPECT_EQ(largest->segments()[0].position(), std::numeric_limits<size_t>::max());
}

}  // namespace treecoder
