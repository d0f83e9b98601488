// test_decode_error.cpp - Unit tests for the failure taxonomy
//
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "treecoder/basic/decode_error.hpp"
#include "treecoder/basic/decode_result.hpp"

namespace treecoder
{

namespace
{

CodingPath path_of(const char * field) { return CodingPath{}.appending_field(field); }

}  // namespace

TEST(DecodeErrorTest, ShapeMismatch)
{
  const auto e = DecodeError::shape_mismatch(path_of("foo"), Shape::Keyed, ValueKind::String);

  EXPECT_EQ(e.kind, FailureKind::ShapeMismatch);
  EXPECT_EQ(e.expected, "Keyed");
  EXPECT_EQ(e.found, ValueKind::String);
  EXPECT_EQ(e.code(), "D001");
  EXPECT_EQ(e.message(), "shape mismatch: expected Keyed container but found String");
  EXPECT_EQ(e.to_string(), "foo: shape mismatch: expected Keyed container but found String");
}

TEST(DecodeErrorTest, KeyNotFound)
{
  const auto e = DecodeError::key_not_found(CodingPath{}, "missing", {"optional", "required"});

  EXPECT_EQ(e.kind, FailureKind::KeyNotFound);
  EXPECT_EQ(e.key, "missing");
  ASSERT_EQ(e.available_keys.size(), 2u);
  EXPECT_TRUE(e.declared_keys.empty());
  EXPECT_EQ(e.code(), "D002");
  EXPECT_EQ(e.to_string(), "<root>: key not found: \"missing\"");
}

TEST(DecodeErrorTest, TypeMismatch)
{
  const auto e = DecodeError::type_mismatch(
    path_of("baz").appending_index(2), "Int", ValueKind::String);

  EXPECT_EQ(e.kind, FailureKind::TypeMismatch);
  EXPECT_EQ(e.code(), "D003");
  EXPECT_EQ(e.to_string(), "baz[2]: type mismatch: expected Int but found String");
}

TEST(DecodeErrorTest, ElementOutOfBounds)
{
  const auto e = DecodeError::element_out_of_bounds(path_of("items"), 3, 3);

  EXPECT_EQ(e.kind, FailureKind::ElementOutOfBounds);
  EXPECT_EQ(e.index, 3u);
  EXPECT_EQ(e.count, 3u);
  EXPECT_EQ(e.code(), "D004");
  EXPECT_EQ(e.message(), "element out of bounds: index 3 (count: 3)");
}

TEST(DecodeErrorTest, FailureKindNames)
{
  EXPECT_EQ(to_string(FailureKind::ShapeMismatch), "shape mismatch");
  EXPECT_EQ(to_string(FailureKind::ElementOutOfBounds), "element out of bounds");
}

TEST(DecodeErrorTest, UnsupportedFeatureIsLogicError)
{
  const CodingPath path = path_of("base");
  const UnsupportedFeatureError err("base-class decoding", path);

  const std::logic_error & as_logic = err;
  EXPECT_EQ(std::string(as_logic.what()), "base-class decoding is not supported (at base)");
  EXPECT_EQ(err.path(), path);
}

// ============================================================================
// DecodeResult
// ============================================================================

TEST(DecodeResultTest, HoldsValue)
{
  DecodeResult<int64_t> r(int64_t{42});

  EXPECT_TRUE(r.has_value());
  EXPECT_FALSE(r.has_error());
  EXPECT_TRUE(static_cast<bool>(r));
  EXPECT_EQ(*r, 42);
  EXPECT_EQ(r.value(), 42);
}

TEST(DecodeResultTest, HoldsError)
{
  DecodeResult<std::string> r(DecodeError::key_not_found(CodingPath{}, "k"));

  EXPECT_FALSE(r.has_value());
  EXPECT_TRUE(r.has_error());
  EXPECT_FALSE(static_cast<bool>(r));
  EXPECT_EQ(r.error().kind, FailureKind::KeyNotFound);
}

TEST(DecodeResultTest, MovesOutValue)
{
  DecodeResult<std::string> r(std::string("payload"));
  const std::string taken = std::move(r).value();
  EXPECT_EQ(taken, "payload");
}

}  // namespace treecoder
