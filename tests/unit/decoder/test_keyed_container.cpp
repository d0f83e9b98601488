// test_keyed_container.cpp - Unit tests for the keyed container walker
//
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "treecoder/decoder/decoding.hpp"
#include "treecoder/test_support/value_builders.hpp"

namespace treecoder
{

using namespace test_support;

class KeyedContainerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = keyed({
      {"foo", str("bar")},
      {"baz", integer(42)},
      {"nothing", null()},
      {"inner", keyed({{"x", boolean(true)}})},
      {"list", ordered({integer(1), integer(2)})},
    });
  }

  KeyedContainer container(std::vector<std::string> declared = {}) const
  {
    return KeyedContainer(root_, CodingPath{}.appending_field("cfg"), std::move(declared));
  }

  Value root_;
};

TEST_F(KeyedContainerTest, AllKeysAreSorted)
{
  const auto keys = container().all_keys();
  EXPECT_EQ(keys, (std::vector<std::string>{"baz", "foo", "inner", "list", "nothing"}));
}

TEST_F(KeyedContainerTest, AllKeysFilteredByDeclaredKeys)
{
  const auto keys = container({"foo", "absent", "baz"}).all_keys();
  EXPECT_EQ(keys, (std::vector<std::string>{"baz", "foo"}));
}

TEST_F(KeyedContainerTest, Contains)
{
  const auto c = container();
  EXPECT_TRUE(c.contains("foo"));
  EXPECT_TRUE(c.contains("nothing"));
  EXPECT_FALSE(c.contains("missing"));
  EXPECT_FALSE(c.contains("Foo"));
}

TEST_F(KeyedContainerTest, DecodeNil)
{
  const auto c = container();
  EXPECT_TRUE(*c.decode_nil("nothing"));
  EXPECT_FALSE(*c.decode_nil("foo"));

  auto missing = c.decode_nil("missing");
  ASSERT_TRUE(missing.has_error());
  EXPECT_EQ(missing.error().kind, FailureKind::KeyNotFound);
}

TEST_F(KeyedContainerTest, DecodeScalars)
{
  const auto c = container();
  EXPECT_EQ(*c.decode_scalar<std::string>("foo"), "bar");
  EXPECT_EQ(*c.decode<int64_t>("baz"), 42);
}

TEST_F(KeyedContainerTest, TypeMismatchAtChildPath)
{
  auto r = container().decode<int64_t>("foo");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error().kind, FailureKind::TypeMismatch);
  EXPECT_EQ(r.error().path.to_string(), "cfg.foo");
  EXPECT_EQ(r.error().found, ValueKind::String);
}

TEST_F(KeyedContainerTest, KeyNotFoundAtContainerPath)
{
  auto r = container().decode<std::string>("missing");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error().kind, FailureKind::KeyNotFound);
  EXPECT_EQ(r.error().path.to_string(), "cfg");
  EXPECT_EQ(r.error().key, "missing");
  EXPECT_EQ(
    r.error().available_keys,
    (std::vector<std::string>{"baz", "foo", "inner", "list", "nothing"}));
}

TEST_F(KeyedContainerTest, KeyNotFoundCarriesDeclaredKeys)
{
  auto r = container({"foo", "port"}).decode<int64_t>("port");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error().kind, FailureKind::KeyNotFound);
  EXPECT_EQ(r.error().declared_keys, (std::vector<std::string>{"foo", "port"}));
  EXPECT_EQ(r.error().available_keys.size(), 5u);

  auto untyped = container().decode<int64_t>("port");
  ASSERT_TRUE(untyped.has_error());
  EXPECT_TRUE(untyped.error().declared_keys.empty());
}

TEST_F(KeyedContainerTest, DecodeIfPresent)
{
  const auto c = container();

  auto absent = c.decode_if_present<std::string>("missing");
  ASSERT_TRUE(absent.has_value());
  EXPECT_FALSE(absent->has_value());

  auto null_value = c.decode_if_present<std::string>("nothing");
  ASSERT_TRUE(null_value.has_value());
  EXPECT_FALSE(null_value->has_value());

  auto present = c.decode_if_present<std::string>("foo");
  ASSERT_TRUE(present.has_value());
  EXPECT_EQ(present->value(), "bar");

  auto wrong = c.decode_if_present<bool>("foo");
  ASSERT_TRUE(wrong.has_error());
  EXPECT_EQ(wrong.error().path.to_string(), "cfg.foo");
}

TEST_F(KeyedContainerTest, Element)
{
  auto inner = container().element("inner");
  ASSERT_TRUE(inner.has_value());
  EXPECT_TRUE(inner->is_keyed());
  EXPECT_TRUE(container().element("missing").has_error());
}

TEST_F(KeyedContainerTest, NestedKeyedContainer)
{
  auto nested = container().nested_keyed_container("inner");
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->coding_path().to_string(), "cfg.inner");
  EXPECT_TRUE(*nested->decode<bool>("x"));

  auto bad = nested->decode<std::string>("x");
  ASSERT_TRUE(bad.has_error());
  EXPECT_EQ(bad.error().path.to_string(), "cfg.inner.x");
}

TEST_F(KeyedContainerTest, NestedContainerShapeErrorsAreTypeMismatch)
{
  auto keyed_from_list = container().nested_keyed_container("list");
  ASSERT_TRUE(keyed_from_list.has_error());
  EXPECT_EQ(keyed_from_list.error().kind, FailureKind::TypeMismatch);
  EXPECT_EQ(keyed_from_list.error().expected, "Keyed");
  EXPECT_EQ(keyed_from_list.error().path.to_string(), "cfg.list");

  auto ordered_from_string = container().nested_ordered_container("foo");
  ASSERT_TRUE(ordered_from_string.has_error());
  EXPECT_EQ(ordered_from_string.error().expected, "Ordered");
  EXPECT_EQ(ordered_from_string.error().found, ValueKind::String);
}

TEST_F(KeyedContainerTest, NestedOrderedContainer)
{
  auto list = container().nested_ordered_container("list");
  ASSERT_TRUE(list.has_value());
  EXPECT_EQ(list->count(), 2u);
  EXPECT_EQ(list->coding_path().to_string(), "cfg.list");
}

TEST_F(KeyedContainerTest, SuperDecoderThrows)
{
  const auto c = container();
  EXPECT_THROW((void)c.super_decoder(), UnsupportedFeatureError);

  try {
    (void)c.super_decoder("inner");
    FAIL() << "expected UnsupportedFeatureError";
  } catch (const UnsupportedFeatureError & e) {
    EXPECT_EQ(e.path().to_string(), "cfg.inner");
  }
}

TEST_F(KeyedContainerTest, EmptyMapping)
{
  const Value empty = keyed({});
  const KeyedContainer c(empty, CodingPath{});
  EXPECT_TRUE(c.all_keys().empty());

  auto r = c.decode<int64_t>("a");
  ASSERT_TRUE(r.has_error());
  EXPECT_TRUE(r.error().available_keys.empty());
}

}  // namespace treecoder
