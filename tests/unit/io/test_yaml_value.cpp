// test_yaml_value.cpp - Unit tests for YAML ingestion
//
#include <gtest/gtest.h>

#include <map>
#include <string>

#include "treecoder/io/yaml_value.hpp"
#include "treecoder/treecoder.hpp"

namespace treecoder
{

TEST(YamlValueTest, ScalarResolution)
{
  auto r = parse_yaml(R"(
flag: true
count: 42
negative: -3
ratio: 0.5
name: hello
quoted: "42"
single: 'true'
empty: ~
)");
  ASSERT_TRUE(r.success) << r.error;
  const Value & v = r.value;
  ASSERT_TRUE(v.is_keyed());

  EXPECT_EQ(v.find("flag")->kind(), ValueKind::Bool);
  EXPECT_TRUE(v.find("flag")->as_bool());
  EXPECT_EQ(v.find("count")->as_integer(), 42);
  EXPECT_EQ(v.find("negative")->as_integer(), -3);
  EXPECT_DOUBLE_EQ(v.find("ratio")->as_float(), 0.5);
  EXPECT_EQ(v.find("name")->as_string(), "hello");
  EXPECT_EQ(v.find("quoted")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("quoted")->as_string(), "42");
  EXPECT_EQ(v.find("single")->kind(), ValueKind::String);
  EXPECT_TRUE(v.find("empty")->is_null());
}

TEST(YamlValueTest, ExplicitTagsAreHonored)
{
  auto r = parse_yaml(R"(
a: !!str 123
d: !!str true
n: !!int 7
f: !!float 3
b: !!bool false
z: !!null ~
)");
  ASSERT_TRUE(r.success) << r.error;
  const Value & v = r.value;

  EXPECT_EQ(v.find("a")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("a")->as_string(), "123");
  EXPECT_EQ(v.find("d")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("n")->as_integer(), 7);
  EXPECT_EQ(v.find("f")->kind(), ValueKind::Float);
  EXPECT_DOUBLE_EQ(v.find("f")->as_float(), 3.0);
  EXPECT_EQ(v.find("b")->kind(), ValueKind::Bool);
  EXPECT_FALSE(v.find("b")->as_bool());
  EXPECT_TRUE(v.find("z")->is_null());

  auto decoded = decode<std::map<std::string, std::string>>(
    Value::make_keyed({{"a", *v.find("a")}, {"d", *v.find("d")}}));
  ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
  EXPECT_EQ(decoded->at("a"), "123");
  EXPECT_EQ(decoded->at("d"), "true");
}

TEST(YamlValueTest, InvalidTaggedScalarFails)
{
  auto r = parse_yaml("n: !!int twelve\n");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "invalid YAML document: value 'twelve' is not a valid !!int");

  auto b = parse_yaml("b: !!bool maybe\n");
  EXPECT_FALSE(b.success);
  EXPECT_EQ(b.error, "invalid YAML document: value 'maybe' is not a valid !!bool");
}

TEST(YamlValueTest, UnknownTagIsRejected)
{
  auto r = parse_yaml("x: !custom value\n");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "invalid YAML document: unsupported tag '!custom'");
}

TEST(YamlValueTest, OnlyCoreSchemaBooleans)
{
  auto r = parse_yaml("a: no\nb: y\nc: on\nd: Off\ne: TRUE\nf: False\n");
  ASSERT_TRUE(r.success) << r.error;
  const Value & v = r.value;

  EXPECT_EQ(v.find("a")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("a")->as_string(), "no");
  EXPECT_EQ(v.find("b")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("c")->kind(), ValueKind::String);
  EXPECT_EQ(v.find("d")->as_string(), "Off");
  EXPECT_TRUE(v.find("e")->as_bool());
  EXPECT_EQ(v.find("f")->kind(), ValueKind::Bool);
  EXPECT_FALSE(v.find("f")->as_bool());
}

TEST(YamlValueTest, Sequences)
{
  auto r = parse_yaml("- 1\n- two\n- [3, 4]\n");
  ASSERT_TRUE(r.success) << r.error;
  ASSERT_TRUE(r.value.is_ordered());

  const auto elements = r.value.as_ordered();
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0].as_integer(), 1);
  EXPECT_EQ(elements[1].as_string(), "two");
  EXPECT_TRUE(elements[2].is_ordered());
  EXPECT_EQ(elements[2].size(), 2u);
}

TEST(YamlValueTest, NestedMappings)
{
  auto r = parse_yaml("server:\n  host: example.com\n  ports: [80, 443]\n");
  ASSERT_TRUE(r.success) << r.error;

  const Value * server = r.value.find("server");
  ASSERT_NE(server, nullptr);
  ASSERT_TRUE(server->is_keyed());
  EXPECT_EQ(server->find("host")->as_string(), "example.com");
  EXPECT_EQ(server->find("ports")->size(), 2u);
}

TEST(YamlValueTest, EmptyDocumentIsNull)
{
  auto r = parse_yaml("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.value.is_null());
}

TEST(YamlValueTest, MalformedText)
{
  auto r = parse_yaml("key: [unclosed");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0u) << r.error;
}

TEST(YamlValueTest, NonScalarKeysAreRejected)
{
  auto r = parse_yaml("? [a, b]\n: value\n");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "invalid YAML document: mapping keys must be scalars");
}

}  // namespace treecoder
