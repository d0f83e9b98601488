// treecoder/io/yaml_value.cpp - YAML ingestion implementation
//
#include "treecoder/io/yaml_value.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace treecoder
{

namespace
{

constexpr std::string_view k_str_tag = "tag:yaml.org,2002:str";
constexpr std::string_view k_bool_tag = "tag:yaml.org,2002:bool";
constexpr std::string_view k_int_tag = "tag:yaml.org,2002:int";
constexpr std::string_view k_float_tag = "tag:yaml.org,2002:float";
constexpr std::string_view k_null_tag = "tag:yaml.org,2002:null";

/// YAML 1.2 core schema booleans only; `yes`, `on`, `y` and friends stay strings
std::optional<bool> parse_bool(const std::string & text)
{
  if (text == "true" || text == "True" || text == "TRUE") return true;
  if (text == "false" || text == "False" || text == "FALSE") return false;
  return std::nullopt;
}

std::optional<int64_t> parse_integer(const YAML::Node & node)
{
  int64_t value = 0;
  if (YAML::convert<int64_t>::decode(node, value)) return value;
  return std::nullopt;
}

std::optional<double> parse_float(const YAML::Node & node)
{
  double value = 0.0;
  if (YAML::convert<double>::decode(node, value)) return value;
  return std::nullopt;
}

std::string invalid_tagged(const YAML::Node & node, std::string_view tag_name)
{
  return "value '" + node.Scalar() + "' is not a valid " + std::string(tag_name);
}

/// Resolve a scalar to a kind: explicit tags are honored, plain scalars are
/// resolved bool, int, float, then string
std::optional<Value> convert_scalar(const YAML::Node & node, std::string & error)
{
  const std::string & tag = node.Tag();

  // Quoted scalars carry the non-specific tag "!" and always stay strings
  if (tag == "!" || tag == k_str_tag) {
    return Value::make_string(node.Scalar());
  }

  if (tag == k_bool_tag) {
    if (auto b = parse_bool(node.Scalar())) return Value::make_bool(*b);
    error = invalid_tagged(node, "!!bool");
    return std::nullopt;
  }
  if (tag == k_int_tag) {
    if (auto i = parse_integer(node)) return Value::make_integer(*i);
    error = invalid_tagged(node, "!!int");
    return std::nullopt;
  }
  if (tag == k_float_tag) {
    if (auto f = parse_float(node)) return Value::make_float(*f);
    error = invalid_tagged(node, "!!float");
    return std::nullopt;
  }
  if (tag == k_null_tag) {
    return Value::make_null();
  }
  if (tag != "?") {
    error = "unsupported tag '" + tag + "'";
    return std::nullopt;
  }

  if (auto b = parse_bool(node.Scalar())) return Value::make_bool(*b);
  if (auto i = parse_integer(node)) return Value::make_integer(*i);
  if (auto f = parse_float(node)) return Value::make_float(*f);
  return Value::make_string(node.Scalar());
}

std::optional<Value> convert_node(const YAML::Node & node, std::string & error)
{
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
      return Value::make_null();

    case YAML::NodeType::Null:
      // `key: !!str` with no content is an empty string, not null
      if (node.Tag() == k_str_tag) return Value::make_string("");
      return Value::make_null();

    case YAML::NodeType::Scalar:
      return convert_scalar(node, error);

    case YAML::NodeType::Sequence: {
      Value::OrderedStorage elements;
      elements.reserve(node.size());
      for (const auto & element : node) {
        auto converted = convert_node(element, error);
        if (!converted) return std::nullopt;
        elements.push_back(std::move(*converted));
      }
      return Value::make_ordered(std::move(elements));
    }

    case YAML::NodeType::Map: {
      Value::KeyedStorage entries;
      for (const auto & entry : node) {
        if (!entry.first.IsScalar()) {
          error = "mapping keys must be scalars";
          return std::nullopt;
        }
        auto converted = convert_node(entry.second, error);
        if (!converted) return std::nullopt;
        entries.insert_or_assign(entry.first.Scalar(), std::move(*converted));
      }
      return Value::make_keyed(std::move(entries));
    }
  }

  error = "unknown YAML node type";
  return std::nullopt;
}

}  // namespace

LoadResult<Value> value_from_yaml(const YAML::Node & node)
{
  std::string error;
  auto converted = convert_node(node, error);
  if (!converted) {
    return LoadResult<Value>::fail("invalid YAML document: " + error);
  }
  return LoadResult<Value>::ok(std::move(*converted));
}

LoadResult<Value> parse_yaml(std::string_view text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    return LoadResult<Value>::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return value_from_yaml(root);
}

}  // namespace treecoder
