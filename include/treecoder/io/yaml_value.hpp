// treecoder/io/yaml_value.hpp - YAML ingestion
//
// Builds a Value tree from yaml-cpp nodes. YAML scalars are untyped text, so
// plain scalars are resolved by yaml-cpp's own conversions in the order
// bool, integer, float; anything else (and every quoted scalar) is a String.
//
#pragma once

#include <string_view>

#include "treecoder/basic/value.hpp"
#include "treecoder/io/load_result.hpp"

namespace YAML
{
class Node;
}

namespace treecoder
{

/**
 * Convert a parsed YAML node to a Value.
 *
 * Fails if a mapping uses a non-scalar key.
 */
[[nodiscard]] LoadResult<Value> value_from_yaml(const YAML::Node & node);

/**
 * Parse YAML text into a Value.
 */
[[nodiscard]] LoadResult<Value> parse_yaml(std::string_view text);

}  // namespace treecoder
