// treecoder/io/json_value.hpp - JSON ingestion
//
// Builds a Value tree from nlohmann::json documents.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "treecoder/basic/value.hpp"
#include "treecoder/io/load_result.hpp"

namespace treecoder
{

/**
 * Convert a JSON document to a Value.
 *
 * Unsigned numbers that do not fit in int64 become Float; binary payloads
 * become an ordered sequence of byte integers.
 */
[[nodiscard]] Value value_from_json(const nlohmann::json & json);

/**
 * Parse JSON text into a Value.
 */
[[nodiscard]] LoadResult<Value> parse_json(std::string_view text);

}  // namespace treecoder
