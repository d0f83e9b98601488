// treecoder/decoder/classifier.hpp - Shape classification of a value
#pragma once

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

/**
 * Check that a value has the requested shape.
 *
 * @param value Value to classify
 * @param requested Shape the caller wants to consume
 * @param path Coding path of the value, used for the error
 * @return The value itself, or ShapeMismatch(requested, value.kind()) at path
 */
[[nodiscard]] DecodeResult<const Value *> classify(
  const Value & value, Shape requested, const CodingPath & path);

}  // namespace treecoder
