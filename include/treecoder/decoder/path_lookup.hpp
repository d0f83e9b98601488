// treecoder/decoder/path_lookup.hpp - Follow a coding path through a value tree
//
#pragma once

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

/**
 * Resolve `target` against `root` segment by segment through the container
 * views.
 *
 * Field segments fail with ShapeMismatch or KeyNotFound at the parent path.
 * Index segments past the end fail with ElementOutOfBounds reporting the
 * requested index.
 */
[[nodiscard]] DecodeResult<Value> lookup_path(const Value & root, const CodingPath & target);

}  // namespace treecoder
