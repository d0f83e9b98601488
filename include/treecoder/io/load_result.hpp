// treecoder/io/load_result.hpp - Result of loading a document from outside
#pragma once

#include <optional>
#include <string>
#include <utility>

#include "treecoder/basic/decode_error.hpp"

namespace treecoder
{

/**
 * Result of loading (and optionally decoding) a document.
 *
 * Ingestion failures (missing file, malformed text) carry only a message;
 * decode failures additionally keep the DecodeError for path-aware reporting.
 */
template <typename T>
struct LoadResult
{
  /// Loaded value (only valid if success == true)
  T value{};

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Set when loading failed while decoding the document
  std::optional<DecodeError> decode_error;

  /// Create a successful result
  static LoadResult ok(T loaded)
  {
    LoadResult r;
    r.value = std::move(loaded);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static LoadResult fail(std::string msg)
  {
    LoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }

  /// Create a failed result from a decode error
  static LoadResult fail(DecodeError err)
  {
    LoadResult r = fail(err.to_string());
    r.decode_error = std::move(err);
    return r;
  }
};

}  // namespace treecoder
