// treecoder/basic/decode_error.hpp - Decode failure taxonomy
//
// DecodeError is the data-error surface of the decoder: it always carries
// the coding path of the deepest failure point and a failure kind.
// UnsupportedFeatureError is the separate usage-error surface.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

// ============================================================================
// Failure Kind
// ============================================================================

enum class FailureKind : uint8_t {
  ShapeMismatch,       ///< value is not the requested container shape
  KeyNotFound,         ///< keyed container has no entry for a field
  TypeMismatch,        ///< value cannot be reinterpreted as the requested type
  ElementOutOfBounds,  ///< ordered container cursor is past the last element
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

// ============================================================================
// Decode Error
// ============================================================================

/**
 * A single decode failure.
 *
 * Which payload fields are meaningful depends on `kind`:
 * - ShapeMismatch:      expected (shape name), found
 * - KeyNotFound:        key, available_keys, declared_keys
 * - TypeMismatch:       expected (type name), found
 * - ElementOutOfBounds: index, count
 */
struct DecodeError
{
  FailureKind kind = FailureKind::TypeMismatch;

  /// Path at which the failure was detected
  CodingPath path;

  std::string expected;
  ValueKind found = ValueKind::Null;

  std::string key;
  std::vector<std::string> available_keys;
  /// Field names the schema declares for the container; empty when untyped
  std::vector<std::string> declared_keys;

  size_t index = 0;
  size_t count = 0;

  static DecodeError shape_mismatch(CodingPath path, Shape expected, ValueKind found);

  static DecodeError key_not_found(
    CodingPath path, std::string key, std::vector<std::string> available_keys = {},
    std::vector<std::string> declared_keys = {});

  static DecodeError type_mismatch(CodingPath path, std::string expected, ValueKind found);

  static DecodeError element_out_of_bounds(CodingPath path, size_t index, size_t count);

  /// Stable diagnostic code, e.g. "D003"
  [[nodiscard]] std::string code() const;

  /// One-line description without the path, e.g. "expected Int but found String"
  [[nodiscard]] std::string message() const;

  /// Full one-line rendering: "<path>: <message>"
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Usage Errors
// ============================================================================

/**
 * Thrown when a schema requests a feature the decoder does not implement
 * (decoding a base class through a shared ancestor decoder).
 *
 * This signals a programming error in the schema, not bad input data, and is
 * never reported through DecodeResult.
 */
class UnsupportedFeatureError : public std::logic_error
{
public:
  UnsupportedFeatureError(const std::string & feature, const CodingPath & path);

  [[nodiscard]] const CodingPath & path() const noexcept { return path_; }

private:
  CodingPath path_;
};

}  // namespace treecoder
