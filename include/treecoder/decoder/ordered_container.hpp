// treecoder/decoder/ordered_container.hpp - Positional access over an ordered value
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

class Decoder;
class KeyedContainer;

/**
 * Ordered container walker.
 *
 * Wraps one Ordered value with a cursor. Every decode attempt consumes the
 * element under the cursor exactly once, whether or not it succeeds; the
 * cursor never moves backwards. An attempt at the end fails with
 * ElementOutOfBounds instead of reading past the sequence.
 */
class OrderedContainer
{
public:
  OrderedContainer(const Value & value, CodingPath path);

  [[nodiscard]] const CodingPath & coding_path() const noexcept { return path_; }

  [[nodiscard]] size_t count() const noexcept { return count_; }
  [[nodiscard]] size_t current_index() const noexcept { return cursor_; }
  [[nodiscard]] bool is_at_end() const noexcept { return cursor_ >= count_; }

  /**
   * Consume the current element if it is Null.
   *
   * @return true (and advance) iff the element is Null; a non-null element
   *         is left in place for the next decode
   */
  [[nodiscard]] DecodeResult<bool> decode_nil();

  /// Decode the current element as a primitive, then advance
  template <typename P>
  [[nodiscard]] DecodeResult<P> decode_scalar();

  /// Decode the current element as any decodable T, then advance
  template <typename T>
  [[nodiscard]] DecodeResult<T> decode();

  [[nodiscard]] DecodeResult<KeyedContainer> nested_keyed_container(
    std::vector<std::string> declared_keys = {});

  [[nodiscard]] DecodeResult<OrderedContainer> nested_ordered_container();

  /// Base-class decoding is unsupported: always throws UnsupportedFeatureError
  [[noreturn]] Decoder super_decoder();

private:
  struct Element
  {
    const Value * value;
    CodingPath path;
  };

  /// Take the element under the cursor and advance
  [[nodiscard]] DecodeResult<Element> next_element();

  const Value * value_;
  CodingPath path_;
  size_t count_;
  size_t cursor_ = 0;
};

}  // namespace treecoder
