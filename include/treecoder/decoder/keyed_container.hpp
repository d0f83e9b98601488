// treecoder/decoder/keyed_container.hpp - Named-field access over a keyed value
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

class Decoder;
class OrderedContainer;

/**
 * Keyed container walker.
 *
 * Wraps one Keyed value together with the coding path at which it was
 * reached. Keys are matched by exact string comparison. The walker does not
 * know which fields are optional: callers distinguish absent from null with
 * contains() and decode_nil() (or use decode_if_present()).
 *
 * The view references the value tree and must not outlive it.
 */
class KeyedContainer
{
public:
  /**
   * @param value A Keyed value
   * @param path Coding path of the value
   * @param declared_keys Field names declared by the target schema; when
   *                      non-empty, all_keys() is restricted to them
   */
  KeyedContainer(
    const Value & value, CodingPath path, std::vector<std::string> declared_keys = {});

  [[nodiscard]] const CodingPath & coding_path() const noexcept { return path_; }

  [[nodiscard]] const std::vector<std::string> & declared_keys() const noexcept
  {
    return declared_;
  }

  /// Keys present in the value (filtered to the declared keys, if any)
  [[nodiscard]] std::vector<std::string> all_keys() const;

  /// True iff an entry exists for key (a Null entry counts)
  [[nodiscard]] bool contains(std::string_view key) const;

  /// KeyNotFound if absent; otherwise true iff the entry is Null
  [[nodiscard]] DecodeResult<bool> decode_nil(std::string_view key) const;

  /// Raw entry for key, or KeyNotFound at this container's path
  [[nodiscard]] DecodeResult<Value> element(std::string_view key) const;

  /**
   * Decode the entry for key as a primitive.
   *
   * Fails with KeyNotFound at this path if absent, or TypeMismatch at
   * path + key if the entry is not a P.
   */
  template <typename P>
  [[nodiscard]] DecodeResult<P> decode_scalar(std::string_view key) const;

  /// Decode the entry for key as any decodable T, recursing at path + key
  template <typename T>
  [[nodiscard]] DecodeResult<T> decode(std::string_view key) const;

  /// Like decode(), but an absent or Null entry yields std::nullopt
  template <typename T>
  [[nodiscard]] DecodeResult<std::optional<T>> decode_if_present(std::string_view key) const;

  [[nodiscard]] DecodeResult<KeyedContainer> nested_keyed_container(
    std::string_view key, std::vector<std::string> declared_keys = {}) const;

  [[nodiscard]] DecodeResult<OrderedContainer> nested_ordered_container(
    std::string_view key) const;

  /// Base-class decoding is unsupported: always throws UnsupportedFeatureError
  [[noreturn]] Decoder super_decoder() const;
  [[noreturn]] Decoder super_decoder(std::string_view key) const;

private:
  [[nodiscard]] DecodeResult<const Value *> lookup(std::string_view key) const;

  [[nodiscard]] CodingPath child_path(std::string_view key) const
  {
    return path_.appending_field(std::string(key));
  }

  const Value * value_;
  CodingPath path_;
  std::vector<std::string> declared_;
};

}  // namespace treecoder
