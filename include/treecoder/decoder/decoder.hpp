// treecoder/decoder/decoder.hpp - Recursive dispatcher
//
// The Decoder pairs one opaque value with its coding path and offers the
// three container views to the schema machinery (Decoding<T>), which picks
// the one matching the target type's expected shape. Container views that
// need to materialize a nested value construct a fresh Decoder scoped to the
// child value and the extended path.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"
#include "treecoder/decoder/keyed_container.hpp"
#include "treecoder/decoder/ordered_container.hpp"
#include "treecoder/decoder/scalar_container.hpp"

namespace treecoder
{

/**
 * Schema hook for a target type.
 *
 * Specializations provide:
 * @code
 *   static DecodeResult<T> decode(const Decoder & decoder);
 * @endcode
 * Built-in specializations live in treecoder/decoder/decoding.hpp.
 */
template <typename T, typename Enable = void>
struct Decoding;

class Decoder
{
public:
  Decoder(const Value & value, CodingPath path) : value_(&value), path_(std::move(path)) {}

  [[nodiscard]] const Value & value() const noexcept { return *value_; }
  [[nodiscard]] const CodingPath & coding_path() const noexcept { return path_; }

  /// Keyed view, or ShapeMismatch(Keyed) at this path
  [[nodiscard]] DecodeResult<KeyedContainer> keyed_container(
    std::vector<std::string> declared_keys = {}) const;

  /// Ordered view, or ShapeMismatch(Ordered) at this path
  [[nodiscard]] DecodeResult<OrderedContainer> ordered_container() const;

  /// Scalar view; never fails
  [[nodiscard]] ScalarContainer scalar_container() const;

  /// Decode this value as T through Decoding<T>
  template <typename T>
  [[nodiscard]] DecodeResult<T> decode() const
  {
    return Decoding<T>::decode(*this);
  }

  /// Base-class decoding is unsupported: always throws UnsupportedFeatureError
  [[noreturn]] Decoder super_decoder() const;

private:
  const Value * value_;
  CodingPath path_;
};

// ============================================================================
// Container template definitions (need a complete Decoder)
// ============================================================================

template <typename P>
DecodeResult<P> KeyedContainer::decode_scalar(std::string_view key) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();
  return ScalarContainer(**child, child_path(key)).decode<P>();
}

template <typename T>
DecodeResult<T> KeyedContainer::decode(std::string_view key) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();
  return Decoder(**child, child_path(key)).decode<T>();
}

template <typename T>
DecodeResult<std::optional<T>> KeyedContainer::decode_if_present(std::string_view key) const
{
  const Value * child = value_->find(key);
  if (child == nullptr || child->is_null()) {
    return std::optional<T>{};
  }

  auto decoded = Decoder(*child, child_path(key)).decode<T>();
  if (!decoded) return std::move(decoded).error();
  return std::optional<T>(std::move(decoded).value());
}

template <typename P>
DecodeResult<P> OrderedContainer::decode_scalar()
{
  auto element = next_element();
  if (!element) return std::move(element).error();
  return ScalarContainer(*element->value, std::move(element->path)).decode<P>();
}

template <typename T>
DecodeResult<T> OrderedContainer::decode()
{
  auto element = next_element();
  if (!element) return std::move(element).error();
  return Decoder(*element->value, std::move(element->path)).decode<T>();
}

// ============================================================================
// Entry Point
// ============================================================================

/**
 * Decode a value tree into T.
 *
 * Example usage:
 * @code
 *     auto result = treecoder::decode<ServerConfig>(root);
 *     if (result) {
 *         // Use result.value() or *result
 *     } else {
 *         // Report result.error()
 *     }
 * @endcode
 *
 * @throws UnsupportedFeatureError if the schema of T requests base-class decoding
 */
template <typename T>
[[nodiscard]] DecodeResult<T> decode(const Value & root)
{
  return Decoder(root, CodingPath{}).decode<T>();
}

}  // namespace treecoder
