// treecoder/decoder/decoding.hpp - Built-in Decoding<T> specializations
//
// Primitives go through the scalar container; std::optional treats Null as
// absent; sequences drive the ordered walker to its end; string-keyed maps
// drive the keyed walker over every present key. Structures with
// coding_fields() are handled by the primary template.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "treecoder/decoder/decoder.hpp"
#include "treecoder/schema/fields.hpp"

namespace treecoder
{

// Structures registering their fields through coding_fields()
template <typename T, typename Enable>
struct Decoding
{
  static_assert(
    has_coding_fields_v<T>,
    "no Decoding<T> specialization: specialize treecoder::Decoding<T> or add "
    "`static auto coding_fields()` to T");

  static DecodeResult<T> decode(const Decoder & decoder)
  {
    return decode_fields<T>(decoder, T::coding_fields());
  }
};

// Primitives
template <typename P>
struct Decoding<P, std::enable_if_t<is_scalar_v<P>>>
{
  static DecodeResult<P> decode(const Decoder & decoder)
  {
    return decoder.scalar_container().decode<P>();
  }
};

// Raw subtree
template <>
struct Decoding<Value>
{
  static DecodeResult<Value> decode(const Decoder & decoder) { return decoder.value(); }
};

template <typename T>
struct Decoding<std::optional<T>>
{
  static DecodeResult<std::optional<T>> decode(const Decoder & decoder)
  {
    if (decoder.scalar_container().decode_nil()) {
      return std::optional<T>{};
    }

    auto inner = decoder.decode<T>();
    if (!inner) return std::move(inner).error();
    return std::optional<T>(std::move(inner).value());
  }
};

template <typename T, typename Alloc>
struct Decoding<std::vector<T, Alloc>>
{
  static DecodeResult<std::vector<T, Alloc>> decode(const Decoder & decoder)
  {
    auto container = decoder.ordered_container();
    if (!container) return std::move(container).error();

    std::vector<T, Alloc> out;
    out.reserve(container->count());
    while (!container->is_at_end()) {
      auto element = container->template decode<T>();
      if (!element) return std::move(element).error();
      out.push_back(std::move(element).value());
    }
    return out;
  }
};

namespace detail
{

template <typename Map>
DecodeResult<Map> decode_string_map(const Decoder & decoder)
{
  auto container = decoder.keyed_container();
  if (!container) return std::move(container).error();

  Map out;
  for (const auto & key : container->all_keys()) {
    auto element = container->template decode<typename Map::mapped_type>(key);
    if (!element) return std::move(element).error();
    out.emplace(key, std::move(element).value());
  }
  return out;
}

}  // namespace detail

template <typename T, typename Compare, typename Alloc>
struct Decoding<std::map<std::string, T, Compare, Alloc>>
{
  static DecodeResult<std::map<std::string, T, Compare, Alloc>> decode(const Decoder & decoder)
  {
    return detail::decode_string_map<std::map<std::string, T, Compare, Alloc>>(decoder);
  }
};

template <typename T, typename Hash, typename KeyEqual, typename Alloc>
struct Decoding<std::unordered_map<std::string, T, Hash, KeyEqual, Alloc>>
{
  static DecodeResult<std::unordered_map<std::string, T, Hash, KeyEqual, Alloc>> decode(
    const Decoder & decoder)
  {
    return detail::decode_string_map<std::unordered_map<std::string, T, Hash, KeyEqual, Alloc>>(
      decoder);
  }
};

}  // namespace treecoder
