// treecoder/schema/fields.hpp - Field registration for user structures
//
// A lightweight stand-in for reflection: a structure lists its fields as
// (name, member pointer) pairs, and decode_fields() drives a keyed container
// over them. Members of type std::optional<U> are optional fields; all other
// members are required.
//
// Usage:
//   struct Server
//   {
//     std::string host;
//     std::optional<int64_t> port;
//
//     static auto coding_fields()
//     {
//       return std::make_tuple(
//         treecoder::field("host", &Server::host), treecoder::field("port", &Server::port));
//     }
//   };
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "treecoder/decoder/decoder.hpp"

namespace treecoder
{

// ============================================================================
// Field Specifications
// ============================================================================

template <typename T, typename M>
struct FieldSpec
{
  std::string_view name;
  M T::*member;
};

/// Declare a field named `name` stored in `member`
template <typename T, typename M>
constexpr FieldSpec<T, M> field(std::string_view name, M T::*member)
{
  return FieldSpec<T, M>{name, member};
}

/// Marks a base-class section; decoding it is unsupported
template <typename Base>
struct InheritsSpec
{
};

template <typename Base>
constexpr InheritsSpec<Base> inherits()
{
  return InheritsSpec<Base>{};
}

namespace detail
{

template <typename M>
struct IsOptional : std::false_type
{
};

template <typename U>
struct IsOptional<std::optional<U>> : std::true_type
{
};

/// Check if T declares `static auto coding_fields()`
template <typename T, typename = void>
struct HasCodingFields : std::false_type
{
};

template <typename T>
struct HasCodingFields<T, std::void_t<decltype(T::coding_fields())>> : std::true_type
{
};

template <typename T, typename M>
void collect_name(std::vector<std::string> & names, const FieldSpec<T, M> & spec)
{
  names.emplace_back(spec.name);
}

template <typename Base>
void collect_name(std::vector<std::string> & /*names*/, const InheritsSpec<Base> & /*spec*/)
{
}

/// Decode one field into target; on failure stores the error and returns false
template <typename Target, typename T, typename M>
bool decode_field(
  const KeyedContainer & container, Target & target, const FieldSpec<T, M> & spec,
  std::optional<DecodeError> & failure)
{
  if constexpr (IsOptional<M>::value) {
    auto decoded = container.decode_if_present<typename M::value_type>(spec.name);
    if (!decoded) {
      failure = std::move(decoded).error();
      return false;
    }
    target.*spec.member = std::move(decoded).value();
  } else {
    auto decoded = container.decode<M>(spec.name);
    if (!decoded) {
      failure = std::move(decoded).error();
      return false;
    }
    target.*spec.member = std::move(decoded).value();
  }
  return true;
}

template <typename Target, typename Base>
bool decode_field(
  const KeyedContainer & container, Target & /*target*/, const InheritsSpec<Base> & /*spec*/,
  std::optional<DecodeError> & /*failure*/)
{
  static_assert(std::is_base_of_v<Base, Target>, "inherits<Base>() requires a base class");
  (void)container.super_decoder();
}

}  // namespace detail

template <typename T>
inline constexpr bool has_coding_fields_v = detail::HasCodingFields<T>::value;

// ============================================================================
// Structure Decoding
// ============================================================================

/**
 * Decode a structure field by field.
 *
 * Acquires a keyed container (ShapeMismatch if the value is not keyed),
 * then decodes every field in declaration order into a fresh T. The first
 * failure is returned and the partially built T is discarded.
 *
 * @throws UnsupportedFeatureError if the fields include inherits<Base>()
 */
template <typename T, typename... Specs>
[[nodiscard]] DecodeResult<T> decode_fields(
  const Decoder & decoder, const std::tuple<Specs...> & fields)
{
  static_assert(std::is_default_constructible_v<T>, "decoded structures must be default-constructible");

  std::vector<std::string> declared;
  declared.reserve(sizeof...(Specs));
  std::apply([&](const auto &... spec) { (detail::collect_name(declared, spec), ...); }, fields);

  auto container = decoder.keyed_container(std::move(declared));
  if (!container) return std::move(container).error();

  T result{};
  std::optional<DecodeError> failure;
  std::apply(
    [&](const auto &... spec) {
      (void)(detail::decode_field(*container, result, spec, failure) && ...);
    },
    fields);

  if (failure) return std::move(*failure);
  return result;
}

}  // namespace treecoder
