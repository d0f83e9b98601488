// treecoder/decoder/scalar_container.hpp - Single-value primitive extraction
//
// Reinterprets one opaque value as a primitive type. There is no coercion
// between kinds: a String never becomes an Integer, an Integer never becomes
// a Float. Integer targets are range-checked instead of truncated.
//
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "treecoder/basic/coding_path.hpp"
#include "treecoder/basic/decode_result.hpp"
#include "treecoder/basic/value.hpp"

namespace treecoder
{

// ============================================================================
// Scalar Traits
// ============================================================================

/**
 * Per-primitive reinterpretation rules.
 *
 * Each specialization provides the user-facing type name used in
 * TypeMismatch errors and a reinterpret() that yields std::nullopt when the
 * value is of the wrong kind or out of range.
 */
template <typename P>
struct ScalarTraits
{
};

namespace detail
{

std::optional<bool> reinterpret_bool(const Value & value);
std::optional<std::string> reinterpret_string(const Value & value);
std::optional<double> reinterpret_double(const Value & value);
std::optional<float> reinterpret_float(const Value & value);

template <typename I>
std::optional<I> reinterpret_integer(const Value & value)
{
  static_assert(std::is_integral_v<I> && sizeof(I) <= sizeof(int64_t));

  if (!value.is_integer()) return std::nullopt;

  const int64_t raw = value.as_integer();
  if constexpr (std::is_signed_v<I>) {
    if (
      raw < static_cast<int64_t>(std::numeric_limits<I>::min()) ||
      raw > static_cast<int64_t>(std::numeric_limits<I>::max())) {
      return std::nullopt;
    }
  } else {
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<I>::max()) {
      return std::nullopt;
    }
  }
  return static_cast<I>(raw);
}

/// Check if ScalarTraits<P> is specialized
template <typename P, typename = void>
struct IsScalar : std::false_type
{
};

template <typename P>
struct IsScalar<P, std::void_t<decltype(ScalarTraits<P>::name)>> : std::true_type
{
};

}  // namespace detail

template <typename P>
inline constexpr bool is_scalar_v = detail::IsScalar<P>::value;

template <>
struct ScalarTraits<bool>
{
  static constexpr std::string_view name = "Bool";
  static std::optional<bool> reinterpret(const Value & v) { return detail::reinterpret_bool(v); }
};

template <>
struct ScalarTraits<std::string>
{
  static constexpr std::string_view name = "String";
  static std::optional<std::string> reinterpret(const Value & v)
  {
    return detail::reinterpret_string(v);
  }
};

template <>
struct ScalarTraits<double>
{
  static constexpr std::string_view name = "Double";
  static std::optional<double> reinterpret(const Value & v)
  {
    return detail::reinterpret_double(v);
  }
};

template <>
struct ScalarTraits<float>
{
  static constexpr std::string_view name = "Float";
  static std::optional<float> reinterpret(const Value & v) { return detail::reinterpret_float(v); }
};

#define TREECODER_INTEGER_SCALAR(type, type_name)                                      \
  template <>                                                                          \
  struct ScalarTraits<type>                                                            \
  {                                                                                    \
    static constexpr std::string_view name = type_name;                                \
    static std::optional<type> reinterpret(const Value & v)                            \
    {                                                                                  \
      return detail::reinterpret_integer<type>(v);                                     \
    }                                                                                  \
  };

// Native width
TREECODER_INTEGER_SCALAR(int64_t, "Int")
TREECODER_INTEGER_SCALAR(uint64_t, "UInt")

// Fixed widths
TREECODER_INTEGER_SCALAR(int8_t, "Int8")
TREECODER_INTEGER_SCALAR(int16_t, "Int16")
TREECODER_INTEGER_SCALAR(int32_t, "Int32")
TREECODER_INTEGER_SCALAR(uint8_t, "UInt8")
TREECODER_INTEGER_SCALAR(uint16_t, "UInt16")
TREECODER_INTEGER_SCALAR(uint32_t, "UInt32")

#undef TREECODER_INTEGER_SCALAR

// ============================================================================
// Scalar Container
// ============================================================================

/**
 * View over a single value, consumed as one primitive.
 *
 * Acquiring the view never fails; a type mismatch surfaces only when a
 * specific primitive is requested.
 */
class ScalarContainer
{
public:
  ScalarContainer(const Value & value, CodingPath path) : value_(&value), path_(std::move(path))
  {
  }

  [[nodiscard]] const CodingPath & coding_path() const noexcept { return path_; }

  /// True iff the value is Null
  [[nodiscard]] bool decode_nil() const noexcept { return value_->is_null(); }

  /**
   * Reinterpret the value as P.
   *
   * @return The primitive, or TypeMismatch(P, value kind) at this path
   */
  template <typename P>
  [[nodiscard]] DecodeResult<P> decode() const
  {
    static_assert(is_scalar_v<P>, "ScalarContainer::decode<P>() requires a supported primitive");

    auto result = ScalarTraits<P>::reinterpret(*value_);
    if (!result) {
      return DecodeError::type_mismatch(
        path_, std::string(ScalarTraits<P>::name), value_->kind());
    }
    return std::move(*result);
  }

private:
  const Value * value_;
  CodingPath path_;
};

}  // namespace treecoder
