// treecoder/basic/decode_result.hpp - Result type for decode operations
#pragma once

#include <utility>
#include <variant>

#include "treecoder/basic/decode_error.hpp"

namespace treecoder
{

/**
 * Decode result type using std::variant.
 * Holds either a fully decoded value T or the DecodeError that stopped it.
 */
template <typename T>
class DecodeResult
{
public:
  using ValueType = T;
  using ErrorType = DecodeError;

  // Construct with success value
  DecodeResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}

  // Construct with error
  DecodeResult(DecodeError error) : data_(std::in_place_index<1>, std::move(error)) {}

  // Check if result contains a value
  [[nodiscard]] bool has_value() const { return data_.index() == 0; }

  // Check if result contains an error
  [[nodiscard]] bool has_error() const { return data_.index() == 1; }

  // Conversion to bool (true if has value)
  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<1>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<1>(data_); }
  ErrorType && error() && { return std::get<1>(std::move(data_)); }

  // Pointer-like access
  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

}  // namespace treecoder
