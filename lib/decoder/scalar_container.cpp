// treecoder/decoder/scalar_container.cpp - Primitive reinterpretation rules
//
#include "treecoder/decoder/scalar_container.hpp"

#include <cmath>

namespace treecoder::detail
{

std::optional<bool> reinterpret_bool(const Value & value)
{
  if (!value.is_bool()) return std::nullopt;
  return value.as_bool();
}

std::optional<std::string> reinterpret_string(const Value & value)
{
  if (!value.is_string()) return std::nullopt;
  return value.as_string();
}

std::optional<double> reinterpret_double(const Value & value)
{
  if (!value.is_float()) return std::nullopt;
  return value.as_float();
}

std::optional<float> reinterpret_float(const Value & value)
{
  if (!value.is_float()) return std::nullopt;

  const double raw = value.as_float();
  // NaN and infinities carry over; finite values must fit the float range
  if (std::isfinite(raw) && std::fabs(raw) > static_cast<double>(std::numeric_limits<float>::max())) {
    return std::nullopt;
  }
  return static_cast<float>(raw);
}

}  // namespace treecoder::detail
