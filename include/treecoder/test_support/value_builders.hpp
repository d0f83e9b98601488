// treecoder/test_support/value_builders.hpp - helpers for unit/integration tests
//
// Terse constructors for Value trees:
//   keyed({{"foo", str("bar")}, {"baz", integer(42)}})
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

#include "treecoder/basic/value.hpp"

namespace treecoder::test_support
{

[[nodiscard]] inline Value null() { return Value::make_null(); }

[[nodiscard]] inline Value boolean(bool v) { return Value::make_bool(v); }

[[nodiscard]] inline Value integer(int64_t v) { return Value::make_integer(v); }

[[nodiscard]] inline Value floating(double v) { return Value::make_float(v); }

[[nodiscard]] inline Value str(std::string v) { return Value::make_string(std::move(v)); }

[[nodiscard]] inline Value keyed(std::initializer_list<std::pair<const std::string, Value>> entries)
{
  return Value::make_keyed(Value::KeyedStorage(entries.begin(), entries.end()));
}

[[nodiscard]] inline Value ordered(std::initializer_list<Value> elements)
{
  return Value::make_ordered(Value::OrderedStorage(elements));
}

}  // namespace treecoder::test_support
