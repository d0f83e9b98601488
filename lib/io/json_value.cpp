// treecoder/io/json_value.cpp - JSON ingestion implementation
//
#include "treecoder/io/json_value.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace treecoder
{

using nlohmann::json;

Value value_from_json(const json & j)
{
  switch (j.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
      return Value::make_null();

    case json::value_t::boolean:
      return Value::make_bool(j.get<bool>());

    case json::value_t::number_integer:
      return Value::make_integer(j.get<int64_t>());

    case json::value_t::number_unsigned: {
      const auto raw = j.get<uint64_t>();
      if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value::make_float(static_cast<double>(raw));
      }
      return Value::make_integer(static_cast<int64_t>(raw));
    }

    case json::value_t::number_float:
      return Value::make_float(j.get<double>());

    case json::value_t::string:
      return Value::make_string(j.get<std::string>());

    case json::value_t::array: {
      Value::OrderedStorage elements;
      elements.reserve(j.size());
      for (const auto & element : j) {
        elements.push_back(value_from_json(element));
      }
      return Value::make_ordered(std::move(elements));
    }

    case json::value_t::object: {
      Value::KeyedStorage entries;
      for (const auto & item : j.items()) {
        entries.emplace(item.key(), value_from_json(item.value()));
      }
      return Value::make_keyed(std::move(entries));
    }

    case json::value_t::binary: {
      Value::OrderedStorage bytes;
      for (const auto byte : j.get_binary()) {
        bytes.push_back(Value::make_integer(byte));
      }
      return Value::make_ordered(std::move(bytes));
    }
  }
  return Value::make_null();
}

LoadResult<Value> parse_json(std::string_view text)
{
  json document;
  try {
    document = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return LoadResult<Value>::fail("failed to parse JSON: " + std::string(e.what()));
  }
  return LoadResult<Value>::ok(value_from_json(document));
}

}  // namespace treecoder
