// treecoder/decoder/ordered_container.cpp - Ordered container walker
//
#include "treecoder/decoder/ordered_container.hpp"

#include <utility>

#include "treecoder/decoder/decoder.hpp"
#include "treecoder/decoder/keyed_container.hpp"

namespace treecoder
{

OrderedContainer::OrderedContainer(const Value & value, CodingPath path)
: value_(&value), path_(std::move(path)), count_(value.size())
{
}

DecodeResult<bool> OrderedContainer::decode_nil()
{
  if (is_at_end()) {
    return DecodeError::element_out_of_bounds(path_, cursor_, count_);
  }
  if (!value_->as_ordered()[cursor_].is_null()) {
    return false;
  }
  ++cursor_;
  return true;
}

DecodeResult<KeyedContainer> OrderedContainer::nested_keyed_container(
  std::vector<std::string> declared_keys)
{
  auto element = next_element();
  if (!element) return std::move(element).error();

  if (!element->value->is_keyed()) {
    return DecodeError::type_mismatch(
      std::move(element->path), std::string(to_string(ValueKind::Keyed)),
      element->value->kind());
  }
  return KeyedContainer(*element->value, std::move(element->path), std::move(declared_keys));
}

DecodeResult<OrderedContainer> OrderedContainer::nested_ordered_container()
{
  auto element = next_element();
  if (!element) return std::move(element).error();

  if (!element->value->is_ordered()) {
    return DecodeError::type_mismatch(
      std::move(element->path), std::string(to_string(ValueKind::Ordered)),
      element->value->kind());
  }
  return OrderedContainer(*element->value, std::move(element->path));
}

Decoder OrderedContainer::super_decoder()
{
  throw UnsupportedFeatureError("base-class decoding", path_.appending_index(cursor_));
}

DecodeResult<OrderedContainer::Element> OrderedContainer::next_element()
{
  if (is_at_end()) {
    return DecodeError::element_out_of_bounds(path_, cursor_, count_);
  }

  const size_t index = cursor_++;
  return Element{&value_->as_ordered()[index], path_.appending_index(index)};
}

}  // namespace treecoder
