// treecoder/decoder/keyed_container.cpp - Keyed container walker
//
#include "treecoder/decoder/keyed_container.hpp"

#include <algorithm>
#include <utility>

#include "treecoder/decoder/decoder.hpp"
#include "treecoder/decoder/ordered_container.hpp"

namespace treecoder
{

KeyedContainer::KeyedContainer(
  const Value & value, CodingPath path, std::vector<std::string> declared_keys)
: value_(&value), path_(std::move(path)), declared_(std::move(declared_keys))
{
}

std::vector<std::string> KeyedContainer::all_keys() const
{
  std::vector<std::string> keys;
  keys.reserve(value_->size());
  for (const auto & [key, _] : value_->as_keyed()) {
    if (
      declared_.empty() ||
      std::find(declared_.begin(), declared_.end(), key) != declared_.end()) {
      keys.push_back(key);
    }
  }
  return keys;
}

bool KeyedContainer::contains(std::string_view key) const
{
  return value_->find(key) != nullptr;
}

DecodeResult<bool> KeyedContainer::decode_nil(std::string_view key) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();
  return (*child)->is_null();
}

DecodeResult<Value> KeyedContainer::element(std::string_view key) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();
  return **child;
}

DecodeResult<KeyedContainer> KeyedContainer::nested_keyed_container(
  std::string_view key, std::vector<std::string> declared_keys) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();

  const Value & nested = **child;
  if (!nested.is_keyed()) {
    return DecodeError::type_mismatch(
      child_path(key), std::string(to_string(ValueKind::Keyed)), nested.kind());
  }
  return KeyedContainer(nested, child_path(key), std::move(declared_keys));
}

DecodeResult<OrderedContainer> KeyedContainer::nested_ordered_container(
  std::string_view key) const
{
  auto child = lookup(key);
  if (!child) return std::move(child).error();

  const Value & nested = **child;
  if (!nested.is_ordered()) {
    return DecodeError::type_mismatch(
      child_path(key), std::string(to_string(ValueKind::Ordered)), nested.kind());
  }
  return OrderedContainer(nested, child_path(key));
}

Decoder KeyedContainer::super_decoder() const
{
  throw UnsupportedFeatureError("base-class decoding", path_);
}

Decoder KeyedContainer::super_decoder(std::string_view key) const
{
  throw UnsupportedFeatureError("base-class decoding", child_path(key));
}

DecodeResult<const Value *> KeyedContainer::lookup(std::string_view key) const
{
  const Value * child = value_->find(key);
  if (child == nullptr) {
    std::vector<std::string> available;
    available.reserve(value_->size());
    for (const auto & [name, _] : value_->as_keyed()) {
      available.push_back(name);
    }
    return DecodeError::key_not_found(path_, std::string(key), std::move(available), declared_);
  }
  return child;
}

}  // namespace treecoder
