// treecoder/decoder/decoder.cpp - Recursive dispatcher implementation
//
#include "treecoder/decoder/decoder.hpp"

#include "treecoder/decoder/classifier.hpp"

namespace treecoder
{

DecodeResult<KeyedContainer> Decoder::keyed_container(
  std::vector<std::string> declared_keys) const
{
  auto keyed = classify(*value_, Shape::Keyed, path_);
  if (!keyed) return std::move(keyed).error();
  return KeyedContainer(**keyed, path_, std::move(declared_keys));
}

DecodeResult<OrderedContainer> Decoder::ordered_container() const
{
  auto ordered = classify(*value_, Shape::Ordered, path_);
  if (!ordered) return std::move(ordered).error();
  return OrderedContainer(**ordered, path_);
}

ScalarContainer Decoder::scalar_container() const
{
  return ScalarContainer(*value_, path_);
}

Decoder Decoder::super_decoder() const
{
  throw UnsupportedFeatureError("base-class decoding", path_);
}

}  // namespace treecoder
