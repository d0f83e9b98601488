// treecoder/decoder/path_lookup.cpp - Coding path resolution
//
#include "treecoder/decoder/path_lookup.hpp"

#include <utility>

#include "treecoder/decoder/decoding.hpp"

namespace treecoder
{

DecodeResult<Value> lookup_path(const Value & root, const CodingPath & target)
{
  Value current = root;
  CodingPath at;

  for (const auto & segment : target) {
    const Decoder decoder(current, at);

    if (segment.is_field()) {
      auto keyed = decoder.keyed_container();
      if (!keyed) return std::move(keyed).error();
      auto child = keyed->element(segment.name());
      if (!child) return std::move(child).error();
      current = std::move(child).value();
    } else {
      auto ordered = decoder.ordered_container();
      if (!ordered) return std::move(ordered).error();
      if (segment.position() >= ordered->count()) {
        return DecodeError::element_out_of_bounds(at, segment.position(), ordered->count());
      }

      Value element;
      while (ordered->current_index() <= segment.position()) {
        auto next = ordered->decode<Value>();
        if (!next) return std::move(next).error();
        element = std::move(next).value();
      }
      current = std::move(element);
    }
    at = at.appending(segment);
  }

  return current;
}

}  // namespace treecoder
