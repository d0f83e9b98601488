// treecoder/decoder/classifier.cpp - Shape classification
//
#include "treecoder/decoder/classifier.hpp"

namespace treecoder
{

DecodeResult<const Value *> classify(
  const Value & value, Shape requested, const CodingPath & path)
{
  bool matches = false;
  switch (value.kind()) {
    case ValueKind::Keyed:
      matches = requested == Shape::Keyed;
      break;
    case ValueKind::Ordered:
      matches = requested == Shape::Ordered;
      break;
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
      matches = requested == Shape::Scalar;
      break;
  }

  if (!matches) {
    return DecodeError::shape_mismatch(path, requested, value.kind());
  }
  return &value;
}

}  // namespace treecoder
