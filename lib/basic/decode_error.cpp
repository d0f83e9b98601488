// treecoder/basic/decode_error.cpp - Decode failure formatting
//
#include "treecoder/basic/decode_error.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <utility>

namespace treecoder
{

std::string_view to_string(FailureKind kind) noexcept
{
  switch (kind) {
    case FailureKind::ShapeMismatch:
      return "shape mismatch";
    case FailureKind::KeyNotFound:
      return "key not found";
    case FailureKind::TypeMismatch:
      return "type mismatch";
    case FailureKind::ElementOutOfBounds:
      return "element out of bounds";
  }
  return "decode error";
}

DecodeError DecodeError::shape_mismatch(CodingPath path, Shape expected, ValueKind found)
{
  DecodeError e;
  e.kind = FailureKind::ShapeMismatch;
  e.path = std::move(path);
  e.expected = std::string(treecoder::to_string(expected));
  e.found = found;
  return e;
}

DecodeError DecodeError::key_not_found(
  CodingPath path, std::string key, std::vector<std::string> available_keys,
  std::vector<std::string> declared_keys)
{
  DecodeError e;
  e.kind = FailureKind::KeyNotFound;
  e.path = std::move(path);
  e.key = std::move(key);
  e.available_keys = std::move(available_keys);
  e.declared_keys = std::move(declared_keys);
  return e;
}

DecodeError DecodeError::type_mismatch(CodingPath path, std::string expected, ValueKind found)
{
  DecodeError e;
  e.kind = FailureKind::TypeMismatch;
  e.path = std::move(path);
  e.expected = std::move(expected);
  e.found = found;
  return e;
}

DecodeError DecodeError::element_out_of_bounds(CodingPath path, size_t index, size_t count)
{
  DecodeError e;
  e.kind = FailureKind::ElementOutOfBounds;
  e.path = std::move(path);
  e.index = index;
  e.count = count;
  return e;
}

std::string DecodeError::code() const
{
  switch (kind) {
    case FailureKind::ShapeMismatch:
      return "D001";
    case FailureKind::KeyNotFound:
      return "D002";
    case FailureKind::TypeMismatch:
      return "D003";
    case FailureKind::ElementOutOfBounds:
      return "D004";
  }
  return "D000";
}

std::string DecodeError::message() const
{
  switch (kind) {
    case FailureKind::ShapeMismatch:
      return fmt::format(
        "shape mismatch: expected {} container but found {}", expected,
        treecoder::to_string(found));
    case FailureKind::KeyNotFound:
      return fmt::format("key not found: \"{}\"", key);
    case FailureKind::TypeMismatch:
      return fmt::format(
        "type mismatch: expected {} but found {}", expected, treecoder::to_string(found));
    case FailureKind::ElementOutOfBounds:
      return fmt::format("element out of bounds: index {} (count: {})", index, count);
  }
  return "decode error";
}

std::string DecodeError::to_string() const
{
  return fmt::format("{}: {}", path.to_string(), message());
}

UnsupportedFeatureError::UnsupportedFeatureError(
  const std::string & feature, const CodingPath & path)
: std::logic_error(fmt::format("{} is not supported (at {})", feature, path.to_string())),
  path_(path)
{
}

}  // namespace treecoder
