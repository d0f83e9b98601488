// treecoder/basic/value.cpp - Opaque value implementation
//
#include "treecoder/basic/value.hpp"

#include <utility>

namespace treecoder
{

Shape shape_of(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Keyed:
      return Shape::Keyed;
    case ValueKind::Ordered:
      return Shape::Ordered;
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
      return Shape::Scalar;
  }
  return Shape::Scalar;
}

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Null:
      return "Null";
    case ValueKind::Bool:
      return "Bool";
    case ValueKind::Integer:
      return "Integer";
    case ValueKind::Float:
      return "Float";
    case ValueKind::String:
      return "String";
    case ValueKind::Keyed:
      return "Keyed";
    case ValueKind::Ordered:
      return "Ordered";
  }
  return "Unknown";
}

std::string_view to_string(Shape shape) noexcept
{
  switch (shape) {
    case Shape::Keyed:
      return "Keyed";
    case Shape::Ordered:
      return "Ordered";
    case Shape::Scalar:
      return "Scalar";
  }
  return "Unknown";
}

Value Value::make_keyed(KeyedStorage entries)
{
  Value v;
  v.kind_ = ValueKind::Keyed;
  v.keyed_ = std::make_shared<const KeyedStorage>(std::move(entries));
  return v;
}

Value Value::make_ordered(OrderedStorage elements)
{
  Value v;
  v.kind_ = ValueKind::Ordered;
  v.ordered_ = std::make_shared<const OrderedStorage>(std::move(elements));
  return v;
}

const Value::KeyedStorage & Value::as_keyed() const noexcept
{
  static const KeyedStorage k_empty;
  return keyed_ ? *keyed_ : k_empty;
}

gsl::span<const Value> Value::as_ordered() const noexcept
{
  if (!ordered_) return {};
  return gsl::span<const Value>(ordered_->data(), ordered_->size());
}

size_t Value::size() const noexcept
{
  if (keyed_) return keyed_->size();
  if (ordered_) return ordered_->size();
  return 0;
}

const Value * Value::find(std::string_view key) const
{
  if (!keyed_) return nullptr;
  const auto it = keyed_->find(key);
  return it != keyed_->end() ? &it->second : nullptr;
}

bool operator==(const Value & lhs, const Value & rhs)
{
  if (lhs.kind_ != rhs.kind_) return false;

  switch (lhs.kind_) {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return lhs.boolValue_ == rhs.boolValue_;
    case ValueKind::Integer:
      return lhs.intValue_ == rhs.intValue_;
    case ValueKind::Float:
      return lhs.floatValue_ == rhs.floatValue_;
    case ValueKind::String:
      return lhs.stringValue_ == rhs.stringValue_;
    case ValueKind::Keyed:
      return lhs.keyed_ == rhs.keyed_ || lhs.as_keyed() == rhs.as_keyed();
    case ValueKind::Ordered:
      return lhs.ordered_ == rhs.ordered_ || *lhs.ordered_ == *rhs.ordered_;
  }
  return false;
}

}  // namespace treecoder
