// treecoder/basic/value.hpp - Opaque value tree
//
// Represents a dynamically-typed value of unknown shape: the input of the
// decoder. Values are immutable once built; container children are held in
// shared storage so copies are cheap and never alias mutable state.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace treecoder
{

// ============================================================================
// Value Kind / Shape
// ============================================================================

/**
 * Runtime kind of a value.
 */
enum class ValueKind : uint8_t {
  Null,     ///< explicit null
  Bool,     ///< boolean
  Integer,  ///< 64-bit signed integer
  Float,    ///< 64-bit floating point
  String,   ///< UTF-8 string
  Keyed,    ///< mapping from string key to value
  Ordered,  ///< sequence of values
};

/**
 * Structural category of a value, independent of its primitive type.
 */
enum class Shape : uint8_t {
  Keyed,
  Ordered,
  Scalar,
};

[[nodiscard]] Shape shape_of(ValueKind kind) noexcept;

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Shape shape) noexcept;

// ============================================================================
// Value
// ============================================================================

/**
 * Opaque value.
 *
 * A closed tagged union over Null, Bool, Integer, Float, String, Keyed and
 * Ordered. The default-constructed value is Null.
 */
class Value
{
public:
  using KeyedStorage = std::map<std::string, Value, std::less<>>;
  using OrderedStorage = std::vector<Value>;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_null() { return Value(); }

  static Value make_bool(bool value)
  {
    Value v;
    v.kind_ = ValueKind::Bool;
    v.boolValue_ = value;
    return v;
  }

  static Value make_integer(int64_t value)
  {
    Value v;
    v.kind_ = ValueKind::Integer;
    v.intValue_ = value;
    return v;
  }

  static Value make_float(double value)
  {
    Value v;
    v.kind_ = ValueKind::Float;
    v.floatValue_ = value;
    return v;
  }

  static Value make_string(std::string value)
  {
    Value v;
    v.kind_ = ValueKind::String;
    v.stringValue_ = std::move(value);
    return v;
  }

  static Value make_keyed(KeyedStorage entries);

  static Value make_ordered(OrderedStorage elements);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] Shape shape() const noexcept { return shape_of(kind_); }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }

  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }

  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }

  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }

  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }

  [[nodiscard]] bool is_keyed() const noexcept { return kind_ == ValueKind::Keyed; }

  [[nodiscard]] bool is_ordered() const noexcept { return kind_ == ValueKind::Ordered; }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Get boolean value (only valid if is_bool())
  [[nodiscard]] bool as_bool() const noexcept { return boolValue_; }

  /// Get integer value (only valid if is_integer())
  [[nodiscard]] int64_t as_integer() const noexcept { return intValue_; }

  /// Get float value (only valid if is_float())
  [[nodiscard]] double as_float() const noexcept { return floatValue_; }

  /// Get string value (only valid if is_string())
  [[nodiscard]] const std::string & as_string() const noexcept { return stringValue_; }

  /// Get keyed entries (empty unless is_keyed())
  [[nodiscard]] const KeyedStorage & as_keyed() const noexcept;

  /// Get ordered elements (empty unless is_ordered())
  [[nodiscard]] gsl::span<const Value> as_ordered() const noexcept;

  /// Number of children of a container value; 0 for scalars
  [[nodiscard]] size_t size() const noexcept;

  /**
   * Look up a child of a keyed value.
   *
   * @return Pointer into this value's storage, or nullptr if the key is
   *         absent or this value is not keyed
   */
  [[nodiscard]] const Value * find(std::string_view key) const;

  friend bool operator==(const Value & lhs, const Value & rhs);
  friend bool operator!=(const Value & lhs, const Value & rhs) { return !(lhs == rhs); }

  Value() = default;

private:
  ValueKind kind_ = ValueKind::Null;
  bool boolValue_ = false;
  int64_t intValue_ = 0;
  double floatValue_ = 0.0;
  std::string stringValue_;
  std::shared_ptr<const KeyedStorage> keyed_;
  std::shared_ptr<const OrderedStorage> ordered_;
};

}  // namespace treecoder
