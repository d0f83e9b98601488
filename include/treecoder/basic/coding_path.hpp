// treecoder/basic/coding_path.hpp - Breadcrumb from the decode root
//
// A coding path records the field names and positional indices leading from
// the root value to the value currently being decoded. Paths are immutable:
// descending produces an extended copy, so siblings never observe each
// other's segments.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace treecoder
{

// ============================================================================
// Path Segment
// ============================================================================

/**
 * One step of a coding path: a field name or a positional index.
 */
class PathSegment
{
public:
  enum class Kind : uint8_t { Field, Index };

  static PathSegment field(std::string name)
  {
    PathSegment s;
    s.kind_ = Kind::Field;
    s.name_ = std::move(name);
    return s;
  }

  static PathSegment index(size_t position)
  {
    PathSegment s;
    s.kind_ = Kind::Index;
    s.index_ = position;
    return s;
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_field() const noexcept { return kind_ == Kind::Field; }
  [[nodiscard]] bool is_index() const noexcept { return kind_ == Kind::Index; }

  /// Field name (empty for index segments)
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// Position (0 for field segments)
  [[nodiscard]] size_t position() const noexcept { return index_; }

  friend bool operator==(const PathSegment & lhs, const PathSegment & rhs)
  {
    return lhs.kind_ == rhs.kind_ && lhs.name_ == rhs.name_ && lhs.index_ == rhs.index_;
  }
  friend bool operator!=(const PathSegment & lhs, const PathSegment & rhs)
  {
    return !(lhs == rhs);
  }

private:
  PathSegment() = default;

  Kind kind_ = Kind::Field;
  std::string name_;
  size_t index_ = 0;
};

// ============================================================================
// Coding Path
// ============================================================================

class CodingPath
{
public:
  CodingPath() = default;
  explicit CodingPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {}

  /// Return a copy of this path extended by one segment
  [[nodiscard]] CodingPath appending(PathSegment segment) const;

  [[nodiscard]] CodingPath appending_field(std::string name) const
  {
    return appending(PathSegment::field(std::move(name)));
  }

  [[nodiscard]] CodingPath appending_index(size_t position) const
  {
    return appending(PathSegment::index(position));
  }

  [[nodiscard]] const std::vector<PathSegment> & segments() const noexcept { return segments_; }
  [[nodiscard]] size_t size() const noexcept { return segments_.size(); }
  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }

  [[nodiscard]] auto begin() const { return segments_.begin(); }
  [[nodiscard]] auto end() const { return segments_.end(); }

  /**
   * Render the path for diagnostics.
   *
   * Produces `servers[1].port`; the empty path renders as `<root>`.
   * Field names that are not plain identifiers are quoted: `tags["a b"]`.
   */
  [[nodiscard]] std::string to_string() const;

  /**
   * Parse the rendering produced by to_string().
   *
   * @return The path, or std::nullopt if the text is malformed
   */
  [[nodiscard]] static std::optional<CodingPath> parse(std::string_view text);

  friend bool operator==(const CodingPath & lhs, const CodingPath & rhs)
  {
    return lhs.segments_ == rhs.segments_;
  }
  friend bool operator!=(const CodingPath & lhs, const CodingPath & rhs) { return !(lhs == rhs); }

private:
  std::vector<PathSegment> segments_;
};

/// Rendering of the empty path
inline constexpr const char * k_root_path_name = "<root>";

}  // namespace treecoder
