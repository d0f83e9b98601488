// treecoder/basic/coding_path.cpp - Coding path rendering and parsing
//
#include "treecoder/basic/coding_path.hpp"

#include <cctype>
#include <limits>
#include <utility>

namespace treecoder
{

namespace
{

bool is_ident_start(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

bool is_plain_identifier(std::string_view name)
{
  if (name.empty() || !is_ident_start(name.front())) return false;
  for (const char c : name) {
    if (!is_ident_char(c)) return false;
  }
  return true;
}

void append_quoted(std::string & out, std::string_view name)
{
  out += "[\"";
  for (const char c : name) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += "\"]";
}

}  // namespace

CodingPath CodingPath::appending(PathSegment segment) const
{
  std::vector<PathSegment> extended = segments_;
  extended.push_back(std::move(segment));
  return CodingPath(std::move(extended));
}

std::string CodingPath::to_string() const
{
  if (segments_.empty()) {
    return k_root_path_name;
  }

  std::string out;
  bool first = true;
  for (const auto & seg : segments_) {
    if (seg.is_index()) {
      out += '[';
      out += std::to_string(seg.position());
      out += ']';
    } else if (is_plain_identifier(seg.name())) {
      if (!first) out += '.';
      out += seg.name();
    } else {
      append_quoted(out, seg.name());
    }
    first = false;
  }
  return out;
}

std::optional<CodingPath> CodingPath::parse(std::string_view text)
{
  std::vector<PathSegment> segments;
  if (text.empty() || text == k_root_path_name) {
    return CodingPath{};
  }

  size_t pos = 0;
  bool expect_field = true;  // a bare identifier is allowed here without '.'

  while (pos < text.size()) {
    const char c = text[pos];

    if (c == '[') {
      ++pos;
      if (pos >= text.size()) return std::nullopt;

      if (text[pos] == '"') {
        // Quoted field: ["..."]
        ++pos;
        std::string name;
        bool closed = false;
        while (pos < text.size()) {
          const char q = text[pos++];
          if (q == '\\') {
            if (pos >= text.size()) return std::nullopt;
            name += text[pos++];
          } else if (q == '"') {
            closed = true;
            break;
          } else {
            name += q;
          }
        }
        if (!closed || pos >= text.size() || text[pos] != ']') return std::nullopt;
        ++pos;
        segments.push_back(PathSegment::field(std::move(name)));
      } else {
        // Index: [123]
        size_t value = 0;
        const size_t digits_begin = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
          const auto digit = static_cast<size_t>(text[pos] - '0');
          if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
          value = value * 10 + digit;
          ++pos;
        }
        if (pos == digits_begin || pos >= text.size() || text[pos] != ']') return std::nullopt;
        ++pos;
        segments.push_back(PathSegment::index(value));
      }
      expect_field = false;
      continue;
    }

    if (c == '.') {
      if (segments.empty()) return std::nullopt;
      ++pos;
      expect_field = true;
      if (pos >= text.size() || !is_ident_start(text[pos])) return std::nullopt;
      continue;
    }

    if (!expect_field || !is_ident_start(c)) return std::nullopt;

    const size_t begin = pos;
    while (pos < text.size() && is_ident_char(text[pos])) {
      ++pos;
    }
    segments.emplace_back(PathSegment::field(std::string(text.substr(begin, pos - begin))));
    expect_field = false;
  }

  return CodingPath(std::move(segments));
}

}  // namespace treecoder
