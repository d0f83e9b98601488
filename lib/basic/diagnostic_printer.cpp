// treecoder/basic/diagnostic_printer.cpp - Rust-style decode error output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "treecoder/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace treecoder
{

namespace
{

std::string join_keys(const std::vector<std::string> & keys)
{
  std::string out;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) out += ", ";
    out += keys[i];
  }
  return out;
}

/// Column (0-based) at which the last segment starts in path.to_string()
size_t last_segment_column(const CodingPath & path, const std::string & rendered)
{
  if (path.empty()) return 0;
  const std::string last =
    CodingPath(std::vector<PathSegment>{path.segments().back()}).to_string();
  return rendered.size() >= last.size() ? rendered.size() - last.size() : 0;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const DecodeError & error, std::string_view origin)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(error.code(), error.message());

  // === Location line: --> origin ===
  fmt::print(os_, "{} {}\n", gutter_arrow(), origin.empty() ? "<input>" : origin);

  // === Path with marker ===
  fmt::print(os_, "{}\n", gutter_pipe());
  print_path_context(error);

  // === Notes ===
  switch (error.kind) {
    case FailureKind::ShapeMismatch:
      print_help(fmt::format("the schema reads this value as a {} container", error.expected));
      break;
    case FailureKind::KeyNotFound:
      if (error.available_keys.empty()) {
        print_note("the mapping is empty");
      } else {
        print_note(fmt::format("available keys: {}", join_keys(error.available_keys)));
      }
      if (!error.declared_keys.empty()) {
        print_help(fmt::format("the schema declares: {}", join_keys(error.declared_keys)));
      }
      break;
    case FailureKind::TypeMismatch:
      print_note(fmt::format("expected a value of type {}", error.expected));
      break;
    case FailureKind::ElementOutOfBounds:
      print_note(fmt::format("index {} is past the end of the sequence", error.index));
      break;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_error(std::string_view message, std::string_view origin)
{
  print_severity_header({}, message);
  if (!origin.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), origin);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_severity_header(std::string_view code, std::string_view message)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error";
    if (!code.empty()) {
      os_ << "[" << code << "]";
    }
    os_ << rang::fg::reset << ": " << message << rang::style::reset << "\n";
  } else if (!code.empty()) {
    fmt::print(os_, "error[{}]: {}\n", code, message);
  } else {
    fmt::print(os_, "error: {}\n", message);
  }
}

void DiagnosticPrinter::print_path_context(const DecodeError & error)
{
  const std::string rendered = error.path.to_string();

  // KeyNotFound and ElementOutOfBounds point at the container itself
  size_t start_col = 0;
  std::string label;
  switch (error.kind) {
    case FailureKind::ShapeMismatch:
    case FailureKind::TypeMismatch:
      start_col = last_segment_column(error.path, rendered);
      label = fmt::format("found {}", to_string(error.found));
      break;
    case FailureKind::KeyNotFound:
      label = fmt::format("missing key \"{}\"", error.key);
      break;
    case FailureKind::ElementOutOfBounds:
      label = fmt::format("sequence has {} elements", error.count);
      break;
  }
  const size_t marker_len = rendered.size() > start_col ? rendered.size() - start_col : 1;

  fmt::print(os_, "{} {}\n", gutter_pipe(), rendered);
  fmt::print(os_, "{} {}", gutter_pipe(), std::string(start_col, ' '));

  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{} {}", std::string(marker_len, '^'), label);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{} {}", std::string(marker_len, '^'), label);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace treecoder
