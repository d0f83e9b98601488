// treecoder/basic/diagnostic_printer.hpp
//
// Prints decode errors in Rust-style format, marking the failing segment of
// the coding path.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "treecoder/basic/decode_error.hpp"

namespace treecoder
{

/**
 * Prints decode errors in Rust-style format.
 *
 * Produces output like:
 *   error[D003]: type mismatch: expected Int but found String
 *     --> servers.yaml
 *         |
 *         | servers[1].port
 *         |            ^^^^ found String
 *         |
 *         = note: expected a value of type Int
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a decode error.
   *
   * @param error The error to print
   * @param origin Name of the decoded document (file name); may be empty
   */
  void print(const DecodeError & error, std::string_view origin = {});

  /**
   * Print a plain error without a coding path (I/O or parse failures).
   */
  void print_error(std::string_view message, std::string_view origin = {});

private:
  void print_severity_header(std::string_view code, std::string_view message);

  void print_path_context(const DecodeError & error);

  void print_note(std::string_view message);
  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace treecoder
