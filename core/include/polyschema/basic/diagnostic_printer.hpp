// polyschema/basic/diagnostic_printer.hpp
//
// Prints payload diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "polyschema/basic/diagnostic.hpp"

namespace polyschema
{

/**
 * Prints diagnostics against the document a payload came from.
 *
 * Produces output like:
 *   error[S002]: field 'number' has the wrong type
 *       --> payload.json#/number
 *         |
 *         ^ /number: expected number, got string
 *         = help: variant 'NumberConfig' was selected
 */
class DiagnosticPrinter
{
public:
  /// `use_color` turns on terminal colours through rang
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// `origin` names the document: a file name or "<payload>"
  void print(const Diagnostic & diag, std::string_view origin);

  /// Prints the bag ordered by payload path
  void print_all(const DiagnosticBag & diags, std::string_view origin);

private:
  void print_header(const Diagnostic & diag);
  void print_gutter(std::string_view mark);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace polyschema
