// polyschema/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "polyschema/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace polyschema
{

namespace
{

constexpr std::string_view k_indent = "    ";

const char * severity_name(Severity severity)
{
  return severity == Severity::Warning ? "warning" : "error";
}

rang::fg severity_color(Severity severity)
{
  return severity == Severity::Warning ? rang::fg::yellow : rang::fg::red;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view origin)
{
  print_header(diag);

  const std::string path = diag.primary_path();
  print_gutter("-->");
  if (path.empty()) {
    fmt::print(os_, " {}\n", origin);
  } else {
    fmt::print(os_, " {}#{}\n", origin, path);
  }

  print_gutter("|");
  os_ << "\n";

  for (const auto & label : diag.labels) {
    if (label.message.empty()) {
      continue;
    }
    print_gutter("^");
    fmt::print(
      os_, " {}: {}\n", label.path.empty() ? std::string_view("<root>") : label.path,
      label.message);
  }

  if (diag.help_message) {
    print_gutter("=");
    fmt::print(os_, " help: {}\n", *diag.help_message);
  }

  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view origin)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_path() < b->primary_path();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, origin);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string head = severity_name(diag.severity);
  if (!diag.code.empty()) {
    head += "[" + diag.code + "]";
  }

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset;
    fmt::print(os_, ": {}", diag.message);
    os_ << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}: {}\n", head, diag.message);
}

void DiagnosticPrinter::print_gutter(std::string_view mark)
{
  // Marks are right-aligned so that "-->" and "|" share a column.
  const std::string cell = fmt::format("{}{:>3}", k_indent, mark);
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << cell << rang::style::reset << rang::fg::reset;
    return;
  }
  os_ << cell;
}

}  // namespace polyschema
