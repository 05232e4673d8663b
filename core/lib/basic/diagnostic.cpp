// polyschema/basic/diagnostic.cpp - Diagnostic implementation
#include "polyschema/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace polyschema
{

namespace
{

Diagnostic located(Severity severity, std::string path, std::string message, std::string label)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(path), std::move(label)});
  return d;
}

}  // namespace

std::string Diagnostic::primary_path() const
{
  return labels.empty() ? std::string() : labels.front().path;
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(std::string path, std::string msg)
{
  diagnostic_.labels.push_back(Label{std::move(path), std::move(msg)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

DiagnosticBuilder DiagnosticBag::report_error(
  std::string path, std::string message, std::string label_message)
{
  return {
    *this,
    located(Severity::Error, std::move(path), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  std::string path, std::string message, std::string label_message)
{
  return {
    *this,
    located(Severity::Warning, std::move(path), std::move(message), std::move(label_message))};
}

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [](const Diagnostic & d) { return d.severity == Severity::Error; }));
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [&](const Diagnostic & d) { return d.code == code; });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

std::string DiagnosticBag::summary() const
{
  std::string out;
  for (const auto & d : diagnostics_) {
    const std::string path = d.primary_path();
    out += path.empty() ? std::string("<root>") : path;
    out += ": ";
    out += d.message;
    if (!d.code.empty()) {
      out += " [" + d.code + "]";
    }
    out += "\n";
  }
  return out;
}

std::string json_pointer_for(std::string_view key)
{
  std::string out = "/";
  out.reserve(key.size() + 1);
  for (const char c : key) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace polyschema
