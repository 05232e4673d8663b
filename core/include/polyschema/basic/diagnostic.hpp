// polyschema/basic/diagnostic.hpp - Diagnostics for payload validation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyschema
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * A message attached to a location in the payload.
 *
 * `path` is a JSON pointer ("/number", "/items/0"); the empty string
 * denotes the payload root.
 */
struct Label
{
  std::string path;
  std::string message;
};

/**
 * One problem found in a payload. The first label locates it.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // "S001".."S005"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// Path of the first label, or "" when there is none
  [[nodiscard]] std::string primary_path() const;
};

class DiagnosticBag;

/**
 * Fills in a diagnostic and adds it to its bag when destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(std::string path, std::string msg);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

/**
 * Ordered collection of the diagnostics from one validation.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    std::string path, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    std::string path, std::string message, std::string label_message = "");

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t error_count() const;
  [[nodiscard]] bool has_errors() const { return error_count() > 0; }
  [[nodiscard]] bool has_code(std::string_view code) const;

  void merge(DiagnosticBag && other);

  /// One line per diagnostic: "<path>: <message> [<code>]"
  [[nodiscard]] std::string summary() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

/// JSON pointer for a top-level key ("/a~1b" for "a/b")
[[nodiscard]] std::string json_pointer_for(std::string_view key);

}  // namespace polyschema
