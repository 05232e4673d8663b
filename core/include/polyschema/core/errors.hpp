// polyschema/core/errors.hpp - Error taxonomy
//
// Registration-time failures are thrown (they are programming or setup
// errors surfaced to the code that registered). Validation-time failures
// are returned as ValidationError values; ValidationFailure wraps one for
// the throwing entry points.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "polyschema/basic/diagnostic.hpp"
#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/hierarchy_id.hpp"

namespace polyschema
{

enum class ErrorKind : uint8_t {
  // Registration / setup
  DuplicateDiscriminator,
  NonLiteralDiscriminator,
  HierarchyConflict,
  UnknownHierarchy,
  VariantConflict,
  // Validation
  EmptyHierarchy,
  MissingDiscriminatorField,
  UnknownDiscriminatorValue,
  FieldValidation,
};

/// "DuplicateDiscriminatorError", "EmptyHierarchyError", ...
[[nodiscard]] const char * to_string(ErrorKind kind) noexcept;

// ============================================================================
// Exceptions
// ============================================================================

/**
 * Base of every exception thrown by the library.
 */
class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, const std::string & message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/// Two distinct variants claim the same value within one hierarchy.
class DuplicateDiscriminatorError : public Error
{
public:
  DuplicateDiscriminatorError(
    std::string hierarchy, DiscriminatorValue value, std::string existing_variant,
    std::string rejected_variant);

  [[nodiscard]] const std::string & hierarchy() const noexcept { return hierarchy_; }
  [[nodiscard]] const DiscriminatorValue & value() const noexcept { return value_; }
  [[nodiscard]] const std::string & existing_variant() const noexcept { return existing_; }
  [[nodiscard]] const std::string & rejected_variant() const noexcept { return rejected_; }

private:
  std::string hierarchy_;
  DiscriminatorValue value_;
  std::string existing_;
  std::string rejected_;
};

/// The variant's discriminator field is missing, open-typed or of the wrong kind.
class NonLiteralDiscriminatorError : public Error
{
public:
  NonLiteralDiscriminatorError(std::string variant, std::string field, const std::string & reason);

  [[nodiscard]] const std::string & variant() const noexcept { return variant_; }
  [[nodiscard]] const std::string & field() const noexcept { return field_; }

private:
  std::string variant_;
  std::string field_;
};

/// A hierarchy name was declared again with a different field or kind.
class HierarchyConflictError : public Error
{
public:
  HierarchyConflictError(std::string hierarchy, const std::string & reason);

  [[nodiscard]] const std::string & hierarchy() const noexcept { return hierarchy_; }

private:
  std::string hierarchy_;
};

/// The id does not name a hierarchy of this registry.
class UnknownHierarchyError : public Error
{
public:
  explicit UnknownHierarchyError(HierarchyId id);
  explicit UnknownHierarchyError(const std::string & name);

  [[nodiscard]] HierarchyId id() const noexcept { return id_; }

private:
  HierarchyId id_;
};

/// A variant name was registered again with a different value set or type.
class VariantConflictError : public Error
{
public:
  VariantConflictError(std::string hierarchy, std::string variant, const std::string & reason);

  [[nodiscard]] const std::string & hierarchy() const noexcept { return hierarchy_; }
  [[nodiscard]] const std::string & variant() const noexcept { return variant_; }

private:
  std::string hierarchy_;
  std::string variant_;
};

// ============================================================================
// Validation errors
// ============================================================================

/**
 * Structured outcome of a failed validate call.
 *
 * Exactly one kind; the remaining members carry whatever context that kind
 * has (offending value, known alternatives, selected variant, engine
 * diagnostics).
 */
struct ValidationError
{
  ErrorKind kind = ErrorKind::FieldValidation;
  std::string message;

  std::string hierarchy;
  std::string discriminator_field;

  /// The value extracted from the payload (absent for missing-field errors)
  std::optional<DiscriminatorValue> value;

  /// Sorted values known at resolution time (unknown-value errors)
  std::vector<DiscriminatorValue> known_values;

  /// The variant whose field rules rejected the payload (field errors)
  std::optional<std::string> variant;

  /// Schema engine diagnostics (field errors)
  DiagnosticBag diagnostics;

  /// Message followed by one line per engine diagnostic
  [[nodiscard]] std::string describe() const;

  /// Single diagnostic for the printer; engine diagnostics are not included
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

class ValidationFailure : public Error
{
public:
  explicit ValidationFailure(ValidationError error);

  [[nodiscard]] const ValidationError & error() const noexcept { return error_; }

private:
  ValidationError error_;
};

}  // namespace polyschema
