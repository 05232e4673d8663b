// polyschema/core/errors.cpp - Error taxonomy implementation
#include "polyschema/core/errors.hpp"

#include <utility>

namespace polyschema
{

const char * to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::DuplicateDiscriminator:
      return "DuplicateDiscriminatorError";
    case ErrorKind::NonLiteralDiscriminator:
      return "NonLiteralDiscriminatorError";
    case ErrorKind::HierarchyConflict:
      return "HierarchyConflictError";
    case ErrorKind::UnknownHierarchy:
      return "UnknownHierarchyError";
    case ErrorKind::VariantConflict:
      return "VariantConflictError";
    case ErrorKind::EmptyHierarchy:
      return "EmptyHierarchyError";
    case ErrorKind::MissingDiscriminatorField:
      return "MissingDiscriminatorFieldError";
    case ErrorKind::UnknownDiscriminatorValue:
      return "UnknownDiscriminatorValueError";
    case ErrorKind::FieldValidation:
      return "FieldValidationError";
  }
  return "Error";
}

// ============================================================================
// Exceptions
// ============================================================================

DuplicateDiscriminatorError::DuplicateDiscriminatorError(
  std::string hierarchy, DiscriminatorValue value, std::string existing_variant,
  std::string rejected_variant)
: Error(
    ErrorKind::DuplicateDiscriminator,
    "hierarchy '" + hierarchy + "': discriminator value " + value.display() +
      " is already registered by variant '" + existing_variant + "', cannot register '" +
      rejected_variant + "'"),
  hierarchy_(std::move(hierarchy)),
  value_(std::move(value)),
  existing_(std::move(existing_variant)),
  rejected_(std::move(rejected_variant))
{
}

NonLiteralDiscriminatorError::NonLiteralDiscriminatorError(
  std::string variant, std::string field, const std::string & reason)
: Error(
    ErrorKind::NonLiteralDiscriminator,
    "variant '" + variant + "': discriminator field '" + field + "' " + reason),
  variant_(std::move(variant)),
  field_(std::move(field))
{
}

HierarchyConflictError::HierarchyConflictError(std::string hierarchy, const std::string & reason)
: Error(ErrorKind::HierarchyConflict, "hierarchy '" + hierarchy + "' " + reason),
  hierarchy_(std::move(hierarchy))
{
}

UnknownHierarchyError::UnknownHierarchyError(HierarchyId id)
: Error(
    ErrorKind::UnknownHierarchy, "unknown hierarchy id " + std::to_string(id.value())),
  id_(id)
{
}

UnknownHierarchyError::UnknownHierarchyError(const std::string & name)
: Error(ErrorKind::UnknownHierarchy, "unknown hierarchy '" + name + "'")
{
}

VariantConflictError::VariantConflictError(
  std::string hierarchy, std::string variant, const std::string & reason)
: Error(
    ErrorKind::VariantConflict,
    "hierarchy '" + hierarchy + "': variant '" + variant + "' " + reason),
  hierarchy_(std::move(hierarchy)),
  variant_(std::move(variant))
{
}

// ============================================================================
// Validation errors
// ============================================================================

std::string ValidationError::describe() const
{
  std::string out = std::string(to_string(kind)) + ": " + message;
  if (!diagnostics.empty()) {
    out += "\n" + diagnostics.summary();
  }
  return out;
}

Diagnostic ValidationError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = to_string(kind);
  d.message = message;

  std::string path;
  if (!discriminator_field.empty() && kind != ErrorKind::EmptyHierarchy) {
    path = json_pointer_for(discriminator_field);
  }

  switch (kind) {
    case ErrorKind::UnknownDiscriminatorValue:
      d.labels.push_back(Label{path, "no variant registered for this value"});
      d.help_message = known_values.empty() ? std::string("no values are registered")
                                            : "expected one of " + join_values(known_values);
      break;
    case ErrorKind::MissingDiscriminatorField:
      d.labels.push_back(Label{path, "discriminator field is absent or of the wrong kind"});
      break;
    case ErrorKind::FieldValidation:
      if (variant) {
        d.help_message = "variant '" + *variant + "' was selected" +
                         (value ? " by " + value->display() : std::string());
      }
      break;
    case ErrorKind::EmptyHierarchy:
      d.help_message = "register at least one variant before validating";
      break;
    default:
      break;
  }
  return d;
}

ValidationFailure::ValidationFailure(ValidationError error)
: Error(error.kind, error.describe()), error_(std::move(error))
{
}

}  // namespace polyschema
