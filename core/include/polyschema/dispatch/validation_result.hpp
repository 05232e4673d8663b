// polyschema/dispatch/validation_result.hpp - Outcome of a validate call
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <utility>

#include "polyschema/core/errors.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/model/model.hpp"

namespace polyschema
{

/**
 * A payload the schema engine accepted, together with the variant that
 * accepted it.
 */
struct ValidatedPayload
{
  TypeDescriptorPtr descriptor;

  /// Normalized fields (defaults applied, numbers coerced)
  nlohmann::json fields;

  /// Build the variant's instance; its dynamic type is the variant's type
  [[nodiscard]] std::unique_ptr<Model> instantiate() const
  {
    return descriptor->instantiate(fields);
  }
};

/**
 * Result of validation: a ValidatedPayload on success, a ValidationError
 * of exactly one kind otherwise.
 */
struct ValidationResult
{
  /// Whether validation succeeded
  bool success = false;

  /// Only valid if success == true
  std::optional<ValidatedPayload> value;

  /// Only valid if success == false
  std::optional<ValidationError> error;

  static ValidationResult ok(ValidatedPayload payload)
  {
    ValidationResult r;
    r.value = std::move(payload);
    r.success = true;
    return r;
  }

  static ValidationResult fail(ValidationError err)
  {
    ValidationResult r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }

  explicit operator bool() const noexcept { return success; }
};

}  // namespace polyschema
