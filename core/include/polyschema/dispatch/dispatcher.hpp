// polyschema/dispatch/dispatcher.hpp - Validation dispatcher
//
// Turns an untyped payload into a validated instance of the right variant:
//   1. Extract the discriminator value
//   2. Resolve it against a fresh snapshot
//   3. Delegate field validation to the variant's schema
//
#pragma once

#include <nlohmann/json.hpp>

#include "polyschema/core/hierarchy_id.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/dispatch/validation_result.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"
#include "polyschema/resolve/selection.hpp"

namespace polyschema
{

/// Stages a validate call moves through, in order. Logged at trace level.
enum class ValidationStage {
  ExtractingDiscriminator,
  ResolvingType,
  DelegatingValidation,
  Succeeded,
  Failed,
};

[[nodiscard]] const char * to_string(ValidationStage stage) noexcept;

/**
 * Stateless front end over a Registry.
 *
 * Each call takes its own snapshot, so a Dispatcher may be shared between
 * threads and sees every registration completed before the call.
 */
class Dispatcher
{
public:
  explicit Dispatcher(const Registry & registry) : registry_(registry) {}

  /**
   * Validate a payload against a hierarchy.
   *
   * @throws UnknownHierarchyError if `hierarchy` is not declared
   */
  [[nodiscard]] ValidationResult validate(HierarchyId hierarchy, const nlohmann::json & payload) const;

  /**
   * Validate a payload against a selection.
   *
   * Groups whose discriminator field the payload carries are tried in
   * hierarchy declaration order; the first success wins, otherwise the
   * first attempted group's error is returned.
   */
  [[nodiscard]] ValidationResult validate(
    const Selection & selection, const nlohmann::json & payload) const;

  /**
   * Validate directly against one variant, without dispatch.
   *
   * The discriminator may be omitted; when present it must be one of the
   * variant's values.
   */
  [[nodiscard]] ValidationResult validate_as(
    const TypeDescriptorPtr & descriptor, const nlohmann::json & payload) const;

  /// validate() that throws ValidationFailure instead of returning an error
  [[nodiscard]] ValidatedPayload validate_or_throw(
    HierarchyId hierarchy, const nlohmann::json & payload) const;

  [[nodiscard]] const Registry & registry() const noexcept { return registry_; }

private:
  const Registry & registry_;
};

}  // namespace polyschema
