// polyschema/dispatch/dispatcher.cpp - Validation dispatcher implementation
#include "polyschema/dispatch/dispatcher.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "polyschema/basic/logging.hpp"
#include "polyschema/resolve/resolver.hpp"

namespace polyschema
{

const char * to_string(ValidationStage stage) noexcept
{
  switch (stage) {
    case ValidationStage::ExtractingDiscriminator:
      return "ExtractingDiscriminator";
    case ValidationStage::ResolvingType:
      return "ResolvingType";
    case ValidationStage::DelegatingValidation:
      return "DelegatingValidation";
    case ValidationStage::Succeeded:
      return "Succeeded";
    case ValidationStage::Failed:
      return "Failed";
  }
  return "Failed";
}

namespace
{

void trace_stage(const HierarchyInfo & info, ValidationStage stage)
{
  logger()->trace("validate '{}': {}", info.name, to_string(stage));
}

ValidationResult failed(const HierarchyInfo & info, ValidationError error)
{
  logger()->trace(
    "validate '{}': {}({})", info.name, to_string(ValidationStage::Failed),
    to_string(error.kind));
  return ValidationResult::fail(std::move(error));
}

/// Run the variant's field rules
ValidationResult delegate(
  const HierarchyInfo & info, const TypeDescriptorPtr & descriptor,
  const std::optional<DiscriminatorValue> & value, const nlohmann::json & payload)
{
  trace_stage(info, ValidationStage::DelegatingValidation);

  DiagnosticBag diags;
  std::optional<nlohmann::json> fields = descriptor->schema().validate(payload, diags);
  if (!fields) {
    ValidationError error;
    error.kind = ErrorKind::FieldValidation;
    error.hierarchy = info.name;
    error.discriminator_field = info.discriminator_field;
    error.value = value;
    error.variant = descriptor->name();
    error.message = "hierarchy '" + info.name + "': variant '" + descriptor->name() +
                    "' rejected the payload (" + std::to_string(diags.error_count()) +
                    " error(s))";
    error.diagnostics = std::move(diags);
    return failed(info, std::move(error));
  }

  trace_stage(info, ValidationStage::Succeeded);
  return ValidationResult::ok(ValidatedPayload{descriptor, std::move(*fields)});
}

}  // namespace

ValidationResult Dispatcher::validate(HierarchyId hierarchy, const nlohmann::json & payload) const
{
  const HierarchySnapshotPtr snapshot = registry_.snapshot(hierarchy);
  const HierarchyInfo & info = snapshot->info();

  trace_stage(info, ValidationStage::ExtractingDiscriminator);
  std::optional<DiscriminatorValue> value = extract_discriminator(payload, info);
  if (!value) {
    return failed(info, missing_discriminator_error(payload, info));
  }

  trace_stage(info, ValidationStage::ResolvingType);
  Resolution resolution = resolve(*snapshot, *value);
  if (!resolution.ok()) {
    return failed(info, std::move(*resolution.error));
  }

  return delegate(info, resolution.descriptor, value, payload);
}

ValidationResult Dispatcher::validate(
  const Selection & selection, const nlohmann::json & payload) const
{
  const std::vector<SelectionGroup> groups = selection.evaluate(registry_);

  if (groups.empty()) {
    ValidationError error;
    error.kind = ErrorKind::EmptyHierarchy;
    for (HierarchyId id : selection.hierarchy_ids()) {
      error.hierarchy += (error.hierarchy.empty() ? "" : ", ") + registry_.info(id).name;
    }
    error.message = "selection over '" + error.hierarchy + "' has no registered variants";
    logger()->trace("validate selection: {}(EmptyHierarchyError)", to_string(ValidationStage::Failed));
    return ValidationResult::fail(std::move(error));
  }

  std::optional<ValidationError> first_missing;
  std::optional<ValidationError> first_error;

  for (const auto & group : groups) {
    const HierarchyInfo & info = group.info();

    trace_stage(info, ValidationStage::ExtractingDiscriminator);
    std::optional<DiscriminatorValue> value = extract_discriminator(payload, info);
    if (!value) {
      if (!first_missing) {
        first_missing = missing_discriminator_error(payload, info);
      }
      continue;
    }

    trace_stage(info, ValidationStage::ResolvingType);
    TypeDescriptorPtr descriptor = group.find(*value);
    if (!descriptor) {
      ValidationError error;
      error.kind = ErrorKind::UnknownDiscriminatorValue;
      error.hierarchy = info.name;
      error.discriminator_field = info.discriminator_field;
      error.value = value;
      error.known_values = group.known_values();
      error.message = "hierarchy '" + info.name + "': no selected variant for " +
                      info.discriminator_field + " = " + value->display() + " (known: " +
                      join_values(error.known_values) + ")";
      ValidationResult result = failed(info, std::move(error));
      if (!first_error) {
        first_error = std::move(result.error);
      }
      continue;
    }

    ValidationResult result = delegate(info, descriptor, value, payload);
    if (result.success) {
      return result;
    }
    if (!first_error) {
      first_error = std::move(result.error);
    }
  }

  if (first_error) {
    return ValidationResult::fail(std::move(*first_error));
  }
  return ValidationResult::fail(std::move(*first_missing));
}

ValidationResult Dispatcher::validate_as(
  const TypeDescriptorPtr & descriptor, const nlohmann::json & payload) const
{
  if (!descriptor) {
    throw std::invalid_argument("validate_as requires a descriptor");
  }
  const HierarchyInfo info = registry_.info(descriptor->hierarchy());

  std::optional<DiscriminatorValue> value = extract_discriminator(payload, info);
  if (!value) {
    value = descriptor->primary_value();
  }
  return delegate(info, descriptor, value, payload);
}

ValidatedPayload Dispatcher::validate_or_throw(
  HierarchyId hierarchy, const nlohmann::json & payload) const
{
  ValidationResult result = validate(hierarchy, payload);
  if (!result.success) {
    throw ValidationFailure(std::move(*result.error));
  }
  return std::move(*result.value);
}

}  // namespace polyschema
