// polyschema/resolve/resolver.hpp - Lazy discriminator resolution
//
// Resolution is computed from a snapshot on every call; nothing is cached.
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/errors.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"

namespace polyschema
{

/**
 * Outcome of resolve(): a descriptor, or the ValidationError explaining
 * why none was found.
 */
struct Resolution
{
  TypeDescriptorPtr descriptor;
  std::optional<ValidationError> error;

  [[nodiscard]] bool ok() const noexcept { return descriptor != nullptr; }
};

/**
 * Read the discriminator value out of a payload.
 *
 * @return the value, or std::nullopt if `payload` is not an object, lacks
 *         the field, or holds a value that is not a scalar of `hierarchy.kind`
 */
[[nodiscard]] std::optional<DiscriminatorValue> extract_discriminator(
  const nlohmann::json & payload, const HierarchyInfo & hierarchy);

/// MissingDiscriminatorFieldError describing why extraction failed
[[nodiscard]] ValidationError missing_discriminator_error(
  const nlohmann::json & payload, const HierarchyInfo & hierarchy);

/// EmptyHierarchyError for a hierarchy without variants
[[nodiscard]] ValidationError empty_hierarchy_error(const HierarchyInfo & hierarchy);

/**
 * Map a discriminator value to its variant.
 *
 * Fails with EmptyHierarchyError when the snapshot has no variants, and
 * with UnknownDiscriminatorValueError (carrying the sorted known values)
 * when no variant claims `value`.
 */
[[nodiscard]] Resolution resolve(const HierarchySnapshot & snapshot, const DiscriminatorValue & value);

}  // namespace polyschema
