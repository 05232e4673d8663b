// polyschema/registry/registration.hpp - Variant registration hook
//
// Entry point every variant's initialization path calls. Reads the
// discriminator literal from the variant's own schema, builds its
// TypeDescriptor and inserts it into the registry.
//
#pragma once

#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"
#include "polyschema/schema/object_schema.hpp"

namespace polyschema
{

/**
 * Everything a variant supplies at registration.
 */
struct VariantDeclaration
{
  /// Unique within the hierarchy; used in diagnostics
  std::string name;

  /// The variant's own fields. May already declare the discriminator literal.
  ObjectSchema schema;

  /**
   * Discriminator value(s) supplied at registration instead of (or in
   * agreement with) a literal field in `schema`. The first one is the
   * default of the literal field.
   */
  std::optional<std::vector<DiscriminatorValue>> values;

  /// C++ type produced by `factory`; typeid(void) with no factory
  std::type_index type = typeid(void);

  /// Instance factory; empty means DynamicModel
  InstanceFactory factory;
};

/**
 * Determine the discriminator values of a declaration.
 *
 * @throws NonLiteralDiscriminatorError if the field is missing, open-typed
 *         without supplied values, contradicts the supplied values, or holds
 *         values of the wrong kind
 */
[[nodiscard]] std::vector<DiscriminatorValue> extract_discriminator_values(
  const HierarchyInfo & hierarchy, const VariantDeclaration & declaration);

/**
 * Register a variant directly under a hierarchy.
 *
 * Idempotent: registering the same variant again returns the descriptor
 * registered first.
 *
 * @throws NonLiteralDiscriminatorError, DuplicateDiscriminatorError,
 *         VariantConflictError, UnknownHierarchyError
 */
TypeDescriptorPtr register_variant(
  Registry & registry, HierarchyId hierarchy, VariantDeclaration declaration);

/**
 * Register a variant of a variant.
 *
 * The new variant joins the parent's hierarchy (the one that introduced
 * dispatch) and records `parent` for subtree selection.
 */
TypeDescriptorPtr register_variant(
  Registry & registry, const TypeDescriptorPtr & parent, VariantDeclaration declaration);

}  // namespace polyschema
