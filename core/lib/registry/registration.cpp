// polyschema/registry/registration.cpp - Variant registration hook implementation
//
#include "polyschema/registry/registration.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "polyschema/core/errors.hpp"

namespace polyschema
{

namespace
{

std::vector<DiscriminatorValue> sorted_copy(std::vector<DiscriminatorValue> values)
{
  normalize_values(values);
  return values;
}

TypeDescriptorPtr register_in(
  Registry & registry, const HierarchyInfo & info, TypeDescriptorPtr parent,
  VariantDeclaration declaration)
{
  if (declaration.name.empty()) {
    throw std::invalid_argument("variant name must not be empty");
  }

  std::vector<DiscriminatorValue> values = extract_discriminator_values(info, declaration);

  TypeDescriptor::Init init;
  init.name = std::move(declaration.name);
  init.hierarchy = info.id;
  init.schema = declaration.schema.with_literal(info.discriminator_field, values);
  init.values = std::move(values);
  init.parent = std::move(parent);
  init.type = declaration.type;
  init.factory = std::move(declaration.factory);

  return registry.register_descriptor(TypeDescriptor::create(std::move(init))).descriptor;
}

}  // namespace

std::vector<DiscriminatorValue> extract_discriminator_values(
  const HierarchyInfo & hierarchy, const VariantDeclaration & declaration)
{
  const std::string & field = hierarchy.discriminator_field;
  const FieldSpec * spec = declaration.schema.field(field);
  const auto declared = declaration.schema.literal_values(field);

  std::vector<DiscriminatorValue> values;

  if (declaration.values) {
    if (declaration.values->empty()) {
      throw NonLiteralDiscriminatorError(declaration.name, field, "declares no value");
    }
    if (declared && sorted_copy(*declared) != sorted_copy(*declaration.values)) {
      throw NonLiteralDiscriminatorError(
        declaration.name, field,
        "is declared as literal " + join_values(*declared) + " but registered with " +
          join_values(*declaration.values));
    }
    values = *declaration.values;
  } else if (declared) {
    values = *declared;
  } else if (spec != nullptr) {
    throw NonLiteralDiscriminatorError(
      declaration.name, field,
      std::string("has open type '") + to_string(spec->type) + "'; declare it as a literal");
  } else {
    throw NonLiteralDiscriminatorError(declaration.name, field, "is not declared");
  }

  for (const auto & value : values) {
    if (value.kind() != hierarchy.kind) {
      throw NonLiteralDiscriminatorError(
        declaration.name, field,
        "has literal " + value.display() + " but hierarchy '" + hierarchy.name + "' expects " +
          to_string(hierarchy.kind) + " values");
    }
  }

  // Keep declaration order (the first value becomes the field default),
  // dropping repeats.
  std::vector<DiscriminatorValue> unique;
  for (auto & value : values) {
    if (std::find(unique.begin(), unique.end(), value) == unique.end()) {
      unique.push_back(std::move(value));
    }
  }
  return unique;
}

TypeDescriptorPtr register_variant(
  Registry & registry, HierarchyId hierarchy, VariantDeclaration declaration)
{
  return register_in(registry, registry.info(hierarchy), nullptr, std::move(declaration));
}

TypeDescriptorPtr register_variant(
  Registry & registry, const TypeDescriptorPtr & parent, VariantDeclaration declaration)
{
  if (!parent) {
    throw std::invalid_argument("parent descriptor must not be null");
  }
  const HierarchyInfo info = registry.info(parent->hierarchy());

  // A schema extended from the parent's still declares the parent's
  // literal; supplied values replace it.
  if (declaration.values) {
    const auto declared = declaration.schema.literal_values(info.discriminator_field);
    const std::vector<DiscriminatorValue> inherited(parent->values().begin(), parent->values().end());
    if (declared && sorted_copy(*declared) == inherited) {
      declaration.schema =
        declaration.schema.with_literal(info.discriminator_field, *declaration.values);
    }
  }
  return register_in(registry, info, parent, std::move(declaration));
}

}  // namespace polyschema
