// polyschema/test_support/fixtures.hpp - helpers for unit tests
//
// The "Config" hierarchy used throughout the tests: discriminator "mode",
// with text, number and bytes variants.
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"
#include "polyschema/registry/registration.hpp"
#include "polyschema/schema/object_schema.hpp"

namespace polyschema::test_support
{

[[nodiscard]] inline DiscriminatorValue str(std::string value)
{
  return DiscriminatorValue::make_string(std::move(value));
}

[[nodiscard]] inline DiscriminatorValue num(int64_t value)
{
  return DiscriminatorValue::make_integer(value);
}

[[nodiscard]] inline std::vector<DiscriminatorValue> strs(std::vector<std::string> values)
{
  std::vector<DiscriminatorValue> out;
  for (auto & v : values) {
    out.push_back(str(std::move(v)));
  }
  return out;
}

/// mode = "text"; text: string
[[nodiscard]] inline VariantDeclaration text_variant()
{
  VariantDeclaration d;
  d.name = "TextConfig";
  d.schema = ObjectSchema::builder()
               .literal("mode", str("text"))
               .field("text", FieldType::String)
               .build();
  return d;
}

/// mode = "number"; number: number, precision: integer = 2
[[nodiscard]] inline VariantDeclaration number_variant()
{
  VariantDeclaration d;
  d.name = "NumberConfig";
  d.schema = ObjectSchema::builder()
               .literal("mode", str("number"))
               .field("number", FieldType::Number)
               .with_default("precision", FieldType::Integer, 2)
               .build();
  return d;
}

/// mode = "bytes"; content: string
[[nodiscard]] inline VariantDeclaration bytes_variant()
{
  VariantDeclaration d;
  d.name = "BytesConfig";
  d.schema = ObjectSchema::builder()
               .literal("mode", str("bytes"))
               .field("content", FieldType::String)
               .build();
  return d;
}

/// Registry with an empty "Config" hierarchy (discriminator "mode")
struct ConfigRegistry
{
  Registry registry;
  HierarchyId config = registry.declare_hierarchy("Config", "mode");

  TypeDescriptorPtr add(VariantDeclaration declaration)
  {
    return register_variant(registry, config, std::move(declaration));
  }

  /// Registers text and number
  void add_text_and_number()
  {
    add(text_variant());
    add(number_variant());
  }
};

}  // namespace polyschema::test_support
