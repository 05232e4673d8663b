// polyschema/catalog/catalog.cpp - YAML catalog implementation
//
#include "polyschema/catalog/catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <map>
#include <utility>

#include "polyschema/basic/logging.hpp"
#include "polyschema/registry/registration.hpp"

namespace polyschema
{

namespace
{

/// YAML scalar to JSON; quoted scalars stay strings
nlohmann::json scalar_to_json(const YAML::Node & node)
{
  const std::string & text = node.Scalar();
  if (node.Tag() == "!") {
    return text;
  }
  if (text.empty() || text == "~" || text == "null") {
    return nullptr;
  }
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }
  int64_t integer = 0;
  if (YAML::convert<int64_t>::decode(node, integer)) {
    return integer;
  }
  double number = 0.0;
  if (YAML::convert<double>::decode(node, number)) {
    return number;
  }
  return text;
}

nlohmann::json yaml_to_json(const YAML::Node & node)
{
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return scalar_to_json(node);
    case YAML::NodeType::Sequence: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto & item : node) {
        array.push_back(yaml_to_json(item));
      }
      return array;
    }
    case YAML::NodeType::Map: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto & entry : node) {
        object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
      }
      return object;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

/// Parse one discriminator value of the given kind
std::optional<DiscriminatorValue> parse_value(
  const YAML::Node & node, DiscriminatorKind kind, std::string & error)
{
  if (!node.IsScalar()) {
    error = "discriminator value must be a scalar";
    return std::nullopt;
  }
  if (kind == DiscriminatorKind::String) {
    return DiscriminatorValue::make_string(node.Scalar());
  }
  int64_t integer = 0;
  if (node.Tag() == "!" || !YAML::convert<int64_t>::decode(node, integer)) {
    error = "discriminator value '" + node.Scalar() + "' is not an integer";
    return std::nullopt;
  }
  return DiscriminatorValue::make_integer(integer);
}

/// Scalar or list of scalars
std::optional<std::vector<DiscriminatorValue>> parse_values(
  const YAML::Node & node, DiscriminatorKind kind, std::string & error)
{
  std::vector<DiscriminatorValue> values;
  if (node.IsSequence()) {
    for (const auto & item : node) {
      auto value = parse_value(item, kind, error);
      if (!value) {
        return std::nullopt;
      }
      values.push_back(std::move(*value));
    }
  } else {
    auto value = parse_value(node, kind, error);
    if (!value) {
      return std::nullopt;
    }
    values.push_back(std::move(*value));
  }
  if (values.empty()) {
    error = "'value' must not be empty";
    return std::nullopt;
  }
  return values;
}

/// `name: type` or `name: { type, required, default, values, description }`
std::optional<FieldSpec> parse_field(
  const std::string & name, const YAML::Node & node, std::string & error)
{
  FieldSpec spec;
  spec.name = name;

  if (node.IsScalar()) {
    auto type = parse_field_type(node.Scalar());
    if (!type || *type == FieldType::Literal) {
      error = "field '" + name + "': unknown type '" + node.Scalar() + "'";
      return std::nullopt;
    }
    spec.type = *type;
    return spec;
  }

  if (!node.IsMap()) {
    error = "field '" + name + "' must be a type name or a map";
    return std::nullopt;
  }

  if (node["type"]) {
    const auto type_name = node["type"].as<std::string>();
    auto type = parse_field_type(type_name);
    if (!type) {
      error = "field '" + name + "': unknown type '" + type_name + "'";
      return std::nullopt;
    }
    spec.type = *type;
  }

  if (node["values"]) {
    const YAML::Node values = node["values"];
    if (!values.IsSequence() || values.size() == 0) {
      error = "field '" + name + "': 'values' must be a non-empty list";
      return std::nullopt;
    }
    for (const auto & item : values) {
      auto value = item.IsScalar() ? DiscriminatorValue::from_json(scalar_to_json(item))
                                   : std::nullopt;
      if (!value) {
        error = "field '" + name + "': literal values must be strings or integers";
        return std::nullopt;
      }
      spec.literal_values.push_back(std::move(*value));
    }
    spec.type = FieldType::Literal;
  } else if (spec.type == FieldType::Literal) {
    error = "field '" + name + "': literal type requires 'values'";
    return std::nullopt;
  }

  if (node["default"]) {
    spec.default_value = yaml_to_json(node["default"]);
    spec.required = false;
  }
  if (node["required"]) {
    spec.required = node["required"].as<bool>();
    if (spec.required && spec.default_value) {
      error = "field '" + name + "': a required field cannot have a default";
      return std::nullopt;
    }
  }
  if (node["description"]) {
    spec.description = node["description"].as<std::string>();
  }
  return spec;
}

std::optional<CatalogVariant> parse_variant(
  const YAML::Node & node, const CatalogHierarchy & hierarchy, std::string & error)
{
  if (!node.IsMap()) {
    error = "variant entry must be a map";
    return std::nullopt;
  }

  CatalogVariant variant;
  if (!node["name"]) {
    error = "variant must have a 'name'";
    return std::nullopt;
  }
  variant.name = node["name"].as<std::string>();

  const auto context = [&](const std::string & what) { return "variant '" + variant.name + "': " + what; };

  if (!node["value"]) {
    error = context("missing 'value'");
    return std::nullopt;
  }
  std::string value_error;
  auto values = parse_values(node["value"], hierarchy.kind, value_error);
  if (!values) {
    error = context(value_error);
    return std::nullopt;
  }
  variant.values = std::move(*values);

  if (node["extends"]) {
    variant.extends = node["extends"].as<std::string>();
    const bool known = std::any_of(
      hierarchy.variants.begin(), hierarchy.variants.end(),
      [&](const CatalogVariant & v) { return v.name == *variant.extends; });
    if (!known) {
      error = context("extends unknown variant '" + *variant.extends + "'");
      return std::nullopt;
    }
  }

  if (node["extra"]) {
    const auto text = node["extra"].as<std::string>();
    variant.extra = parse_extra_fields(text);
    if (!variant.extra) {
      error = context("invalid 'extra': '" + text + "' (must be 'ignore', 'forbid' or 'allow')");
      return std::nullopt;
    }
  }

  if (node["fields"]) {
    if (!node["fields"].IsMap()) {
      error = context("'fields' must be a map");
      return std::nullopt;
    }
    for (const auto & entry : node["fields"]) {
      std::string field_error;
      auto field = parse_field(entry.first.as<std::string>(), entry.second, field_error);
      if (!field) {
        error = context(field_error);
        return std::nullopt;
      }
      variant.fields.push_back(std::move(*field));
    }
  }

  return variant;
}

std::optional<CatalogHierarchy> parse_hierarchy(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "hierarchy entry must be a map";
    return std::nullopt;
  }

  CatalogHierarchy hierarchy;
  if (!node["name"] || !node["discriminator"]) {
    error = "hierarchy must have 'name' and 'discriminator'";
    return std::nullopt;
  }
  hierarchy.name = node["name"].as<std::string>();
  hierarchy.discriminator = node["discriminator"].as<std::string>();

  if (node["kind"]) {
    const auto text = node["kind"].as<std::string>();
    auto kind = parse_discriminator_kind(text);
    if (!kind) {
      error = "hierarchy '" + hierarchy.name + "': invalid kind '" + text +
              "' (must be 'string' or 'integer')";
      return std::nullopt;
    }
    hierarchy.kind = *kind;
  }

  if (node["variants"]) {
    if (!node["variants"].IsSequence()) {
      error = "hierarchy '" + hierarchy.name + "': variants must be a list";
      return std::nullopt;
    }
    for (const auto & variant_node : node["variants"]) {
      std::string variant_error;
      auto variant = parse_variant(variant_node, hierarchy, variant_error);
      if (!variant) {
        error = "hierarchy '" + hierarchy.name + "': " + variant_error;
        return std::nullopt;
      }
      const bool duplicate = std::any_of(
        hierarchy.variants.begin(), hierarchy.variants.end(),
        [&](const CatalogVariant & v) { return v.name == variant->name; });
      if (duplicate) {
        error = "hierarchy '" + hierarchy.name + "': variant '" + variant->name +
                "' is declared twice";
        return std::nullopt;
      }
      hierarchy.variants.push_back(std::move(*variant));
    }
  }

  return hierarchy;
}

CatalogLoadResult parse_root(const YAML::Node & root)
{
  Catalog catalog;

  if (!root.IsMap()) {
    return CatalogLoadResult::fail("catalog must be a map");
  }

  // Parse 'settings' section
  if (root["settings"]) {
    const auto & settings = root["settings"];
    if (settings["log_level"]) {
      const auto text = settings["log_level"].as<std::string>();
      catalog.settings.log_level = parse_log_level(text);
      if (!catalog.settings.log_level) {
        return CatalogLoadResult::fail("invalid settings.log_level: '" + text + "'");
      }
    }
  }

  // Parse 'hierarchies' section
  if (root["hierarchies"]) {
    if (!root["hierarchies"].IsSequence()) {
      return CatalogLoadResult::fail("hierarchies must be a list");
    }
    for (const auto & node : root["hierarchies"]) {
      std::string error;
      auto hierarchy = parse_hierarchy(node, error);
      if (!hierarchy) {
        return CatalogLoadResult::fail("invalid hierarchy: " + error);
      }
      catalog.hierarchies.push_back(std::move(*hierarchy));
    }
  }

  return CatalogLoadResult::ok(std::move(catalog));
}

/// Own fields over inherited ones; the discriminator is never inherited
std::vector<FieldSpec> merge_fields(
  const std::vector<FieldSpec> & inherited, const std::vector<FieldSpec> & own,
  const std::string & discriminator)
{
  std::vector<FieldSpec> merged;
  for (const auto & field : inherited) {
    if (field.name != discriminator) {
      merged.push_back(field);
    }
  }
  for (const auto & field : own) {
    auto it = std::find_if(merged.begin(), merged.end(), [&](const FieldSpec & f) {
      return f.name == field.name;
    });
    if (it != merged.end()) {
      *it = field;
    } else {
      merged.push_back(field);
    }
  }
  return merged;
}

}  // namespace

CatalogLoadResult load_catalog(const std::filesystem::path & catalog_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(catalog_path)) {
    return CatalogLoadResult::fail("catalog file not found: " + catalog_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(catalog_path.string());
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  CatalogLoadResult result;
  try {
    result = parse_root(root);
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail(catalog_path.string() + ": " + e.what());
  }
  if (result.success) {
    result.catalog.source = fs::absolute(catalog_path);
  }
  return result;
}

CatalogLoadResult parse_catalog(std::string_view text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root);
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail(e.what());
  }
}

std::vector<TypeDescriptorPtr> apply_catalog(Registry & registry, const Catalog & catalog)
{
  std::vector<TypeDescriptorPtr> registered;

  for (const auto & hierarchy : catalog.hierarchies) {
    const HierarchyId id =
      registry.declare_hierarchy(hierarchy.name, hierarchy.discriminator, hierarchy.kind);

    struct Resolved
    {
      TypeDescriptorPtr descriptor;
      std::vector<FieldSpec> fields;
      ExtraFields extra;
    };
    std::map<std::string, Resolved> by_name;

    for (const auto & variant : hierarchy.variants) {
      const Resolved * base = nullptr;
      if (variant.extends) {
        base = &by_name.at(*variant.extends);
      }

      std::vector<FieldSpec> fields = merge_fields(
        base ? base->fields : std::vector<FieldSpec>{}, variant.fields, hierarchy.discriminator);
      const ExtraFields extra =
        variant.extra ? *variant.extra : (base ? base->extra : ExtraFields::Ignore);

      ObjectSchema::Builder builder = ObjectSchema::builder();
      for (const auto & field : fields) {
        builder.add(field);
      }
      builder.extra_fields(extra);

      VariantDeclaration declaration;
      declaration.name = variant.name;
      declaration.schema = builder.build();
      declaration.values = variant.values;

      TypeDescriptorPtr descriptor =
        base ? register_variant(registry, base->descriptor, std::move(declaration))
             : register_variant(registry, id, std::move(declaration));

      by_name.emplace(variant.name, Resolved{descriptor, std::move(fields), extra});
      registered.push_back(std::move(descriptor));
    }
  }

  logger()->info(
    "applied catalog: {} hierarchies, {} variants", catalog.hierarchies.size(), registered.size());
  return registered;
}

std::optional<std::filesystem::path> find_catalog(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_catalog_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace polyschema
