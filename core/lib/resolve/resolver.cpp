// polyschema/resolve/resolver.cpp - Lazy discriminator resolution implementation
#include "polyschema/resolve/resolver.hpp"

#include <utility>

namespace polyschema
{

namespace
{

const char * json_type_name(const nlohmann::json & j)
{
  if (j.is_number_integer()) return "integer";
  if (j.is_number_float()) return "number";
  return j.type_name();
}

}  // namespace

std::optional<DiscriminatorValue> extract_discriminator(
  const nlohmann::json & payload, const HierarchyInfo & hierarchy)
{
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto it = payload.find(hierarchy.discriminator_field);
  if (it == payload.end()) {
    return std::nullopt;
  }
  auto value = DiscriminatorValue::from_json(*it);
  if (!value || value->kind() != hierarchy.kind) {
    return std::nullopt;
  }
  return value;
}

ValidationError missing_discriminator_error(
  const nlohmann::json & payload, const HierarchyInfo & hierarchy)
{
  ValidationError error;
  error.kind = ErrorKind::MissingDiscriminatorField;
  error.hierarchy = hierarchy.name;
  error.discriminator_field = hierarchy.discriminator_field;

  const std::string & field = hierarchy.discriminator_field;
  if (!payload.is_object()) {
    error.message = "hierarchy '" + hierarchy.name + "': payload is " +
                    json_type_name(payload) + ", expected an object with field '" + field + "'";
  } else if (payload.find(field) == payload.end()) {
    error.message =
      "hierarchy '" + hierarchy.name + "': discriminator field '" + field + "' is missing";
  } else {
    error.message = "hierarchy '" + hierarchy.name + "': discriminator field '" + field +
                    "' is " + json_type_name(payload.at(field)) + ", expected " +
                    to_string(hierarchy.kind);
  }
  return error;
}

ValidationError empty_hierarchy_error(const HierarchyInfo & hierarchy)
{
  ValidationError error;
  error.kind = ErrorKind::EmptyHierarchy;
  error.hierarchy = hierarchy.name;
  error.discriminator_field = hierarchy.discriminator_field;
  error.message = "hierarchy '" + hierarchy.name + "' has no registered variants";
  return error;
}

Resolution resolve(const HierarchySnapshot & snapshot, const DiscriminatorValue & value)
{
  Resolution resolution;
  const HierarchyInfo & info = snapshot.info();

  if (snapshot.empty()) {
    ValidationError error = empty_hierarchy_error(info);
    error.value = value;
    resolution.error = std::move(error);
    return resolution;
  }

  if (TypeDescriptorPtr descriptor = snapshot.find(value)) {
    resolution.descriptor = std::move(descriptor);
    return resolution;
  }

  ValidationError error;
  error.kind = ErrorKind::UnknownDiscriminatorValue;
  error.hierarchy = info.name;
  error.discriminator_field = info.discriminator_field;
  error.value = value;
  error.known_values = snapshot.known_values();
  error.message = "hierarchy '" + info.name + "': no variant for " + info.discriminator_field +
                  " = " + value.display() + " (known: " + join_values(error.known_values) + ")";
  resolution.error = std::move(error);
  return resolution;
}

}  // namespace polyschema
