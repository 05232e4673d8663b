// polyschema/schema/object_schema.cpp - Field-level schema engine implementation
//
#include "polyschema/schema/object_schema.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace polyschema
{

namespace
{

using nlohmann::json;

/// Name used in "expected X, got Y" messages
const char * json_type_name(const json & j)
{
  switch (j.type()) {
    case json::value_t::null:
      return "null";
    case json::value_t::boolean:
      return "boolean";
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
      return "integer";
    case json::value_t::number_float:
      return "number";
    case json::value_t::string:
      return "string";
    case json::value_t::array:
      return "array";
    case json::value_t::object:
      return "object";
    default:
      return "value";
  }
}

// 2^63; INT64_MAX itself rounds up to this as a double.
constexpr double k_int64_upper_bound = 9223372036854775808.0;

/**
 * Check a value against a non-literal field type and produce its normalized
 * form, or std::nullopt on mismatch.
 */
std::optional<json> coerce(const json & value, FieldType type)
{
  switch (type) {
    case FieldType::String:
      if (value.is_string()) return value;
      return std::nullopt;

    case FieldType::Integer:
      if (value.is_number_integer()) return value;
      if (value.is_number_float()) {
        const double d = value.get<double>();
        if (
          std::isfinite(d) && std::floor(d) == d &&
          d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
          d < k_int64_upper_bound) {
          return json(static_cast<int64_t>(d));
        }
      }
      return std::nullopt;

    case FieldType::Number:
      // bool is not a number in nlohmann::json, so it never reaches here as one
      if (value.is_number()) return json(value.get<double>());
      return std::nullopt;

    case FieldType::Boolean:
      if (value.is_boolean()) return value;
      return std::nullopt;

    case FieldType::Object:
      if (value.is_object()) return value;
      return std::nullopt;

    case FieldType::Array:
      if (value.is_array()) return value;
      return std::nullopt;

    case FieldType::Any:
      return value;

    case FieldType::Literal:
      break;
  }
  return std::nullopt;
}

void upsert(std::vector<FieldSpec> & fields, FieldSpec spec)
{
  auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldSpec & f) {
    return f.name == spec.name;
  });
  if (it != fields.end()) {
    *it = std::move(spec);
  } else {
    fields.push_back(std::move(spec));
  }
}

}  // namespace

// ============================================================================
// Enum helpers
// ============================================================================

const char * to_string(FieldType type) noexcept
{
  switch (type) {
    case FieldType::String:
      return "string";
    case FieldType::Integer:
      return "integer";
    case FieldType::Number:
      return "number";
    case FieldType::Boolean:
      return "boolean";
    case FieldType::Object:
      return "object";
    case FieldType::Array:
      return "array";
    case FieldType::Any:
      return "any";
    case FieldType::Literal:
      return "literal";
  }
  return "any";
}

std::optional<FieldType> parse_field_type(std::string_view text)
{
  if (text == "string" || text == "str") return FieldType::String;
  if (text == "integer" || text == "int") return FieldType::Integer;
  if (text == "number" || text == "float") return FieldType::Number;
  if (text == "boolean" || text == "bool") return FieldType::Boolean;
  if (text == "object") return FieldType::Object;
  if (text == "array") return FieldType::Array;
  if (text == "any") return FieldType::Any;
  if (text == "literal") return FieldType::Literal;
  return std::nullopt;
}

std::optional<ExtraFields> parse_extra_fields(std::string_view text)
{
  if (text == "ignore") return ExtraFields::Ignore;
  if (text == "forbid") return ExtraFields::Forbid;
  if (text == "allow") return ExtraFields::Allow;
  return std::nullopt;
}

// ============================================================================
// Builder
// ============================================================================

ObjectSchema::Builder & ObjectSchema::Builder::field(
  std::string name, FieldType type, std::string description)
{
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = type;
  spec.required = true;
  spec.description = std::move(description);
  return add(std::move(spec));
}

ObjectSchema::Builder & ObjectSchema::Builder::optional(
  std::string name, FieldType type, std::string description)
{
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = type;
  spec.required = false;
  spec.description = std::move(description);
  return add(std::move(spec));
}

ObjectSchema::Builder & ObjectSchema::Builder::with_default(
  std::string name, FieldType type, nlohmann::json value, std::string description)
{
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = type;
  spec.required = false;
  spec.default_value = std::move(value);
  spec.description = std::move(description);
  return add(std::move(spec));
}

ObjectSchema::Builder & ObjectSchema::Builder::literal(
  std::string name, std::vector<DiscriminatorValue> values)
{
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::Literal;
  spec.required = true;
  spec.literal_values = std::move(values);
  return add(std::move(spec));
}

ObjectSchema::Builder & ObjectSchema::Builder::literal(std::string name, DiscriminatorValue value)
{
  return literal(std::move(name), std::vector<DiscriminatorValue>{std::move(value)});
}

ObjectSchema::Builder & ObjectSchema::Builder::extra_fields(ExtraFields policy)
{
  extra_ = policy;
  return *this;
}

ObjectSchema::Builder & ObjectSchema::Builder::add(FieldSpec spec)
{
  upsert(fields_, std::move(spec));
  return *this;
}

ObjectSchema ObjectSchema::Builder::build() const
{
  ObjectSchema schema;
  schema.fields_ = fields_;
  schema.extra_ = extra_;
  return schema;
}

// ============================================================================
// ObjectSchema
// ============================================================================

ObjectSchema::Builder ObjectSchema::extend() const
{
  Builder b;
  for (const auto & f : fields_) {
    b.add(f);
  }
  b.extra_fields(extra_);
  return b;
}

const FieldSpec * ObjectSchema::field(std::string_view name) const
{
  auto it = std::find_if(
    fields_.begin(), fields_.end(), [&](const FieldSpec & f) { return f.name == name; });
  return it != fields_.end() ? &*it : nullptr;
}

std::optional<std::vector<DiscriminatorValue>> ObjectSchema::literal_values(
  std::string_view name) const
{
  const FieldSpec * spec = field(name);
  if (spec == nullptr || !spec->is_literal() || spec->literal_values.empty()) {
    return std::nullopt;
  }
  return spec->literal_values;
}

ObjectSchema ObjectSchema::with_literal(
  const std::string & name, std::vector<DiscriminatorValue> values) const
{
  FieldSpec spec;
  spec.name = name;
  spec.type = FieldType::Literal;
  spec.required = false;
  if (!values.empty()) {
    spec.default_value = values.front().to_json();
  }
  spec.literal_values = std::move(values);

  if (const FieldSpec * existing = field(name)) {
    spec.description = existing->description;
  }

  ObjectSchema copy = *this;
  upsert(copy.fields_, std::move(spec));
  return copy;
}

std::optional<nlohmann::json> ObjectSchema::validate(
  const nlohmann::json & payload, DiagnosticBag & diags) const
{
  if (!payload.is_object()) {
    diags
      .report_error(
        "", std::string("payload must be an object, got ") + json_type_name(payload),
        "expected object")
      .with_code(k_code_not_object);
    return std::nullopt;
  }

  json out = json::object();
  bool ok = true;

  for (const auto & spec : fields_) {
    const std::string path = json_pointer_for(spec.name);
    auto it = payload.find(spec.name);

    if (it == payload.end()) {
      if (spec.default_value) {
        out[spec.name] = *spec.default_value;
      } else if (spec.required) {
        diags
          .report_error(path, "missing required field '" + spec.name + "'", "field is required")
          .with_code(k_code_missing_field);
        ok = false;
      }
      continue;
    }

    if (spec.is_literal()) {
      const auto value = DiscriminatorValue::from_json(*it);
      const bool matches =
        value && std::find(spec.literal_values.begin(), spec.literal_values.end(), *value) !=
                   spec.literal_values.end();
      if (!matches) {
        diags
          .report_error(
            path, "field '" + spec.name + "' must be one of " + join_values(spec.literal_values),
            "got " + it->dump())
          .with_code(k_code_literal_mismatch);
        ok = false;
        continue;
      }
      out[spec.name] = *it;
      continue;
    }

    auto coerced = coerce(*it, spec.type);
    if (!coerced) {
      diags
        .report_error(
          path, "field '" + spec.name + "' has the wrong type",
          std::string("expected ") + to_string(spec.type) + ", got " + json_type_name(*it))
        .with_code(k_code_type_mismatch);
      ok = false;
      continue;
    }
    out[spec.name] = std::move(*coerced);
  }

  for (const auto & item : payload.items()) {
    if (field(item.key()) != nullptr) {
      continue;
    }
    switch (extra_) {
      case ExtraFields::Ignore:
        break;
      case ExtraFields::Allow:
        out[item.key()] = item.value();
        break;
      case ExtraFields::Forbid:
        diags
          .report_error(
            json_pointer_for(item.key()), "unexpected field '" + item.key() + "'",
            "not declared by this variant")
          .with_code(k_code_extra_field);
        ok = false;
        break;
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return out;
}

}  // namespace polyschema
