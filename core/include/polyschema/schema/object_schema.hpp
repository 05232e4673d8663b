// polyschema/schema/object_schema.hpp - Field-level schema engine
//
// Declares the fields of one variant and validates a JSON object against
// them: presence, scalar types, literals, defaults and extra-field policy.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "polyschema/basic/diagnostic.hpp"
#include "polyschema/core/discriminator.hpp"

namespace polyschema
{

// ============================================================================
// Field Types
// ============================================================================

enum class FieldType : uint8_t {
  String,
  Integer,  ///< int64; integral floats are accepted
  Number,   ///< double; integers are accepted
  Boolean,
  Object,   ///< any JSON object
  Array,    ///< any JSON array
  Any,      ///< any JSON value, including null
  Literal,  ///< one of a fixed set of discriminator values
};

[[nodiscard]] const char * to_string(FieldType type) noexcept;

/// Parse "string" | "integer" | "number" | "boolean" | "object" | "array" | "any" | "literal"
[[nodiscard]] std::optional<FieldType> parse_field_type(std::string_view text);

/// Policy for payload keys that no field declares.
enum class ExtraFields : uint8_t {
  Ignore,  ///< dropped from the validated output
  Forbid,  ///< reported as S004
  Allow,   ///< copied to the validated output unchanged
};

[[nodiscard]] std::optional<ExtraFields> parse_extra_fields(std::string_view text);

// ============================================================================
// Field Spec
// ============================================================================

struct FieldSpec
{
  std::string name;
  FieldType type = FieldType::Any;
  bool required = true;
  std::optional<nlohmann::json> default_value;
  std::vector<DiscriminatorValue> literal_values;  ///< FieldType::Literal only
  std::string description;

  [[nodiscard]] bool is_literal() const noexcept { return type == FieldType::Literal; }
};

// ============================================================================
// Diagnostic codes
// ============================================================================

inline constexpr const char * k_code_missing_field = "S001";
inline constexpr const char * k_code_type_mismatch = "S002";
inline constexpr const char * k_code_literal_mismatch = "S003";
inline constexpr const char * k_code_extra_field = "S004";
inline constexpr const char * k_code_not_object = "S005";

// ============================================================================
// Object Schema
// ============================================================================

/**
 * Immutable, ordered list of field specs for one variant.
 *
 * Built through ObjectSchema::builder() or ObjectSchema::extend(). A field
 * declared twice keeps its first position and its last definition, which
 * is how an extending schema overrides a field it inherited.
 */
class ObjectSchema
{
public:
  class Builder
  {
  public:
    Builder() = default;

    /// Required field
    Builder & field(std::string name, FieldType type, std::string description = "");

    /// Optional field without a default (omitted from output when absent)
    Builder & optional(std::string name, FieldType type, std::string description = "");

    /// Optional field with a default applied when absent
    Builder & with_default(
      std::string name, FieldType type, nlohmann::json value, std::string description = "");

    /// Required literal field accepting exactly the given values
    Builder & literal(std::string name, std::vector<DiscriminatorValue> values);
    Builder & literal(std::string name, DiscriminatorValue value);

    Builder & extra_fields(ExtraFields policy);

    /// Insert or replace a fully specified field
    Builder & add(FieldSpec spec);

    [[nodiscard]] ObjectSchema build() const;

  private:
    std::vector<FieldSpec> fields_;
    ExtraFields extra_ = ExtraFields::Ignore;
  };

  ObjectSchema() = default;

  [[nodiscard]] static Builder builder() { return Builder{}; }

  /// A builder seeded with this schema's fields and extra-field policy
  [[nodiscard]] Builder extend() const;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const std::vector<FieldSpec> & fields() const noexcept { return fields_; }
  [[nodiscard]] ExtraFields extra_fields() const noexcept { return extra_; }
  [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

  /// Field spec by name, nullptr if not declared
  [[nodiscard]] const FieldSpec * field(std::string_view name) const;

  /**
   * Literal values of a field.
   *
   * @return the values if `name` is declared as a literal field,
   *         std::nullopt if it is absent or has an open type
   */
  [[nodiscard]] std::optional<std::vector<DiscriminatorValue>> literal_values(
    std::string_view name) const;

  /**
   * Copy of this schema whose field `name` is a literal over `values`
   * defaulting to the first value.
   */
  [[nodiscard]] ObjectSchema with_literal(
    const std::string & name, std::vector<DiscriminatorValue> values) const;

  // ===========================================================================
  // Validation
  // ===========================================================================

  /**
   * Validate a payload against the declared fields.
   *
   * Every problem is reported to `diags` (codes S001-S005), not just the
   * first one.
   *
   * @return the normalized object (defaults applied, numbers coerced,
   *         extra fields handled per policy), or std::nullopt on error
   */
  [[nodiscard]] std::optional<nlohmann::json> validate(
    const nlohmann::json & payload, DiagnosticBag & diags) const;

private:
  std::vector<FieldSpec> fields_;
  ExtraFields extra_ = ExtraFields::Ignore;
};

}  // namespace polyschema
