// polyschema/core/discriminator.hpp - Discriminator value representation
//
// The literal scalar a variant claims within its hierarchy.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace polyschema
{

// ============================================================================
// Discriminator Kind
// ============================================================================

/**
 * Scalar kind of the discriminator field, declared once per hierarchy.
 *
 * Enumerations are carried in their string or integer form.
 */
enum class DiscriminatorKind : uint8_t {
  String,
  Integer,
};

[[nodiscard]] const char * to_string(DiscriminatorKind kind) noexcept;

/// Parse "string" | "integer"
[[nodiscard]] std::optional<DiscriminatorKind> parse_discriminator_kind(std::string_view text);

// ============================================================================
// Discriminator Value
// ============================================================================

/**
 * Immutable, totally ordered discriminator scalar.
 *
 * Ordering: every integer sorts before every string; integers compare
 * numerically and strings lexicographically.
 */
class DiscriminatorValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static DiscriminatorValue make_string(std::string value)
  {
    DiscriminatorValue v;
    v.value_ = std::move(value);
    return v;
  }

  static DiscriminatorValue make_integer(int64_t value)
  {
    DiscriminatorValue v;
    v.value_ = value;
    return v;
  }

  /**
   * Convert a JSON scalar.
   *
   * @return the value, or std::nullopt if `j` is neither a string nor an
   *         integer representable as int64_t
   */
  [[nodiscard]] static std::optional<DiscriminatorValue> from_json(const nlohmann::json & j);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] DiscriminatorKind kind() const noexcept
  {
    return std::holds_alternative<std::string>(value_) ? DiscriminatorKind::String
                                                       : DiscriminatorKind::Integer;
  }

  [[nodiscard]] bool is_string() const noexcept { return kind() == DiscriminatorKind::String; }
  [[nodiscard]] bool is_integer() const noexcept { return kind() == DiscriminatorKind::Integer; }

  /// Precondition: is_string()
  [[nodiscard]] const std::string & as_string() const { return std::get<std::string>(value_); }

  /// Precondition: is_integer()
  [[nodiscard]] int64_t as_integer() const { return std::get<int64_t>(value_); }

  [[nodiscard]] nlohmann::json to_json() const;

  /// Unquoted text ("text", "42")
  [[nodiscard]] std::string to_string() const;

  /// JSON rendering, strings quoted ("\"text\"", "42")
  [[nodiscard]] std::string display() const;

  // ===========================================================================
  // Comparison
  // ===========================================================================

  friend bool operator==(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return !(a == b);
  }
  friend bool operator<(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return a.value_ < b.value_;
  }
  friend bool operator>(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return b < a;
  }
  friend bool operator<=(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return !(b < a);
  }
  friend bool operator>=(const DiscriminatorValue & a, const DiscriminatorValue & b)
  {
    return !(a < b);
  }

private:
  DiscriminatorValue() = default;

  // Alternative order defines the cross-kind ordering.
  std::variant<int64_t, std::string> value_;
};

/// Sort and deduplicate in place
void normalize_values(std::vector<DiscriminatorValue> & values);

/// Comma-separated display form: "\"number\", \"text\""
[[nodiscard]] std::string join_values(gsl::span<const DiscriminatorValue> values);

}  // namespace polyschema
