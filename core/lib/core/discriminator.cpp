// polyschema/core/discriminator.cpp - Discriminator value implementation
#include "polyschema/core/discriminator.hpp"

#include <algorithm>
#include <limits>

namespace polyschema
{

const char * to_string(DiscriminatorKind kind) noexcept
{
  switch (kind) {
    case DiscriminatorKind::String:
      return "string";
    case DiscriminatorKind::Integer:
      return "integer";
  }
  return "string";
}

std::optional<DiscriminatorKind> parse_discriminator_kind(std::string_view text)
{
  if (text == "string") return DiscriminatorKind::String;
  if (text == "integer" || text == "int") return DiscriminatorKind::Integer;
  return std::nullopt;
}

std::optional<DiscriminatorValue> DiscriminatorValue::from_json(const nlohmann::json & j)
{
  if (j.is_string()) {
    return make_string(j.get<std::string>());
  }
  if (j.is_number_unsigned()) {
    const auto u = j.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::nullopt;
    }
    return make_integer(static_cast<int64_t>(u));
  }
  if (j.is_number_integer()) {
    return make_integer(j.get<int64_t>());
  }
  return std::nullopt;
}

nlohmann::json DiscriminatorValue::to_json() const
{
  if (is_string()) {
    return nlohmann::json(as_string());
  }
  return nlohmann::json(as_integer());
}

std::string DiscriminatorValue::to_string() const
{
  if (is_string()) {
    return as_string();
  }
  return std::to_string(as_integer());
}

std::string DiscriminatorValue::display() const { return to_json().dump(); }

void normalize_values(std::vector<DiscriminatorValue> & values)
{
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
}

std::string join_values(gsl::span<const DiscriminatorValue> values)
{
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += values[i].display();
  }
  return out;
}

}  // namespace polyschema
