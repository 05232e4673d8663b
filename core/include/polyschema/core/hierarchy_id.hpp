// polyschema/core/hierarchy_id.hpp - Strongly typed hierarchy identifier
#pragma once

#include <cstdint>
#include <functional>

namespace polyschema
{

/**
 * Identity of one hierarchy (the family of variants rooted at a base).
 *
 * Ids are handed out by a Registry and are never reused, so an id kept
 * after its hierarchy was unregistered stays invalid for that registry.
 */
class HierarchyId
{
public:
  constexpr HierarchyId() = default;
  constexpr explicit HierarchyId(uint32_t value) : value_(value) {}

  [[nodiscard]] static constexpr HierarchyId invalid() { return HierarchyId{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != 0; }
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  friend constexpr bool operator==(HierarchyId a, HierarchyId b) { return a.value_ == b.value_; }
  friend constexpr bool operator!=(HierarchyId a, HierarchyId b) { return a.value_ != b.value_; }
  friend constexpr bool operator<(HierarchyId a, HierarchyId b) { return a.value_ < b.value_; }

private:
  uint32_t value_ = 0;
};

}  // namespace polyschema

namespace std
{

template <>
struct hash<polyschema::HierarchyId>
{
  size_t operator()(polyschema::HierarchyId id) const noexcept
  {
    return std::hash<uint32_t>{}(id.value());
  }
};

}  // namespace std
