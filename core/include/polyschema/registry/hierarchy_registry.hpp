// polyschema/registry/hierarchy_registry.hpp - Hierarchy registry
//
// Maps, per hierarchy, discriminator value -> TypeDescriptor. Writes are
// serialized; reads take an immutable snapshot without locking.
//
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/hierarchy_id.hpp"
#include "polyschema/core/type_descriptor.hpp"

namespace polyschema
{

// ============================================================================
// Hierarchy Info
// ============================================================================

struct HierarchyInfo
{
  HierarchyId id;
  std::string name;
  std::string discriminator_field;
  DiscriminatorKind kind = DiscriminatorKind::String;
};

// ============================================================================
// Hierarchy Snapshot
// ============================================================================

/**
 * Immutable view of one hierarchy at the moment it was taken.
 *
 * Later registrations publish a new snapshot; this one never changes, so a
 * validation keeps a consistent view for its whole duration.
 */
class HierarchySnapshot
{
public:
  [[nodiscard]] const HierarchyInfo & info() const noexcept { return info_; }

  [[nodiscard]] bool empty() const noexcept { return descriptors_.empty(); }

  /// Number of distinct variants (not values)
  [[nodiscard]] size_t size() const noexcept { return descriptors_.size(); }

  /// Descriptor claiming `value`, nullptr if none
  [[nodiscard]] TypeDescriptorPtr find(const DiscriminatorValue & value) const;

  /// All claimed values, sorted
  [[nodiscard]] std::vector<DiscriminatorValue> known_values() const;

  /// Distinct descriptors ordered by their primary value
  [[nodiscard]] const std::vector<TypeDescriptorPtr> & descriptors() const noexcept
  {
    return descriptors_;
  }

  /// Descriptor registered under `name`, nullptr if none
  [[nodiscard]] TypeDescriptorPtr find_variant(std::string_view name) const;

  /// Count of registrations published for this hierarchy
  [[nodiscard]] uint64_t version() const noexcept { return version_; }

private:
  friend class Registry;

  HierarchyInfo info_;
  std::map<DiscriminatorValue, TypeDescriptorPtr> by_value_;
  std::vector<TypeDescriptorPtr> descriptors_;
  uint64_t version_ = 0;
};

using HierarchySnapshotPtr = std::shared_ptr<const HierarchySnapshot>;

// ============================================================================
// Registry
// ============================================================================

enum class RegisterOutcome {
  Inserted,           ///< new variant, visible to every later snapshot
  AlreadyRegistered,  ///< the same variant was registered before; nothing changed
};

struct RegisterResult
{
  TypeDescriptorPtr descriptor;  ///< the registered descriptor (the existing one on repeat)
  RegisterOutcome outcome = RegisterOutcome::Inserted;
};

/**
 * Process-lifetime store of hierarchies and their variants.
 *
 * Thread safety: every member function may be called concurrently.
 * Mutations (declare, register, unregister, reset) take one registry-wide
 * mutex for the check-and-publish step. Readers atomically load the
 * current state pointer and never block behind a writer.
 */
class Registry
{
public:
  Registry();
  ~Registry();

  Registry(const Registry &) = delete;
  Registry & operator=(const Registry &) = delete;

  // ===========================================================================
  // Hierarchies
  // ===========================================================================

  /**
   * Declare a hierarchy root.
   *
   * Declaring an existing name again with the same field and kind returns
   * the existing id.
   *
   * @throws HierarchyConflictError if `name` exists with another field or kind
   * @throws std::invalid_argument if `name` or `discriminator_field` is empty
   */
  HierarchyId declare_hierarchy(
    const std::string & name, const std::string & discriminator_field,
    DiscriminatorKind kind = DiscriminatorKind::String);

  [[nodiscard]] std::optional<HierarchyId> find_hierarchy(std::string_view name) const;

  /// @throws UnknownHierarchyError
  [[nodiscard]] HierarchyInfo info(HierarchyId id) const;

  /// All hierarchies in declaration order
  [[nodiscard]] std::vector<HierarchyInfo> hierarchies() const;

  /**
   * Remove a hierarchy and all its variants. Meant for test isolation.
   *
   * Snapshots already taken remain valid.
   *
   * @return false if the id was not registered
   */
  bool unregister_hierarchy(HierarchyId id);

  /// Remove every hierarchy. Meant for test isolation.
  void reset();

  // ===========================================================================
  // Variants
  // ===========================================================================

  /**
   * Insert a descriptor under each of its values.
   *
   * All or nothing: on error no value of the descriptor is inserted.
   *
   * @throws UnknownHierarchyError if the descriptor's hierarchy is not declared
   * @throws NonLiteralDiscriminatorError if it claims no value, or a value
   *         of the wrong kind
   * @throws DuplicateDiscriminatorError if a value is claimed by another variant
   * @throws VariantConflictError if its name is registered as a different variant
   */
  RegisterResult register_descriptor(TypeDescriptorPtr descriptor);

  // ===========================================================================
  // Reads
  // ===========================================================================

  /// @throws UnknownHierarchyError
  [[nodiscard]] HierarchySnapshotPtr snapshot(HierarchyId id) const;

  /// Sorted values currently claimed in the hierarchy
  [[nodiscard]] std::vector<DiscriminatorValue> known_values(HierarchyId id) const;

  /// Distinct descriptors ordered by primary value
  [[nodiscard]] std::vector<TypeDescriptorPtr> descriptors(HierarchyId id) const;

private:
  struct State
  {
    std::map<HierarchyId, HierarchySnapshotPtr> hierarchies;
  };

  [[nodiscard]] std::shared_ptr<const State> load() const;
  void publish(std::shared_ptr<const State> next);

  std::mutex write_mutex_;
  std::shared_ptr<const State> state_;
  uint32_t next_id_ = 1;
};

/**
 * Process-wide registry, constructed on first call.
 *
 * Libraries that register variants from static initializers should call
 * this rather than rely on a namespace-scope object.
 */
[[nodiscard]] Registry & default_registry();

}  // namespace polyschema
