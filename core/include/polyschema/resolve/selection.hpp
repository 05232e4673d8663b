// polyschema/resolve/selection.hpp - Lazily evaluated sets of variants
//
// A Selection names variants by hierarchy or subtree and combines them
// with union and intersection. It stores only the expression; the variants
// are looked up in fresh snapshots each time it is evaluated.
//
#pragma once

#include <memory>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/hierarchy_id.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"

namespace polyschema
{

/**
 * The selected variants of one hierarchy, as of one snapshot.
 */
struct SelectionGroup
{
  HierarchySnapshotPtr snapshot;

  /// Selected variants, ordered by primary value
  std::vector<TypeDescriptorPtr> variants;

  [[nodiscard]] const HierarchyInfo & info() const noexcept { return snapshot->info(); }

  /// Selected variant claiming `value`, nullptr if none
  [[nodiscard]] TypeDescriptorPtr find(const DiscriminatorValue & value) const;

  /// Values claimed by the selected variants, sorted
  [[nodiscard]] std::vector<DiscriminatorValue> known_values() const;
};

class Selection
{
public:
  /// Every variant of a hierarchy
  [[nodiscard]] static Selection hierarchy(HierarchyId id);

  /// `root` and every variant registered with it as an ancestor
  [[nodiscard]] static Selection subtree(TypeDescriptorPtr root);

  friend Selection operator|(const Selection & a, const Selection & b);
  friend Selection operator&(const Selection & a, const Selection & b);

  /// Hierarchies the expression mentions, ascending (declaration order)
  [[nodiscard]] std::vector<HierarchyId> hierarchy_ids() const;

  [[nodiscard]] bool contains(const TypeDescriptor & descriptor) const;

  /**
   * Evaluate against the registry's current state.
   *
   * One group per mentioned hierarchy that has at least one selected
   * variant, in declaration order.
   *
   * @throws UnknownHierarchyError if a mentioned hierarchy is not declared
   */
  [[nodiscard]] std::vector<SelectionGroup> evaluate(const Registry & registry) const;

private:
  struct Node;

  explicit Selection(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

  std::shared_ptr<const Node> node_;
};

}  // namespace polyschema
