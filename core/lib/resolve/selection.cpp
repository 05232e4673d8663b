// polyschema/resolve/selection.cpp - Selection implementation
#include "polyschema/resolve/selection.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace polyschema
{

// ============================================================================
// SelectionGroup
// ============================================================================

TypeDescriptorPtr SelectionGroup::find(const DiscriminatorValue & value) const
{
  TypeDescriptorPtr descriptor = snapshot->find(value);
  if (!descriptor) {
    return nullptr;
  }
  auto it = std::find(variants.begin(), variants.end(), descriptor);
  return it != variants.end() ? descriptor : nullptr;
}

std::vector<DiscriminatorValue> SelectionGroup::known_values() const
{
  std::vector<DiscriminatorValue> values;
  for (const auto & descriptor : variants) {
    values.insert(values.end(), descriptor->values().begin(), descriptor->values().end());
  }
  normalize_values(values);
  return values;
}

// ============================================================================
// Selection
// ============================================================================

struct Selection::Node
{
  enum class Op { Hierarchy, Subtree, Union, Intersection };

  Op op = Op::Hierarchy;
  HierarchyId hierarchy;
  TypeDescriptorPtr root;
  std::shared_ptr<const Node> lhs;
  std::shared_ptr<const Node> rhs;

  void collect(std::set<HierarchyId> & out) const
  {
    switch (op) {
      case Op::Hierarchy:
        out.insert(hierarchy);
        break;
      case Op::Subtree:
        out.insert(root->hierarchy());
        break;
      case Op::Union:
      case Op::Intersection:
        lhs->collect(out);
        rhs->collect(out);
        break;
    }
  }

  bool contains(const TypeDescriptor & d) const
  {
    switch (op) {
      case Op::Hierarchy:
        return d.hierarchy() == hierarchy;
      case Op::Subtree:
        return d.hierarchy() == root->hierarchy() && d.descends_from(*root);
      case Op::Union:
        return lhs->contains(d) || rhs->contains(d);
      case Op::Intersection:
        return lhs->contains(d) && rhs->contains(d);
    }
    return false;
  }
};

Selection Selection::hierarchy(HierarchyId id)
{
  if (!id.is_valid()) {
    throw std::invalid_argument("selection of an invalid hierarchy id");
  }
  auto node = std::make_shared<Node>();
  node->op = Node::Op::Hierarchy;
  node->hierarchy = id;
  return Selection(std::move(node));
}

Selection Selection::subtree(TypeDescriptorPtr root)
{
  if (!root) {
    throw std::invalid_argument("selection of a null variant");
  }
  auto node = std::make_shared<Node>();
  node->op = Node::Op::Subtree;
  node->root = std::move(root);
  return Selection(std::move(node));
}

Selection operator|(const Selection & a, const Selection & b)
{
  auto node = std::make_shared<Selection::Node>();
  node->op = Selection::Node::Op::Union;
  node->lhs = a.node_;
  node->rhs = b.node_;
  return Selection(std::move(node));
}

Selection operator&(const Selection & a, const Selection & b)
{
  auto node = std::make_shared<Selection::Node>();
  node->op = Selection::Node::Op::Intersection;
  node->lhs = a.node_;
  node->rhs = b.node_;
  return Selection(std::move(node));
}

std::vector<HierarchyId> Selection::hierarchy_ids() const
{
  std::set<HierarchyId> ids;
  node_->collect(ids);
  return {ids.begin(), ids.end()};
}

bool Selection::contains(const TypeDescriptor & descriptor) const
{
  return node_->contains(descriptor);
}

std::vector<SelectionGroup> Selection::evaluate(const Registry & registry) const
{
  std::vector<SelectionGroup> groups;
  for (HierarchyId id : hierarchy_ids()) {
    SelectionGroup group;
    group.snapshot = registry.snapshot(id);
    for (const auto & descriptor : group.snapshot->descriptors()) {
      if (node_->contains(*descriptor)) {
        group.variants.push_back(descriptor);
      }
    }
    if (!group.variants.empty()) {
      groups.push_back(std::move(group));
    }
  }
  return groups;
}

}  // namespace polyschema
