// polyschema/registry/hierarchy_registry.cpp - Hierarchy registry implementation
//
#include "polyschema/registry/hierarchy_registry.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

#include "polyschema/basic/logging.hpp"
#include "polyschema/core/errors.hpp"

namespace polyschema
{

// ============================================================================
// HierarchySnapshot
// ============================================================================

TypeDescriptorPtr HierarchySnapshot::find(const DiscriminatorValue & value) const
{
  auto it = by_value_.find(value);
  return it != by_value_.end() ? it->second : nullptr;
}

std::vector<DiscriminatorValue> HierarchySnapshot::known_values() const
{
  std::vector<DiscriminatorValue> values;
  values.reserve(by_value_.size());
  for (const auto & entry : by_value_) {
    values.push_back(entry.first);
  }
  return values;
}

TypeDescriptorPtr HierarchySnapshot::find_variant(std::string_view name) const
{
  auto it = std::find_if(descriptors_.begin(), descriptors_.end(), [&](const TypeDescriptorPtr & d) {
    return d->name() == name;
  });
  return it != descriptors_.end() ? *it : nullptr;
}

// ============================================================================
// Registry
// ============================================================================

Registry::Registry() : state_(std::make_shared<const State>()) {}

Registry::~Registry() = default;

std::shared_ptr<const Registry::State> Registry::load() const { return std::atomic_load(&state_); }

void Registry::publish(std::shared_ptr<const State> next)
{
  std::atomic_store(&state_, std::shared_ptr<const State>(std::move(next)));
}

HierarchyId Registry::declare_hierarchy(
  const std::string & name, const std::string & discriminator_field, DiscriminatorKind kind)
{
  if (name.empty()) {
    throw std::invalid_argument("hierarchy name must not be empty");
  }
  if (discriminator_field.empty()) {
    throw std::invalid_argument("hierarchy '" + name + "' must name a discriminator field");
  }

  const std::lock_guard<std::mutex> lock(write_mutex_);
  const auto current = load();

  for (const auto & entry : current->hierarchies) {
    const HierarchyInfo & existing = entry.second->info();
    if (existing.name != name) {
      continue;
    }
    if (existing.discriminator_field != discriminator_field) {
      throw HierarchyConflictError(
        name, "is already declared with discriminator field '" + existing.discriminator_field +
                "', not '" + discriminator_field + "'");
    }
    if (existing.kind != kind) {
      throw HierarchyConflictError(
        name, std::string("is already declared with ") + to_string(existing.kind) +
                " discriminator values, not " + to_string(kind));
    }
    return existing.id;
  }

  auto table = std::make_shared<HierarchySnapshot>();
  table->info_.id = HierarchyId{next_id_++};
  table->info_.name = name;
  table->info_.discriminator_field = discriminator_field;
  table->info_.kind = kind;

  auto next = std::make_shared<State>(*current);
  next->hierarchies.emplace(table->info_.id, table);
  publish(std::move(next));

  logger()->info(
    "declared hierarchy '{}' (discriminator '{}', {})", name, discriminator_field,
    to_string(kind));
  return table->info_.id;
}

std::optional<HierarchyId> Registry::find_hierarchy(std::string_view name) const
{
  const auto current = load();
  for (const auto & entry : current->hierarchies) {
    if (entry.second->info().name == name) {
      return entry.first;
    }
  }
  return std::nullopt;
}

HierarchyInfo Registry::info(HierarchyId id) const { return snapshot(id)->info(); }

std::vector<HierarchyInfo> Registry::hierarchies() const
{
  const auto current = load();
  std::vector<HierarchyInfo> out;
  out.reserve(current->hierarchies.size());
  for (const auto & entry : current->hierarchies) {
    out.push_back(entry.second->info());
  }
  return out;
}

bool Registry::unregister_hierarchy(HierarchyId id)
{
  const std::lock_guard<std::mutex> lock(write_mutex_);
  const auto current = load();
  if (current->hierarchies.count(id) == 0) {
    return false;
  }
  auto next = std::make_shared<State>(*current);
  next->hierarchies.erase(id);
  publish(std::move(next));
  logger()->debug("unregistered hierarchy id {}", id.value());
  return true;
}

void Registry::reset()
{
  const std::lock_guard<std::mutex> lock(write_mutex_);
  publish(std::make_shared<const State>());
  logger()->debug("registry reset");
}

RegisterResult Registry::register_descriptor(TypeDescriptorPtr descriptor)
{
  if (!descriptor) {
    throw std::invalid_argument("cannot register a null descriptor");
  }

  const std::lock_guard<std::mutex> lock(write_mutex_);
  const auto current = load();

  auto found = current->hierarchies.find(descriptor->hierarchy());
  if (found == current->hierarchies.end()) {
    throw UnknownHierarchyError(descriptor->hierarchy());
  }
  const HierarchySnapshot & table = *found->second;
  const HierarchyInfo & info = table.info();

  if (descriptor->values().empty()) {
    throw NonLiteralDiscriminatorError(
      descriptor->name(), info.discriminator_field, "declares no value");
  }
  for (const auto & value : descriptor->values()) {
    if (value.kind() != info.kind) {
      throw NonLiteralDiscriminatorError(
        descriptor->name(), info.discriminator_field,
        "has literal " + value.display() + " but hierarchy '" + info.name + "' expects " +
          to_string(info.kind) + " values");
    }
  }
  if (descriptor->parent() && descriptor->parent()->hierarchy() != info.id) {
    throw std::invalid_argument(
      "variant '" + descriptor->name() + "' has a parent from another hierarchy");
  }

  const TypeDescriptorPtr existing = table.find_variant(descriptor->name());
  if (existing && existing->same_variant(*descriptor)) {
    logger()->debug(
      "hierarchy '{}': variant '{}' already registered", info.name, descriptor->name());
    return RegisterResult{existing, RegisterOutcome::AlreadyRegistered};
  }

  // A value owned by any other descriptor is a duplicate, even one that
  // shares this variant's name.
  for (const auto & value : descriptor->values()) {
    if (TypeDescriptorPtr owner = table.find(value)) {
      logger()->warn(
        "hierarchy '{}': rejected variant '{}', value {} is claimed by '{}'", info.name,
        descriptor->name(), value.display(), owner->name());
      throw DuplicateDiscriminatorError(info.name, value, owner->name(), descriptor->name());
    }
  }

  if (existing) {
    throw VariantConflictError(
      info.name, descriptor->name(),
      "is already registered with values [" + join_values(existing->values()) +
        "] and a different definition");
  }

  auto next_table = std::make_shared<HierarchySnapshot>(table);
  for (const auto & value : descriptor->values()) {
    next_table->by_value_.emplace(value, descriptor);
  }
  auto pos = std::upper_bound(
    next_table->descriptors_.begin(), next_table->descriptors_.end(), descriptor,
    [](const TypeDescriptorPtr & a, const TypeDescriptorPtr & b) {
      return a->primary_value() < b->primary_value();
    });
  next_table->descriptors_.insert(pos, descriptor);
  next_table->version_ = table.version_ + 1;

  auto next = std::make_shared<State>(*current);
  next->hierarchies[info.id] = std::move(next_table);
  publish(std::move(next));

  logger()->debug(
    "hierarchy '{}': registered variant '{}' for {}", info.name, descriptor->name(),
    join_values(descriptor->values()));
  return RegisterResult{std::move(descriptor), RegisterOutcome::Inserted};
}

HierarchySnapshotPtr Registry::snapshot(HierarchyId id) const
{
  const auto current = load();
  auto it = current->hierarchies.find(id);
  if (it == current->hierarchies.end()) {
    throw UnknownHierarchyError(id);
  }
  return it->second;
}

std::vector<DiscriminatorValue> Registry::known_values(HierarchyId id) const
{
  return snapshot(id)->known_values();
}

std::vector<TypeDescriptorPtr> Registry::descriptors(HierarchyId id) const
{
  return snapshot(id)->descriptors();
}

Registry & default_registry()
{
  static Registry instance;
  return instance;
}

}  // namespace polyschema
