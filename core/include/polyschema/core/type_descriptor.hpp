// polyschema/core/type_descriptor.hpp - Immutable record of one variant
#pragma once

#include <functional>
#include <gsl/span>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <typeindex>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/hierarchy_id.hpp"
#include "polyschema/schema/object_schema.hpp"

namespace polyschema
{

class Model;
class TypeDescriptor;

using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

/// Builds an instance of the variant from fields the schema engine accepted.
using InstanceFactory = std::function<std::unique_ptr<Model>(const nlohmann::json & fields)>;

// ============================================================================
// Type Descriptor
// ============================================================================

/**
 * Describes one variant: the discriminator value(s) it claims, the
 * hierarchy it belongs to and the handle to its field schema.
 *
 * Created once by the registration hook and immutable afterwards. The
 * registry owns descriptors through TypeDescriptorPtr; resolutions and
 * instances share the same object.
 */
class TypeDescriptor : public std::enable_shared_from_this<TypeDescriptor>
{
public:
  struct Init
  {
    std::string name;
    HierarchyId hierarchy;
    std::vector<DiscriminatorValue> values;
    ObjectSchema schema;
    TypeDescriptorPtr parent;
    std::type_index type = typeid(void);
    InstanceFactory factory;
  };

  /// Values are sorted and deduplicated; a missing factory yields DynamicModel.
  [[nodiscard]] static TypeDescriptorPtr create(Init init);

  TypeDescriptor(const TypeDescriptor &) = delete;
  TypeDescriptor & operator=(const TypeDescriptor &) = delete;

  // ===========================================================================
  // Accessors
  // ===========================================================================

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] HierarchyId hierarchy() const noexcept { return hierarchy_; }

  /// Sorted, deduplicated; the first one is the canonical value
  [[nodiscard]] gsl::span<const DiscriminatorValue> values() const noexcept
  {
    return {values_.data(), values_.size()};
  }

  [[nodiscard]] const DiscriminatorValue & primary_value() const { return values_.front(); }

  [[nodiscard]] bool claims(const DiscriminatorValue & value) const;

  [[nodiscard]] const ObjectSchema & schema() const noexcept { return *schema_; }

  /// The variant this one was declared under, nullptr for direct variants
  [[nodiscard]] const TypeDescriptorPtr & parent() const noexcept { return parent_; }

  /// The C++ type instantiate() produces (typeid(DynamicModel) for untyped variants)
  [[nodiscard]] std::type_index type() const noexcept { return type_; }

  /// True if `ancestor` is this descriptor or one of its parents
  [[nodiscard]] bool descends_from(const TypeDescriptor & ancestor) const noexcept;

  /**
   * Same variant: same hierarchy, name, C++ type and value set.
   *
   * Registering a descriptor that is the same variant as an already
   * registered one is a no-op.
   */
  [[nodiscard]] bool same_variant(const TypeDescriptor & other) const;

  // ===========================================================================
  // Instantiation
  // ===========================================================================

  /**
   * Build an instance from validated fields.
   *
   * The returned model's descriptor() is this descriptor.
   */
  [[nodiscard]] std::unique_ptr<Model> instantiate(const nlohmann::json & fields) const;

private:
  explicit TypeDescriptor(Init init);

  std::string name_;
  HierarchyId hierarchy_;
  std::vector<DiscriminatorValue> values_;
  std::shared_ptr<const ObjectSchema> schema_;
  TypeDescriptorPtr parent_;
  std::type_index type_;
  InstanceFactory factory_;
};

}  // namespace polyschema
