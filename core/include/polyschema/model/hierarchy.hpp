// polyschema/model/hierarchy.hpp - Typed facade over a hierarchy
//
// Hierarchy<Base> binds a hierarchy id to a C++ base class deriving from
// Model. Variants are C++ classes deriving from Base that provide
//
//   static polyschema::ObjectSchema schema();
//   explicit V(const nlohmann::json & fields);
//
// and validation hands back std::unique_ptr<Base> whose dynamic type is
// the resolved variant.
//
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/errors.hpp"
#include "polyschema/dispatch/dispatcher.hpp"
#include "polyschema/model/model.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"
#include "polyschema/registry/registration.hpp"
#include "polyschema/resolve/selection.hpp"

namespace polyschema
{

/// Readable name of a C++ type ("demo::TextConfig")
[[nodiscard]] std::string type_name(const std::type_info & type);

/**
 * Options for Hierarchy<Base>::add.
 */
struct VariantOptions
{
  /// Discriminator value(s); absent means the variant's schema declares them
  std::optional<std::vector<DiscriminatorValue>> values;

  /// Register as a variant of this variant (subtree membership)
  TypeDescriptorPtr parent;

  /// Variant name; empty means the demangled C++ type name
  std::string name;

  VariantOptions & with_value(DiscriminatorValue value)
  {
    values = std::vector<DiscriminatorValue>{std::move(value)};
    return *this;
  }

  VariantOptions & with_values(std::vector<DiscriminatorValue> aliases)
  {
    values = std::move(aliases);
    return *this;
  }

  VariantOptions & under(TypeDescriptorPtr variant)
  {
    parent = std::move(variant);
    return *this;
  }

  VariantOptions & named(std::string variant_name)
  {
    name = std::move(variant_name);
    return *this;
  }
};

/**
 * Typed outcome of Hierarchy<Base>::try_validate.
 */
template <typename Base>
struct TypedResult
{
  bool success = false;
  std::unique_ptr<Base> value;
  std::optional<ValidationError> error;

  static TypedResult ok(std::unique_ptr<Base> instance)
  {
    TypedResult r;
    r.value = std::move(instance);
    r.success = true;
    return r;
  }

  static TypedResult fail(ValidationError err)
  {
    TypedResult r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }

  explicit operator bool() const noexcept { return success; }
};

template <typename Base>
class Hierarchy
{
  static_assert(std::is_base_of<Model, Base>::value, "Base must derive from polyschema::Model");

public:
  /**
   * Declare (or look up, if already declared identically) a hierarchy.
   *
   * @throws HierarchyConflictError
   */
  static Hierarchy declare(
    Registry & registry, const std::string & name, const std::string & discriminator_field,
    DiscriminatorKind kind = DiscriminatorKind::String)
  {
    return Hierarchy(registry, registry.declare_hierarchy(name, discriminator_field, kind));
  }

  [[nodiscard]] HierarchyId id() const noexcept { return id_; }
  [[nodiscard]] Registry & registry() const noexcept { return *registry_; }

  /**
   * Register V as a variant.
   *
   * Idempotent; see register_variant for the failure modes.
   */
  template <typename V>
  TypeDescriptorPtr add(VariantOptions options = {})
  {
    static_assert(std::is_base_of<Base, V>::value, "variant must derive from the hierarchy base");
    static_assert(
      std::is_constructible<V, const nlohmann::json &>::value,
      "variant must be constructible from const nlohmann::json &");

    VariantDeclaration declaration;
    declaration.name = options.name.empty() ? type_name(typeid(V)) : std::move(options.name);
    declaration.schema = V::schema();
    declaration.values = std::move(options.values);
    declaration.type = typeid(V);
    declaration.factory = [](const nlohmann::json & fields) -> std::unique_ptr<Model> {
      return std::make_unique<V>(fields);
    };

    if (options.parent) {
      if (options.parent->hierarchy() != id_) {
        throw std::invalid_argument(
          "variant '" + declaration.name + "' has a parent from another hierarchy");
      }
      return register_variant(*registry_, options.parent, std::move(declaration));
    }
    return register_variant(*registry_, id_, std::move(declaration));
  }

  /**
   * Validate and instantiate.
   *
   * @throws ValidationFailure
   */
  [[nodiscard]] std::unique_ptr<Base> validate(const nlohmann::json & payload) const
  {
    return downcast(Dispatcher(*registry_).validate_or_throw(id_, payload));
  }

  [[nodiscard]] TypedResult<Base> try_validate(const nlohmann::json & payload) const
  {
    ValidationResult result = Dispatcher(*registry_).validate(id_, payload);
    if (!result.success) {
      return TypedResult<Base>::fail(std::move(*result.error));
    }
    return TypedResult<Base>::ok(downcast(*result.value));
  }

  [[nodiscard]] std::vector<DiscriminatorValue> known_values() const
  {
    return registry_->known_values(id_);
  }

  /// Selection of every variant, for combining with others
  [[nodiscard]] Selection selection() const { return Selection::hierarchy(id_); }

private:
  Hierarchy(Registry & registry, HierarchyId id) : registry_(&registry), id_(id) {}

  static std::unique_ptr<Base> downcast(const ValidatedPayload & payload)
  {
    std::unique_ptr<Model> instance = payload.instantiate();
    auto * typed = dynamic_cast<Base *>(instance.get());
    if (typed == nullptr) {
      throw std::logic_error(
        "variant '" + payload.descriptor->name() + "' does not produce a " +
        type_name(typeid(Base)));
    }
    instance.release();
    return std::unique_ptr<Base>(typed);
  }

  Registry * registry_;
  HierarchyId id_;
};

}  // namespace polyschema
