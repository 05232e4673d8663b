// polyschema/model/model.hpp - Polymorphic root of validated instances
#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "polyschema/core/type_descriptor.hpp"

namespace polyschema
{

/**
 * Root of every instance produced by validation.
 *
 * A base schema is a class deriving from Model; each variant derives from
 * its base (or from another variant) and is constructible from the
 * validated `const nlohmann::json &` fields.
 */
class Model
{
public:
  virtual ~Model() = default;

  /// The descriptor this instance was built from (null for hand-built instances)
  [[nodiscard]] const TypeDescriptorPtr & descriptor() const noexcept { return descriptor_; }

protected:
  Model() = default;
  Model(const Model &) = default;
  Model & operator=(const Model &) = default;

private:
  friend class TypeDescriptor;

  TypeDescriptorPtr descriptor_;
};

/**
 * Instance of a variant declared without a C++ type (catalog variants).
 */
class DynamicModel : public Model
{
public:
  explicit DynamicModel(nlohmann::json fields) : fields_(std::move(fields)) {}

  [[nodiscard]] const nlohmann::json & fields() const noexcept { return fields_; }

private:
  nlohmann::json fields_;
};

}  // namespace polyschema
