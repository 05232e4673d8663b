// polyschema/core/type_descriptor.cpp - Type descriptor implementation
#include "polyschema/core/type_descriptor.hpp"

#include <algorithm>
#include <utility>

#include "polyschema/model/model.hpp"

namespace polyschema
{

TypeDescriptorPtr TypeDescriptor::create(Init init)
{
  // The constructor is private, so std::make_shared cannot be used.
  return TypeDescriptorPtr(new TypeDescriptor(std::move(init)));
}

TypeDescriptor::TypeDescriptor(Init init)
: name_(std::move(init.name)),
  hierarchy_(init.hierarchy),
  values_(std::move(init.values)),
  schema_(std::make_shared<const ObjectSchema>(std::move(init.schema))),
  parent_(std::move(init.parent)),
  type_(init.type),
  factory_(std::move(init.factory))
{
  normalize_values(values_);
  if (!factory_) {
    type_ = typeid(DynamicModel);
    factory_ = [](const nlohmann::json & fields) -> std::unique_ptr<Model> {
      return std::make_unique<DynamicModel>(fields);
    };
  }
}

bool TypeDescriptor::claims(const DiscriminatorValue & value) const
{
  return std::binary_search(values_.begin(), values_.end(), value);
}

bool TypeDescriptor::descends_from(const TypeDescriptor & ancestor) const noexcept
{
  for (const TypeDescriptor * d = this; d != nullptr; d = d->parent_.get()) {
    if (d == &ancestor) {
      return true;
    }
  }
  return false;
}

bool TypeDescriptor::same_variant(const TypeDescriptor & other) const
{
  return hierarchy_ == other.hierarchy_ && name_ == other.name_ && type_ == other.type_ &&
         values_ == other.values_;
}

std::unique_ptr<Model> TypeDescriptor::instantiate(const nlohmann::json & fields) const
{
  std::unique_ptr<Model> model = factory_(fields);
  if (model) {
    model->descriptor_ = shared_from_this();
  }
  return model;
}

}  // namespace polyschema
