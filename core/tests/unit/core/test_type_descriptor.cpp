// tests/unit/core/test_type_descriptor.cpp - TypeDescriptor
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/model/model.hpp"
#include "polyschema/test_support/fixtures.hpp"

using namespace polyschema;
using namespace polyschema::test_support;

namespace
{

TypeDescriptorPtr make_descriptor(
  const std::string & name, std::vector<DiscriminatorValue> values, TypeDescriptorPtr parent = nullptr)
{
  TypeDescriptor::Init init;
  init.name = name;
  init.hierarchy = HierarchyId{1};
  init.values = std::move(values);
  init.parent = std::move(parent);
  return TypeDescriptor::create(std::move(init));
}

}  // namespace

TEST(CoreTypeDescriptor, ValuesAreSortedAndDeduplicated)
{
  auto d = make_descriptor("Text", {str("txt"), str("text"), str("txt")});
  ASSERT_EQ(d->values().size(), 2U);
  EXPECT_EQ(d->primary_value(), str("text"));
  EXPECT_TRUE(d->claims(str("txt")));
  EXPECT_FALSE(d->claims(str("number")));
}

TEST(CoreTypeDescriptor, DefaultsToDynamicModel)
{
  auto d = make_descriptor("Text", {str("text")});
  EXPECT_EQ(d->type(), std::type_index(typeid(DynamicModel)));

  const nlohmann::json fields = {{"mode", "text"}, {"text", "hi"}};
  auto instance = d->instantiate(fields);
  ASSERT_NE(instance, nullptr);
  EXPECT_EQ(instance->descriptor(), d);

  auto * dynamic = dynamic_cast<DynamicModel *>(instance.get());
  ASSERT_NE(dynamic, nullptr);
  EXPECT_EQ(dynamic->fields(), fields);
}

TEST(CoreTypeDescriptor, DescendsFromFollowsParents)
{
  auto root = make_descriptor("Shape", {str("shape")});
  auto mid = make_descriptor("Polygon", {str("polygon")}, root);
  auto leaf = make_descriptor("Square", {str("square")}, mid);
  auto other = make_descriptor("Circle", {str("circle")});

  EXPECT_TRUE(leaf->descends_from(*leaf));
  EXPECT_TRUE(leaf->descends_from(*mid));
  EXPECT_TRUE(leaf->descends_from(*root));
  EXPECT_FALSE(root->descends_from(*leaf));
  EXPECT_FALSE(leaf->descends_from(*other));
}

TEST(CoreTypeDescriptor, SameVariantComparesIdentityNotSchema)
{
  auto a = make_descriptor("Text", {str("text")});
  auto b = make_descriptor("Text", {str("text")});
  auto renamed = make_descriptor("Text2", {str("text")});
  auto revalued = make_descriptor("Text", {str("text"), str("txt")});

  EXPECT_TRUE(a->same_variant(*b));
  EXPECT_FALSE(a->same_variant(*renamed));
  EXPECT_FALSE(a->same_variant(*revalued));
}
