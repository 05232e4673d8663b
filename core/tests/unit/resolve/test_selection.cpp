// tests/unit/resolve/test_selection.cpp - Selections over hierarchies and subtrees
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "polyschema/core/errors.hpp"
#include "polyschema/dispatch/dispatcher.hpp"
#include "polyschema/registry/registration.hpp"
#include "polyschema/resolve/selection.hpp"
#include "polyschema/test_support/fixtures.hpp"

using namespace polyschema;
using namespace polyschema::test_support;
using nlohmann::json;

namespace
{

VariantDeclaration shape(const std::string & name, const std::string & value)
{
  VariantDeclaration d;
  d.name = name;
  d.schema = ObjectSchema::builder().field("size", FieldType::Number).build();
  d.values = strs({value});
  return d;
}

/// Shape: polygon <- square, polygon <- triangle, circle
struct ShapeRegistry
{
  Registry registry;
  HierarchyId shapes = registry.declare_hierarchy("Shape", "kind");
  TypeDescriptorPtr polygon = register_variant(registry, shapes, shape("Polygon", "polygon"));
  TypeDescriptorPtr square = register_variant(registry, polygon, shape("Square", "square"));
  TypeDescriptorPtr triangle = register_variant(registry, polygon, shape("Triangle", "triangle"));
  TypeDescriptorPtr circle = register_variant(registry, shapes, shape("Circle", "circle"));
};

}  // namespace

TEST(ResolveSelection, HierarchyCoversEveryVariant)
{
  ShapeRegistry fx;
  const auto groups = Selection::hierarchy(fx.shapes).evaluate(fx.registry);
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].variants.size(), 4U);
  EXPECT_EQ(groups[0].info().discriminator_field, "kind");
}

TEST(ResolveSelection, SubtreeCoversRootAndDescendants)
{
  ShapeRegistry fx;
  const Selection polygons = Selection::subtree(fx.polygon);

  EXPECT_TRUE(polygons.contains(*fx.polygon));
  EXPECT_TRUE(polygons.contains(*fx.square));
  EXPECT_TRUE(polygons.contains(*fx.triangle));
  EXPECT_FALSE(polygons.contains(*fx.circle));

  const auto groups = polygons.evaluate(fx.registry);
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].known_values(), strs({"polygon", "square", "triangle"}));
  EXPECT_EQ(groups[0].find(str("circle")), nullptr);
  EXPECT_EQ(groups[0].find(str("square")), fx.square);
}

TEST(ResolveSelection, UnionAndIntersection)
{
  ShapeRegistry fx;
  const Selection squares = Selection::subtree(fx.square);
  const Selection circles = Selection::subtree(fx.circle);
  const Selection polygons = Selection::subtree(fx.polygon);

  const auto either = (squares | circles).evaluate(fx.registry);
  ASSERT_EQ(either.size(), 1U);
  EXPECT_EQ(either[0].known_values(), strs({"circle", "square"}));

  const auto both = (polygons & squares).evaluate(fx.registry);
  ASSERT_EQ(both.size(), 1U);
  EXPECT_EQ(both[0].known_values(), strs({"square"}));

  EXPECT_TRUE((polygons & circles).evaluate(fx.registry).empty());
}

TEST(ResolveSelection, LateRegistrationsAreVisible)
{
  ShapeRegistry fx;
  const Selection polygons = Selection::subtree(fx.polygon);
  EXPECT_EQ(polygons.evaluate(fx.registry)[0].variants.size(), 3U);

  (void)register_variant(fx.registry, fx.polygon, shape("Hexagon", "hexagon"));
  EXPECT_EQ(polygons.evaluate(fx.registry)[0].variants.size(), 4U);
}

TEST(ResolveSelection, DispatchWithinSubtree)
{
  ShapeRegistry fx;
  const Dispatcher dispatcher(fx.registry);
  const Selection polygons = Selection::subtree(fx.polygon);

  const ValidationResult ok = dispatcher.validate(polygons, json{{"kind", "square"}, {"size", 2}});
  ASSERT_TRUE(ok.success);
  EXPECT_EQ(ok.value->descriptor, fx.square);

  const ValidationResult outside = dispatcher.validate(polygons, json{{"kind", "circle"}, {"size", 2}});
  ASSERT_FALSE(outside.success);
  EXPECT_EQ(outside.error->kind, ErrorKind::UnknownDiscriminatorValue);
  EXPECT_EQ(outside.error->known_values, strs({"polygon", "square", "triangle"}));
}

TEST(ResolveSelection, DispatchAcrossHierarchies)
{
  ShapeRegistry fx;
  const HierarchyId config = fx.registry.declare_hierarchy("Config", "mode");
  (void)register_variant(fx.registry, config, text_variant());

  const Dispatcher dispatcher(fx.registry);
  const Selection any = Selection::hierarchy(fx.shapes) | Selection::hierarchy(config);

  const ValidationResult text = dispatcher.validate(any, json{{"mode", "text"}, {"text", "hi"}});
  ASSERT_TRUE(text.success);
  EXPECT_EQ(text.value->descriptor->name(), "TextConfig");

  const ValidationResult circle = dispatcher.validate(any, json{{"kind", "circle"}, {"size", 1.5}});
  ASSERT_TRUE(circle.success);
  EXPECT_EQ(circle.value->descriptor, fx.circle);

  const ValidationResult neither = dispatcher.validate(any, json{{"size", 1}});
  ASSERT_FALSE(neither.success);
  EXPECT_EQ(neither.error->kind, ErrorKind::MissingDiscriminatorField);
  EXPECT_EQ(neither.error->hierarchy, "Shape");
}

TEST(ResolveSelection, FirstAttemptedGroupErrorIsReported)
{
  ShapeRegistry fx;
  const HierarchyId config = fx.registry.declare_hierarchy("Config", "mode");
  (void)register_variant(fx.registry, config, text_variant());

  const Dispatcher dispatcher(fx.registry);
  const Selection any = Selection::hierarchy(fx.shapes) | Selection::hierarchy(config);

  // Shape group is tried first and fails on the field rules; Config fails on the value.
  const ValidationResult r =
    dispatcher.validate(any, json{{"kind", "circle"}, {"size", "big"}, {"mode", "bytes"}});
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::FieldValidation);
  EXPECT_EQ(r.error->variant, std::string("Circle"));
}

TEST(ResolveSelection, EmptySelectionIsEmptyHierarchy)
{
  ShapeRegistry fx;
  const HierarchyId empty = fx.registry.declare_hierarchy("Empty", "mode");
  const Dispatcher dispatcher(fx.registry);

  const ValidationResult r = dispatcher.validate(Selection::hierarchy(empty), json{{"mode", "x"}});
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::EmptyHierarchy);
  EXPECT_EQ(r.error->hierarchy, "Empty");
}

TEST(ResolveSelection, InvalidArgumentsThrow)
{
  EXPECT_THROW((void)Selection::hierarchy(HierarchyId::invalid()), std::invalid_argument);
  EXPECT_THROW((void)Selection::subtree(nullptr), std::invalid_argument);
}
