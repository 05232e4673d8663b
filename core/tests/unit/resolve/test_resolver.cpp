// tests/unit/resolve/test_resolver.cpp - Lazy resolution and discriminator extraction
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "polyschema/resolve/resolver.hpp"
#include "polyschema/test_support/fixtures.hpp"

using namespace polyschema;
using namespace polyschema::test_support;
using nlohmann::json;

TEST(ResolveResolver, FindsRegisteredVariant)
{
  ConfigRegistry fx;
  fx.add_text_and_number();

  const Resolution r = resolve(*fx.registry.snapshot(fx.config), str("number"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.descriptor->name(), "NumberConfig");
  EXPECT_FALSE(r.error.has_value());
}

TEST(ResolveResolver, UnknownValueCarriesSortedKnownValues)
{
  ConfigRegistry fx;
  (void)fx.add(text_variant());
  (void)fx.add(number_variant());

  const Resolution r = resolve(*fx.registry.snapshot(fx.config), str("bytes"));
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ErrorKind::UnknownDiscriminatorValue);
  EXPECT_EQ(r.error->hierarchy, "Config");
  EXPECT_EQ(r.error->value, str("bytes"));
  EXPECT_EQ(r.error->known_values, strs({"number", "text"}));
  EXPECT_NE(r.error->message.find("\"bytes\""), std::string::npos);
}

TEST(ResolveResolver, EmptySnapshot)
{
  ConfigRegistry fx;
  const Resolution r = resolve(*fx.registry.snapshot(fx.config), str("text"));
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error->kind, ErrorKind::EmptyHierarchy);
  EXPECT_TRUE(r.error->known_values.empty());
}

TEST(ResolveResolver, ResolutionIsNotCached)
{
  ConfigRegistry fx;
  (void)fx.add(text_variant());
  EXPECT_FALSE(resolve(*fx.registry.snapshot(fx.config), str("bytes")).ok());

  (void)fx.add(bytes_variant());
  EXPECT_TRUE(resolve(*fx.registry.snapshot(fx.config), str("bytes")).ok());
}

TEST(ResolveResolver, ExtractDiscriminator)
{
  ConfigRegistry fx;
  const HierarchyInfo info = fx.registry.info(fx.config);

  EXPECT_EQ(extract_discriminator(json{{"mode", "text"}}, info), str("text"));
  EXPECT_FALSE(extract_discriminator(json{{"text", "hi"}}, info).has_value());
  EXPECT_FALSE(extract_discriminator(json{{"mode", 3}}, info).has_value());
  EXPECT_FALSE(extract_discriminator(json{{"mode", nullptr}}, info).has_value());
  EXPECT_FALSE(extract_discriminator(json::array({"mode"}), info).has_value());
  EXPECT_FALSE(extract_discriminator(json("text"), info).has_value());
}

TEST(ResolveResolver, ExtractIntegerDiscriminator)
{
  Registry registry;
  const HierarchyInfo info =
    registry.info(registry.declare_hierarchy("Opcode", "op", DiscriminatorKind::Integer));

  EXPECT_EQ(extract_discriminator(json{{"op", 7}}, info), num(7));
  EXPECT_FALSE(extract_discriminator(json{{"op", "7"}}, info).has_value());
  EXPECT_FALSE(extract_discriminator(json{{"op", 7.5}}, info).has_value());
}

TEST(ResolveResolver, MissingDiscriminatorMessages)
{
  ConfigRegistry fx;
  const HierarchyInfo info = fx.registry.info(fx.config);

  const ValidationError absent = missing_discriminator_error(json{{"text", "hi"}}, info);
  EXPECT_EQ(absent.kind, ErrorKind::MissingDiscriminatorField);
  EXPECT_EQ(absent.discriminator_field, "mode");
  EXPECT_NE(absent.message.find("is missing"), std::string::npos);

  const ValidationError wrong = missing_discriminator_error(json{{"mode", 1}}, info);
  EXPECT_NE(wrong.message.find("is integer, expected string"), std::string::npos);

  const ValidationError not_object = missing_discriminator_error(json::array(), info);
  EXPECT_NE(not_object.message.find("payload is array"), std::string::npos);
}
