// tests/unit/registry/test_concurrency.cpp - Concurrent registration and validation
//
#include <gtest/gtest.h>

#include <atomic>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "polyschema/core/errors.hpp"
#include "polyschema/dispatch/dispatcher.hpp"
#include "polyschema/registry/registration.hpp"
#include "polyschema/test_support/fixtures.hpp"

using namespace polyschema;
using namespace polyschema::test_support;

namespace
{

constexpr int k_threads = 16;

VariantDeclaration numbered_variant(int i)
{
  VariantDeclaration d;
  d.name = "Variant" + std::to_string(i);
  d.schema = ObjectSchema::builder()
               .literal("mode", str("v" + std::to_string(i)))
               .field("payload", FieldType::Integer)
               .build();
  return d;
}

}  // namespace

TEST(RegistryConcurrency, ParallelRegistrationThenParallelValidation)
{
  ConfigRegistry fx;

  std::vector<std::thread> writers;
  for (int i = 0; i < k_threads; ++i) {
    writers.emplace_back([&fx, i] { (void)fx.add(numbered_variant(i)); });
  }
  for (auto & t : writers) {
    t.join();
  }

  ASSERT_EQ(fx.registry.known_values(fx.config).size(), static_cast<size_t>(k_threads));
  ASSERT_EQ(fx.registry.descriptors(fx.config).size(), static_cast<size_t>(k_threads));

  const Dispatcher dispatcher(fx.registry);
  std::atomic<int> correct{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < k_threads; ++i) {
    readers.emplace_back([&dispatcher, &fx, &correct, i] {
      const nlohmann::json payload = {{"mode", "v" + std::to_string(i)}, {"payload", i}};
      const ValidationResult result = dispatcher.validate(fx.config, payload);
      if (
        result.success && result.value->descriptor->name() == "Variant" + std::to_string(i) &&
        result.value->fields.at("payload") == i) {
        ++correct;
      }
    });
  }
  for (auto & t : readers) {
    t.join();
  }

  EXPECT_EQ(correct.load(), k_threads);
}

TEST(RegistryConcurrency, RacingDuplicatesAdmitExactlyOne)
{
  ConfigRegistry fx;
  std::atomic<int> inserted{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> writers;
  for (int i = 0; i < k_threads; ++i) {
    writers.emplace_back([&, i] {
      VariantDeclaration d = text_variant();
      d.name = "Text" + std::to_string(i);
      try {
        (void)fx.add(std::move(d));
        ++inserted;
      } catch (const DuplicateDiscriminatorError &) {
        ++rejected;
      }
    });
  }
  for (auto & t : writers) {
    t.join();
  }

  EXPECT_EQ(inserted.load(), 1);
  EXPECT_EQ(rejected.load(), k_threads - 1);
  EXPECT_EQ(fx.registry.known_values(fx.config), strs({"text"}));
}

TEST(RegistryConcurrency, ReadersDuringWritesSeeConsistentSnapshots)
{
  ConfigRegistry fx;
  std::atomic<bool> done{false};
  std::atomic<int> inconsistent{0};

  std::thread reader([&] {
    while (!done.load()) {
      const auto snapshot = fx.registry.snapshot(fx.config);
      // Every value maps to a variant, and there is one value per variant.
      if (snapshot->known_values().size() != snapshot->size()) {
        ++inconsistent;
      }
      for (const auto & value : snapshot->known_values()) {
        if (snapshot->find(value) == nullptr) {
          ++inconsistent;
        }
      }
    }
  });

  std::vector<std::thread> writers;
  for (int i = 0; i < k_threads; ++i) {
    writers.emplace_back([&fx, i] { (void)fx.add(numbered_variant(i)); });
  }
  for (auto & t : writers) {
    t.join();
  }
  done = true;
  reader.join();

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_EQ(fx.registry.snapshot(fx.config)->size(), static_cast<size_t>(k_threads));
}
