// polyschema/catalog/catalog.hpp - YAML catalog of hierarchies and variants
//
// Declares hierarchies and untyped variants without C++ code:
//
//   settings:
//     log_level: info
//   hierarchies:
//     - name: Config
//       discriminator: mode
//       variants:
//         - name: text
//           value: text
//           fields:
//             text: string
//         - name: number
//           value: [number, num]
//           extra: forbid
//           fields:
//             number: number
//             precision: { type: integer, default: 2 }
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "polyschema/basic/logging.hpp"
#include "polyschema/core/discriminator.hpp"
#include "polyschema/core/type_descriptor.hpp"
#include "polyschema/registry/hierarchy_registry.hpp"
#include "polyschema/schema/object_schema.hpp"

namespace polyschema
{

// ============================================================================
// Catalog Structure
// ============================================================================

struct CatalogVariant
{
  std::string name;

  /// Discriminator value(s), in declaration order
  std::vector<DiscriminatorValue> values;

  /// Name of an earlier variant of the same hierarchy to inherit from
  std::optional<std::string> extends;

  std::optional<ExtraFields> extra;

  /// Own fields, in declaration order
  std::vector<FieldSpec> fields;
};

struct CatalogHierarchy
{
  std::string name;
  std::string discriminator;
  DiscriminatorKind kind = DiscriminatorKind::String;
  std::vector<CatalogVariant> variants;
};

struct CatalogSettings
{
  std::optional<LogLevel> log_level;
};

struct Catalog
{
  CatalogSettings settings;
  std::vector<CatalogHierarchy> hierarchies;

  /// File the catalog was loaded from (empty for parse_catalog)
  std::filesystem::path source;
};

// ============================================================================
// Catalog Loading Result
// ============================================================================

struct CatalogLoadResult
{
  /// Loaded catalog (only valid if success == true)
  Catalog catalog;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static CatalogLoadResult ok(Catalog c)
  {
    CatalogLoadResult r;
    r.catalog = std::move(c);
    r.success = true;
    return r;
  }

  static CatalogLoadResult fail(std::string msg)
  {
    CatalogLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Catalog API
// ============================================================================

/**
 * Load a catalog from a YAML file.
 *
 * @param catalog_path Path to polyschema.yaml
 * @return CatalogLoadResult with the catalog or an error naming the entry
 */
[[nodiscard]] CatalogLoadResult load_catalog(const std::filesystem::path & catalog_path);

/// Parse a catalog from YAML text
[[nodiscard]] CatalogLoadResult parse_catalog(std::string_view text);

/**
 * Declare the catalog's hierarchies and register its variants, in order.
 *
 * @return the registered descriptors, in catalog order
 * @throws the registration errors of Registry::declare_hierarchy and
 *         register_variant
 */
std::vector<TypeDescriptorPtr> apply_catalog(Registry & registry, const Catalog & catalog);

/**
 * Find a catalog by searching upward from a directory.
 *
 * @return Path to polyschema.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_catalog(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_catalog_file_name = "polyschema.yaml";

}  // namespace polyschema
