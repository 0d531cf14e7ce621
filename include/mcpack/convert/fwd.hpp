#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mcpack_convert module

#include <cstdint>

namespace mcpack_convert {

// =============================================================================
// Addressing
// =============================================================================

/// Kind of asset an identifier points at
enum class AssetKind : std::uint8_t {
    Model,           ///< assets/<ns>/models/<path>.json
    Texture,         ///< assets/<ns>/textures/<path>.png
    ItemDefinition,  ///< assets/<ns>/items/<path>.json
};

struct ResourceIdentifier;
struct AssetKey;

// =============================================================================
// Trees and Classification
// =============================================================================

class ResourceTree;

/// Classification of a single file in an input tree
enum class AssetClass : std::uint8_t {
    LegacyItemDefinition,  ///< Model with custom_model_data overrides
    Model,                 ///< Any other block/item model
    ItemDefinition,        ///< Modern items/ descriptor
    Skipped,               ///< Texture, metadata, non-asset JSON
    Malformed,             ///< .json that failed to parse
};

struct ClassifiedAsset;
struct ClassifiedTree;
class AssetClassifier;

// =============================================================================
// References
// =============================================================================

struct Reference;
struct ResolvedReference;
class ReferenceIndex;
class ReferenceResolver;

// =============================================================================
// Conversion
// =============================================================================

/// Target encoding for custom model data dispatch
enum class DispatchEncoding : std::uint8_t {
    Predicate,      ///< 1.14 - 1.21.3 predicate overrides (direct value)
    Select,         ///< 1.21.4+ select cases (wrapped list)
    RangeDispatch,  ///< 1.21.4+ range_dispatch entries (threshold)
};

struct PredicateOverride;
struct CompoundOverride;
class ItemDefinition;
struct ModelVariant;
struct ConversionReport;
class ProgressSink;
class CancellationToken;
struct ConverterConfig;

class CustomModelDataConverter;
class ItemModelConverter;
class FolderStructureNormalizer;
class ArchiveBuilder;
struct ArchiveSummary;

} // namespace mcpack_convert
