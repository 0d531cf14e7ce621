#pragma once

/// @file normalizer.hpp
/// @brief Folder layout normalization after custom model data conversion
///
/// Relocations follow a layout table selected by the dispatch encoding.
/// All moves and reference rewrites are computed in memory on a copy of the
/// tree; the caller decides when (and whether) the result reaches disk.

#include "fwd.hpp"
#include "resource_id.hpp"
#include "resource_tree.hpp"

#include <mcpack/core/error.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mcpack_convert {

/// Which rule of the layout table produced a move
enum class RelocationRule : std::uint8_t {
    ItemDefinitionToItems,   ///< models/item/<p>.json descriptor -> items/<p>.json
    ReferencedModelToItem,   ///< models/<p>.json -> models/item/<p>.json
};

/// Get rule name
[[nodiscard]] const char* relocation_rule_name(RelocationRule rule);

/// One planned file move
struct Relocation {
    RelocationRule rule;
    AssetKey from;
    AssetKey to;
};

// =============================================================================
// FolderStructureNormalizer
// =============================================================================

class FolderStructureNormalizer {
public:
    explicit FolderStructureNormalizer(const ConverterConfig& config);

    /// Moves required for the tree under the configured layout
    ///
    /// Empty for the Predicate layout and for already normalized trees.
    [[nodiscard]] std::vector<Relocation> plan(const ResourceTree& tree) const;

    /// Apply the layout to a copy of the tree, rewriting every referrer
    ///
    /// Fails with ConflictError::PathCollision when a target is occupied and
    /// with ReferenceError when the result does not validate.
    [[nodiscard]] mcpack_core::Result<ResourceTree> normalize(
        const ResourceTree& tree,
        ConversionReport& report) const;

    /// Normalize a directory in place
    [[nodiscard]] mcpack_core::Result<void> normalize_directory(
        const std::filesystem::path& root,
        ConversionReport& report) const;

private:
    [[nodiscard]] mcpack_core::Result<void> apply(
        ResourceTree& tree,
        const std::vector<Relocation>& moves,
        ConversionReport& report) const;

    const ConverterConfig& m_config;
};

} // namespace mcpack_convert
