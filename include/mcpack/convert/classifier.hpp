#pragma once

/// @file classifier.hpp
/// @brief Asset classification for conversion input trees
///
/// Splits a tree into legacy item definitions (item models carrying
/// custom_model_data overrides), plain models and modern item descriptors.
/// Everything else (textures, .mcmeta, stray JSON) is skipped, not an error;
/// a .json file that fails to parse is reported per file.

#include "fwd.hpp"
#include "resource_id.hpp"
#include "report.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mcpack_convert {

/// Get class name
[[nodiscard]] const char* asset_class_name(AssetClass cls);

/// One classified JSON asset
struct ClassifiedAsset {
    std::string path;     ///< Relative tree path
    AssetKey key;         ///< Kind and identifier derived from the path
    nlohmann::json json;  ///< Parsed content
};

/// Result of classifying a whole tree; the sequences are disjoint
struct ClassifiedTree {
    std::vector<ClassifiedAsset> item_definitions;  ///< Legacy, to convert
    std::vector<ClassifiedAsset> models;
    std::vector<ClassifiedAsset> modern_items;
    std::vector<std::string> skipped;
    std::vector<AssetIssue> malformed;

    [[nodiscard]] std::size_t total() const noexcept {
        return item_definitions.size() + models.size() + modern_items.size() +
               skipped.size() + malformed.size();
    }
};

// =============================================================================
// AssetClassifier
// =============================================================================

class AssetClassifier {
public:
    /// Classify a single file
    ///
    /// @param path Relative tree path
    /// @param bytes File content
    /// @param out_json Receives parsed JSON for JSON asset classes (may be null)
    /// @param out_error Receives the parse message for Malformed (may be null)
    [[nodiscard]] AssetClass classify(
        const std::string& path,
        const std::string& bytes,
        nlohmann::json* out_json = nullptr,
        std::string* out_error = nullptr) const;

    /// Classify every file of a tree in path order
    ///
    /// Updates files_scanned, files_skipped and issues of the report.
    [[nodiscard]] ClassifiedTree classify_tree(
        const ResourceTree& tree,
        ConversionReport& report) const;

    /// JSON object with an overrides array holding a custom_model_data predicate
    [[nodiscard]] static bool has_custom_model_data_overrides(const nlohmann::json& j);

    /// JSON object whose "model" member is an object (items/ descriptor shape)
    [[nodiscard]] static bool is_item_descriptor_shape(const nlohmann::json& j);
};

} // namespace mcpack_convert
