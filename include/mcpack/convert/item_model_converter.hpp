#pragma once

/// @file item_model_converter.hpp
/// @brief Custom model data overrides -> standalone item models
///
/// Each override becomes its own model variant plus (optionally) its own
/// items/ descriptor, so the variant can be addressed directly through the
/// item_model component. The root descriptor keeps custom_model_data working
/// through a select on the same values.

#include "fwd.hpp"
#include "item_definition.hpp"
#include "resource_id.hpp"
#include "resource_tree.hpp"

#include <mcpack/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpack_convert {

/// A generated standalone model
struct ModelVariant {
    ResourceIdentifier id;   ///< "ns:item/<name>" or "ns:item/<name>_<cmd>"
    nlohmann::json content;  ///< Model declaration, overrides removed
    std::string source;      ///< Location that produced it
    std::string origin;      ///< Tree path of the model it was derived from (empty if none)
    std::optional<std::int64_t> value;  ///< Discriminant, nullopt for the base variant

    [[nodiscard]] std::string path() const { return asset_path(AssetKind::Model, id); }
};

/// Apply base inheritance to a variant declaration
///
/// `parent` is taken as a whole when absent; `textures` and `display` are
/// merged key by key with the variant's own entries winning.
void inherit_from_base(nlohmann::json& variant, const nlohmann::json& base);

// =============================================================================
// ItemModelConverter
// =============================================================================

class ItemModelConverter {
public:
    ItemModelConverter(const ConverterConfig& config, const ReferenceResolver& resolver);

    /// Base variant plus one variant per resolvable override
    [[nodiscard]] mcpack_core::Result<std::vector<ModelVariant>> build_variants(
        const ItemDefinition& definition,
        ConversionReport& report) const;

    /// Root select descriptor for the definition
    [[nodiscard]] static nlohmann::json build_root_descriptor(
        const ItemDefinition& definition,
        const std::vector<ModelVariant>& variants);

    /// Descriptor addressing one variant directly
    [[nodiscard]] static nlohmann::json build_variant_descriptor(const ModelVariant& variant);

    /// Convert a whole tree
    [[nodiscard]] mcpack_core::Result<ResourceTree> convert(ConversionReport& report) const;

private:
    /// Claim an output path for a generated file
    ///
    /// Fails with DuplicateVariant when another source already generated the
    /// path, or when an unrelated input file occupies it.
    [[nodiscard]] mcpack_core::Result<void> claim(
        const std::string& path,
        const std::string& id,
        const std::string& source,
        const std::string& origin,
        std::map<std::string, std::string>& claimed) const;

    const ConverterConfig& m_config;
    const ReferenceResolver& m_resolver;
};

} // namespace mcpack_convert
