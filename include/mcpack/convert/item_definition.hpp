#pragma once

/// @file item_definition.hpp
/// @brief Legacy item definitions and their custom_model_data overrides

#include "fwd.hpp"
#include "resource_id.hpp"

#include <mcpack/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpack_convert {

/// One `{"predicate": {"custom_model_data": N}, "model": ...}` entry
struct PredicateOverride {
    std::int64_t value = 0;        ///< Custom model data discriminant
    ResourceIdentifier model;      ///< Model used when the value matches
    std::size_t index = 0;         ///< Position in the source overrides array
};

/// Override whose predicate carries keys besides custom_model_data
struct CompoundOverride {
    std::size_t index = 0;
    nlohmann::json entry;          ///< Verbatim override object
};

// =============================================================================
// ItemDefinition
// =============================================================================

/// Rendering rules of one item as declared by a legacy models/item/ file
class ItemDefinition {
public:
    /// Parse a legacy item model
    ///
    /// Errors:
    /// - AssetError::malformed for a non-integer value or a missing/invalid model
    /// - ConflictError::ambiguous_predicate when a value appears twice
    [[nodiscard]] static mcpack_core::Result<ItemDefinition> parse(
        const ResourceIdentifier& id,
        const std::string& source_path,
        const nlohmann::json& legacy);

    /// Model identifier of the legacy file ("ns:item/stick")
    [[nodiscard]] const ResourceIdentifier& id() const noexcept { return m_id; }

    [[nodiscard]] const std::string& source_path() const noexcept { return m_source_path; }

    /// Legacy declaration without its overrides
    [[nodiscard]] const nlohmann::json& base_model() const noexcept { return m_base; }

    /// Simple overrides in source order
    [[nodiscard]] const std::vector<PredicateOverride>& overrides() const noexcept { return m_overrides; }

    [[nodiscard]] const std::vector<CompoundOverride>& compound_overrides() const noexcept {
        return m_compound;
    }

    /// Item descriptor identifier ("ns:stick" for "ns:item/stick")
    [[nodiscard]] ResourceIdentifier item_id() const;

    /// Identifier of the generated variant for one value ("ns:item/stick_1001")
    [[nodiscard]] ResourceIdentifier variant_id(std::int64_t value) const;

    /// Location of an override for error messages ("path#overrides[2]")
    [[nodiscard]] std::string location(std::size_t index) const;

    /// Copy with the given overrides removed (by source index)
    [[nodiscard]] ItemDefinition without(const std::vector<std::size_t>& indices) const;

    /// Legacy JSON with the simple overrides rewritten to canonical form
    ///
    /// Compound overrides stay at their original positions.
    [[nodiscard]] nlohmann::json to_legacy_json() const;

private:
    ResourceIdentifier m_id;
    std::string m_source_path;
    nlohmann::json m_base;
    std::vector<PredicateOverride> m_overrides;
    std::vector<CompoundOverride> m_compound;
};

/// Parse a classified legacy asset and drop overrides whose model does not resolve
///
/// Malformed definitions and dangling overrides are recorded in the report;
/// a malformed definition yields nullopt. Conflicts are returned as errors.
[[nodiscard]] mcpack_core::Result<std::optional<ItemDefinition>> prepare_item_definition(
    const ClassifiedAsset& asset,
    const ReferenceResolver& resolver,
    ConversionReport& report);

} // namespace mcpack_convert
