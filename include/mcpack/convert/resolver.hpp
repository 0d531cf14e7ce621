#pragma once

/// @file resolver.hpp
/// @brief Resource reference resolution
///
/// The ReferenceResolver performs:
/// - identifier -> tree path resolution (and the inverse)
/// - reference extraction from model and item descriptor JSON
/// - construction of the reverse reference index used by relocations
/// - output-side validation that every reference resolves

#include "fwd.hpp"
#include "resource_id.hpp"

#include <mcpack/core/error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpack_convert {

// =============================================================================
// Reference
// =============================================================================

/// One identifier string found inside a JSON asset
struct Reference {
    AssetKind kind;        ///< Kind of asset the string addresses
    std::string text;      ///< As written ("item/stick", "ns:item/x")
    std::string pointer;   ///< JSON pointer to the string within the file
};

/// Where a reference lands
struct ResolvedReference {
    AssetKey key;          ///< Normalized kind + identifier
    std::string path;      ///< Tree path for the asset
    bool in_tree = true;   ///< false for vanilla/builtin assets outside the pack
};

/// Collect every reference in a model or item descriptor
[[nodiscard]] std::vector<Reference> extract_references(const nlohmann::json& j, AssetKind file_kind);

/// Rewrite references in place
///
/// @param rewrite Returns the replacement text for a reference, or nullopt to keep it
/// @return Number of strings replaced
std::size_t rewrite_references(
    nlohmann::json& j,
    AssetKind file_kind,
    const std::function<std::optional<std::string>(const Reference&)>& rewrite);

// =============================================================================
// ReferenceIndex
// =============================================================================

/// Reverse reference graph: asset -> files that reference it
///
/// Built once per tree; relocations consult it instead of rescanning.
class ReferenceIndex {
public:
    /// Files referencing the asset (empty set if none)
    [[nodiscard]] const std::set<std::string>& dependents(const AssetKey& key) const;

    [[nodiscard]] bool is_referenced(const AssetKey& key) const {
        return m_dependents.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_dependents.size(); }

    void add(const AssetKey& key, const std::string& referrer) {
        m_dependents[key].insert(referrer);
    }

private:
    std::map<AssetKey, std::set<std::string>> m_dependents;
};

// =============================================================================
// ReferenceResolver
// =============================================================================

/// Resolves identifiers against one resource tree
///
/// The resolver borrows the tree; it must not outlive it.
class ReferenceResolver {
public:
    ReferenceResolver(const ResourceTree& tree, bool allow_vanilla_references);

    /// Resolve an identifier of the given kind
    ///
    /// @return The resolved reference, or ReferenceError::unresolved
    [[nodiscard]] mcpack_core::Result<ResolvedReference> resolve(
        const ResourceIdentifier& id,
        AssetKind kind,
        const std::string& referrer = {}) const;

    /// Parse then resolve an identifier string
    [[nodiscard]] mcpack_core::Result<ResolvedReference> resolve(
        std::string_view text,
        AssetKind kind,
        const std::string& referrer = {},
        std::string_view default_namespace = k_default_namespace) const;

    /// Kind and identifier of a path present in the tree
    [[nodiscard]] std::optional<AssetKey> identify(const std::string& path) const;

    /// Parsed JSON of a resolved in-tree reference
    [[nodiscard]] mcpack_core::Result<nlohmann::json> load_json(const ResolvedReference& ref) const;

    /// Build the reverse reference index over every JSON asset
    [[nodiscard]] ReferenceIndex build_index() const;

    /// Check that every reference of every JSON asset resolves
    ///
    /// Malformed JSON files are not inspected (they are reported elsewhere).
    /// @return Ok, or the first ReferenceError in path order
    [[nodiscard]] mcpack_core::Result<void> validate_tree() const;

    [[nodiscard]] const ResourceTree& tree() const noexcept { return m_tree; }

private:
    [[nodiscard]] bool is_external(const ResourceIdentifier& id, AssetKind kind) const;

    const ResourceTree& m_tree;
    bool m_allow_vanilla;
};

} // namespace mcpack_convert
