#pragma once

/// @file resource_id.hpp
/// @brief namespace:path resource identifiers and their asset paths
///
/// Identifiers follow the game's addressing rules:
/// - a bare path implies the `minecraft` namespace
/// - namespaces use [a-z0-9_.-], paths additionally allow '/'
/// - each asset kind maps to a fixed directory and extension

#include "fwd.hpp"
#include <mcpack/core/error.hpp>

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace mcpack_convert {

/// Namespace used when an identifier omits one
inline constexpr const char* k_default_namespace = "minecraft";

// =============================================================================
// ResourceIdentifier
// =============================================================================

/// A (namespace, path) pair uniquely addressing an asset
struct ResourceIdentifier {
    std::string ns;
    std::string path;

    /// Parse "ns:path" or "path" (namespace defaults to minecraft)
    [[nodiscard]] static mcpack_core::Result<ResourceIdentifier> parse(
        std::string_view text,
        std::string_view default_namespace = k_default_namespace);

    /// Check namespace and path characters
    [[nodiscard]] static bool is_valid_namespace(std::string_view ns);
    [[nodiscard]] static bool is_valid_path(std::string_view path);

    /// Format as "ns:path"
    [[nodiscard]] std::string to_string() const { return ns + ":" + path; }

    /// Identifier with a suffix appended to the path
    [[nodiscard]] ResourceIdentifier with_suffix(const std::string& suffix) const {
        return ResourceIdentifier{ns, path + suffix};
    }

    auto operator<=>(const ResourceIdentifier&) const = default;
};

// =============================================================================
// AssetKey
// =============================================================================

/// Identifier qualified by the kind of asset it addresses
struct AssetKey {
    AssetKind kind = AssetKind::Model;
    ResourceIdentifier id;

    /// Relative tree path of this asset
    [[nodiscard]] std::string to_path() const;

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const AssetKey&) const = default;
};

/// Get asset kind name
[[nodiscard]] const char* asset_kind_name(AssetKind kind);

/// Relative tree path for an identifier of the given kind
[[nodiscard]] std::string asset_path(AssetKind kind, const ResourceIdentifier& id);

/// Inverse of asset_path; nullopt for paths outside the asset layout
[[nodiscard]] std::optional<AssetKey> identify_path(std::string_view relative_path);

/// Built-in parents the game resolves internally ("builtin/generated")
[[nodiscard]] bool is_builtin_model(const ResourceIdentifier& id);

} // namespace mcpack_convert
