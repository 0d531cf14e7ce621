/// @file normalizer.cpp
/// @brief Folder-structure normalizer implementation

#include <mcpack/convert/normalizer.hpp>
#include <mcpack/convert/classifier.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/convert/resolver.hpp>
#include <mcpack/core/log.hpp>

#include <map>
#include <set>

namespace mcpack_convert {

namespace {

constexpr std::string_view k_item_prefix = "item/";
constexpr std::string_view k_block_prefix = "block/";

bool starts_with(const std::string& text, std::string_view prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

const char* relocation_rule_name(RelocationRule rule) {
    switch (rule) {
        case RelocationRule::ItemDefinitionToItems: return "item definition -> items/";
        case RelocationRule::ReferencedModelToItem: return "referenced model -> models/item/";
        default: return "unknown";
    }
}

FolderStructureNormalizer::FolderStructureNormalizer(const ConverterConfig& config)
    : m_config(config)
{
}

// =============================================================================
// Planning
// =============================================================================

std::vector<Relocation> FolderStructureNormalizer::plan(const ResourceTree& tree) const {
    std::vector<Relocation> moves;
    if (!uses_item_descriptors(m_config.encoding)) {
        return moves;
    }

    // Descriptors already in items/ plus those still under models/item/
    std::vector<std::pair<AssetKey, nlohmann::json>> descriptors;

    for (const auto& [path, bytes] : tree.entries()) {
        auto key = identify_path(path);
        if (!key || key->kind == AssetKind::Texture) {
            continue;
        }
        auto json = parse_json(bytes, path);
        if (!json || !AssetClassifier::is_item_descriptor_shape(*json)) {
            continue;
        }

        if (key->kind == AssetKind::Model) {
            if (!starts_with(key->id.path, k_item_prefix)) {
                continue;
            }
            AssetKey to{AssetKind::ItemDefinition,
                ResourceIdentifier{key->id.ns, key->id.path.substr(k_item_prefix.size())}};
            moves.push_back(Relocation{RelocationRule::ItemDefinitionToItems, *key, std::move(to)});
        }
        descriptors.emplace_back(std::move(*key), std::move(*json));
    }

    std::set<AssetKey> planned;
    for (const auto& [key, json] : descriptors) {
        for (const auto& ref : extract_references(json, AssetKind::ItemDefinition)) {
            auto id = ResourceIdentifier::parse(ref.text);
            if (!id) {
                continue;
            }
            if (starts_with(id->path, k_item_prefix) || starts_with(id->path, k_block_prefix)) {
                continue;
            }
            AssetKey from{AssetKind::Model, *id};
            if (!tree.contains(from.to_path()) || !planned.insert(from).second) {
                continue;
            }
            AssetKey to{AssetKind::Model,
                ResourceIdentifier{id->ns, std::string(k_item_prefix) + id->path}};
            moves.push_back(Relocation{RelocationRule::ReferencedModelToItem, std::move(from), std::move(to)});
        }
    }

    return moves;
}

// =============================================================================
// Applying
// =============================================================================

mcpack_core::Result<void> FolderStructureNormalizer::apply(
    ResourceTree& tree,
    const std::vector<Relocation>& moves,
    ConversionReport& report) const {

    auto logger = mcpack_core::convert_logger();

    // Dependents are looked up on the tree as it was before any move
    ReferenceResolver resolver(tree, m_config.allow_vanilla_references);
    const auto index = resolver.build_index();

    std::map<std::string, std::string> moved_paths;
    std::map<ResourceIdentifier, ResourceIdentifier> moved_models;
    for (const auto& move : moves) {
        moved_paths.emplace(move.from.to_path(), move.to.to_path());
        if (move.from.kind == AssetKind::Model && move.to.kind == AssetKind::Model) {
            moved_models.emplace(move.from.id, move.to.id);
        }
    }

    std::set<std::string> referrers;
    for (const auto& move : moves) {
        for (const auto& referrer : index.dependents(move.from)) {
            auto it = moved_paths.find(referrer);
            referrers.insert(it != moved_paths.end() ? it->second : referrer);
        }
    }

    // Vacate every source, then fill every target
    std::vector<std::pair<const Relocation*, std::string>> staged;
    staged.reserve(moves.size());
    for (const auto& move : moves) {
        const std::string* bytes = tree.find(move.from.to_path());
        if (!bytes) {
            return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::NotFound,
                "No such file in tree: " + move.from.to_path()));
        }
        staged.emplace_back(&move, *bytes);
    }
    for (const auto& move : moves) {
        tree.remove(move.from.to_path());
    }

    Checkpoint checkpoint(m_config, "Relocating files", staged.size());
    for (auto& [move, bytes] : staged) {
        const auto target = move->to.to_path();
        if (tree.contains(target)) {
            return mcpack_core::Err(mcpack_core::ConflictError::path_collision(
                target, target, move->from.to_path()));
        }
        auto put = tree.put(target, std::move(bytes));
        if (!put) {
            return put;
        }
        ++report.files_relocated;
        logger->debug("{} -> {} ({})", move->from.to_path(), target, relocation_rule_name(move->rule));

        auto step = checkpoint.advance();
        if (!step) {
            return step;
        }
    }

    for (const auto& path : referrers) {
        auto key = identify_path(path);
        if (!key) {
            continue;
        }
        auto json = tree.read_json(path);
        if (!json) {
            continue;
        }

        auto rewritten = rewrite_references(*json, key->kind,
            [&](const Reference& ref) -> std::optional<std::string> {
                if (ref.kind != AssetKind::Model) {
                    return std::nullopt;
                }
                auto id = ResourceIdentifier::parse(ref.text);
                if (!id) {
                    return std::nullopt;
                }
                auto it = moved_models.find(*id);
                if (it == moved_models.end()) {
                    return std::nullopt;
                }
                return it->second.to_string();
            });

        if (rewritten > 0) {
            auto put = tree.put_json(path, *json, m_config.json_indent);
            if (!put) {
                return put;
            }
            report.references_rewritten += rewritten;
        }
    }

    return mcpack_core::Ok();
}

mcpack_core::Result<ResourceTree> FolderStructureNormalizer::normalize(
    const ResourceTree& tree,
    ConversionReport& report) const {

    MCPACK_LOG_SCOPE("folder structure normalization");
    auto logger = mcpack_core::convert_logger();

    report.files_scanned += tree.size();
    ResourceTree result = tree;

    const auto moves = plan(tree);
    if (!moves.empty()) {
        auto applied = apply(result, moves, report);
        if (!applied) {
            return mcpack_core::Err<ResourceTree>(applied.error());
        }
    }

    ReferenceResolver resolver(result, m_config.allow_vanilla_references);
    auto valid = resolver.validate_tree();
    if (!valid) {
        return mcpack_core::Err<ResourceTree>(valid.error());
    }

    logger->info("Normalized layout for {}: {} files relocated, {} references rewritten",
        dispatch_encoding_name(m_config.encoding), report.files_relocated, report.references_rewritten);

    return mcpack_core::Ok(std::move(result));
}

mcpack_core::Result<void> FolderStructureNormalizer::normalize_directory(
    const std::filesystem::path& root,
    ConversionReport& report) const {

    auto previous = ResourceTree::load(root, m_config);
    if (!previous) {
        return mcpack_core::Err(previous.error());
    }

    auto normalized = normalize(*previous, report);
    if (!normalized) {
        return mcpack_core::Err(normalized.error());
    }

    auto synced = normalized->sync_to(root, *previous, m_config);
    if (!synced) {
        return mcpack_core::Err(synced.error());
    }

    mcpack_core::convert_logger()->debug("Removed {} stale files under {}", *synced, root.string());
    return mcpack_core::Ok();
}

} // namespace mcpack_convert
