/// @file item_model_converter.cpp
/// @brief Item model converter implementation

#include <mcpack/convert/item_model_converter.hpp>
#include <mcpack/convert/classifier.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/convert/resolver.hpp>
#include <mcpack/core/log.hpp>

namespace mcpack_convert {

namespace {

nlohmann::json model_node(const ResourceIdentifier& model) {
    return nlohmann::json{
        {"type", "minecraft:model"},
        {"model", model.to_string()},
    };
}

void merge_missing_keys(nlohmann::json& variant, const nlohmann::json& base, const char* key) {
    auto from = base.find(key);
    if (from == base.end() || !from->is_object()) {
        return;
    }
    auto& into = variant[key];
    if (into.is_null()) {
        into = nlohmann::json::object();
    }
    if (!into.is_object()) {
        return;
    }
    for (auto it = from->begin(); it != from->end(); ++it) {
        if (!into.contains(it.key())) {
            into[it.key()] = *it;
        }
    }
}

} // anonymous namespace

void inherit_from_base(nlohmann::json& variant, const nlohmann::json& base) {
    if (!variant.contains("parent") && base.contains("parent")) {
        variant["parent"] = base["parent"];
    }
    merge_missing_keys(variant, base, "textures");
    merge_missing_keys(variant, base, "display");
}

// =============================================================================
// ItemModelConverter
// =============================================================================

ItemModelConverter::ItemModelConverter(const ConverterConfig& config, const ReferenceResolver& resolver)
    : m_config(config)
    , m_resolver(resolver)
{
}

mcpack_core::Result<std::vector<ModelVariant>> ItemModelConverter::build_variants(
    const ItemDefinition& definition,
    ConversionReport& report) const {

    auto logger = mcpack_core::convert_logger();
    std::vector<ModelVariant> variants;
    variants.reserve(definition.overrides().size() + 1);

    variants.push_back(ModelVariant{
        definition.id(),
        definition.base_model(),
        definition.source_path(),
        definition.source_path(),
        std::nullopt,
    });

    for (const auto& ov : definition.overrides()) {
        const auto where = definition.location(ov.index);

        auto resolved = m_resolver.resolve(ov.model, AssetKind::Model, where);
        if (!resolved) {
            logger->warn("Skipping override: {}", resolved.error().message());
            report.add_issue(definition.source_path(), resolved.error().message());
            ++report.overrides_dropped;
            continue;
        }

        nlohmann::json content;
        std::string origin;
        if (resolved->in_tree) {
            auto loaded = m_resolver.load_json(*resolved);
            if (!loaded || !loaded->is_object()) {
                auto message = loaded ? resolved->path + " is not a model object" : loaded.error().message();
                logger->warn("Skipping override {}: {}", where, message);
                report.add_issue(definition.source_path(), message);
                ++report.overrides_dropped;
                continue;
            }
            content = std::move(*loaded);
            content.erase("overrides");
            inherit_from_base(content, definition.base_model());
            origin = resolved->path;
        } else {
            content = nlohmann::json{{"parent", ov.model.to_string()}};
        }

        variants.push_back(ModelVariant{
            definition.variant_id(ov.value),
            std::move(content),
            where,
            std::move(origin),
            ov.value,
        });
    }

    for (const auto& ov : definition.compound_overrides()) {
        logger->warn("{}: dropping override with compound predicate", definition.location(ov.index));
        report.add_issue(definition.source_path(),
            "compound predicate at overrides[" + std::to_string(ov.index) + "] has no item model form");
        ++report.overrides_dropped;
    }

    return mcpack_core::Ok(std::move(variants));
}

nlohmann::json ItemModelConverter::build_root_descriptor(
    const ItemDefinition& definition,
    const std::vector<ModelVariant>& variants) {

    auto cases = nlohmann::json::array();
    for (const auto& variant : variants) {
        if (!variant.value) {
            continue;
        }
        cases.push_back(nlohmann::json{
            {"when", nlohmann::json::array({std::to_string(*variant.value)})},
            {"model", model_node(variant.id)},
        });
    }

    return nlohmann::json{
        {"model", {
            {"type", "minecraft:select"},
            {"property", "minecraft:custom_model_data"},
            {"index", 0},
            {"cases", std::move(cases)},
            {"fallback", model_node(definition.id())},
        }},
    };
}

nlohmann::json ItemModelConverter::build_variant_descriptor(const ModelVariant& variant) {
    return nlohmann::json{{"model", model_node(variant.id)}};
}

mcpack_core::Result<void> ItemModelConverter::claim(
    const std::string& path,
    const std::string& id,
    const std::string& source,
    const std::string& origin,
    std::map<std::string, std::string>& claimed) const {

    auto [it, inserted] = claimed.emplace(path, source);
    if (!inserted) {
        return mcpack_core::Err(mcpack_core::ConflictError::duplicate_variant(id, it->second, source));
    }
    if (path != origin && m_resolver.tree().contains(path)) {
        return mcpack_core::Err(mcpack_core::ConflictError::duplicate_variant(id, path, source));
    }
    return mcpack_core::Ok();
}

mcpack_core::Result<ResourceTree> ItemModelConverter::convert(ConversionReport& report) const {
    MCPACK_LOG_SCOPE("item model conversion");
    auto logger = mcpack_core::convert_logger();
    const auto& input = m_resolver.tree();

    AssetClassifier classifier;
    auto classified = classifier.classify_tree(input, report);

    ResourceTree output = input;
    std::map<std::string, std::string> claimed;
    Checkpoint checkpoint(m_config, "Generating item models", classified.item_definitions.size());

    std::size_t converted = 0;
    for (const auto& asset : classified.item_definitions) {
        auto prepared = prepare_item_definition(asset, m_resolver, report);
        if (!prepared) {
            return mcpack_core::Err<ResourceTree>(prepared.error());
        }

        if (prepared->has_value()) {
            const ItemDefinition& definition = **prepared;

            auto variants = build_variants(definition, report);
            if (!variants) {
                return mcpack_core::Err<ResourceTree>(variants.error());
            }

            // Claim every generated path before writing anything
            std::vector<std::pair<std::string, nlohmann::json>> files;
            for (const auto& variant : *variants) {
                auto claimed_path = claim(variant.path(), variant.id.to_string(), variant.source,
                                          variant.origin, claimed);
                if (!claimed_path) {
                    return mcpack_core::Err<ResourceTree>(claimed_path.error());
                }
                files.emplace_back(variant.path(), variant.content);
            }

            const auto root_id = definition.item_id();
            const auto root_path = asset_path(AssetKind::ItemDefinition, root_id);
            auto claimed_root = claim(root_path, root_id.to_string(), definition.source_path(), {}, claimed);
            if (!claimed_root) {
                return mcpack_core::Err<ResourceTree>(claimed_root.error());
            }
            files.emplace_back(root_path, build_root_descriptor(definition, *variants));

            if (m_config.emit_variant_item_models) {
                for (const auto& variant : *variants) {
                    if (!variant.value) {
                        continue;
                    }
                    const auto item_id = root_id.with_suffix("_" + std::to_string(*variant.value));
                    const auto item_path = asset_path(AssetKind::ItemDefinition, item_id);
                    auto claimed_item = claim(item_path, item_id.to_string(), variant.source, {}, claimed);
                    if (!claimed_item) {
                        return mcpack_core::Err<ResourceTree>(claimed_item.error());
                    }
                    files.emplace_back(item_path, build_variant_descriptor(variant));
                }
            }

            for (const auto& [path, json] : files) {
                auto written = output.put_json(path, json, m_config.json_indent);
                if (!written) {
                    return mcpack_core::Err<ResourceTree>(written.error());
                }
            }

            report.variants_generated += variants->size();
            report.files_rewritten += files.size() - variants->size() + 1;
            ++converted;

            logger->debug("{}: {} variants", definition.source_path(), variants->size());
        }

        auto step = checkpoint.advance();
        if (!step) {
            return mcpack_core::Err<ResourceTree>(step.error());
        }
    }

    report.files_copied += input.size() - converted;

    logger->info("Generated {} model variants from {} item definitions ({} overrides dropped)",
        report.variants_generated, converted, report.overrides_dropped);

    return mcpack_core::Ok(std::move(output));
}

} // namespace mcpack_convert
