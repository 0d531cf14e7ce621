/// @file cmd_converter.cpp
/// @brief Custom model data converter implementation

#include <mcpack/convert/cmd_converter.hpp>
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

} // anonymous namespace

CustomModelDataConverter::CustomModelDataConverter(const ConverterConfig& config)
    : m_config(config)
{
}

// =============================================================================
// Encoding
// =============================================================================

nlohmann::json CustomModelDataConverter::build_item_descriptor(
    const ItemDefinition& definition,
    DispatchEncoding encoding) {

    nlohmann::json dispatch;
    dispatch["property"] = "minecraft:custom_model_data";
    dispatch["index"] = 0;
    dispatch["fallback"] = model_node(definition.id());

    auto list = nlohmann::json::array();

    if (encoding == DispatchEncoding::Select) {
        dispatch["type"] = "minecraft:select";
        for (const auto& ov : definition.overrides()) {
            list.push_back(nlohmann::json{
                {"when", nlohmann::json::array({std::to_string(ov.value)})},
                {"model", model_node(ov.model)},
            });
        }
        dispatch["cases"] = std::move(list);
    } else {
        dispatch["type"] = "minecraft:range_dispatch";
        for (const auto& ov : definition.overrides()) {
            list.push_back(nlohmann::json{
                {"threshold", ov.value},
                {"model", model_node(ov.model)},
            });
        }
        dispatch["entries"] = std::move(list);
    }

    return nlohmann::json{{"model", std::move(dispatch)}};
}

// =============================================================================
// Conversion
// =============================================================================

mcpack_core::Result<void> CustomModelDataConverter::convert_definition(
    const ItemDefinition& definition,
    const ResourceTree& input,
    ResourceTree& output,
    ConversionReport& report) const {

    auto logger = mcpack_core::convert_logger();
    const auto encoding = m_config.encoding;

    if (encoding == DispatchEncoding::Predicate) {
        auto written = output.put_json(definition.source_path(), definition.to_legacy_json(),
                                       m_config.json_indent);
        if (!written) {
            return written;
        }
        ++report.files_rewritten;
        logger->debug("{}: {} overrides kept as predicates", definition.source_path(),
            definition.overrides().size() + definition.compound_overrides().size());
        return mcpack_core::Ok();
    }

    for (const auto& ov : definition.compound_overrides()) {
        logger->warn("{}: dropping override with compound predicate {}",
            definition.location(ov.index), ov.entry.value("predicate", nlohmann::json::object()).dump());
        report.add_issue(definition.source_path(),
            "compound predicate at overrides[" + std::to_string(ov.index) +
            "] cannot be expressed by " + dispatch_encoding_name(encoding));
        ++report.overrides_dropped;
    }

    const auto descriptor_path = asset_path(AssetKind::ItemDefinition, definition.item_id());
    if (input.contains(descriptor_path) || output.contains(descriptor_path)) {
        return mcpack_core::Err(mcpack_core::ConflictError::duplicate_variant(
            definition.item_id().to_string(), descriptor_path, definition.source_path()));
    }

    auto written = output.put_json(definition.source_path(), definition.base_model(), m_config.json_indent);
    if (!written) {
        return written;
    }
    written = output.put_json(descriptor_path, build_item_descriptor(definition, encoding),
                              m_config.json_indent);
    if (!written) {
        return written;
    }

    report.files_rewritten += 2;
    logger->debug("{} -> {} ({} {} entries)", definition.source_path(), descriptor_path,
        definition.overrides().size(), dispatch_encoding_name(encoding));
    return mcpack_core::Ok();
}

mcpack_core::Result<ResourceTree> CustomModelDataConverter::convert(
    const ResourceTree& input,
    ConversionReport& report) const {

    MCPACK_LOG_SCOPE("custom model data conversion");
    auto logger = mcpack_core::convert_logger();

    AssetClassifier classifier;
    auto classified = classifier.classify_tree(input, report);
    ReferenceResolver resolver(input, m_config.allow_vanilla_references);

    ResourceTree output = input;
    Checkpoint checkpoint(m_config, "Converting custom model data", classified.item_definitions.size());

    std::size_t converted = 0;
    for (const auto& asset : classified.item_definitions) {
        auto prepared = prepare_item_definition(asset, resolver, report);
        if (!prepared) {
            return mcpack_core::Err<ResourceTree>(prepared.error());
        }
        if (prepared->has_value()) {
            auto result = convert_definition(**prepared, input, output, report);
            if (!result) {
                return mcpack_core::Err<ResourceTree>(result.error());
            }
            ++converted;
        }

        auto step = checkpoint.advance();
        if (!step) {
            return mcpack_core::Err<ResourceTree>(step.error());
        }
    }

    report.files_copied += input.size() - converted;

    logger->info("Converted {} item definitions to {} ({} overrides dropped, {} issues)",
        converted, dispatch_encoding_name(m_config.encoding),
        report.overrides_dropped, report.issues.size());
    logger->info("Output requires Minecraft {} or newer",
        dispatch_encoding_min_version(m_config.encoding));

    return mcpack_core::Ok(std::move(output));
}

} // namespace mcpack_convert
