#pragma once

/// @file convert.hpp
/// @brief Main include file for mcpack_convert module
///
/// # Conversion Overview
///
/// A run moves a resource pack from custom_model_data predicate overrides
/// to the item model / components scheme:
///
/// | Stage | Class | Output |
/// |-------|-------|--------|
/// | Classify | AssetClassifier | legacy definitions, models, descriptors |
/// | Convert (cmd) | CustomModelDataConverter | overrides in the chosen DispatchEncoding |
/// | Convert (item-model) | ItemModelConverter | one model + descriptor per override |
/// | Normalize (cmd only) | FolderStructureNormalizer | 1.21.4 folder layout |
/// | Archive | ArchiveBuilder | deterministic ZIP |
///
/// # Basic Usage
///
/// ```cpp
/// #include <mcpack/convert/convert.hpp>
///
/// using namespace mcpack_convert;
///
/// ConverterConfig config;
/// config.encoding = DispatchEncoding::Select;
///
/// PipelineRequest request;
/// request.mode = ConversionMode::CustomModelData;
/// request.input = "packs/legacy";
/// request.destination = "out/" + default_archive_name(std::time(nullptr));
///
/// auto result = run_pipeline(request, config);
/// if (!result) {
///     MCPACK_LOG_ERROR("{}", mcpack_core::build_error_chain(result.error()));
/// }
/// ```

#include "fwd.hpp"
#include "resource_id.hpp"
#include "resource_tree.hpp"
#include "report.hpp"
#include "config.hpp"
#include "classifier.hpp"
#include "resolver.hpp"
#include "item_definition.hpp"
#include "cmd_converter.hpp"
#include "item_model_converter.hpp"
#include "normalizer.hpp"
#include "archive.hpp"
#include "converter.hpp"
