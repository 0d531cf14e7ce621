#pragma once

/// @file cmd_converter.hpp
/// @brief Custom model data overrides -> target dispatch encoding
///
/// The converter rewrites each legacy item definition into the configured
/// DispatchEncoding. Override order and the fallback model are preserved;
/// the models the overrides point at are left where they are.

#include "fwd.hpp"
#include "item_definition.hpp"
#include "resource_tree.hpp"

#include <mcpack/core/error.hpp>

#include <nlohmann/json.hpp>

namespace mcpack_convert {

class CustomModelDataConverter {
public:
    explicit CustomModelDataConverter(const ConverterConfig& config);

    /// Convert a whole tree
    ///
    /// Every input file is carried into the result; legacy item definitions
    /// are rewritten and, for component encodings, gain an items/ descriptor.
    [[nodiscard]] mcpack_core::Result<ResourceTree> convert(
        const ResourceTree& input,
        ConversionReport& report) const;

    /// Write one definition into the output tree
    [[nodiscard]] mcpack_core::Result<void> convert_definition(
        const ItemDefinition& definition,
        const ResourceTree& input,
        ResourceTree& output,
        ConversionReport& report) const;

    /// items/ descriptor for Select or RangeDispatch
    ///
    /// Compound overrides are not representable and are left out.
    [[nodiscard]] static nlohmann::json build_item_descriptor(
        const ItemDefinition& definition,
        DispatchEncoding encoding);

private:
    const ConverterConfig& m_config;
};

} // namespace mcpack_convert
