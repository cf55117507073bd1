#pragma once

#include <filesystem>
#include <string>

#include "abi_type.hpp"
#include "address_labeler.hpp"
#include "legacy_decoder.hpp"
#include "parse_error.hpp"

namespace ddc::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
        std::filesystem::path resources_path;

        std::filesystem::path abi_path;
        std::filesystem::path labels_path;
        std::filesystem::path legacy_layout_path;

        std::string function_name = "deployToken";
    };

    /**
     * @brief Default paths relative to the directory holding the executable.
     */
    Config makeDefaultConfig(const std::filesystem::path & bin_path);

    parse::Result<abi::FunctionInterface> loadFunctionInterface(const std::filesystem::path & path, const std::string & function_name);

    parse::Result<legacy::LegacyLayout> loadLegacyLayout(const std::filesystem::path & path);

    parse::Result<labels::AddressLabeler> loadAddressLabels(const std::filesystem::path & path);
}
