#include "config.hpp"

#include <format>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "file.hpp"

namespace ddc::config
{
    using json = nlohmann::json;

    namespace
    {
        parse::Result<json> _loadJsonFile(const std::filesystem::path & path)
        {
            const auto content = file::loadTextFile(path);
            if(!content)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::IO_ERROR, std::format("Cannot read {}", path.string())});
            }

            try
            {
                return json::parse(*content);
            }
            catch(const json::exception & e)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, std::format("Invalid JSON in {}: {}", path.string(), e.what())});
            }
        }
    }

    Config makeDefaultConfig(const std::filesystem::path & bin_path)
    {
        Config cfg;
        cfg.bin_path = bin_path;
        cfg.logs_path = cfg.bin_path.parent_path() / "logs";
        cfg.resources_path = cfg.bin_path.parent_path() / "resources";

        cfg.abi_path = cfg.resources_path / "abi" / "deploy_token.json";
        cfg.labels_path = cfg.resources_path / "labels.json";
        cfg.legacy_layout_path = cfg.resources_path / "legacy_layout.json";
        return cfg;
    }

    parse::Result<abi::FunctionInterface> loadFunctionInterface(const std::filesystem::path & path, const std::string & function_name)
    {
        const auto abi_json = _loadJsonFile(path);
        if(!abi_json)
        {
            return std::unexpected(abi_json.error());
        }

        auto function_res = abi::parseFunctionInterface(*abi_json, function_name);
        if(function_res)
        {
            spdlog::debug("Loaded function interface {}", function_res->signature());
        }
        return function_res;
    }

    parse::Result<legacy::LegacyLayout> loadLegacyLayout(const std::filesystem::path & path)
    {
        const auto layout_json = _loadJsonFile(path);
        if(!layout_json)
        {
            return std::unexpected(layout_json.error());
        }
        return legacy::parseLegacyLayout(*layout_json);
    }

    parse::Result<labels::AddressLabeler> loadAddressLabels(const std::filesystem::path & path)
    {
        const auto labels_json = _loadJsonFile(path);
        if(!labels_json)
        {
            return std::unexpected(labels_json.error());
        }

        auto labeler_res = labels::AddressLabeler::fromJson(*labels_json);
        if(labeler_res)
        {
            spdlog::debug("Loaded {} address labels", labeler_res->size());
        }
        return labeler_res;
    }
}
