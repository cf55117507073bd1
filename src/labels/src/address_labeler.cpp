#include "address_labeler.hpp"

#include <format>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace ddc::labels
{
    AddressLabeler::AddressLabeler(const absl::flat_hash_map<std::string, std::string> & labels)
    {
        _labels.reserve(labels.size());
        for(const auto & [address, label] : labels)
        {
            if(!utils::isAddress(address))
            {
                spdlog::warn("Address label key '{}' is not a 0x-prefixed 20 byte address", address);
            }
            _labels.insert_or_assign(utils::toLower(address), label);
        }
    }

    parse::Result<AddressLabeler> AddressLabeler::fromJson(const nlohmann::json & labels_json)
    {
        if(!labels_json.is_object())
        {
            return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, "Address labels must be a JSON object"});
        }

        absl::flat_hash_map<std::string, std::string> labels;
        for(const auto & [address, label] : labels_json.items())
        {
            if(!label.is_string())
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, std::format("Label for '{}' must be a string", address)});
            }
            labels.try_emplace(address, label.get<std::string>());
        }

        return AddressLabeler(labels);
    }

    std::optional<std::string> AddressLabeler::label(const std::string & address) const
    {
        const auto it = _labels.find(utils::toLower(address));
        if(it == _labels.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t AddressLabeler::size() const
    {
        return _labels.size();
    }
}
