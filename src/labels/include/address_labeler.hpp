#pragma once

#include <optional>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <nlohmann/json_fwd.hpp>

#include "parse_error.hpp"

namespace ddc::labels
{
    /**
     * @brief Read-only table of known sender addresses, compared case-insensitively.
     */
    class AddressLabeler
    {
        public:
            AddressLabeler() = default;
            explicit AddressLabeler(const absl::flat_hash_map<std::string, std::string> & labels);

            /**
             * @brief Builds the table from a JSON object mapping addresses to labels.
             */
            static parse::Result<AddressLabeler> fromJson(const nlohmann::json & labels_json);

            std::optional<std::string> label(const std::string & address) const;

            std::size_t size() const;

        private:
            // keys are lowercase
            absl::flat_hash_map<std::string, std::string> _labels;
    };
}
