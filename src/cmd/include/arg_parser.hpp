#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "parse_error.hpp"

namespace ddc::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string description;
    };

    /**
     * @brief Minimal command line parser for `--name value` style options.
     */
    class ArgParser
    {
        public:
            void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description);

            /**
             * @brief Parses the command line. argv[0] is skipped.
             * 
             * @return Error on an unknown option, a missing value or a value of the wrong type.
             */
            parse::Result<void> parse(int argc, const char * const argv[]);

            /**
             * @brief Returns the parsed value.
             * 
             * Supported types: `bool` (flag present), `std::vector<int>`, `std::vector<std::string>`.
             * std::nullopt when the option was not given.
             */
            template<class T>
            std::optional<T> getArg(const std::string & name) const;

            std::string constructHelpMessage() const;

        private:
            std::vector<std::pair<std::string, CommandLineArgDef>> _defs;
            absl::flat_hash_map<std::string, std::vector<std::string>> _values;

            const CommandLineArgDef * _findDef(const std::string & name) const;
    };

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const;

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const;
}
