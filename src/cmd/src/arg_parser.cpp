#include "arg_parser.hpp"

#include <charconv>
#include <format>

namespace ddc::cmd
{
    namespace
    {
        std::optional<int> _parseInt(const std::string & value)
        {
            int out = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if(ec != std::errc{} || ptr != value.data() + value.size())
            {
                return std::nullopt;
            }
            return out;
        }
    }

    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description)
    {
        _defs.emplace_back(std::move(name), CommandLineArgDef{nargs, type, std::move(description)});
    }

    const CommandLineArgDef * ArgParser::_findDef(const std::string & name) const
    {
        for(const auto & [def_name, def] : _defs)
        {
            if(def_name == name)
            {
                return &def;
            }
        }
        return nullptr;
    }

    parse::Result<void> ArgParser::parse(int argc, const char * const argv[])
    {
        _values.clear();

        for(int i = 1; i < argc; ++i)
        {
            const std::string name = argv[i];
            const CommandLineArgDef * def = _findDef(name);
            if(def == nullptr)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, std::format("Unknown argument '{}'", name)});
            }

            auto & values = _values[name];

            if(def->nargs == CommandLineArgDef::NArgs::Zero)
            {
                continue;
            }

            std::size_t consumed = 0;
            while(i + 1 < argc)
            {
                const std::string value = argv[i + 1];
                if(value.starts_with("-") && _findDef(value) != nullptr)
                {
                    break;
                }

                if(def->type == CommandLineArgDef::Type::Int && !_parseInt(value))
                {
                    return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, std::format("Argument '{}' expects an integer, got '{}'", name, value)});
                }

                values.push_back(value);
                ++consumed;
                ++i;

                if(def->nargs == CommandLineArgDef::NArgs::One)
                {
                    break;
                }
            }

            if(consumed == 0)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::MISSING_FIELD, std::format("Argument '{}' expects a value", name)});
            }
        }

        return {};
    }

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const
    {
        if(!_values.contains(name))
        {
            return std::nullopt;
        }
        return true;
    }

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }

        std::vector<int> out;
        out.reserve(it->second.size());
        for(const auto & value : it->second)
        {
            const auto parsed = _parseInt(value);
            if(!parsed)
            {
                return std::nullopt;
            }
            out.push_back(*parsed);
        }
        return out;
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::string out = "Options:\n";
        for(const auto & [name, def] : _defs)
        {
            std::string value_hint;
            if(def.nargs != CommandLineArgDef::NArgs::Zero)
            {
                value_hint = (def.type == CommandLineArgDef::Type::Int) ? " <int>" : " <value>";
                if(def.nargs == CommandLineArgDef::NArgs::Many) value_hint += "...";
            }
            out += std::format("  {:<24} {}\n", name + value_hint, def.description);
        }
        return out;
    }
}
