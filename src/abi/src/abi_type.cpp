#include "abi_type.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>

#include <nlohmann/json.hpp>

#ifdef interface
    #undef interface
#endif
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace ddc::abi
{
    using json = nlohmann::json;

    namespace
    {
        std::optional<std::size_t> _parseSize(std::string_view digits)
        {
            if(digits.empty())
            {
                return std::nullopt;
            }

            std::size_t value = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if(ec != std::errc{} || ptr != digits.data() + digits.size())
            {
                return std::nullopt;
            }
            return value;
        }

        parse::Result<ParamType> _parseIntegerType(ParamType::Kind kind, std::string_view width_str, const std::string & type)
        {
            std::size_t bits = 256;
            if(!width_str.empty())
            {
                const auto width = _parseSize(width_str);
                if(!width || *width == 0 || *width > 256 || (*width % 8) != 0)
                {
                    return std::unexpected(parse::ParseError{parse::ParseError::Kind::OUT_OF_RANGE, std::format("Invalid integer width in '{}'", type)});
                }
                bits = *width;
            }

            ParamType out;
            out.kind = kind;
            out.size = bits;
            return out;
        }

        parse::Result<std::vector<Param>> _parseParams(const json & params)
        {
            if(!params.is_array())
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, "ABI parameter list is not an array"});
            }

            std::vector<Param> out;
            out.reserve(params.size());

            for(const auto & param : params)
            {
                if(!param.is_object() || !param.contains("type") || !param["type"].is_string())
                {
                    return std::unexpected(parse::ParseError{parse::ParseError::Kind::MISSING_FIELD, "ABI parameter without a type"});
                }

                const json components = param.contains("components") ? param["components"] : json::array();
                auto type_res = parseParamType(param["type"].get<std::string>(), components);
                if(!type_res)
                {
                    return std::unexpected(type_res.error());
                }

                std::string name;
                if(param.contains("name") && param["name"].is_string())
                {
                    name = param["name"].get<std::string>();
                }

                out.push_back(Param{std::move(name), std::move(*type_res)});
            }

            return out;
        }

        const json * _findFunctionEntry(const json & entries, const std::string & function_name)
        {
            if(entries.is_object())
            {
                return (entries.value("name", "") == function_name) ? &entries : nullptr;
            }

            if(!entries.is_array())
            {
                return nullptr;
            }

            for(const auto & entry : entries)
            {
                if(!entry.is_object())
                {
                    continue;
                }

                if(entry.value("type", "function") != "function")
                {
                    continue;
                }

                if(entry.value("name", "") == function_name)
                {
                    return &entry;
                }
            }
            return nullptr;
        }
    }

    bool ParamType::isDynamic() const
    {
        switch(kind)
        {
            case Kind::STRING:
            case Kind::BYTES:
            case Kind::ARRAY:
                return true;

            case Kind::TUPLE:
                return std::ranges::any_of(components, [](const Param & p) { return p.type.isDynamic(); });

            case Kind::FIXED_ARRAY:
                return !element.empty() && element.front().isDynamic();

            default:
                return false;
        }
    }

    std::size_t ParamType::headSize() const
    {
        if(isDynamic())
        {
            return 32;
        }

        if(kind == Kind::TUPLE)
        {
            std::size_t total = 0;
            for(const Param & p : components)
            {
                total += p.type.headSize();
            }
            return total;
        }

        if(kind == Kind::FIXED_ARRAY)
        {
            return size * elementType().headSize();
        }

        return 32;
    }

    std::string ParamType::canonical() const
    {
        switch(kind)
        {
            case Kind::ADDRESS: return "address";
            case Kind::BOOL: return "bool";
            case Kind::UINT: return std::format("uint{}", size);
            case Kind::INT: return std::format("int{}", size);
            case Kind::FIXED_BYTES: return std::format("bytes{}", size);
            case Kind::BYTES: return "bytes";
            case Kind::STRING: return "string";

            case Kind::TUPLE:
            {
                std::string out = "(";
                for(std::size_t i = 0; i < components.size(); ++i)
                {
                    if(i > 0) out += ",";
                    out += components[i].type.canonical();
                }
                out += ")";
                return out;
            }

            case Kind::ARRAY: return elementType().canonical() + "[]";
            case Kind::FIXED_ARRAY: return std::format("{}[{}]", elementType().canonical(), size);

            default: return "unknown";
        }
    }

    const ParamType & ParamType::elementType() const
    {
        // array types are only built by parseParamType, which always sets the element
        return element.front();
    }

    std::string FunctionInterface::signature() const
    {
        std::string out = name + "(";
        for(std::size_t i = 0; i < inputs.size(); ++i)
        {
            if(i > 0) out += ",";
            out += inputs[i].type.canonical();
        }
        out += ")";
        return out;
    }

    parse::Result<ParamType> parseParamType(const std::string & type, const json & components)
    {
        if(!type.empty() && type.back() == ']')
        {
            const auto open = type.rfind('[');
            if(open == std::string::npos || open == 0)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, std::format("Malformed array type '{}'", type)});
            }

            auto element_res = parseParamType(type.substr(0, open), components);
            if(!element_res)
            {
                return std::unexpected(element_res.error());
            }

            ParamType out;
            const std::string_view dim = std::string_view(type).substr(open + 1, type.size() - open - 2);
            if(dim.empty())
            {
                out.kind = ParamType::Kind::ARRAY;
            }
            else
            {
                const auto length = _parseSize(dim);
                if(!length || *length == 0)
                {
                    return std::unexpected(parse::ParseError{parse::ParseError::Kind::OUT_OF_RANGE, std::format("Invalid array length in '{}'", type)});
                }
                out.kind = ParamType::Kind::FIXED_ARRAY;
                out.size = *length;
            }
            out.element.push_back(std::move(*element_res));
            return out;
        }

        if(type == "tuple")
        {
            auto components_res = _parseParams(components);
            if(!components_res)
            {
                return std::unexpected(components_res.error());
            }

            ParamType out;
            out.kind = ParamType::Kind::TUPLE;
            out.components = std::move(*components_res);
            return out;
        }

        if(type == "address") return ParamType{.kind = ParamType::Kind::ADDRESS};
        if(type == "bool") return ParamType{.kind = ParamType::Kind::BOOL};
        if(type == "string") return ParamType{.kind = ParamType::Kind::STRING};
        if(type == "bytes") return ParamType{.kind = ParamType::Kind::BYTES};

        if(type.starts_with("uint"))
        {
            return _parseIntegerType(ParamType::Kind::UINT, std::string_view(type).substr(4), type);
        }

        if(type.starts_with("int"))
        {
            return _parseIntegerType(ParamType::Kind::INT, std::string_view(type).substr(3), type);
        }

        if(type.starts_with("bytes"))
        {
            const auto length = _parseSize(std::string_view(type).substr(5));
            if(!length || *length == 0 || *length > 32)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::OUT_OF_RANGE, std::format("Invalid fixed bytes size in '{}'", type)});
            }
            return ParamType{.kind = ParamType::Kind::FIXED_BYTES, .size = *length};
        }

        return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, std::format("Unsupported ABI type '{}'", type)});
    }

    parse::Result<FunctionInterface> parseFunctionInterface(const json & abi_json, const std::string & function_name)
    {
        try
        {
            FunctionInterface out;
            out.name = function_name;

            const json * entries = &abi_json;

            if(abi_json.is_object() && abi_json.contains("abi"))
            {
                out.name = abi_json.value("function", function_name);
                entries = &abi_json["abi"];

                if(abi_json.contains("selector"))
                {
                    if(!abi_json["selector"].is_string())
                    {
                        return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, "Selector must be a hex string"});
                    }

                    const auto selector_bytes = evmc::from_hex(abi_json["selector"].get<std::string>());
                    if(!selector_bytes || selector_bytes->size() != 4)
                    {
                        return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, "Selector must be exactly 4 bytes"});
                    }

                    std::array<std::uint8_t, 4> selector{};
                    std::memcpy(selector.data(), selector_bytes->data(), 4);
                    out.selector = selector;
                }
            }

            const json * entry = _findFunctionEntry(*entries, out.name);
            if(entry == nullptr)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::MISSING_FIELD, std::format("Function '{}' not found in ABI", out.name)});
            }

            auto inputs_res = _parseParams(entry->contains("inputs") ? (*entry)["inputs"] : json::array());
            if(!inputs_res)
            {
                return std::unexpected(inputs_res.error());
            }

            out.inputs = std::move(*inputs_res);
            return out;
        }
        catch(const json::exception & e)
        {
            return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, e.what()});
        }
    }
}
