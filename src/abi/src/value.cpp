#include "value.hpp"

#include <format>

#ifdef interface
    #undef interface
#endif
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "math.hpp"

namespace ddc::abi
{
    const Value * Struct::find(const std::string & name) const
    {
        for(std::size_t i = 0; i < names.size() && i < values.size(); ++i)
        {
            if(names[i] == name)
            {
                return &values[i];
            }
        }
        return nullptr;
    }

    void Struct::set(std::string name, Value value)
    {
        for(std::size_t i = 0; i < names.size(); ++i)
        {
            if(names[i] == name)
            {
                values[i] = std::move(value);
                return;
            }
        }
        names.push_back(std::move(name));
        values.push_back(std::move(value));
    }

    std::optional<std::string> toString(const Value & value)
    {
        if(const auto * str = std::get_if<std::string>(&value.data))
        {
            return *str;
        }

        if(const auto * integer = std::get_if<Integer>(&value.data))
        {
            return utils::wordToDecimal(integer->word, integer->is_signed);
        }

        if(const auto * flag = std::get_if<bool>(&value.data))
        {
            return *flag ? "true" : "false";
        }

        if(const auto * address = std::get_if<evmc::address>(&value.data))
        {
            return std::string("0x") + evmc::hex(evmc::bytes_view{address->bytes, sizeof(address->bytes)});
        }

        if(const auto * bytes = std::get_if<Bytes>(&value.data))
        {
            return std::string("0x") + evmc::hex(evmc::bytes_view{bytes->data(), bytes->size()});
        }

        return std::nullopt;
    }

    const Value * findPath(const Struct & root, std::initializer_list<std::string> path)
    {
        const Struct * current = &root;
        const Value * found = nullptr;

        for(const std::string & name : path)
        {
            if(current == nullptr)
            {
                return nullptr;
            }

            found = current->find(name);
            if(found == nullptr)
            {
                return nullptr;
            }
            current = found->asStruct();
        }
        return found;
    }
}
