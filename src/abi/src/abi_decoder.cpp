#include "abi_decoder.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>

#ifdef interface
    #undef interface
#endif
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "math.hpp"
#include "utils.hpp"

namespace ddc::abi
{
    namespace
    {
        /*
            Bytes the decoded values may still claim. Every word and payload of a valid
            encoding occupies its own region of the buffer, so the total never exceeds its size.
        */
        struct DecodeBudget
        {
            std::size_t remaining = 0;
        };

        DecodeResult<Value> _decodeValue(const ParamType & type, const std::uint8_t* data, std::size_t data_size, std::size_t pos, DecodeBudget & budget);

        bool _consume(DecodeBudget & budget, std::size_t bytes)
        {
            if(bytes > budget.remaining)
            {
                return false;
            }
            budget.remaining -= bytes;
            return true;
        }

        DecodeError _overlapping(std::size_t pos)
        {
            return DecodeError{DecodeError::Kind::INVALID_OFFSET, std::format("Value at offset {} overlaps data that was already decoded", pos)};
        }

        DecodeError _truncated(std::size_t pos, std::size_t data_size)
        {
            return DecodeError{DecodeError::Kind::TRUNCATED_DATA, std::format("Need 32 bytes at offset {}, buffer has {}", pos, data_size)};
        }

        DecodeResult<evmc::bytes32> _readWord(const std::uint8_t* data, std::size_t data_size, std::size_t pos, DecodeBudget & budget)
        {
            const auto word = utils::readWord(data, data_size, pos);
            if(!word)
            {
                return std::unexpected(_truncated(pos, data_size));
            }
            if(!_consume(budget, 32))
            {
                return std::unexpected(_overlapping(pos));
            }
            return *word;
        }

        /*
            Reads a dynamic offset relative to `base` from the head slot at `slot`
            and returns the absolute position it points to.
        */
        DecodeResult<std::size_t> _readOffset(const std::uint8_t* data, std::size_t data_size, std::size_t base, std::size_t slot)
        {
            if(slot > data_size || data_size - slot < 32)
            {
                return std::unexpected(_truncated(slot, data_size));
            }

            const auto offset = utils::readWordAsSizeT(data, data_size, slot);
            if(!offset || *offset >= data_size - std::min(base, data_size))
            {
                return std::unexpected(DecodeError{DecodeError::Kind::INVALID_OFFSET,
                    std::format("Offset in slot {} points outside the {} byte buffer", slot, data_size)});
            }

            return base + *offset;
        }

        DecodeResult<std::size_t> _readLength(const std::uint8_t* data, std::size_t data_size, std::size_t pos, DecodeBudget & budget)
        {
            if(pos > data_size || data_size - pos < 32)
            {
                return std::unexpected(_truncated(pos, data_size));
            }

            const auto length = utils::readWordAsSizeT(data, data_size, pos);
            if(!length)
            {
                return std::unexpected(DecodeError{DecodeError::Kind::TRUNCATED_DATA, std::format("Length at offset {} exceeds the buffer", pos)});
            }
            if(!_consume(budget, 32))
            {
                return std::unexpected(_overlapping(pos));
            }
            return *length;
        }

        /*
            Decodes `count` consecutive head slots starting at `base`.
            Dynamic members are resolved through offsets relative to `base`.
        */
        template<class TypeAt>
        DecodeResult<List> _decodeSequence(std::size_t count, TypeAt type_at, const std::uint8_t* data, std::size_t data_size, std::size_t base, DecodeBudget & budget)
        {
            List out;
            out.reserve(count);

            std::size_t cursor = base;
            for(std::size_t i = 0; i < count; ++i)
            {
                const ParamType & type = type_at(i);

                std::size_t pos = cursor;
                if(type.isDynamic())
                {
                    const auto offset_res = _readOffset(data, data_size, base, cursor);
                    if(!offset_res)
                    {
                        return std::unexpected(offset_res.error());
                    }
                    pos = *offset_res;
                }

                auto value_res = _decodeValue(type, data, data_size, pos, budget);
                if(!value_res)
                {
                    return std::unexpected(value_res.error());
                }

                out.push_back(std::move(*value_res));
                cursor += type.headSize();
            }

            return out;
        }

        DecodeResult<Struct> _decodeTuple(const std::vector<Param> & params, const std::uint8_t* data, std::size_t data_size, std::size_t base, DecodeBudget & budget)
        {
            auto values_res = _decodeSequence(params.size(), [&params](std::size_t i) -> const ParamType & { return params[i].type; }, data, data_size, base, budget);
            if(!values_res)
            {
                return std::unexpected(values_res.error());
            }

            Struct out;
            out.names.reserve(params.size());
            for(std::size_t i = 0; i < params.size(); ++i)
            {
                // unnamed components keep their position as the key
                out.names.push_back(params[i].name.empty() ? std::to_string(i) : params[i].name);
            }
            out.values = std::move(*values_res);
            return out;
        }

        DecodeResult<Value> _decodeValue(const ParamType & type, const std::uint8_t* data, std::size_t data_size, std::size_t pos, DecodeBudget & budget)
        {
            switch(type.kind)
            {
                case ParamType::Kind::ADDRESS:
                {
                    const auto word = _readWord(data, data_size, pos, budget);
                    if(!word) return std::unexpected(word.error());

                    evmc::address address{};
                    std::memcpy(address.bytes, word->bytes + 12, 20);
                    return Value{address};
                }

                case ParamType::Kind::BOOL:
                {
                    const auto word = _readWord(data, data_size, pos, budget);
                    if(!word) return std::unexpected(word.error());

                    return Value{std::ranges::any_of(word->bytes, [](std::uint8_t b) { return b != 0; })};
                }

                case ParamType::Kind::UINT:
                case ParamType::Kind::INT:
                {
                    const auto word = _readWord(data, data_size, pos, budget);
                    if(!word) return std::unexpected(word.error());

                    return Value{Integer{*word, type.kind == ParamType::Kind::INT}};
                }

                case ParamType::Kind::FIXED_BYTES:
                {
                    const auto word = _readWord(data, data_size, pos, budget);
                    if(!word) return std::unexpected(word.error());

                    return Value{Bytes(word->bytes, word->bytes + type.size)};
                }

                case ParamType::Kind::BYTES:
                case ParamType::Kind::STRING:
                {
                    const auto length = _readLength(data, data_size, pos, budget);
                    if(!length) return std::unexpected(length.error());

                    const std::size_t start = pos + 32;
                    if(*length > data_size - start)
                    {
                        return std::unexpected(DecodeError{DecodeError::Kind::TRUNCATED_DATA,
                            std::format("{} of length {} at offset {} exceeds the buffer", type.kind, *length, pos)});
                    }
                    if(!_consume(budget, *length))
                    {
                        return std::unexpected(_overlapping(pos));
                    }

                    if(type.kind == ParamType::Kind::BYTES)
                    {
                        return Value{Bytes(data + start, data + start + *length)};
                    }
                    return Value{utils::sanitizeUtf8(evmc::bytes_view{data + start, *length})};
                }

                case ParamType::Kind::TUPLE:
                {
                    auto tuple_res = _decodeTuple(type.components, data, data_size, pos, budget);
                    if(!tuple_res) return std::unexpected(tuple_res.error());

                    return Value{std::move(*tuple_res)};
                }

                case ParamType::Kind::ARRAY:
                case ParamType::Kind::FIXED_ARRAY:
                {
                    std::size_t count = type.size;
                    std::size_t base = pos;

                    if(type.kind == ParamType::Kind::ARRAY)
                    {
                        const auto length = _readLength(data, data_size, pos, budget);
                        if(!length) return std::unexpected(length.error());

                        count = *length;
                        base = pos + 32;
                    }

                    const ParamType & element = type.elementType();
                    const std::size_t element_head = std::max<std::size_t>(element.headSize(), 1);
                    if(base > data_size || count > (data_size - base) / element_head)
                    {
                        return std::unexpected(DecodeError{DecodeError::Kind::TRUNCATED_DATA,
                            std::format("Array of {} elements at offset {} exceeds the buffer", count, pos)});
                    }

                    auto list_res = _decodeSequence(count, [&element](std::size_t) -> const ParamType & { return element; }, data, data_size, base, budget);
                    if(!list_res) return std::unexpected(list_res.error());

                    return Value{std::move(*list_res)};
                }

                default:
                    return std::unexpected(DecodeError{DecodeError::Kind::UNKNOWN, "Unsupported parameter type"});
            }
        }
    }

    DecodeResult<Struct> decodeParameters(const std::vector<Param> & params, const std::uint8_t* data, std::size_t data_size)
    {
        if(data == nullptr && data_size != 0)
        {
            return std::unexpected(DecodeError{DecodeError::Kind::TRUNCATED_DATA, "No call data"});
        }
        DecodeBudget budget{data_size};
        return _decodeTuple(params, data, data_size, 0, budget);
    }

    DecodeResult<DecodedCall> decodeCall(const FunctionInterface & abi, const std::uint8_t* data, std::size_t data_size)
    {
        if(data == nullptr || data_size < 4)
        {
            return std::unexpected(DecodeError{DecodeError::Kind::TRUNCATED_DATA, std::format("Call data of {} bytes has no selector", data_size)});
        }

        if(abi.selector && !std::equal(abi.selector->begin(), abi.selector->end(), data))
        {
            return std::unexpected(DecodeError{DecodeError::Kind::SELECTOR_MISMATCH,
                std::format("Selector 0x{} does not match {}", evmc::hex(evmc::bytes_view{data, 4}), abi.signature())});
        }

        auto arguments_res = decodeParameters(abi.inputs, data + 4, data_size - 4);
        if(!arguments_res)
        {
            return std::unexpected(arguments_res.error());
        }

        return DecodedCall{abi.name, std::move(*arguments_res)};
    }

    DecodeResult<DecodedCall> decodeCall(const FunctionInterface & abi, const std::vector<std::uint8_t> & data)
    {
        return decodeCall(abi, data.data(), data.size());
    }
}
