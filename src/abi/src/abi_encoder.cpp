#include "abi_encoder.hpp"

#include <algorithm>
#include <format>

namespace ddc::abi
{
    namespace
    {
        EncodeResult _encodeValue(const ParamType & type, const Value & value);

        DecodeError _mismatch(const ParamType & type)
        {
            return DecodeError{DecodeError::Kind::SHAPE_MISMATCH, std::format("Value does not match type {}", type.canonical())};
        }

        void _appendWord(std::vector<std::uint8_t> & out, const evmc::bytes32 & word)
        {
            out.insert(out.end(), word.bytes, word.bytes + 32);
        }

        void _appendSize(std::vector<std::uint8_t> & out, std::size_t value)
        {
            evmc::bytes32 word{};
            for(std::size_t i = 0; i < sizeof(std::size_t); ++i)
            {
                word.bytes[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
            }
            _appendWord(out, word);
        }

        void _appendPadded(std::vector<std::uint8_t> & out, const std::uint8_t* data, std::size_t size)
        {
            out.insert(out.end(), data, data + size);
            const std::size_t padding = (32 - (size % 32)) % 32;
            out.insert(out.end(), padding, std::uint8_t{0});
        }

        template<class TypeAt, class ValueAt>
        EncodeResult _encodeSequence(std::size_t count, TypeAt type_at, ValueAt value_at)
        {
            std::size_t head_size = 0;
            for(std::size_t i = 0; i < count; ++i)
            {
                head_size += type_at(i).headSize();
            }

            std::vector<std::uint8_t> head;
            std::vector<std::uint8_t> tail;
            head.reserve(head_size);

            for(std::size_t i = 0; i < count; ++i)
            {
                const ParamType & type = type_at(i);
                const Value * value = value_at(i);
                if(value == nullptr)
                {
                    return std::unexpected(DecodeError{DecodeError::Kind::SHAPE_MISMATCH, std::format("Missing value for member {}", i)});
                }

                auto encoded = _encodeValue(type, *value);
                if(!encoded)
                {
                    return std::unexpected(encoded.error());
                }

                if(type.isDynamic())
                {
                    _appendSize(head, head_size + tail.size());
                    tail.insert(tail.end(), encoded->begin(), encoded->end());
                }
                else
                {
                    head.insert(head.end(), encoded->begin(), encoded->end());
                }
            }

            head.insert(head.end(), tail.begin(), tail.end());
            return head;
        }

        EncodeResult _encodeTuple(const std::vector<Param> & params, const Struct & value)
        {
            return _encodeSequence(params.size(),
                [&params](std::size_t i) -> const ParamType & { return params[i].type; },
                [&params, &value](std::size_t i) -> const Value *
                {
                    return value.find(params[i].name.empty() ? std::to_string(i) : params[i].name);
                });
        }

        EncodeResult _encodeValue(const ParamType & type, const Value & value)
        {
            std::vector<std::uint8_t> out;

            switch(type.kind)
            {
                case ParamType::Kind::ADDRESS:
                {
                    const auto * address = std::get_if<evmc::address>(&value.data);
                    if(address == nullptr) return std::unexpected(_mismatch(type));

                    evmc::bytes32 word{};
                    std::copy(address->bytes, address->bytes + 20, word.bytes + 12);
                    _appendWord(out, word);
                    return out;
                }

                case ParamType::Kind::BOOL:
                {
                    const auto * flag = std::get_if<bool>(&value.data);
                    if(flag == nullptr) return std::unexpected(_mismatch(type));

                    _appendSize(out, *flag ? 1 : 0);
                    return out;
                }

                case ParamType::Kind::UINT:
                case ParamType::Kind::INT:
                {
                    const auto * integer = std::get_if<Integer>(&value.data);
                    if(integer == nullptr) return std::unexpected(_mismatch(type));

                    _appendWord(out, integer->word);
                    return out;
                }

                case ParamType::Kind::FIXED_BYTES:
                {
                    const auto * bytes = std::get_if<Bytes>(&value.data);
                    if(bytes == nullptr || bytes->size() > type.size) return std::unexpected(_mismatch(type));

                    _appendPadded(out, bytes->data(), bytes->size());
                    if(bytes->empty())
                    {
                        _appendSize(out, 0);
                    }
                    return out;
                }

                case ParamType::Kind::BYTES:
                {
                    const auto * bytes = std::get_if<Bytes>(&value.data);
                    if(bytes == nullptr) return std::unexpected(_mismatch(type));

                    _appendSize(out, bytes->size());
                    _appendPadded(out, bytes->data(), bytes->size());
                    return out;
                }

                case ParamType::Kind::STRING:
                {
                    const auto * str = value.asString();
                    if(str == nullptr) return std::unexpected(_mismatch(type));

                    _appendSize(out, str->size());
                    _appendPadded(out, reinterpret_cast<const std::uint8_t*>(str->data()), str->size());
                    return out;
                }

                case ParamType::Kind::TUPLE:
                {
                    const auto * tuple = value.asStruct();
                    if(tuple == nullptr) return std::unexpected(_mismatch(type));

                    return _encodeTuple(type.components, *tuple);
                }

                case ParamType::Kind::ARRAY:
                case ParamType::Kind::FIXED_ARRAY:
                {
                    const auto * list = value.asList();
                    if(list == nullptr) return std::unexpected(_mismatch(type));
                    if(type.kind == ParamType::Kind::FIXED_ARRAY && list->size() != type.size) return std::unexpected(_mismatch(type));

                    const ParamType & element = type.elementType();
                    auto elements = _encodeSequence(list->size(),
                        [&element](std::size_t) -> const ParamType & { return element; },
                        [list](std::size_t i) -> const Value * { return &(*list)[i]; });
                    if(!elements) return std::unexpected(elements.error());

                    if(type.kind == ParamType::Kind::ARRAY)
                    {
                        _appendSize(out, list->size());
                    }
                    out.insert(out.end(), elements->begin(), elements->end());
                    return out;
                }

                default:
                    return std::unexpected(_mismatch(type));
            }
        }
    }

    EncodeResult encodeParameters(const std::vector<Param> & params, const Struct & arguments)
    {
        return _encodeTuple(params, arguments);
    }

    EncodeResult encodeCall(const FunctionInterface & abi, const Struct & arguments)
    {
        auto body = encodeParameters(abi.inputs, arguments);
        if(!body)
        {
            return std::unexpected(body.error());
        }

        std::vector<std::uint8_t> out(4, 0);
        if(abi.selector)
        {
            std::copy(abi.selector->begin(), abi.selector->end(), out.begin());
        }
        out.insert(out.end(), body->begin(), body->end());
        return out;
    }
}
