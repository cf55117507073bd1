#pragma once

#include <cstdint>
#include <vector>

#include "abi_type.hpp"
#include "decode_error.hpp"
#include "value.hpp"

namespace ddc::abi
{
    using EncodeResult = DecodeResult<std::vector<std::uint8_t>>;

    /**
     * @brief Encodes arguments as call data for the given interface.
     * 
     * Tuple members are looked up by component name. The selector is prepended when the
     * interface declares one, otherwise 4 zero bytes take its place.
     * 
     * @return The call data or SHAPE_MISMATCH when a value does not fit its declared type.
     */
    EncodeResult encodeCall(const FunctionInterface & abi, const Struct & arguments);

    EncodeResult encodeParameters(const std::vector<Param> & params, const Struct & arguments);
}
