#pragma once

#include <cstdint>
#include <vector>

#include "abi_type.hpp"
#include "decode_error.hpp"
#include "value.hpp"

namespace ddc::abi
{
    /**
     * @brief Decodes contract call data against a known function interface.
     * 
     * The first 4 bytes are the function selector. They are compared with the interface selector
     * when one is configured and skipped otherwise. Parameters are decoded by the standard
     * head/tail rules; tuples become Struct values keyed by component name.
     * 
     * The function only reads from the buffer and the interface, so it may be called concurrently.
     * 
     * @param abi The function interface.
     * @param data Pointer to the call data.
     * @param data_size Size of the call data in bytes.
     * @return The decoded call or a DecodeError (TRUNCATED_DATA, INVALID_OFFSET, SELECTOR_MISMATCH).
     */
    DecodeResult<DecodedCall> decodeCall(const FunctionInterface & abi, const std::uint8_t* data, std::size_t data_size);

    DecodeResult<DecodedCall> decodeCall(const FunctionInterface & abi, const std::vector<std::uint8_t> & data);

    /**
     * @brief Decodes a parameter list (no selector) starting at the beginning of the buffer.
     */
    DecodeResult<Struct> decodeParameters(const std::vector<Param> & params, const std::uint8_t* data, std::size_t data_size);
}
