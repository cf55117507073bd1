#pragma once

#include <cstdint>

#include "parse_error.hpp"
#include "utils.hpp"
#include "file.hpp"
#include "config.hpp"
#include "arg_parser.hpp"

#include "abi_type.hpp"
#include "abi_decoder.hpp"
#include "abi_encoder.hpp"
#include "classifier.hpp"
#include "legacy_decoder.hpp"
#include "normalizer.hpp"
#include "address_labeler.hpp"
#include "engine.hpp"
#include "report.hpp"

namespace ddc
{
    static constexpr std::uint32_t MAJOR_VERSION = 0;
    static constexpr std::uint32_t MINOR_VERSION = 1;
    static constexpr std::uint32_t PATCH_VERSION = 0;
}
