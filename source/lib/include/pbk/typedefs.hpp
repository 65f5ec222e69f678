#pragma once

#include <cstdint>

#include <pbk/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    Console = Bit(0u),
    File = Bit(1u),
    // Debug messages are dropped unless this is set
    Verbose = Bit(2u),
    DetailTime = Bit(3u),
    // File and line of the call site
    DetailLocation = Bit(4u),
};
PBK_ENABLE_BITFIELD_OPERATORS(LogFlags);
