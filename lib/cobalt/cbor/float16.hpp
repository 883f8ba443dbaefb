/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CBOR_FLOAT16_HPP
#define COBALT_CBOR_FLOAT16_HPP

#include <cstdint>

namespace cobalt::cbor {
    // Bit-exact IEEE-754 half to single precision widening. NaN payloads are preserved.
    constexpr uint32_t float16_to_float32_bits(const uint16_t h) noexcept
    {
        const uint32_t sign = static_cast<uint32_t>(h & 0x8000U) << 16;
        uint32_t exp = (h >> 10) & 0x1FU;
        uint32_t mant = h & 0x3FFU;
        if (exp == 0) {
            if (mant == 0)
                return sign;
            // subnormal: normalize until the implicit bit is set
            exp = 127 - 15 + 1;
            while ((mant & 0x400U) == 0) {
                mant <<= 1;
                --exp;
            }
            mant &= 0x3FFU;
            return sign | (exp << 23) | (mant << 13);
        }
        if (exp == 0x1F)
            return sign | 0x7F800000U | (mant << 13);
        return sign | ((exp + 127 - 15) << 23) | (mant << 13);
    }

    static_assert(float16_to_float32_bits(0x3C00) == 0x3F800000);
    static_assert(float16_to_float32_bits(0x7C00) == 0x7F800000);
    static_assert(float16_to_float32_bits(0x0001) == 0x33800000);
}

#endif // !COBALT_CBOR_FLOAT16_HPP
