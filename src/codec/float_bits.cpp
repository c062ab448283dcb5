// SPDX-License-Identifier: Apache-2.0
#include "codec/float_bits.hpp"

#include <bit>

namespace urlprm::codec {

static_assert(sizeof(double) == sizeof(uint64_t), "IEEE-754 binary64 required");

uint64_t to_bits(double x) noexcept
{
    return std::bit_cast<uint64_t>(x);
}

double from_bits(uint64_t bits) noexcept
{
    return std::bit_cast<double>(bits);
}

DecomposedFloat decompose(double x) noexcept
{
    uint64_t bits = to_bits(x);
    DecomposedFloat d;
    d.sign = (bits >> 63) != 0;
    d.exponent = static_cast<int>((bits >> DOUBLE_MANT_BITS) & 0x7ff) - DOUBLE_EXP_BIAS;
    d.mantissa = bits & DOUBLE_MANT_MASK;
    return d;
}

double recompose(const DecomposedFloat &d) noexcept
{
    uint64_t field = static_cast<uint64_t>(d.exponent + DOUBLE_EXP_BIAS) & 0x7ff;
    uint64_t bits = (uint64_t(d.sign ? 1 : 0) << 63) | (field << DOUBLE_MANT_BITS) | (d.mantissa & DOUBLE_MANT_MASK);
    return from_bits(bits);
}

} // namespace urlprm::codec
