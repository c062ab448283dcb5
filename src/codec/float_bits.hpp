// SPDX-License-Identifier: Apache-2.0
// float_bits.hpp
// IEEE-754 double <-> {sign, unbiased exponent, 52-bit mantissa}. Bit exact for every double.
#pragma once

#include <cstdint>

namespace urlprm::codec {

inline constexpr int DOUBLE_MANT_BITS = 52;
inline constexpr int DOUBLE_EXP_BIAS = 1023;
inline constexpr uint64_t DOUBLE_MANT_MASK = (uint64_t{1} << DOUBLE_MANT_BITS) - 1;

struct DecomposedFloat
{
    bool sign{false};
    int exponent{-DOUBLE_EXP_BIAS}; // exponent field - 1023; -1023 for zero/subnormal, 1024 for inf/nan
    uint64_t mantissa{0}; // low 52 bits, implicit leading 1 not included

    // Zero or subnormal (exponent field 0).
    bool is_zero_or_subnormal() const noexcept { return exponent == -DOUBLE_EXP_BIAS; }

    bool operator==(const DecomposedFloat &) const = default;
};

DecomposedFloat decompose(double x) noexcept;
double recompose(const DecomposedFloat &d) noexcept;

// Raw pattern helpers used by the lossless modes.
uint64_t to_bits(double x) noexcept;
double from_bits(uint64_t bits) noexcept;

} // namespace urlprm::codec
