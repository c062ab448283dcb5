// SPDX-License-Identifier: Apache-2.0
#include "codec/fixed_point.hpp"

#include "codec/errors.hpp"

#include <algorithm>
#include <bit>
#include <string>

namespace urlprm::codec {

namespace {

constexpr int SIGNIFICAND_BITS = DOUBLE_MANT_BITS + 1;
constexpr int DOUBLE_MAX_EXP = 1023;
constexpr int DOUBLE_MIN_NORMAL_EXP = -1022;

void check_mant_bits(int mant_bits)
{
    if (mant_bits < 1 || mant_bits > MAX_MANT_BITS)
        throw RangeError("quantize: mant_bits " + std::to_string(mant_bits) + " outside [1, 52]");
}

uint64_t low_mask(int bits)
{
    return bits >= 64 ? ~uint64_t{0} : (uint64_t{1} << bits) - 1;
}

} // namespace

FixedPointValue quantize(const DecomposedFloat &d, int ref_exponent, int mant_bits)
{
    check_mant_bits(mant_bits);
    if (d.exponent > DOUBLE_MAX_EXP)
        throw RangeError("quantize: non-finite value");
    FixedPointValue out{d.sign, ref_exponent, 0};
    if (d.is_zero_or_subnormal())
        return out;
    if (d.exponent + 1 > ref_exponent)
        throw RangeError("quantize: exponent " + std::to_string(d.exponent) + " exceeds reference exponent "
                         + std::to_string(ref_exponent));

    int lead = ref_exponent - (d.exponent + 1); // zero bits above the marker
    if (lead > mant_bits)
        return out; // below half the smallest step

    uint64_t sig = d.mantissa | (uint64_t{1} << DOUBLE_MANT_BITS);
    int shift = lead + SIGNIFICAND_BITS - mant_bits; // 1..53 given the checks above
    uint64_t q = sig >> shift;
    if ((sig >> (shift - 1)) & 1)
        ++q;

    // Rounding carried into the next power of two: the marker moves up one bit.
    int width = mant_bits - lead;
    if ((q >> width) != 0) {
        if (lead > 0)
            --lead;
        else
            q = low_mask(mant_bits); // batch maximum cannot grow past ref; saturate
    }
    q |= uint64_t{1} << (mant_bits - 1 - lead);
    out.mantissa = q & low_mask(mant_bits);
    return out;
}

DecomposedFloat dequantize(const FixedPointValue &f, int mant_bits)
{
    check_mant_bits(mant_bits);
    DecomposedFloat d;
    d.sign = f.sign;
    uint64_t q = f.mantissa & low_mask(mant_bits);
    if (q == 0)
        return d;

    int len = 64 - std::countl_zero(q);
    int exponent = f.exponent - (mant_bits - len) - 1;
    if (exponent > DOUBLE_MAX_EXP)
        throw RangeError("dequantize: exponent " + std::to_string(exponent) + " out of double range");
    if (exponent < DOUBLE_MIN_NORMAL_EXP)
        return d; // flush to signed zero

    uint64_t rest = q & low_mask(len - 1);
    d.exponent = exponent;
    d.mantissa = rest << (DOUBLE_MANT_BITS - (len - 1));
    return d;
}

int batch_max_exponent(std::span<const DecomposedFloat> values, const PrecisionScheme &scheme)
{
    int max_exp = scheme.min_exponent();
    for (const auto &d : values) {
        if (d.exponent > DOUBLE_MAX_EXP)
            throw RangeError("quantize: non-finite value in batch");
        if (!d.is_zero_or_subnormal())
            max_exp = std::max(max_exp, d.exponent);
    }
    if (max_exp > scheme.max_exponent())
        throw RangeError("quantize: exponent " + std::to_string(max_exp) + " does not fit " + std::to_string(scheme.exp_bits)
                         + " exponent bits (max " + std::to_string(scheme.max_exponent()) + ")");
    return max_exp;
}

} // namespace urlprm::codec
