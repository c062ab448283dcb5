// SPDX-License-Identifier: Apache-2.0
// fixed_point.hpp
// Shared-exponent fixed-point quantizer.
//
// Values packed together share one reference exponent `ref` (batch maximum exponent + 1). A value with
// exponent e is stored as a mant_bits wide integer: its 53-bit significand shifted right by
// (ref - (e + 1)) + 53 - mant_bits with round-to-nearest (ties up). The leading 1 of the significand
// lands at bit mant_bits - 1 - (ref - (e + 1)) and acts as a marker: the decoder recovers e from the
// position of the highest set bit. Smaller members therefore keep fewer significant bits.
#pragma once

#include "codec/float_bits.hpp"
#include "codec/precision.hpp"

#include <cstdint>
#include <span>

namespace urlprm::codec {

struct FixedPointValue
{
    bool sign{false};
    int exponent{0}; // shared reference exponent
    uint64_t mantissa{0}; // exactly mant_bits wide; 0 encodes signed zero

    bool operator==(const FixedPointValue &) const = default;
};

// RangeError if d is non-finite, d.exponent + 1 > ref_exponent, or mant_bits is outside [1, 52].
// Zero and subnormal inputs yield a zero mantissa; values too small for the field underflow to zero.
FixedPointValue quantize(const DecomposedFloat &d, int ref_exponent, int mant_bits);

// Inverse of quantize. A zero mantissa decodes to signed zero.
DecomposedFloat dequantize(const FixedPointValue &f, int mant_bits);

// Largest member exponent, clamped up to scheme.min_exponent(). Zero/subnormal members are ignored.
// Throws RangeError for non-finite members or when the result exceeds scheme.max_exponent().
int batch_max_exponent(std::span<const DecomposedFloat> values, const PrecisionScheme &scheme);

} // namespace urlprm::codec
