// SPDX-License-Identifier: Apache-2.0
// unit_fixed_point.cpp
// Shared-exponent quantizer: marker placement, rounding, carry renormalization, error bounds.
#include "codec/errors.hpp"
#include "codec/fixed_point.hpp"
#include "codec/float_bits.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

using namespace urlprm::codec;

static double through(double x, int ref, int mant_bits)
{
    return recompose(dequantize(quantize(decompose(x), ref, mant_bits), mant_bits));
}

// Single value with its own exponent as batch maximum.
static double alone(double x, int mant_bits)
{
    return through(x, decompose(x).exponent + 1, mant_bits);
}

int main()
{
    // 3.14159 = 1.5707.. * 2^1, ref 2: marker at bit 15, 15 fraction bits kept
    auto q = quantize(decompose(3.14159), 2, 16);
    assert(q.mantissa == 0xc910);
    assert(q.exponent == 2 && !q.sign);
    assert(recompose(dequantize(q, 16)) == 3.1416015625);

    // Leading zeros above the marker encode how far below ref the value sits
    auto small = quantize(decompose(0.001), 7, 22);
    assert(small.mantissa == 0x21);
    assert(recompose(dequantize(small, 22)) == 0.001007080078125);

    // Exact powers of two and short significands survive unchanged
    assert(alone(1.0, 22) == 1.0);
    assert(alone(-2.5, 16) == -2.5);
    assert(through(0.75, 1, 22) == 0.75);

    // Zero keeps its sign; subnormals flush to zero
    auto z = quantize(decompose(-0.0), 3, 16);
    assert(z.mantissa == 0 && z.sign);
    double back = recompose(dequantize(z, 16));
    assert(back == 0.0 && std::signbit(back));
    assert(quantize(decompose(std::numeric_limits<double>::denorm_min()), 3, 16).mantissa == 0);

    // Rounding carry: the batch maximum saturates, smaller members move up one exponent
    assert(alone(1.9999999, 16) == 1.999969482421875);
    assert(through(1.9999999, 3, 16) == 2.0);

    // Round to nearest, ties up: 2^-16 sits exactly halfway on a 2^-15 grid
    assert(through(std::ldexp(1.0, -16), 1, 16) == std::ldexp(1.0, -15));
    assert(through(std::ldexp(1.0, -17), 1, 16) == 0.0);

    // 52-bit mantissa: exact when the significand has a free low bit, within 2^-52 otherwise
    assert(alone(0.1, 52) == 0.1);
    assert(alone(3.14159, 52) == 3.14159);
    double third = 1.0 / 3.0;
    assert(std::fabs(alone(third, 52) - third) / third <= std::ldexp(1.0, -52));

    // Relative error bound 2^-mant_bits, tightening as mant_bits grows
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> dist(-1e4, 1e4);
    for (int i = 0; i < 20000; ++i) {
        double x = dist(rng);
        if (x == 0.0)
            continue;
        double prev_err = std::numeric_limits<double>::infinity();
        for (int mb : {16, 22, 28, 34, 40, 46, 52}) {
            double err = std::fabs(alone(x, mb) - x) / std::fabs(x);
            assert(err <= std::ldexp(1.0, -mb));
            assert(err <= prev_err);
            prev_err = err;
        }
    }

    // Errors
    bool threw = false;
    try {
        (void)quantize(decompose(8.0), 3, 16); // exponent 3 needs ref >= 4
    } catch (const RangeError &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        (void)quantize(decompose(std::numeric_limits<double>::quiet_NaN()), 3, 16);
    } catch (const RangeError &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        (void)quantize(decompose(1.0), 1, 53);
    } catch (const RangeError &) {
        threw = true;
    }
    assert(threw);

    // Batch exponent: clamped from below, rejected above
    PrecisionScheme s{5, 16};
    DecomposedFloat batch[] = {decompose(100.0), decompose(0.001), decompose(0.0)};
    assert(batch_max_exponent(batch, s) == 6);
    DecomposedFloat tiny[] = {decompose(1e-10)};
    assert(batch_max_exponent(tiny, s) == -16);
    DecomposedFloat zeros[] = {decompose(0.0), decompose(-0.0)};
    assert(batch_max_exponent(zeros, s) == -16);
    DecomposedFloat edge[] = {decompose(65535.0)};
    assert(batch_max_exponent(edge, s) == 15);
    DecomposedFloat big[] = {decompose(65536.0)};
    threw = false;
    try {
        (void)batch_max_exponent(big, s);
    } catch (const RangeError &) {
        threw = true;
    }
    assert(threw);

    std::cout << "unit_fixed_point OK" << std::endl;
    return 0;
}
