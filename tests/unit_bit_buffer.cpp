// SPDX-License-Identifier: Apache-2.0
// unit_bit_buffer.cpp
// MSB-first packing across byte boundaries, high-water trimming, shared-exponent batches on the wire.
#include "codec/bit_buffer.hpp"
#include "codec/errors.hpp"
#include "codec/precision.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>

using namespace urlprm::codec;

static bool within(double got, double want, double tol)
{
    return std::fabs(got - want) <= tol;
}

int main()
{
    // 101 + 1010101111001101 = 19 bits -> 3 bytes
    {
        BitBuffer buf;
        buf.encode_int(0b101, 3);
        buf.encode_int(0xABCD, 16);
        assert(buf.bit_length() == 19);
        assert(buf.position() == 19);
        assert((buf.to_bytes() == std::vector<uint8_t>{0xB5, 0x79, 0xA0}));
        buf.seek(0);
        assert(buf.decode_int(3) == 0b101);
        assert(buf.decode_int(16) == 0xABCD);
        // Only the low bits of the value are written
        BitBuffer masked;
        masked.encode_int(0xFFFFFFFF, 4);
        assert((masked.to_bytes() == std::vector<uint8_t>{0xF0}));
    }

    // Wide fields, odd widths, straddling several bytes
    {
        BitBuffer buf;
        const uint64_t mant = 0xFEDCBA9876543ULL; // 52 bits
        buf.encode_bool(true);
        buf.encode_big_int(mant, 52);
        buf.encode_int(0x7, 3);
        buf.encode_big_int(0xFFFFFFFFFFFFFFFFULL, 64);
        buf.encode_int(0, 0);
        assert(buf.bit_length() == 1 + 52 + 3 + 64);
        assert(buf.to_bytes().size() == 15);
        buf.seek(0);
        assert(buf.decode_bool());
        assert(buf.decode_big_int(52) == mant);
        assert(buf.decode_int(3) == 0x7);
        assert(buf.decode_big_int(64) == 0xFFFFFFFFFFFFFFFFULL);
    }

    // Partially written bytes are merged, not replaced
    {
        BitBuffer buf;
        buf.encode_int(0b1, 1);
        buf.seek(4);
        buf.encode_int(0b1, 1);
        assert((buf.to_bytes() == std::vector<uint8_t>{0x88}));
        assert(buf.bit_length() == 5);
    }

    // Reading past the written bits yields zeros without growing storage
    {
        auto buf = BitBuffer::from_bytes(std::vector<uint8_t>{0xFF});
        assert(buf.bit_length() == 8);
        assert(buf.decode_int(4) == 0xF);
        assert(buf.decode_int(8) == 0xF0);
        assert(buf.to_bytes().size() == 1);
    }

    // Width checks
    {
        BitBuffer buf;
        bool threw = false;
        try {
            buf.encode_int(1, 33);
        } catch (const RangeError &) {
            threw = true;
        }
        assert(threw && buf.bit_length() == 0);
    }

    // Single value wire format: 5 exponent bits + 1 sign + 16 mantissa bits
    {
        BitBuffer buf;
        std::vector<double> one{3.14159};
        buf.encode_fixed_points(one, PrecisionScheme{5, 16});
        assert(buf.bit_length() == packed_bit_length(1, PrecisionScheme{5, 16}));
        assert((buf.to_bytes() == std::vector<uint8_t>{0x8B, 0x24, 0x40}));
        assert(buf.to_base64() == "iyRA");
        auto back = BitBuffer::from_base64("iyRA").decode_fixed_points(1, PrecisionScheme{5, 16});
        assert(back.size() == 1 && back[0] == 3.1416015625);
        assert(std::fabs(back[0] - 3.14159) / 3.14159 < 1e-4);
    }

    // Batch sharing one exponent: [100, 0.001] with {5,22}
    {
        PrecisionScheme s{5, 22};
        BitBuffer buf;
        std::vector<double> values{100.0, 0.001};
        buf.encode_fixed_points(values, s);
        assert(buf.bit_length() == 5 + 2 * 23);
        auto text = buf.to_base64();
        assert(text == "syAAAAAEIA");
        auto back = BitBuffer::from_base64(text).decode_fixed_points(2, s);
        // step of the shared grid is 2^(ref - mant_bits), ref = 7
        double tol = std::ldexp(1.0, 7 - s.mant_bits);
        assert(back.size() == 2);
        assert(back[0] == 100.0);
        assert(within(back[1], 0.001, tol));
    }

    // Order and signs are preserved
    {
        PrecisionScheme s{5, 22};
        std::vector<double> values{1.5, -0.75, 0.0, -0.0, 12.25, -3.0};
        BitBuffer buf;
        buf.encode_fixed_points(values, s);
        auto back = BitBuffer::from_bytes(buf.to_bytes()).decode_fixed_points(values.size(), s);
        assert(back == values);
        assert(std::signbit(back[3]) && !std::signbit(back[2]));
    }

    // 52-bit scheme reproduces values whose exponents are within the 5-bit range
    {
        PrecisionScheme s{5, 52};
        for (double x : {0.1, -0.3, 1234.5678, 0.0, 65535.0, 1.0 / 1024}) {
            BitBuffer buf;
            std::vector<double> one{x};
            buf.encode_fixed_points(one, s);
            double back = BitBuffer::from_base64(buf.to_base64()).decode_fixed_points(1, s)[0];
            assert(std::fabs(back - x) <= std::fabs(x) * std::ldexp(1.0, -52));
        }
    }

    // Points
    {
        BitBuffer buf;
        buf.encode_point(Point{1.5, -0.75}, DEFAULT_SCHEME);
        assert(buf.to_base64() == "gwAACwAAAA");
        auto p = BitBuffer::from_base64("gwAACwAAAA").decode_point(DEFAULT_SCHEME);
        assert((p == Point{1.5, -0.75}));
    }

    // Range failure leaves the buffer untouched
    {
        PrecisionScheme s{5, 16};
        BitBuffer buf;
        std::vector<double> values{1.0, 65536.0};
        bool threw = false;
        try {
            buf.encode_fixed_points(values, s);
        } catch (const RangeError &) {
            threw = true;
        }
        assert(threw);
        assert(buf.bit_length() == 0 && buf.position() == 0 && buf.to_bytes().empty());

        std::vector<double> nan{std::numeric_limits<double>::quiet_NaN()};
        threw = false;
        try {
            buf.encode_fixed_points(nan, s);
        } catch (const RangeError &) {
            threw = true;
        }
        assert(threw && buf.to_bytes().empty());
    }

    // Values below the exponent range clamp instead of failing
    {
        PrecisionScheme s{5, 16};
        BitBuffer buf;
        std::vector<double> tiny{1e-10};
        buf.encode_fixed_points(tiny, s);
        assert(buf.to_base64() == "AAAA");
        assert(BitBuffer::from_base64("AAAA").decode_fixed_points(1, s)[0] == 0.0);
    }

    // Lossless: 8 big-endian IEEE bytes
    {
        BitBuffer buf;
        buf.encode_lossless(1.0);
        assert((buf.to_bytes() == std::vector<uint8_t>{0x3F, 0xF0, 0, 0, 0, 0, 0, 0}));
        assert(buf.to_base64() == "P_AAAAAAAAA");
        assert(BitBuffer::from_base64("QAkh-fAbhm4").decode_lossless() == 3.14159);
    }

    // reset() returns to an empty buffer
    {
        BitBuffer buf;
        buf.encode_int(0xFF, 8);
        buf.reset();
        assert(buf.bit_length() == 0 && buf.to_bytes().empty());
    }

    std::cout << "unit_bit_buffer OK" << std::endl;
    return 0;
}
