// SPDX-License-Identifier: Apache-2.0
// bit_buffer.hpp
// Growable bit-addressable buffer. Fields are written most-significant-bit first and may straddle byte
// boundaries; partially written bytes are OR-merged, never overwritten. One instance per encode or
// decode call, not thread-safe.
#pragma once

#include "codec/precision.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace urlprm::codec {

struct Point
{
    double x{0.0};
    double y{0.0};

    bool operator==(const Point &) const = default;
};

class BitBuffer
{
public:
    BitBuffer() = default;

    // Buffer over existing bytes: bit_length() == bytes.size() * 8, cursor at 0.
    static BitBuffer from_bytes(std::span<const uint8_t> bytes);
    // Lenient base64 (unknown characters read as zero bits).
    static BitBuffer from_base64(std::string_view s);
    // Strict base64; FormatError on malformed text.
    static BitBuffer from_base64_strict(std::string_view s);

    // Low num_bits (0..32) of value, MSB first.
    void encode_int(uint32_t value, int num_bits);
    uint32_t decode_int(int num_bits);
    // Same for widths up to 64 bits (mantissas).
    void encode_big_int(uint64_t value, int num_bits);
    uint64_t decode_big_int(int num_bits);

    void encode_bool(bool v) { encode_int(v ? 1u : 0u, 1); }
    bool decode_bool() { return decode_int(1) != 0; }

    // Shared-exponent packing: exp_bits biased batch exponent, then per value 1 sign bit + mant_bits.
    // Every value is range-checked before the first bit is written.
    BitBuffer &encode_fixed_points(std::span<const double> values, const PrecisionScheme &scheme);
    std::vector<double> decode_fixed_points(size_t count, const PrecisionScheme &scheme);

    BitBuffer &encode_point(const Point &p, const PrecisionScheme &scheme);
    Point decode_point(const PrecisionScheme &scheme);

    // Full 64-bit IEEE pattern, no quantization.
    BitBuffer &encode_lossless(double v);
    double decode_lossless();

    // Stored bytes trimmed to ceil(bit_length() / 8).
    std::vector<uint8_t> to_bytes() const;
    std::string to_base64() const;

    void seek(size_t bit_offset) noexcept { m_cursor = bit_offset; }
    size_t position() const noexcept { return m_cursor; }
    // High-water mark: furthest bit ever written (or the size of the source bytes).
    size_t bit_length() const noexcept { return m_end; }
    void reset() noexcept;

private:
    std::vector<uint8_t> m_bytes;
    size_t m_cursor{0};
    size_t m_end{0};
};

} // namespace urlprm::codec
