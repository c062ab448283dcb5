// SPDX-License-Identifier: Apache-2.0
#include "codec/bit_buffer.hpp"

#include "codec/base64.hpp"
#include "codec/errors.hpp"
#include "codec/fixed_point.hpp"
#include "codec/float_bits.hpp"

#include <algorithm>
#include <array>

namespace urlprm::codec {

namespace {

void check_width(int num_bits, int max_bits)
{
    if (num_bits < 0 || num_bits > max_bits)
        throw RangeError("bit_buffer: field width " + std::to_string(num_bits) + " outside [0, "
                         + std::to_string(max_bits) + "]");
}

} // namespace

BitBuffer BitBuffer::from_bytes(std::span<const uint8_t> bytes)
{
    BitBuffer buf;
    buf.m_bytes.assign(bytes.begin(), bytes.end());
    buf.m_end = bytes.size() * 8;
    return buf;
}

BitBuffer BitBuffer::from_base64(std::string_view s)
{
    return from_bytes(base64::decode(s));
}

BitBuffer BitBuffer::from_base64_strict(std::string_view s)
{
    return from_bytes(base64::decode_strict(s));
}

void BitBuffer::encode_int(uint32_t value, int num_bits)
{
    check_width(num_bits, 32);
    encode_big_int(value, num_bits);
}

uint32_t BitBuffer::decode_int(int num_bits)
{
    check_width(num_bits, 32);
    return static_cast<uint32_t>(decode_big_int(num_bits));
}

void BitBuffer::encode_big_int(uint64_t value, int num_bits)
{
    check_width(num_bits, 64);
    int remaining = num_bits;
    while (remaining > 0) {
        size_t byte_idx = m_cursor / 8;
        int room = 8 - static_cast<int>(m_cursor % 8);
        while (m_bytes.size() <= byte_idx)
            m_bytes.push_back(0);
        int n = std::min(room, remaining);
        auto chunk = static_cast<uint8_t>((value >> (remaining - n)) & ((1u << n) - 1));
        m_bytes[byte_idx] |= static_cast<uint8_t>(chunk << (room - n));
        m_cursor += static_cast<size_t>(n);
        remaining -= n;
    }
    m_end = std::max(m_end, m_cursor);
}

uint64_t BitBuffer::decode_big_int(int num_bits)
{
    check_width(num_bits, 64);
    uint64_t value = 0;
    int remaining = num_bits;
    while (remaining > 0) {
        size_t byte_idx = m_cursor / 8;
        int room = 8 - static_cast<int>(m_cursor % 8);
        int n = std::min(room, remaining);
        uint8_t byte = byte_idx < m_bytes.size() ? m_bytes[byte_idx] : 0; // past the end reads zeros
        uint64_t chunk = (byte >> (room - n)) & ((1u << n) - 1);
        value = (value << n) | chunk;
        m_cursor += static_cast<size_t>(n);
        remaining -= n;
    }
    return value;
}

BitBuffer &BitBuffer::encode_fixed_points(std::span<const double> values, const PrecisionScheme &scheme)
{
    scheme.validate();
    std::vector<DecomposedFloat> parts;
    parts.reserve(values.size());
    for (double v : values)
        parts.push_back(decompose(v));
    int max_exp = batch_max_exponent(parts, scheme);
    int ref = max_exp + 1;

    std::vector<FixedPointValue> quantized;
    quantized.reserve(parts.size());
    for (const auto &d : parts)
        quantized.push_back(quantize(d, ref, scheme.mant_bits));

    // Nothing has been written yet; from here on no step can fail.
    encode_int(static_cast<uint32_t>(max_exp - scheme.min_exponent()), scheme.exp_bits);
    for (const auto &f : quantized) {
        encode_bool(f.sign);
        encode_big_int(f.mantissa, scheme.mant_bits);
    }
    return *this;
}

std::vector<double> BitBuffer::decode_fixed_points(size_t count, const PrecisionScheme &scheme)
{
    scheme.validate();
    int max_exp = static_cast<int>(decode_int(scheme.exp_bits)) + scheme.min_exponent();
    std::vector<double> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        FixedPointValue f;
        f.sign = decode_bool();
        f.exponent = max_exp + 1;
        f.mantissa = decode_big_int(scheme.mant_bits);
        out.push_back(recompose(dequantize(f, scheme.mant_bits)));
    }
    return out;
}

BitBuffer &BitBuffer::encode_point(const Point &p, const PrecisionScheme &scheme)
{
    std::array<double, 2> xy{p.x, p.y};
    return encode_fixed_points(xy, scheme);
}

Point BitBuffer::decode_point(const PrecisionScheme &scheme)
{
    auto xy = decode_fixed_points(2, scheme);
    return Point{xy[0], xy[1]};
}

BitBuffer &BitBuffer::encode_lossless(double v)
{
    encode_big_int(to_bits(v), 64);
    return *this;
}

double BitBuffer::decode_lossless()
{
    return from_bits(decode_big_int(64));
}

std::vector<uint8_t> BitBuffer::to_bytes() const
{
    size_t n = std::min(m_bytes.size(), (m_end + 7) / 8);
    return std::vector<uint8_t>(m_bytes.begin(), m_bytes.begin() + static_cast<std::ptrdiff_t>(n));
}

std::string BitBuffer::to_base64() const
{
    return base64::encode(to_bytes());
}

void BitBuffer::reset() noexcept
{
    m_bytes.clear();
    m_cursor = 0;
    m_end = 0;
}

} // namespace urlprm::codec
