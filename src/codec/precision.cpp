// SPDX-License-Identifier: Apache-2.0
#include "codec/precision.hpp"

#include "codec/errors.hpp"

#include <array>
#include <charconv>

namespace urlprm::codec {

namespace {

constexpr std::array<PrecisionScheme, 7> PRESETS{{
    {5, 16},
    {5, 22},
    {5, 28},
    {5, 34},
    {5, 40},
    {5, 46},
    {5, 52},
}};

bool parse_width(std::string_view digits, int &out)
{
    if (digits.empty() || digits.size() > 3)
        return false;
    for (char c : digits)
        if (c < '0' || c > '9')
            return false;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return res.ec == std::errc{} && res.ptr == digits.data() + digits.size();
}

} // namespace

void PrecisionScheme::validate() const
{
    if (exp_bits < 1 || exp_bits > MAX_EXP_BITS)
        throw RangeError("precision: exp_bits " + std::to_string(exp_bits) + " outside [1, "
                         + std::to_string(MAX_EXP_BITS) + "]");
    if (mant_bits < 1 || mant_bits > MAX_MANT_BITS)
        throw RangeError("precision: mant_bits " + std::to_string(mant_bits) + " outside [1, "
                         + std::to_string(MAX_MANT_BITS) + "]");
}

std::string PrecisionScheme::to_string() const
{
    return std::to_string(exp_bits) + "+" + std::to_string(mant_bits);
}

std::span<const PrecisionScheme> precision_schemes() noexcept
{
    return PRESETS;
}

PrecisionScheme scheme_for_mantissa(int mant_bits)
{
    for (const auto &s : PRESETS)
        if (s.mant_bits >= mant_bits)
            return s;
    throw RangeError("precision: no preset with " + std::to_string(mant_bits) + " mantissa bits");
}

PrecisionScheme parse_precision(std::string_view s)
{
    auto plus = s.find('+');
    PrecisionScheme scheme;
    if (plus == std::string_view::npos || !parse_width(s.substr(0, plus), scheme.exp_bits)
        || !parse_width(s.substr(plus + 1), scheme.mant_bits))
        throw FormatError("precision: expected \"<exp>+<mant>\", got \"" + std::string(s) + "\"");
    scheme.validate();
    return scheme;
}

size_t packed_bit_length(size_t count, const PrecisionScheme &scheme) noexcept
{
    return static_cast<size_t>(scheme.exp_bits) + count * (1 + static_cast<size_t>(scheme.mant_bits));
}

size_t packed_byte_length(size_t count, const PrecisionScheme &scheme) noexcept
{
    return (packed_bit_length(count, scheme) + 7) / 8;
}

} // namespace urlprm::codec
