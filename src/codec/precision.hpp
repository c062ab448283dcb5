// SPDX-License-Identifier: Apache-2.0
// precision.hpp
// Precision schemes: (exp_bits, mant_bits) pairs controlling the shared-exponent float packing.
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace urlprm::codec {

inline constexpr int MAX_EXP_BITS = 10;
inline constexpr int MAX_MANT_BITS = 52;

struct PrecisionScheme
{
    int exp_bits{5}; // shared exponent field width; range [-(2^(exp_bits-1)), 2^(exp_bits-1) - 1]
    int mant_bits{22}; // per-value mantissa width, marker bit included

    // Throws RangeError unless 1 <= exp_bits <= 10 and 1 <= mant_bits <= 52.
    void validate() const;

    int min_exponent() const noexcept { return -(1 << (exp_bits - 1)); }
    int max_exponent() const noexcept { return (1 << (exp_bits - 1)) - 1; }

    // "<exp_bits>+<mant_bits>"
    std::string to_string() const;

    bool operator==(const PrecisionScheme &) const = default;
};

inline constexpr PrecisionScheme DEFAULT_SCHEME{5, 22};

// Presets {5,16} {5,22} ... {5,52}, ascending precision (~5 to ~16 significant decimal digits).
std::span<const PrecisionScheme> precision_schemes() noexcept;

// Smallest preset carrying at least mant_bits; RangeError when none does.
PrecisionScheme scheme_for_mantissa(int mant_bits);

// Parse "<exp_bits>+<mant_bits>" (e.g. "5+22"). FormatError on mismatch, RangeError on bad widths.
PrecisionScheme parse_precision(std::string_view s);

// Wire size of `count` values sharing one exponent: exp_bits + count * (1 + mant_bits).
size_t packed_bit_length(size_t count, const PrecisionScheme &scheme) noexcept;
size_t packed_byte_length(size_t count, const PrecisionScheme &scheme) noexcept;

} // namespace urlprm::codec
