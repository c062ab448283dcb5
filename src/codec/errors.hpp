// SPDX-License-Identifier: Apache-2.0
// errors.hpp
// Exception types thrown by the strict codec layer. Public param decoders catch these and fall back to defaults.
#pragma once

#include <stdexcept>
#include <string>

namespace urlprm::codec {

// Value (or scheme) cannot be represented: shared exponent overflows exp_bits, non-finite input, bad widths.
class RangeError : public std::range_error
{
public:
    explicit RangeError(const std::string &what) : std::range_error(what) {}
};

// Malformed text: precision string, base64 in strict mode, decimal text, payload length.
class FormatError : public std::runtime_error
{
public:
    explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace urlprm::codec
