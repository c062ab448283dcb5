// SPDX-License-Identifier: Apache-2.0
// float_param.hpp
// Float and 2D point URL params over the bit-packed codec (base64) or decimal text.
#pragma once

#include "codec/bit_buffer.hpp"
#include "codec/precision.hpp"
#include "params/param.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace urlprm::params {

enum class FloatEncoding
{
    string, // decimal text
    base64 // bit-packed, URL-safe base64
};

inline constexpr int MAX_DECIMALS = 17;

struct FloatOptions
{
    double default_value{0.0};
    FloatEncoding encoding{FloatEncoding::string};
    // string: fraction digits kept (trailing zeros dropped); nullopt = shortest round-trip text
    std::optional<int> decimals;
    // base64: shared-exponent scheme; nullopt = lossless 64-bit pattern
    std::optional<codec::PrecisionScheme> precision;

    // Throws codec::RangeError for decimals outside [0, 17] or an invalid scheme.
    void validate() const;
};

struct PointOptions
{
    std::optional<codec::Point> default_value;
    FloatEncoding encoding{FloatEncoding::base64};
    std::optional<int> decimals;
    std::optional<codec::PrecisionScheme> precision{codec::DEFAULT_SCHEME};

    void validate() const;
};

// Throwing layer used by the params below. Non-finite values raise codec::RangeError; malformed text raises
// codec::FormatError.
namespace strict {
std::string format_decimal(double v, std::optional<int> decimals);
double parse_decimal(std::string_view s);

std::string encode_float(double v, const FloatOptions &opts);
double decode_float(std::string_view s, const FloatOptions &opts);

std::string encode_point(const codec::Point &p, const PointOptions &opts);
codec::Point decode_point(std::string_view s, const PointOptions &opts);
} // namespace strict

class FloatParam : public IParam<double>
{
public:
    explicit FloatParam(FloatOptions opts = {});

    std::optional<std::string> encode(const double &value) const override;
    double decode(const std::optional<std::string> &encoded) const override;

    const FloatOptions &options() const noexcept { return m_opts; }

private:
    FloatOptions m_opts;
};

// An absent key decodes to the default. With a point default, encode(nullopt) yields an empty string (a bare
// key in the query), which decodes back to nullopt.
class PointParam : public IParam<std::optional<codec::Point>>
{
public:
    explicit PointParam(PointOptions opts = {});

    std::optional<std::string> encode(const std::optional<codec::Point> &value) const override;
    std::optional<codec::Point> decode(const std::optional<std::string> &encoded) const override;

    const PointOptions &options() const noexcept { return m_opts; }

private:
    PointOptions m_opts;
};

std::unique_ptr<IParam<double>> float_param(FloatOptions opts = {});
std::unique_ptr<IParam<std::optional<codec::Point>>> point_param(PointOptions opts = {});

} // namespace urlprm::params
