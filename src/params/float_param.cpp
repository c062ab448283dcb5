// SPDX-License-Identifier: Apache-2.0
#include "params/float_param.hpp"

#include "codec/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace urlprm::params {

namespace {

constexpr size_t LOSSLESS_BYTES = 8;

void check_decimals(const std::optional<int> &decimals)
{
    if (decimals && (*decimals < 0 || *decimals > MAX_DECIMALS))
        throw codec::RangeError("decimals " + std::to_string(*decimals) + " outside [0, 17]");
}

// Payload must be exactly as long as the layout implies; anything else is not ours.
codec::BitBuffer read_payload(std::string_view s, size_t expected_bytes)
{
    auto buf = codec::BitBuffer::from_base64_strict(s);
    if (buf.bit_length() != expected_bytes * 8)
        throw codec::FormatError("payload is " + std::to_string(buf.bit_length() / 8) + " bytes, expected "
                                 + std::to_string(expected_bytes));
    return buf;
}

} // namespace

void FloatOptions::validate() const
{
    check_decimals(decimals);
    if (precision)
        precision->validate();
}

void PointOptions::validate() const
{
    check_decimals(decimals);
    if (precision)
        precision->validate();
}

namespace strict {

std::string format_decimal(double v, std::optional<int> decimals)
{
    if (!std::isfinite(v))
        throw codec::RangeError("decimal: non-finite value");
    check_decimals(decimals);
    std::array<char, 400> buf{}; // fixed notation of DBL_MAX plus 17 decimals fits
    std::to_chars_result res = decimals ? std::to_chars(buf.data(), buf.data() + buf.size(), v,
                                                        std::chars_format::fixed, *decimals)
                                        : std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (res.ec != std::errc{})
        throw codec::RangeError("decimal: value does not fit the format buffer");
    std::string out(buf.data(), res.ptr);
    if (decimals && out.find('.') != std::string::npos) {
        while (out.back() == '0')
            out.pop_back();
        if (out.back() == '.')
            out.pop_back();
    }
    if (out == "-0")
        out = "0";
    return out;
}

double parse_decimal(std::string_view s)
{
    if (s.empty())
        throw codec::FormatError("decimal: empty text");
    double v = 0.0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
        throw codec::FormatError("decimal: cannot parse \"" + std::string(s) + "\"");
    if (!std::isfinite(v))
        throw codec::FormatError("decimal: non-finite text \"" + std::string(s) + "\"");
    return v;
}

std::string encode_float(double v, const FloatOptions &opts)
{
    if (opts.encoding == FloatEncoding::string)
        return format_decimal(v, opts.decimals);
    codec::BitBuffer buf;
    if (opts.precision) {
        std::array<double, 1> one{v};
        buf.encode_fixed_points(one, *opts.precision);
    } else {
        buf.encode_lossless(v);
    }
    return buf.to_base64();
}

double decode_float(std::string_view s, const FloatOptions &opts)
{
    if (opts.encoding == FloatEncoding::string)
        return parse_decimal(s);
    if (opts.precision) {
        auto buf = read_payload(s, codec::packed_byte_length(1, *opts.precision));
        return buf.decode_fixed_points(1, *opts.precision)[0];
    }
    auto buf = read_payload(s, LOSSLESS_BYTES);
    return buf.decode_lossless();
}

std::string encode_point(const codec::Point &p, const PointOptions &opts)
{
    if (opts.encoding == FloatEncoding::string)
        return format_decimal(p.x, opts.decimals) + " " + format_decimal(p.y, opts.decimals);
    codec::BitBuffer buf;
    if (opts.precision) {
        buf.encode_point(p, *opts.precision);
    } else {
        buf.encode_lossless(p.x);
        buf.encode_lossless(p.y);
    }
    return buf.to_base64();
}

codec::Point decode_point(std::string_view s, const PointOptions &opts)
{
    if (opts.encoding == FloatEncoding::string) {
        auto sep = s.find(' ');
        if (sep == std::string_view::npos)
            throw codec::FormatError("point: expected \"<x> <y>\", got \"" + std::string(s) + "\"");
        return codec::Point{parse_decimal(s.substr(0, sep)), parse_decimal(s.substr(sep + 1))};
    }
    if (opts.precision) {
        auto buf = read_payload(s, codec::packed_byte_length(2, *opts.precision));
        return buf.decode_point(*opts.precision);
    }
    auto buf = read_payload(s, 2 * LOSSLESS_BYTES);
    codec::Point p;
    p.x = buf.decode_lossless();
    p.y = buf.decode_lossless();
    return p;
}

} // namespace strict

FloatParam::FloatParam(FloatOptions opts) : m_opts(std::move(opts))
{
    m_opts.validate();
}

std::optional<std::string> FloatParam::encode(const double &value) const
{
    if (value == m_opts.default_value) {
        metrics::add_omitted_default();
        return std::nullopt;
    }
    try {
        auto text = strict::encode_float(value, m_opts);
        metrics::add_encode(text.size());
        return text;
    } catch (const codec::RangeError &) {
        metrics::add_range_error();
        throw;
    }
}

double FloatParam::decode(const std::optional<std::string> &encoded) const
{
    if (!encoded || encoded->empty())
        return m_opts.default_value;
    metrics::add_decode();
    try {
        return strict::decode_float(*encoded, m_opts);
    } catch (const std::exception &ex) {
        metrics::add_decode_fallback();
        log::debug("float param: unreadable \"{}\" ({}), using default", *encoded, ex.what());
        return m_opts.default_value;
    }
}

PointParam::PointParam(PointOptions opts) : m_opts(std::move(opts))
{
    m_opts.validate();
}

std::optional<std::string> PointParam::encode(const std::optional<codec::Point> &value) const
{
    if (value == m_opts.default_value) {
        metrics::add_omitted_default();
        return std::nullopt;
    }
    // Bare key: no point, overriding a point default.
    if (!value)
        return std::string();
    try {
        auto text = strict::encode_point(*value, m_opts);
        metrics::add_encode(text.size());
        return text;
    } catch (const codec::RangeError &) {
        metrics::add_range_error();
        throw;
    }
}

std::optional<codec::Point> PointParam::decode(const std::optional<std::string> &encoded) const
{
    if (!encoded)
        return m_opts.default_value;
    if (encoded->empty())
        return std::nullopt;
    metrics::add_decode();
    try {
        return strict::decode_point(*encoded, m_opts);
    } catch (const std::exception &ex) {
        metrics::add_decode_fallback();
        log::debug("point param: unreadable \"{}\" ({}), using default", *encoded, ex.what());
        return m_opts.default_value;
    }
}

std::unique_ptr<IParam<double>> float_param(FloatOptions opts)
{
    return std::make_unique<FloatParam>(std::move(opts));
}

std::unique_ptr<IParam<std::optional<codec::Point>>> point_param(PointOptions opts)
{
    return std::make_unique<PointParam>(std::move(opts));
}

} // namespace urlprm::params
