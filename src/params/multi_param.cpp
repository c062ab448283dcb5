// SPDX-License-Identifier: Apache-2.0
#include "params/multi_param.hpp"

#include "codec/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace urlprm::params {

MultiFloatParam::MultiFloatParam(std::vector<double> default_value, FloatOptions element)
    : m_default(std::move(default_value)), m_element(std::move(element))
{
    m_element.validate();
}

std::vector<std::string> MultiFloatParam::encode(const std::vector<double> &value) const
{
    if (value == m_default) {
        metrics::add_omitted_default();
        return {};
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    try {
        for (double v : value) {
            out.push_back(strict::encode_float(v, m_element));
            metrics::add_encode(out.back().size());
        }
    } catch (const codec::RangeError &) {
        metrics::add_range_error();
        throw;
    }
    return out;
}

std::vector<double> MultiFloatParam::decode(const std::vector<std::string> &encoded) const
{
    if (encoded.empty())
        return m_default;
    metrics::add_decode();
    std::vector<double> out;
    out.reserve(encoded.size());
    try {
        for (const auto &s : encoded)
            out.push_back(strict::decode_float(s, m_element));
    } catch (const std::exception &ex) {
        metrics::add_decode_fallback();
        log::debug("multi float param: unreadable element ({}), using default", ex.what());
        return m_default;
    }
    return out;
}

std::unique_ptr<IMultiParam<std::vector<double>>> multi_float_param(std::vector<double> default_value,
                                                                    FloatOptions element)
{
    return std::make_unique<MultiFloatParam>(std::move(default_value), std::move(element));
}

} // namespace urlprm::params
