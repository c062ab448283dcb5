// SPDX-License-Identifier: Apache-2.0
// multi_param.hpp - repeated-key float params (key=1.5&key=2.5).
#pragma once

#include "params/float_param.hpp"
#include "params/param.hpp"

#include <memory>
#include <vector>

namespace urlprm::params {

class MultiFloatParam : public IMultiParam<std::vector<double>>
{
public:
    // element.default_value is unused: elements are never omitted individually.
    explicit MultiFloatParam(std::vector<double> default_value = {}, FloatOptions element = {});

    // Empty list when value equals the default.
    std::vector<std::string> encode(const std::vector<double> &value) const override;
    // Empty list, or any unreadable element, yields the default.
    std::vector<double> decode(const std::vector<std::string> &encoded) const override;

private:
    std::vector<double> m_default;
    FloatOptions m_element;
};

std::unique_ptr<IMultiParam<std::vector<double>>> multi_float_param(std::vector<double> default_value = {},
                                                                    FloatOptions element = {});

} // namespace urlprm::params
