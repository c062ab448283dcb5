// SPDX-License-Identifier: Apache-2.0
// param_set.hpp
// Configured params keyed by URL key; converts between command-line text and query strings.
#pragma once

#include "params/float_param.hpp"
#include "params/multi_param.hpp"
#include "params/param.hpp"
#include "tool/config.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace urlprm::tool {

using Assignment = std::pair<std::string, std::string>; // key, value as typed by the user

class ParamSet
{
public:
    explicit ParamSet(const std::vector<ParamSpec> &specs);

    // Values use the user form: float "1.5", point "x,y" (or "none"), floats "1,2,3" (empty for none).
    // Throws codec::FormatError for unknown keys or unparsable values, codec::RangeError from the codec.
    std::string encode(const std::vector<Assignment> &assignments) const;
    // Every configured key, in configuration order, with its decoded value in user form. Never throws.
    std::vector<Assignment> decode(std::string_view query) const;

    size_t size() const noexcept { return m_entries.size(); }

private:
    struct Entry
    {
        std::string key;
        ParamKind kind;
        std::unique_ptr<params::IParam<double>> single;
        std::unique_ptr<params::IParam<std::optional<codec::Point>>> point;
        std::unique_ptr<params::IMultiParam<std::vector<double>>> multi;
    };

    const Entry *find(const std::string &key) const;

    std::vector<Entry> m_entries;
};

} // namespace urlprm::tool
