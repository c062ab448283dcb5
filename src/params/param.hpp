// SPDX-License-Identifier: Apache-2.0
// param.hpp
// Typed value <-> URL parameter text. Implementations are immutable after construction and may be shared.
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace urlprm::params {

// Single-valued key. nullopt means the key is absent from the URL.
template <typename T>
class IParam
{
public:
    using value_type = T;

    virtual ~IParam() = default;
    // nullopt when value equals the configured default (key omitted). May throw codec::RangeError for values
    // the codec cannot represent.
    virtual std::optional<std::string> encode(const T &value) const = 0;
    // Never throws: absent, empty or malformed text yields the default.
    virtual T decode(const std::optional<std::string> &encoded) const = 0;
};

// Repeated key (key=a&key=b). An empty list means the key is absent.
template <typename T>
class IMultiParam
{
public:
    using value_type = T;

    virtual ~IMultiParam() = default;
    virtual std::vector<std::string> encode(const T &value) const = 0;
    virtual T decode(const std::vector<std::string> &encoded) const = 0;
};

} // namespace urlprm::params
