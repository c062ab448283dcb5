// SPDX-License-Identifier: Apache-2.0
// config.hpp - YAML configuration for the urlprm tool.
#pragma once

#include "params/float_param.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace urlprm::tool {

enum class ParamKind
{
    single_float, // "float"
    point, // "point"
    floats // "floats" (repeated key)
};

struct ParamSpec
{
    std::string key;
    ParamKind kind{ParamKind::single_float};
    params::FloatOptions float_opts; // float, and per-element options for floats
    params::PointOptions point_opts;
    std::vector<double> floats_default;
};

struct ToolConfig
{
    std::string log_level{"info"};
    bool log_json{false};
    bool print_stats{false};
    std::vector<ParamSpec> params;
};

// Throws YAML::Exception for unreadable YAML, codec::FormatError / codec::RangeError for invalid entries.
ToolConfig load_config(const std::string &path);
ToolConfig parse_config(const YAML::Node &root);

ParamKind parse_kind(const std::string &name);
const char *kind_name(ParamKind kind) noexcept;

} // namespace urlprm::tool
